#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/trust_tier.hpp>

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace warden::trust {

/// Minimum tier for every resource at or beneath `prefix`.
struct tier_rule_t final {
  std::string prefix;
  warden::schema::trust_tier_t minimum{warden::schema::trust_tier_t::untrusted};
  /// Needs approval through the escalation collaborator at every tier.
  bool gated{};
};

struct tier_requirement_t final {
  warden::schema::trust_tier_t minimum{warden::schema::trust_tier_t::untrusted};
  bool gated{};
};

std::vector<tier_rule_t> default_tier_rules();

/// Maps resources to the tier needed to use them and caps agents below
/// their behavioral tier. A ceiling can only restrict, never elevate.
class tier_policy final {
 public:
  explicit tier_policy(std::vector<tier_rule_t> rules = default_tier_rules());

  /// Longest matching prefix wins. Unmatched resources require untrusted.
  tier_requirement_t requirement(std::string_view resource_uri) const;

  void set_ceiling(const warden::schema::agent_id_t& agent_id,
                   warden::schema::trust_tier_t ceiling);
  void clear_ceiling(const warden::schema::agent_id_t& agent_id);

  /// min(behavioral, ceiling).
  warden::schema::trust_tier_t effective_tier(
      const warden::schema::agent_id_t& agent_id,
      warden::schema::trust_tier_t behavioral) const;

 private:
  mutable std::shared_mutex mutex_;
  std::vector<tier_rule_t> rules_;
  std::map<warden::schema::agent_id_t, warden::schema::trust_tier_t> ceilings_;
};

}  // namespace warden::trust
