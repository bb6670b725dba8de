#include <warden/security/resource_uri.hpp>
#include <warden/trust/policy.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <utility>

namespace warden::trust {

std::vector<tier_rule_t> default_tier_rules() {
  using warden::schema::trust_tier_t;
  return {
      {"arbor://fs/read", trust_tier_t::untrusted, false},
      {"arbor://fs/write", trust_tier_t::trusted, false},
      {"arbor://code/read", trust_tier_t::probationary, false},
      {"arbor://code/write", trust_tier_t::trusted, false},
      {"arbor://net/http", trust_tier_t::probationary, false},
      {"arbor://shell/exec", trust_tier_t::veteran, true},
      {"arbor://governance/change", trust_tier_t::autonomous, true},
  };
}

tier_policy::tier_policy(std::vector<tier_rule_t> rules)
    : rules_{std::move(rules)} {
  for (auto& rule : rules_) {
    if (auto uri = warden::security::parse_resource_uri(rule.prefix);
        uri.has_value()) {
      rule.prefix = uri->to_string();
    }
  }
}

tier_requirement_t tier_policy::requirement(
    const std::string_view resource_uri) const {
  auto requested = warden::security::parse_resource_uri(resource_uri);
  auto normalized =
      requested.has_value() ? requested->to_string() : std::string{resource_uri};

  auto lock = std::shared_lock{mutex_};
  const tier_rule_t* best = nullptr;
  for (const auto& rule : rules_) {
    if (!warden::security::resource_matches(rule.prefix, normalized, true)) {
      continue;
    }
    if (best == nullptr || rule.prefix.size() > best->prefix.size()) {
      best = &rule;
    }
  }
  if (best == nullptr) {
    return tier_requirement_t{};
  }
  return tier_requirement_t{best->minimum, best->gated};
}

void tier_policy::set_ceiling(const warden::schema::agent_id_t& agent_id,
                              const warden::schema::trust_tier_t ceiling) {
  auto lock = std::unique_lock{mutex_};
  ceilings_[agent_id] = ceiling;
  spdlog::info("Tier ceiling for '{}' set to {}", agent_id,
               warden::schema::to_string(ceiling));
}

void tier_policy::clear_ceiling(const warden::schema::agent_id_t& agent_id) {
  auto lock = std::unique_lock{mutex_};
  ceilings_.erase(agent_id);
}

warden::schema::trust_tier_t tier_policy::effective_tier(
    const warden::schema::agent_id_t& agent_id,
    const warden::schema::trust_tier_t behavioral) const {
  auto lock = std::shared_lock{mutex_};
  auto it = ceilings_.find(agent_id);
  if (it == std::end(ceilings_)) {
    return behavioral;
  }
  return std::min(behavioral, it->second);
}

}  // namespace warden::trust
