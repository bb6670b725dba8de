#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/trust_tier.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: trust profile.
// Per-agent behavioral record. Scores are derived from the raw counters and
// the last activity timestamp; trust_points is an independent ledger.
namespace warden::schema {

template <uint16_t Version>
struct trust_profile;

template <>
struct trust_profile<1> final {
  uint16_t version{1};
  agent_id_t agent_id;

  uint32_t trust_score{};
  trust_tier_t tier{trust_tier_t::untrusted};

  bool frozen{};
  std::string frozen_reason;
  std::optional<timestamp_milliseconds_t> frozen_at;

  double success_rate_score{};
  double uptime_score{};
  double security_score{100.0};
  double test_pass_score{};
  double rollback_score{100.0};

  uint64_t total_actions{};
  uint64_t successful_actions{};
  uint64_t security_violations{};
  uint64_t total_tests{};
  uint64_t tests_passed{};
  uint64_t rollback_count{};
  uint64_t improvement_count{};

  uint64_t trust_points{};
  uint64_t proposals_submitted{};
  uint64_t proposals_approved{};
  uint64_t installations_successful{};
  uint64_t installations_rolled_back{};

  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  std::optional<timestamp_milliseconds_t> last_activity_at;
};

using trust_profile_t = trust_profile<1>;

}  // namespace warden::schema
