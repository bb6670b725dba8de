#pragma once

#include <warden/schema/points_event_type.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/trust_profile.hpp>
#include <warden/schema/trust_tier.hpp>

#include <cstdint>
#include <optional>

namespace warden::trust {

struct score_weights final {
  double success_rate{0.30};
  double uptime{0.15};
  double security{0.25};
  double test_pass{0.20};
  double rollback{0.10};
};

struct decay_options final {
  warden::schema::duration_milliseconds_t grace{
      7 * warden::schema::kMillisecondsPerDay};
  uint32_t points_per_day{1};
  uint32_t floor{10};
};

/// Component scores, each in [0, 100] and rounded to two decimals.
double success_rate_score(uint64_t successful, uint64_t total);
double uptime_score(
    std::optional<warden::schema::timestamp_milliseconds_t> last_activity_at,
    warden::schema::timestamp_milliseconds_t now);
double security_score(uint64_t violations);
double test_pass_score(uint64_t passed, uint64_t total);
double rollback_score(uint64_t rollbacks, uint64_t improvements);

/// clamp(round(sum(weight * component)), 0, 100).
uint32_t weighted_score(const warden::schema::trust_profile_t& profile,
                        const score_weights& weights);

/// Refresh every component from the raw counters, then the score and tier.
void recompute(warden::schema::trust_profile_t& profile,
               const score_weights& weights,
               warden::schema::timestamp_milliseconds_t now);

/// Bands: untrusted 0-19, probationary 20-49, trusted 50-74, veteran 75-89,
/// autonomous 90-100.
warden::schema::trust_tier_t tier_for_score(uint32_t score);

/// Bands: untrusted 0, probationary 25, trusted 100, veteran 500,
/// autonomous 2000.
warden::schema::trust_tier_t tier_for_points(uint64_t points);

bool tier_sufficient(warden::schema::trust_tier_t actual,
                     warden::schema::trust_tier_t required);

uint32_t min_score_for(warden::schema::trust_tier_t tier);
uint32_t max_score_for(warden::schema::trust_tier_t tier);

/// One band down; untrusted stays untrusted.
warden::schema::trust_tier_t demote(warden::schema::trust_tier_t tier);

/// Positive for contributions, zero for penalties.
uint64_t award_points(warden::schema::points_event_type_t type);

/// Positive for penalties, zero for contributions.
uint64_t deduct_points(warden::schema::points_event_type_t type);

/// Score after `inactive_for` without activity. Never raises `score`.
uint32_t decayed_score(uint32_t score,
                       warden::schema::duration_milliseconds_t inactive_for,
                       const decay_options& options);

}  // namespace warden::trust
