#include <warden/trust/score.hpp>

#include <algorithm>
#include <cmath>

namespace warden::trust {

namespace {

double round2(const double value) {
  return std::round(value * 100.0) / 100.0;
}

double ratio_score(const uint64_t numerator, const uint64_t denominator) {
  if (denominator == 0) {
    return 0.0;
  }
  auto rate = static_cast<double>(numerator) / static_cast<double>(denominator);
  return round2(std::min(100.0, rate * 100.0));
}

double interpolate(const double days,
                   const double from_day,
                   const double to_day,
                   const double from_score,
                   const double to_score) {
  auto t = (days - from_day) / (to_day - from_day);
  return from_score + (to_score - from_score) * t;
}

}  // namespace

double success_rate_score(const uint64_t successful, const uint64_t total) {
  return ratio_score(successful, total);
}

double uptime_score(
    const std::optional<warden::schema::timestamp_milliseconds_t>
        last_activity_at,
    const warden::schema::timestamp_milliseconds_t now) {
  if (!last_activity_at.has_value()) {
    return 0.0;
  }
  auto elapsed = now > *last_activity_at ? now - *last_activity_at : 0;
  auto days = static_cast<double>(elapsed) /
              static_cast<double>(warden::schema::kMillisecondsPerDay);
  if (days <= 7.0) {
    return round2(interpolate(days, 0.0, 7.0, 100.0, 70.0));
  }
  if (days <= 30.0) {
    return round2(interpolate(days, 7.0, 30.0, 70.0, 30.0));
  }
  if (days < 60.0) {
    return round2(interpolate(days, 30.0, 60.0, 30.0, 0.0));
  }
  return 0.0;
}

double security_score(const uint64_t violations) {
  if (violations >= 5) {
    return 0.0;
  }
  return 100.0 - 20.0 * static_cast<double>(violations);
}

double test_pass_score(const uint64_t passed, const uint64_t total) {
  return ratio_score(passed, total);
}

double rollback_score(const uint64_t rollbacks, const uint64_t improvements) {
  if (improvements == 0) {
    return 100.0;
  }
  auto ratio =
      static_cast<double>(rollbacks) / static_cast<double>(improvements);
  return round2(std::max(0.0, 100.0 - ratio * 100.0));
}

uint32_t weighted_score(const warden::schema::trust_profile_t& profile,
                        const score_weights& weights) {
  auto score = profile.success_rate_score * weights.success_rate +
               profile.uptime_score * weights.uptime +
               profile.security_score * weights.security +
               profile.test_pass_score * weights.test_pass +
               profile.rollback_score * weights.rollback;
  return static_cast<uint32_t>(std::clamp(std::round(score), 0.0, 100.0));
}

void recompute(warden::schema::trust_profile_t& profile,
               const score_weights& weights,
               const warden::schema::timestamp_milliseconds_t now) {
  profile.success_rate_score =
      success_rate_score(profile.successful_actions, profile.total_actions);
  profile.uptime_score = uptime_score(profile.last_activity_at, now);
  profile.security_score = security_score(profile.security_violations);
  profile.test_pass_score =
      test_pass_score(profile.tests_passed, profile.total_tests);
  profile.rollback_score =
      rollback_score(profile.rollback_count, profile.improvement_count);
  profile.trust_score = weighted_score(profile, weights);
  profile.tier = tier_for_score(profile.trust_score);
}

warden::schema::trust_tier_t tier_for_score(const uint32_t score) {
  using warden::schema::trust_tier_t;
  if (score < 20) {
    return trust_tier_t::untrusted;
  }
  if (score < 50) {
    return trust_tier_t::probationary;
  }
  if (score < 75) {
    return trust_tier_t::trusted;
  }
  if (score < 90) {
    return trust_tier_t::veteran;
  }
  return trust_tier_t::autonomous;
}

warden::schema::trust_tier_t tier_for_points(const uint64_t points) {
  using warden::schema::trust_tier_t;
  if (points < 25) {
    return trust_tier_t::untrusted;
  }
  if (points < 100) {
    return trust_tier_t::probationary;
  }
  if (points < 500) {
    return trust_tier_t::trusted;
  }
  if (points < 2000) {
    return trust_tier_t::veteran;
  }
  return trust_tier_t::autonomous;
}

bool tier_sufficient(const warden::schema::trust_tier_t actual,
                     const warden::schema::trust_tier_t required) {
  return warden::schema::rank(actual) >= warden::schema::rank(required);
}

uint32_t min_score_for(const warden::schema::trust_tier_t tier) {
  switch (tier) {
    case warden::schema::trust_tier_t::untrusted:
      return 0;
    case warden::schema::trust_tier_t::probationary:
      return 20;
    case warden::schema::trust_tier_t::trusted:
      return 50;
    case warden::schema::trust_tier_t::veteran:
      return 75;
    case warden::schema::trust_tier_t::autonomous:
      return 90;
  }
  return 0;
}

uint32_t max_score_for(const warden::schema::trust_tier_t tier) {
  switch (tier) {
    case warden::schema::trust_tier_t::untrusted:
      return 19;
    case warden::schema::trust_tier_t::probationary:
      return 49;
    case warden::schema::trust_tier_t::trusted:
      return 74;
    case warden::schema::trust_tier_t::veteran:
      return 89;
    case warden::schema::trust_tier_t::autonomous:
      return 100;
  }
  return 0;
}

warden::schema::trust_tier_t demote(const warden::schema::trust_tier_t tier) {
  if (tier == warden::schema::trust_tier_t::untrusted) {
    return tier;
  }
  return static_cast<warden::schema::trust_tier_t>(warden::schema::rank(tier) -
                                                   1);
}

uint64_t award_points(const warden::schema::points_event_type_t type) {
  using warden::schema::points_event_type_t;
  switch (type) {
    case points_event_type_t::proposal_approved:
      return 5;
    case points_event_type_t::installation_successful:
      return 10;
    case points_event_type_t::high_impact_feature:
      return 20;
    case points_event_type_t::bug_fix_passed:
      return 3;
    case points_event_type_t::documentation_improvement:
      return 1;
    default:
      return 0;
  }
}

uint64_t deduct_points(const warden::schema::points_event_type_t type) {
  using warden::schema::points_event_type_t;
  switch (type) {
    case points_event_type_t::implementation_failure:
      return 5;
    case points_event_type_t::installation_rolled_back:
      return 10;
    case points_event_type_t::security_violation:
      return 20;
    case points_event_type_t::circuit_breaker_triggered:
      return 15;
    default:
      return 0;
  }
}

uint32_t decayed_score(
    const uint32_t score,
    const warden::schema::duration_milliseconds_t inactive_for,
    const decay_options& options) {
  if (inactive_for <= options.grace) {
    return score;
  }
  auto decay_days =
      (inactive_for - options.grace) / warden::schema::kMillisecondsPerDay;
  auto decay = decay_days * options.points_per_day;
  if (score <= options.floor) {
    return score;
  }
  auto headroom = uint64_t{score} - options.floor;
  return static_cast<uint32_t>(uint64_t{score} - std::min(headroom, decay));
}

}  // namespace warden::trust
