#pragma once

#include <warden/common/clock.hpp>
#include <warden/schema/enum_string.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/points_event_type.hpp>
#include <warden/schema/trust_event_record.hpp>
#include <warden/schema/trust_event_type.hpp>
#include <warden/schema/trust_profile.hpp>
#include <warden/schema/trust_result.hpp>
#include <warden/schema/trust_tier.hpp>
#include <warden/security/event_journal.hpp>
#include <warden/trust/score.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace warden::trust {

enum class breaker_action_t : uint8_t {
  freeze = 0,
  /// Drop one tier without freezing.
  demote = 1,
};

enum class breaker_state_t : uint8_t {
  closed = 0,
  open = 1,
  /// Unfrozen after a trip; the next failure re-trips, the next success
  /// closes.
  half_open = 2,
};

inline constexpr auto kBreakerStateMappings = std::array{
    std::pair<std::string_view, breaker_state_t>{"closed",
                                                 breaker_state_t::closed},
    std::pair<std::string_view, breaker_state_t>{"open", breaker_state_t::open},
    std::pair<std::string_view, breaker_state_t>{"half_open",
                                                 breaker_state_t::half_open},
};

inline constexpr std::string_view to_string(const breaker_state_t value) {
  return warden::schema::to_string(value, kBreakerStateMappings)
      .value_or("unknown");
}

/// `threshold` events whose type is any of `triggers`, counted together
/// within `window`, trip the breaker.
struct breaker_rule_t final {
  std::vector<warden::schema::trust_event_type_t> triggers;
  uint32_t threshold{};
  warden::schema::duration_milliseconds_t window{};
  breaker_action_t action{breaker_action_t::freeze};
  std::string reason;
};

std::vector<breaker_rule_t> default_breaker_rules();

struct engine_options final {
  score_weights weights;
  std::vector<breaker_rule_t> breaker_rules{default_breaker_rules()};
  decay_options decay;
  /// Recorded events kept per agent.
  std::size_t event_history{1000};
};

/// Behavioral trust: per-agent score, tier, freeze state and points ledger.
///
/// Mutations are serialized behind one exclusive lock. Reads take a shared
/// lock. Audit events are delivered after the lock is released.
class engine final {
 public:
  explicit engine(
      engine_options options = {},
      warden::common::time_source_t clock = warden::common::system_now);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  void set_event_sink(warden::security::event_sink_t sink);

  /// Fails with `already_exists` for a known agent.
  warden::schema::trust_result_t create_profile(
      const warden::schema::agent_id_t& agent_id);

  /// Stored profile as of the last mutation.
  std::optional<warden::schema::trust_profile_t> get_profile(
      const warden::schema::agent_id_t& agent_id) const;

  /// Profile with uptime and decay evaluated at the current time. The score
  /// never exceeds the stored one.
  std::optional<warden::schema::trust_profile_t> evaluate(
      const warden::schema::agent_id_t& agent_id) const;

  std::vector<warden::schema::trust_profile_t> list_profiles() const;

  /// Administrative removal of an agent's profile, history and breaker.
  warden::schema::error_code delete_profile(
      const warden::schema::agent_id_t& agent_id);

  /// Apply one behavioral observation. Unknown agents get a profile.
  warden::schema::trust_result_t record_event(
      const warden::schema::agent_id_t& agent_id,
      warden::schema::trust_event_type_t type,
      std::map<std::string, std::string> metadata = {});

  /// Kill switch. Creates the profile if needed so it always takes effect.
  warden::schema::trust_result_t freeze(
      const warden::schema::agent_id_t& agent_id,
      std::string reason);

  warden::schema::trust_result_t unfreeze(
      const warden::schema::agent_id_t& agent_id);

  /// Add the table value for a contribution; penalty types add nothing.
  warden::schema::trust_result_t award(
      const warden::schema::agent_id_t& agent_id,
      warden::schema::points_event_type_t type);

  /// Subtract the table value for a penalty, floored at zero.
  warden::schema::trust_result_t deduct(
      const warden::schema::agent_id_t& agent_id,
      warden::schema::points_event_type_t type);

  /// `trust_frozen`, `insufficient_trust`, `not_found` or `ok`.
  warden::schema::error_code check_authorization(
      const warden::schema::agent_id_t& agent_id,
      warden::schema::trust_tier_t required) const;

  /// Most recent `limit` events, oldest first.
  std::vector<warden::schema::trust_event_record_t> events(
      const warden::schema::agent_id_t& agent_id,
      std::size_t limit = 50) const;

  std::optional<breaker_state_t> breaker_state(
      const warden::schema::agent_id_t& agent_id) const;

  /// Close the breaker and forget its windows. Does not unfreeze.
  warden::schema::error_code reset_breaker(
      const warden::schema::agent_id_t& agent_id);

  /// Apply inactivity decay to every stored profile; returns how many
  /// scores dropped.
  uint64_t run_decay_check();

 private:
  struct breaker_t final {
    breaker_state_t state{breaker_state_t::closed};
    /// Keyed by rule index.
    std::map<std::size_t,
             std::deque<warden::schema::timestamp_milliseconds_t>>
        windows;
  };

  using events_t = std::vector<warden::schema::security_event_record_t>;

  warden::schema::trust_profile_t& profile_for(
      const warden::schema::agent_id_t& agent_id,
      warden::schema::timestamp_milliseconds_t now);
  warden::schema::trust_profile_t fresh_view(
      const warden::schema::trust_profile_t& stored,
      warden::schema::timestamp_milliseconds_t now) const;
  void touch(warden::schema::trust_profile_t& profile,
             warden::schema::timestamp_milliseconds_t now);
  void award_locked(warden::schema::trust_profile_t& profile,
                    warden::schema::points_event_type_t type);
  void deduct_locked(warden::schema::trust_profile_t& profile,
                     warden::schema::points_event_type_t type);
  void freeze_locked(warden::schema::trust_profile_t& profile,
                     const std::string& reason,
                     warden::schema::timestamp_milliseconds_t now,
                     events_t& out);
  void evaluate_breaker(warden::schema::trust_profile_t& profile,
                        warden::schema::trust_event_type_t type,
                        warden::schema::timestamp_milliseconds_t now,
                        events_t& out);
  void trip(warden::schema::trust_profile_t& profile,
            const breaker_rule_t& rule,
            warden::schema::timestamp_milliseconds_t now,
            events_t& out);
  void note_tier_change(const warden::schema::trust_profile_t& profile,
                        warden::schema::trust_tier_t previous,
                        warden::schema::timestamp_milliseconds_t now,
                        events_t& out) const;
  void emit(const events_t& events);

  mutable std::shared_mutex mutex_;
  engine_options options_;
  warden::common::time_source_t clock_;
  warden::security::event_sink_t event_sink_;
  std::map<warden::schema::agent_id_t, warden::schema::trust_profile_t>
      profiles_;
  std::map<warden::schema::agent_id_t,
           std::deque<warden::schema::trust_event_record_t>>
      history_;
  std::map<warden::schema::agent_id_t, breaker_t> breakers_;
};

}  // namespace warden::trust
