#include <warden/trust/engine.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <utility>

namespace warden::trust {

namespace {

using warden::schema::error_code;
using warden::schema::security_event_severity_t;
using warden::schema::security_event_type_t;
using warden::schema::trust_event_type_t;

warden::schema::security_event_record_t make_event(
    const security_event_type_t type,
    const security_event_severity_t severity,
    const warden::schema::agent_id_t& agent_id,
    const warden::schema::timestamp_milliseconds_t now,
    std::string message) {
  auto event = warden::schema::security_event_record_t{};
  event.type = type;
  event.severity = severity;
  event.principal = agent_id;
  event.message = std::move(message);
  event.recorded_at = now;
  return event;
}

warden::schema::trust_result_t make_result(
    const warden::schema::trust_profile_t& profile) {
  auto result = warden::schema::trust_result_t{};
  result.profile = profile;
  return result;
}

warden::schema::trust_result_t make_error(const error_code code,
                                          std::string log) {
  auto result = warden::schema::trust_result_t{};
  result.code = code;
  result.log = std::move(log);
  return result;
}

bool is_success(const trust_event_type_t type) {
  return type == trust_event_type_t::action_success ||
         type == trust_event_type_t::test_passed;
}

bool triggered_by(const breaker_rule_t& rule, const trust_event_type_t type) {
  return std::find(std::begin(rule.triggers), std::end(rule.triggers), type) !=
         std::end(rule.triggers);
}

std::string trigger_names(const breaker_rule_t& rule) {
  auto names = std::string{};
  for (const auto trigger : rule.triggers) {
    if (!names.empty()) {
      names.push_back('/');
    }
    names.append(warden::schema::to_string(trigger));
  }
  return names;
}

}  // namespace

std::vector<breaker_rule_t> default_breaker_rules() {
  return {
      {{trust_event_type_t::action_failure, trust_event_type_t::test_failed},
       5,
       60 * warden::schema::kMillisecondsPerSecond,
       breaker_action_t::freeze,
       "rapid_failures"},
      {{trust_event_type_t::security_violation}, 3,
       warden::schema::kMillisecondsPerHour, breaker_action_t::freeze,
       "security_violations"},
      {{trust_event_type_t::rollback_executed}, 3,
       warden::schema::kMillisecondsPerHour, breaker_action_t::demote,
       "excessive_rollbacks"},
  };
}

engine::engine(engine_options options, warden::common::time_source_t clock)
    : options_{std::move(options)}, clock_{std::move(clock)} {}

void engine::set_event_sink(warden::security::event_sink_t sink) {
  auto lock = std::unique_lock{mutex_};
  event_sink_ = std::move(sink);
}

warden::schema::trust_result_t engine::create_profile(
    const warden::schema::agent_id_t& agent_id) {
  if (agent_id.empty()) {
    return make_error(error_code::invalid_resource, "empty agent id");
  }
  auto lock = std::unique_lock{mutex_};
  if (profiles_.contains(agent_id)) {
    return make_error(error_code::already_exists, "profile already exists");
  }
  auto& profile = profile_for(agent_id, clock_());
  spdlog::info("Created trust profile for '{}'", agent_id);
  return make_result(profile);
}

std::optional<warden::schema::trust_profile_t> engine::get_profile(
    const warden::schema::agent_id_t& agent_id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = profiles_.find(agent_id);
  if (it == std::end(profiles_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<warden::schema::trust_profile_t> engine::evaluate(
    const warden::schema::agent_id_t& agent_id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = profiles_.find(agent_id);
  if (it == std::end(profiles_)) {
    return std::nullopt;
  }
  return fresh_view(it->second, clock_());
}

std::vector<warden::schema::trust_profile_t> engine::list_profiles() const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<warden::schema::trust_profile_t>{};
  out.reserve(profiles_.size());
  for (const auto& [agent_id, profile] : profiles_) {
    out.push_back(profile);
  }
  return out;
}

warden::schema::error_code engine::delete_profile(
    const warden::schema::agent_id_t& agent_id) {
  auto events = events_t{};
  {
    auto lock = std::unique_lock{mutex_};
    if (profiles_.erase(agent_id) == 0) {
      return error_code::not_found;
    }
    history_.erase(agent_id);
    breakers_.erase(agent_id);
    events.push_back(make_event(security_event_type_t::profile_deleted,
                                security_event_severity_t::warning, agent_id,
                                clock_(), "trust profile deleted"));
  }
  emit(events);
  spdlog::warn("Deleted trust profile for '{}'", agent_id);
  return error_code::ok;
}

warden::schema::trust_result_t engine::record_event(
    const warden::schema::agent_id_t& agent_id,
    const warden::schema::trust_event_type_t type,
    std::map<std::string, std::string> metadata) {
  if (agent_id.empty()) {
    return make_error(error_code::invalid_resource, "empty agent id");
  }
  auto events = events_t{};
  auto result = warden::schema::trust_result_t{};
  {
    auto lock = std::unique_lock{mutex_};
    auto now = clock_();
    auto& profile = profile_for(agent_id, now);
    auto previous = profile.tier;

    switch (type) {
      case trust_event_type_t::action_success:
        ++profile.total_actions;
        ++profile.successful_actions;
        break;
      case trust_event_type_t::action_failure:
        ++profile.total_actions;
        break;
      case trust_event_type_t::test_passed:
        ++profile.total_tests;
        ++profile.tests_passed;
        break;
      case trust_event_type_t::test_failed:
        ++profile.total_tests;
        break;
      case trust_event_type_t::rollback_executed:
        ++profile.rollback_count;
        break;
      case trust_event_type_t::security_violation:
        ++profile.security_violations;
        break;
      case trust_event_type_t::improvement_applied:
        ++profile.improvement_count;
        break;
      case trust_event_type_t::proposal_submitted:
        ++profile.proposals_submitted;
        break;
      case trust_event_type_t::proposal_approved:
        award_locked(profile,
                     warden::schema::points_event_type_t::proposal_approved);
        break;
      case trust_event_type_t::proposal_rejected:
        break;
      case trust_event_type_t::installation_success:
        award_locked(
            profile,
            warden::schema::points_event_type_t::installation_successful);
        break;
      case trust_event_type_t::installation_rollback:
        deduct_locked(
            profile,
            warden::schema::points_event_type_t::installation_rolled_back);
        break;
    }

    touch(profile, now);
    recompute(profile, options_.weights, now);

    auto& history = history_[agent_id];
    history.push_back(warden::schema::trust_event_record_t{
        1, agent_id, type, std::move(metadata), now});
    while (history.size() > options_.event_history) {
      history.pop_front();
    }

    evaluate_breaker(profile, type, now, events);
    note_tier_change(profile, previous, now, events);
    result = make_result(profile);
  }
  emit(events);
  spdlog::debug("Recorded {} for '{}' (score {}, tier {})",
                warden::schema::to_string(type), agent_id,
                result.profile->trust_score,
                warden::schema::to_string(result.profile->tier));
  return result;
}

warden::schema::trust_result_t engine::freeze(
    const warden::schema::agent_id_t& agent_id,
    std::string reason) {
  if (agent_id.empty()) {
    return make_error(error_code::invalid_resource, "empty agent id");
  }
  auto events = events_t{};
  auto result = warden::schema::trust_result_t{};
  {
    auto lock = std::unique_lock{mutex_};
    auto now = clock_();
    auto& profile = profile_for(agent_id, now);
    freeze_locked(profile, reason, now, events);
    result = make_result(profile);
  }
  emit(events);
  return result;
}

warden::schema::trust_result_t engine::unfreeze(
    const warden::schema::agent_id_t& agent_id) {
  auto events = events_t{};
  auto result = warden::schema::trust_result_t{};
  {
    auto lock = std::unique_lock{mutex_};
    auto it = profiles_.find(agent_id);
    if (it == std::end(profiles_)) {
      return make_error(error_code::not_found, "no trust profile");
    }
    auto& profile = it->second;
    auto now = clock_();
    if (profile.frozen) {
      profile.frozen = false;
      profile.frozen_reason.clear();
      profile.frozen_at.reset();
      profile.updated_at = now;
      auto& breaker = breakers_[agent_id];
      if (breaker.state == breaker_state_t::open) {
        breaker.state = breaker_state_t::half_open;
      }
      events.push_back(make_event(security_event_type_t::trust_unfrozen,
                                  security_event_severity_t::info, agent_id,
                                  now, "trust unfrozen"));
    }
    result = make_result(profile);
  }
  emit(events);
  spdlog::info("Trust unfrozen for '{}'", agent_id);
  return result;
}

warden::schema::trust_result_t engine::award(
    const warden::schema::agent_id_t& agent_id,
    const warden::schema::points_event_type_t type) {
  if (agent_id.empty()) {
    return make_error(error_code::invalid_resource, "empty agent id");
  }
  auto lock = std::unique_lock{mutex_};
  auto now = clock_();
  auto& profile = profile_for(agent_id, now);
  award_locked(profile, type);
  touch(profile, now);
  spdlog::debug("Awarded {} to '{}' ({} points)",
                warden::schema::to_string(type), agent_id,
                profile.trust_points);
  return make_result(profile);
}

warden::schema::trust_result_t engine::deduct(
    const warden::schema::agent_id_t& agent_id,
    const warden::schema::points_event_type_t type) {
  if (agent_id.empty()) {
    return make_error(error_code::invalid_resource, "empty agent id");
  }
  auto lock = std::unique_lock{mutex_};
  auto now = clock_();
  auto& profile = profile_for(agent_id, now);
  deduct_locked(profile, type);
  touch(profile, now);
  spdlog::debug("Deducted {} from '{}' ({} points)",
                warden::schema::to_string(type), agent_id,
                profile.trust_points);
  return make_result(profile);
}

warden::schema::error_code engine::check_authorization(
    const warden::schema::agent_id_t& agent_id,
    const warden::schema::trust_tier_t required) const {
  auto profile = evaluate(agent_id);
  if (!profile.has_value()) {
    return error_code::not_found;
  }
  if (profile->frozen) {
    return error_code::trust_frozen;
  }
  if (!tier_sufficient(profile->tier, required)) {
    return error_code::insufficient_trust;
  }
  return error_code::ok;
}

std::vector<warden::schema::trust_event_record_t> engine::events(
    const warden::schema::agent_id_t& agent_id,
    const std::size_t limit) const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<warden::schema::trust_event_record_t>{};
  auto it = history_.find(agent_id);
  if (it == std::end(history_)) {
    return out;
  }
  const auto& history = it->second;
  auto skip = history.size() > limit ? history.size() - limit : 0;
  out.assign(std::next(std::begin(history), static_cast<std::ptrdiff_t>(skip)),
             std::end(history));
  return out;
}

std::optional<breaker_state_t> engine::breaker_state(
    const warden::schema::agent_id_t& agent_id) const {
  auto lock = std::shared_lock{mutex_};
  if (!profiles_.contains(agent_id)) {
    return std::nullopt;
  }
  auto it = breakers_.find(agent_id);
  if (it == std::end(breakers_)) {
    return breaker_state_t::closed;
  }
  return it->second.state;
}

warden::schema::error_code engine::reset_breaker(
    const warden::schema::agent_id_t& agent_id) {
  auto lock = std::unique_lock{mutex_};
  if (!profiles_.contains(agent_id)) {
    return error_code::not_found;
  }
  breakers_.erase(agent_id);
  spdlog::info("Circuit breaker reset for '{}'", agent_id);
  return error_code::ok;
}

uint64_t engine::run_decay_check() {
  auto events = events_t{};
  auto decayed = uint64_t{};
  {
    auto lock = std::unique_lock{mutex_};
    auto now = clock_();
    for (auto& [agent_id, profile] : profiles_) {
      auto view = fresh_view(profile, now);
      if (view.trust_score >= profile.trust_score) {
        continue;
      }
      auto previous = profile.tier;
      profile.uptime_score = view.uptime_score;
      profile.trust_score = view.trust_score;
      profile.tier = view.tier;
      profile.updated_at = now;
      ++decayed;
      note_tier_change(profile, previous, now, events);
    }
  }
  emit(events);
  if (decayed > 0) {
    spdlog::info("Trust decay lowered {} profile score(s)", decayed);
  }
  return decayed;
}

warden::schema::trust_profile_t& engine::profile_for(
    const warden::schema::agent_id_t& agent_id,
    const warden::schema::timestamp_milliseconds_t now) {
  auto it = profiles_.find(agent_id);
  if (it != std::end(profiles_)) {
    return it->second;
  }
  auto profile = warden::schema::trust_profile_t{};
  profile.agent_id = agent_id;
  profile.created_at = now;
  profile.updated_at = now;
  return profiles_.emplace(agent_id, std::move(profile)).first->second;
}

warden::schema::trust_profile_t engine::fresh_view(
    const warden::schema::trust_profile_t& stored,
    const warden::schema::timestamp_milliseconds_t now) const {
  auto view = stored;
  recompute(view, options_.weights, now);
  if (view.last_activity_at.has_value() && now > *view.last_activity_at) {
    view.trust_score = decayed_score(
        view.trust_score, now - *view.last_activity_at, options_.decay);
  }
  if (view.trust_score > stored.trust_score) {
    view.trust_score = stored.trust_score;
  }
  view.tier = tier_for_score(view.trust_score);
  return view;
}

void engine::touch(warden::schema::trust_profile_t& profile,
                   const warden::schema::timestamp_milliseconds_t now) {
  profile.last_activity_at = now;
  profile.updated_at = now;
}

void engine::award_locked(warden::schema::trust_profile_t& profile,
                          const warden::schema::points_event_type_t type) {
  profile.trust_points += award_points(type);
  if (type == warden::schema::points_event_type_t::proposal_approved) {
    ++profile.proposals_approved;
  } else if (type ==
             warden::schema::points_event_type_t::installation_successful) {
    ++profile.installations_successful;
  }
}

void engine::deduct_locked(warden::schema::trust_profile_t& profile,
                           const warden::schema::points_event_type_t type) {
  profile.trust_points -= std::min(profile.trust_points, deduct_points(type));
  if (type == warden::schema::points_event_type_t::installation_rolled_back) {
    ++profile.installations_rolled_back;
  }
}

void engine::freeze_locked(warden::schema::trust_profile_t& profile,
                           const std::string& reason,
                           const warden::schema::timestamp_milliseconds_t now,
                           events_t& out) {
  if (profile.frozen) {
    return;
  }
  profile.frozen = true;
  profile.frozen_reason = reason;
  profile.frozen_at = now;
  profile.updated_at = now;
  out.push_back(make_event(security_event_type_t::trust_frozen,
                           security_event_severity_t::critical,
                           profile.agent_id, now, "trust frozen: " + reason));
  spdlog::warn("Trust frozen for '{}': {}", profile.agent_id, reason);
}

void engine::evaluate_breaker(warden::schema::trust_profile_t& profile,
                              const warden::schema::trust_event_type_t type,
                              const warden::schema::timestamp_milliseconds_t now,
                              events_t& out) {
  auto& breaker = breakers_[profile.agent_id];

  if (breaker.state == breaker_state_t::half_open) {
    if (is_success(type)) {
      breaker.state = breaker_state_t::closed;
      spdlog::info("Circuit breaker closed for '{}'", profile.agent_id);
      return;
    }
    for (const auto& rule : options_.breaker_rules) {
      if (triggered_by(rule, type) && rule.action == breaker_action_t::freeze) {
        trip(profile, rule, now, out);
        return;
      }
    }
  }

  for (std::size_t i = 0; i < options_.breaker_rules.size(); ++i) {
    const auto& rule = options_.breaker_rules[i];
    if (!triggered_by(rule, type) || rule.threshold == 0) {
      continue;
    }
    auto& window = breaker.windows[i];
    window.push_back(now);
    while (!window.empty() && window.front() + rule.window <= now) {
      window.pop_front();
    }
    if (window.size() >= rule.threshold) {
      window.clear();
      trip(profile, rule, now, out);
      return;
    }
  }
}

void engine::trip(warden::schema::trust_profile_t& profile,
                  const breaker_rule_t& rule,
                  const warden::schema::timestamp_milliseconds_t now,
                  events_t& out) {
  auto message = fmt::format("circuit breaker tripped: {} ({} {} in {} ms)",
                             rule.reason, rule.threshold, trigger_names(rule),
                             rule.window);
  out.push_back(make_event(security_event_type_t::circuit_breaker_tripped,
                           security_event_severity_t::error, profile.agent_id,
                           now, message));
  spdlog::warn("Trust for '{}': {}", profile.agent_id, message);

  if (rule.action == breaker_action_t::demote) {
    auto lower = demote(profile.tier);
    if (lower != profile.tier) {
      profile.tier = lower;
      profile.trust_score = max_score_for(lower);
    }
    return;
  }

  breakers_[profile.agent_id].state = breaker_state_t::open;
  if (profile.frozen) {
    return;
  }
  deduct_locked(profile,
                warden::schema::points_event_type_t::circuit_breaker_triggered);
  freeze_locked(profile, rule.reason, now, out);
}

void engine::note_tier_change(
    const warden::schema::trust_profile_t& profile,
    const warden::schema::trust_tier_t previous,
    const warden::schema::timestamp_milliseconds_t now,
    events_t& out) const {
  if (profile.tier == previous) {
    return;
  }
  auto message =
      fmt::format("tier changed {} -> {}", warden::schema::to_string(previous),
                  warden::schema::to_string(profile.tier));
  out.push_back(make_event(security_event_type_t::tier_changed,
                           security_event_severity_t::info, profile.agent_id,
                           now, message));
  spdlog::info("Trust for '{}': {}", profile.agent_id, message);
}

void engine::emit(const events_t& events) {
  auto sink = warden::security::event_sink_t{};
  {
    auto lock = std::shared_lock{mutex_};
    sink = event_sink_;
  }
  if (!sink) {
    return;
  }
  for (const auto& event : events) {
    sink(event);
  }
}

}  // namespace warden::trust
