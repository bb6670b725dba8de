#include <warden/security/rate_limiter.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace warden::security {

namespace {

warden::schema::timestamp_milliseconds_t window_start_for(
    const warden::schema::timestamp_milliseconds_t now,
    const warden::schema::duration_milliseconds_t window) {
  if (window == 0) {
    return now;
  }
  return now - (now % window);
}

}  // namespace

rate_limiter::rate_limiter(warden::common::time_source_t clock)
    : clock_{std::move(clock)} {}

rate_decision rate_limiter::consume(
    const std::string& key,
    const uint32_t limit,
    const warden::schema::duration_milliseconds_t window) {
  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();
  auto start = window_start_for(now, window);

  auto& state = windows_[key];
  if (state.window != window || state.window_start != start) {
    state = window_state{start, window, 0};
  }

  auto decision = evaluate(&state, limit, window, now);
  if (!decision.allowed) {
    spdlog::warn("Rate limit reached for '{}' ({} per {} ms)", key, limit,
                 window);
    return decision;
  }
  ++state.count;
  decision.remaining = limit - state.count;
  return decision;
}

rate_decision rate_limiter::peek(
    const std::string& key,
    const uint32_t limit,
    const warden::schema::duration_milliseconds_t window) const {
  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();
  auto it = windows_.find(key);
  if (it == std::end(windows_) || it->second.window != window ||
      it->second.window_start != window_start_for(now, window)) {
    return evaluate(nullptr, limit, window, now);
  }
  return evaluate(&it->second, limit, window, now);
}

void rate_limiter::reset(const std::string& key) {
  auto lock = std::scoped_lock{mutex_};
  windows_.erase(key);
}

void rate_limiter::prune() {
  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();
  for (auto it = std::begin(windows_); it != std::end(windows_);) {
    if (it->second.window_start + it->second.window <= now) {
      it = windows_.erase(it);
    } else {
      ++it;
    }
  }
}

rate_decision rate_limiter::evaluate(
    const window_state* state,
    const uint32_t limit,
    const warden::schema::duration_milliseconds_t window,
    const warden::schema::timestamp_milliseconds_t now) const {
  auto decision = rate_decision{};
  decision.limit = limit;
  auto used = state != nullptr ? state->count : uint32_t{};
  decision.allowed = used < limit;
  decision.remaining = used < limit ? limit - used : 0;
  decision.reset_at = window_start_for(now, window) + window;
  return decision;
}

}  // namespace warden::security
