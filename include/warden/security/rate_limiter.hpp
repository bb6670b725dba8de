#pragma once

#include <warden/common/clock.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace warden::security {

struct rate_decision final {
  bool allowed{};
  uint32_t limit{};
  uint32_t remaining{};
  /// When the current window closes.
  warden::schema::timestamp_milliseconds_t reset_at{};
};

/// Fixed-window request counters keyed by caller-chosen strings
/// (principal + capability in the kernel).
class rate_limiter final {
 public:
  explicit rate_limiter(
      warden::common::time_source_t clock = warden::common::system_now);

  /// Count one request against `key` and report whether it fits within
  /// `limit` per `window`. A refused request is not counted.
  rate_decision consume(const std::string& key,
                        uint32_t limit,
                        warden::schema::duration_milliseconds_t window);

  /// Inspect without counting.
  rate_decision peek(const std::string& key,
                     uint32_t limit,
                     warden::schema::duration_milliseconds_t window) const;

  void reset(const std::string& key);

  /// Forget windows that closed before now.
  void prune();

 private:
  struct window_state final {
    warden::schema::timestamp_milliseconds_t window_start{};
    warden::schema::duration_milliseconds_t window{};
    uint32_t count{};
  };

  rate_decision evaluate(const window_state* state,
                         uint32_t limit,
                         warden::schema::duration_milliseconds_t window,
                         warden::schema::timestamp_milliseconds_t now) const;

  mutable std::mutex mutex_;
  warden::common::time_source_t clock_;
  std::map<std::string, window_state> windows_;
};

}  // namespace warden::security
