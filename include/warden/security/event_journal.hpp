#pragma once

#include <warden/schema/security_event_record.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace warden::security {

/// Receives audit events. Called after the emitting component has released
/// its own lock, so a sink may call back into that component.
using event_sink_t =
    std::function<void(const warden::schema::security_event_record_t&)>;

/// Bounded in-memory audit trail. Assigns monotonically increasing event ids.
class event_journal final {
 public:
  explicit event_journal(std::size_t capacity = 10000);

  void record(warden::schema::security_event_record_t event);

  /// Sink bound to this journal; the journal must outlive it.
  event_sink_t sink();

  /// Events in arrival order, optionally filtered by type.
  std::vector<warden::schema::security_event_record_t> events(
      std::optional<warden::schema::security_event_type_t> type =
          std::nullopt) const;

  /// Events with `from_id <= event_id <= to_id`.
  std::vector<warden::schema::security_event_record_t> range(
      uint64_t from_id,
      uint64_t to_id) const;

  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::size_t capacity_;
  uint64_t next_event_id_{1};
  std::deque<warden::schema::security_event_record_t> events_;
};

}  // namespace warden::security
