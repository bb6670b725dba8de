#include <warden/security/event_journal.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace warden::security {

event_journal::event_journal(const std::size_t capacity)
    : capacity_{capacity == 0 ? 1 : capacity} {}

void event_journal::record(warden::schema::security_event_record_t event) {
  auto lock = std::scoped_lock{mutex_};
  event.event_id = next_event_id_++;
  spdlog::debug("Audit event {} {} principal='{}'", event.event_id,
                warden::schema::to_string(event.type), event.principal);
  events_.push_back(std::move(event));
  while (events_.size() > capacity_) {
    events_.pop_front();
  }
}

event_sink_t event_journal::sink() {
  return [this](const warden::schema::security_event_record_t& event) {
    record(event);
  };
}

std::vector<warden::schema::security_event_record_t> event_journal::events(
    const std::optional<warden::schema::security_event_type_t> type) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<warden::schema::security_event_record_t>{};
  for (const auto& event : events_) {
    if (!type.has_value() || event.type == *type) {
      out.push_back(event);
    }
  }
  return out;
}

std::vector<warden::schema::security_event_record_t> event_journal::range(
    const uint64_t from_id,
    const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<warden::schema::security_event_record_t>{};
  for (const auto& event : events_) {
    if (event.event_id >= from_id && event.event_id <= to_id) {
      out.push_back(event);
    }
  }
  return out;
}

std::size_t event_journal::size() const {
  auto lock = std::scoped_lock{mutex_};
  return events_.size();
}

}  // namespace warden::security
