#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/security_event_severity.hpp>
#include <warden/schema/security_event_type.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct security_event_record;

template <>
struct security_event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  security_event_type_t type{};
  security_event_severity_t severity{};
  agent_id_t principal;
  std::optional<capability_id_t> capability_id;
  std::optional<std::string> resource;
  std::string message;
  timestamp_milliseconds_t recorded_at{};
};

using security_event_record_t = security_event_record<1>;

}  // namespace warden::schema
