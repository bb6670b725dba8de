#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/trust_event_type.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct trust_event_record;

template <>
struct trust_event_record<1> final {
  uint16_t version{1};
  agent_id_t agent_id;
  trust_event_type_t type{};
  std::map<std::string, std::string> metadata;
  timestamp_milliseconds_t recorded_at{};
};

using trust_event_record_t = trust_event_record<1>;

}  // namespace warden::schema
