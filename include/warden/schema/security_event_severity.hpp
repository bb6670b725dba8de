#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: security event severity.
namespace warden::schema {

enum class security_event_severity_t : uint8_t {
  info = 1,
  warning = 2,
  error = 3,
  critical = 4,
};

inline constexpr auto kSecurityEventSeverityMappings = std::array{
    std::pair<std::string_view, security_event_severity_t>{
        "info", security_event_severity_t::info},
    std::pair<std::string_view, security_event_severity_t>{
        "warning", security_event_severity_t::warning},
    std::pair<std::string_view, security_event_severity_t>{
        "error", security_event_severity_t::error},
    std::pair<std::string_view, security_event_severity_t>{
        "critical", security_event_severity_t::critical},
};

inline constexpr std::string_view to_string(
    const security_event_severity_t value) {
  return to_string(value, kSecurityEventSeverityMappings).value_or("unknown");
}

}  // namespace warden::schema
