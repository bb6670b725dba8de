#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: security event type.
// Audit taxonomy handed to the external audit collaborator.
namespace warden::schema {

enum class security_event_type_t : uint16_t {
  capability_granted = 1,
  capability_revoked = 2,
  authorization_denied = 3,
  tier_changed = 4,
  trust_frozen = 5,
  trust_unfrozen = 6,
  circuit_breaker_tripped = 7,
  profile_deleted = 8,
};

inline constexpr auto kSecurityEventTypeMappings = std::array{
    std::pair<std::string_view, security_event_type_t>{
        "capability_granted", security_event_type_t::capability_granted},
    std::pair<std::string_view, security_event_type_t>{
        "capability_revoked", security_event_type_t::capability_revoked},
    std::pair<std::string_view, security_event_type_t>{
        "authorization_denied", security_event_type_t::authorization_denied},
    std::pair<std::string_view, security_event_type_t>{
        "tier_changed", security_event_type_t::tier_changed},
    std::pair<std::string_view, security_event_type_t>{
        "trust_frozen", security_event_type_t::trust_frozen},
    std::pair<std::string_view, security_event_type_t>{
        "trust_unfrozen", security_event_type_t::trust_unfrozen},
    std::pair<std::string_view, security_event_type_t>{
        "circuit_breaker_tripped",
        security_event_type_t::circuit_breaker_tripped},
    std::pair<std::string_view, security_event_type_t>{
        "profile_deleted", security_event_type_t::profile_deleted},
};

inline constexpr std::string_view to_string(const security_event_type_t value) {
  return to_string(value, kSecurityEventTypeMappings).value_or("unknown");
}

}  // namespace warden::schema
