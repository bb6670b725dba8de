#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: authorization code.
// Decision returned by the kernel. Only `authorized` permits the action.
namespace warden::schema {

enum class authorization_code : uint32_t {
  authorized = 0,
  pending_approval = 1,
  unauthorized = 2,
  trust_frozen = 3,
  insufficient_trust = 4,
  constraint_violated = 5,
  rate_limited = 6,
  reflex_blocked = 7,
};

inline constexpr auto kAuthorizationCodeMappings = std::array{
    std::pair<std::string_view, authorization_code>{
        "authorized", authorization_code::authorized},
    std::pair<std::string_view, authorization_code>{
        "pending_approval", authorization_code::pending_approval},
    std::pair<std::string_view, authorization_code>{
        "unauthorized", authorization_code::unauthorized},
    std::pair<std::string_view, authorization_code>{
        "trust_frozen", authorization_code::trust_frozen},
    std::pair<std::string_view, authorization_code>{
        "insufficient_trust", authorization_code::insufficient_trust},
    std::pair<std::string_view, authorization_code>{
        "constraint_violated", authorization_code::constraint_violated},
    std::pair<std::string_view, authorization_code>{
        "rate_limited", authorization_code::rate_limited},
    std::pair<std::string_view, authorization_code>{
        "reflex_blocked", authorization_code::reflex_blocked},
};

inline constexpr std::string_view to_string(const authorization_code value) {
  return to_string(value, kAuthorizationCodeMappings).value_or("unknown");
}

}  // namespace warden::schema
