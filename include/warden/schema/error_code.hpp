#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: error code.
// Outcomes of capability store and trust engine operations.
namespace warden::schema {

enum class error_code : uint32_t {
  ok = 0,
  not_found = 1,
  already_exists = 2,
  invalid_resource = 3,
  signature_required = 4,
  quota_exceeded = 5,
  delegation_not_allowed = 6,
  trust_frozen = 7,
  insufficient_trust = 8,
  identity_revoked = 9,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"not_found", error_code::not_found},
    std::pair<std::string_view, error_code>{"already_exists",
                                            error_code::already_exists},
    std::pair<std::string_view, error_code>{"invalid_resource",
                                            error_code::invalid_resource},
    std::pair<std::string_view, error_code>{"signature_required",
                                            error_code::signature_required},
    std::pair<std::string_view, error_code>{"quota_exceeded",
                                            error_code::quota_exceeded},
    std::pair<std::string_view, error_code>{
        "delegation_not_allowed", error_code::delegation_not_allowed},
    std::pair<std::string_view, error_code>{"trust_frozen",
                                            error_code::trust_frozen},
    std::pair<std::string_view, error_code>{"insufficient_trust",
                                            error_code::insufficient_trust},
    std::pair<std::string_view, error_code>{"identity_revoked",
                                            error_code::identity_revoked},
};

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace warden::schema
