#pragma once

#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: capability.
// An unforgeable grant of one action on one resource to one principal.
namespace warden::schema {

enum class match_mode_t : uint8_t {
  exact = 0,
  /// Also covers descendants on a path-segment boundary. Opt-in only.
  prefix = 1,
};

inline constexpr auto kMatchModeMappings = std::array{
    std::pair<std::string_view, match_mode_t>{"exact", match_mode_t::exact},
    std::pair<std::string_view, match_mode_t>{"prefix", match_mode_t::prefix},
};

template <>
inline std::optional<match_mode_t> try_from_string<match_mode_t>(
    const std::string_view value) {
  return from_string(value, kMatchModeMappings);
}

inline constexpr std::string_view to_string(const match_mode_t value) {
  return to_string(value, kMatchModeMappings).value_or("unknown");
}

struct rate_limit_constraint_t final {
  uint32_t limit{};
  duration_milliseconds_t window{60 * kMillisecondsPerSecond};
};

/// Hours in UTC, [start_hour, end_hour). Wraps past midnight when
/// start_hour > end_hour.
struct time_window_constraint_t final {
  uint8_t start_hour{};
  uint8_t end_hour{24};
};

struct capability_constraints_t final {
  std::optional<rate_limit_constraint_t> rate_limit;
  std::optional<time_window_constraint_t> time_window;
};

template <uint16_t Version>
struct capability;

template <>
struct capability<1> final {
  uint16_t version{1};
  capability_id_t id;
  agent_id_t principal_id;
  std::string resource_uri;
  std::string action;
  timestamp_milliseconds_t granted_at{};
  std::optional<timestamp_milliseconds_t> expires_at;
  std::optional<ed25519_signature_t> signature;
  std::optional<timestamp_milliseconds_t> revoked_at;
  agent_id_t issuer_id;
  std::optional<capability_id_t> parent_id;
  uint8_t delegation_depth{3};
  match_mode_t match_mode{match_mode_t::exact};
  capability_constraints_t constraints;
};

using capability_t = capability<1>;

}  // namespace warden::schema
