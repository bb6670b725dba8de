#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: taint.
// Metadata carried beside an untrusted value: where it came from, which
// sanitizers have scrutinized it and how strongly that scrutiny is certified.
namespace warden::schema {

/// Ordered weakest to strongest.
enum class confidence_t : uint8_t {
  unverified = 0,
  plausible = 1,
  verified = 2,
};

/// Ordered cleanest to dirtiest.
enum class taint_level_t : uint8_t {
  trusted = 0,
  derived = 1,
  untrusted = 2,
  hostile = 3,
};

/// How a value is about to be used.
enum class taint_role_t : uint8_t {
  control = 0,
  data = 1,
};

/// One bit per sanitizer. The command bit is reserved for command reflexes.
enum class sanitization_t : uint8_t {
  xss = 1u << 0u,
  sql_injection = 1u << 1u,
  command_injection = 1u << 2u,
  path_traversal = 1u << 3u,
  prompt_injection = 1u << 4u,
  ssrf = 1u << 5u,
  log_injection = 1u << 6u,
  deserialization = 1u << 7u,
};

struct taint_t final {
  taint_level_t level{taint_level_t::untrusted};
  confidence_t confidence{confidence_t::unverified};
  uint8_t sanitizations{};
  std::string source;
};

inline constexpr auto kConfidenceMappings = std::array{
    std::pair<std::string_view, confidence_t>{"unverified",
                                              confidence_t::unverified},
    std::pair<std::string_view, confidence_t>{"plausible",
                                              confidence_t::plausible},
    std::pair<std::string_view, confidence_t>{"verified",
                                              confidence_t::verified},
};

inline constexpr auto kTaintLevelMappings = std::array{
    std::pair<std::string_view, taint_level_t>{"trusted",
                                               taint_level_t::trusted},
    std::pair<std::string_view, taint_level_t>{"derived",
                                               taint_level_t::derived},
    std::pair<std::string_view, taint_level_t>{"untrusted",
                                               taint_level_t::untrusted},
    std::pair<std::string_view, taint_level_t>{"hostile",
                                               taint_level_t::hostile},
};

inline constexpr auto kSanitizationMappings = std::array{
    std::pair<std::string_view, sanitization_t>{"xss", sanitization_t::xss},
    std::pair<std::string_view, sanitization_t>{
        "sql_injection", sanitization_t::sql_injection},
    std::pair<std::string_view, sanitization_t>{
        "command_injection", sanitization_t::command_injection},
    std::pair<std::string_view, sanitization_t>{
        "path_traversal", sanitization_t::path_traversal},
    std::pair<std::string_view, sanitization_t>{
        "prompt_injection", sanitization_t::prompt_injection},
    std::pair<std::string_view, sanitization_t>{"ssrf", sanitization_t::ssrf},
    std::pair<std::string_view, sanitization_t>{
        "log_injection", sanitization_t::log_injection},
    std::pair<std::string_view, sanitization_t>{
        "deserialization", sanitization_t::deserialization},
};

template <>
inline std::optional<confidence_t> try_from_string<confidence_t>(
    const std::string_view value) {
  return from_string(value, kConfidenceMappings);
}

template <>
inline std::optional<taint_level_t> try_from_string<taint_level_t>(
    const std::string_view value) {
  return from_string(value, kTaintLevelMappings);
}

template <>
inline std::optional<sanitization_t> try_from_string<sanitization_t>(
    const std::string_view value) {
  return from_string(value, kSanitizationMappings);
}

inline constexpr std::string_view to_string(const confidence_t value) {
  return to_string(value, kConfidenceMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const taint_level_t value) {
  return to_string(value, kTaintLevelMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const sanitization_t value) {
  return to_string(value, kSanitizationMappings).value_or("unknown");
}

inline constexpr uint8_t bit(const sanitization_t value) {
  return static_cast<uint8_t>(value);
}

/// Return a copy of `taint` with `applied` set and confidence replaced by
/// `certified`. Existing bits are never cleared.
taint_t apply_sanitization(const taint_t& taint,
                           sanitization_t applied,
                           confidence_t certified);

bool is_sanitized(const taint_t& taint, sanitization_t sanitization);

/// True when every bit in `required_mask` is present. An empty mask on the
/// value never satisfies a non-empty requirement.
bool has_sanitizations(const taint_t& taint, uint8_t required_mask);

/// Names of the bits set in `mask`, in bit order.
std::vector<std::string_view> sanitization_names(uint8_t mask);

/// Combine the taints of two inputs into the taint of a derived value: the
/// dirtier level, the weaker confidence and only the bits both inputs carry.
taint_t merge(const taint_t& left, const taint_t& right);

/// Dirtiest level among `levels`; trusted when empty.
taint_level_t propagate(const std::vector<taint_level_t>& levels);

/// Control positions (paths, commands, URLs) accept trusted or derived
/// values only. Data positions refuse hostile values.
bool can_use_as(taint_level_t level, taint_role_t role);

}  // namespace warden::schema
