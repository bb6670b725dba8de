#pragma once

#include <warden/schema/enum_string.hpp>
#include <warden/schema/sanitize_error_code.hpp>
#include <warden/schema/taint.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::sanitize {

enum class sanitizer_kind : uint8_t {
  xss = 0,
  sql = 1,
  path_traversal = 2,
  prompt_injection = 3,
  ssrf = 4,
  log_injection = 5,
  deserialization = 6,
};

inline constexpr auto kSanitizerKindMappings = std::array{
    std::pair<std::string_view, sanitizer_kind>{"xss", sanitizer_kind::xss},
    std::pair<std::string_view, sanitizer_kind>{"sql", sanitizer_kind::sql},
    std::pair<std::string_view, sanitizer_kind>{
        "path_traversal", sanitizer_kind::path_traversal},
    std::pair<std::string_view, sanitizer_kind>{
        "prompt_injection", sanitizer_kind::prompt_injection},
    std::pair<std::string_view, sanitizer_kind>{"ssrf", sanitizer_kind::ssrf},
    std::pair<std::string_view, sanitizer_kind>{
        "log_injection", sanitizer_kind::log_injection},
    std::pair<std::string_view, sanitizer_kind>{
        "deserialization", sanitizer_kind::deserialization},
};

inline constexpr std::string_view to_string(const sanitizer_kind value) {
  return warden::schema::to_string(value, kSanitizerKindMappings)
      .value_or("unknown");
}

enum class sql_mode_t : uint8_t {
  identifier = 0,
  like = 1,
};

enum class payload_format_t : uint8_t {
  json = 0,
  binary_term = 1,
};

/// Largest value the pattern-matching sanitizers will scan.
inline constexpr std::size_t kDefaultMaxInputBytes = 64 * 1024;

/// Resolve `host` to textual IP addresses. Returns std::nullopt on failure
/// or when `timeout` elapses.
using resolver_t = std::function<std::optional<std::vector<std::string>>(
    std::string_view host,
    std::chrono::milliseconds timeout)>;

/// Per-call options. Each sanitizer reads only its own fields; a required
/// field left unset fails the call with `missing_option`.
struct sanitize_options final {
  // xss, prompt injection: longer values fail with `too_large`
  std::size_t max_input_bytes{kDefaultMaxInputBytes};

  // path traversal
  std::optional<std::filesystem::path> allowed_root;

  // sql
  std::optional<std::vector<std::string>> allowed_identifiers;
  sql_mode_t sql_mode{sql_mode_t::identifier};

  // ssrf
  std::optional<std::vector<std::string>> allowed_schemes;
  std::optional<std::vector<uint16_t>> allowed_ports;
  bool allow_private{false};
  resolver_t resolver;
  std::chrono::milliseconds resolve_timeout{2000};

  // prompt injection
  std::optional<std::string> nonce;
  uint32_t fail_threshold{2};

  // deserialization
  payload_format_t format{payload_format_t::json};
  uint32_t max_depth{32};
  uint64_t max_size{10000};
  uint64_t max_byte_size{1024 * 1024};
  std::vector<std::string> known_atoms;

  // log injection
  std::size_t max_length{4096};
  bool redact{false};
};

/// Outcome of one sanitize call. On failure `value` is empty and `taint`
/// is the caller's taint unchanged.
struct sanitize_result final {
  warden::schema::sanitize_error_code code{
      warden::schema::sanitize_error_code::ok};
  std::string value;
  warden::schema::taint_t taint;
  /// Offending host, address or pattern summary on failure. On success the
  /// pinned address for SSRF and the delimiter nonce for prompt injection.
  std::string detail;
  std::vector<std::string> patterns;

  bool ok() const { return code == warden::schema::sanitize_error_code::ok; }
};

/// Read-only audit probe. `score` is a risk estimate in [0, 1].
struct detect_result final {
  bool safe{true};
  double score{};
  std::vector<std::string> patterns;
};

sanitize_result make_success(std::string value,
                             const warden::schema::taint_t& taint,
                             warden::schema::sanitization_t applied,
                             warden::schema::confidence_t certified,
                             std::string detail = {});

sanitize_result make_failure(warden::schema::sanitize_error_code code,
                             const warden::schema::taint_t& taint,
                             std::string detail,
                             std::vector<std::string> patterns = {});

detect_result make_detection(std::vector<std::string> patterns,
                             double score_per_pattern = 0.5);

}  // namespace warden::sanitize
