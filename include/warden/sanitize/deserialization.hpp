#pragma once

#include <warden/sanitize/binary_term.hpp>
#include <warden/sanitize/sanitizer.hpp>

#include <json/json.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace warden::sanitize {

/// Decodes an untrusted payload and enforces structural caps before the
/// result reaches business logic.
///
/// JSON nesting depth counts containers: a scalar is depth 0 and `[[1]]` is
/// depth 2. A payload exactly at `max_depth` is accepted. On success the
/// value is the canonical re-encoding of the decoded payload.
struct deserialization_sanitizer final {
  static constexpr auto kind = sanitizer_kind::deserialization;

  sanitize_result sanitize(std::string_view value,
                           const warden::schema::taint_t& taint,
                           const sanitize_options& options) const;

  detect_result detect(std::string_view value) const;
};

struct json_decode_result final {
  warden::schema::sanitize_error_code code{
      warden::schema::sanitize_error_code::ok};
  Json::Value value;
  std::string detail;
};

json_decode_result decode_json(std::string_view input,
                               uint32_t max_depth,
                               uint64_t max_size);

/// Deepest container nesting in `input`, ignoring brackets inside strings.
/// Runs without building a document so hostile nesting is rejected cheaply.
uint32_t scan_json_depth(std::string_view input);

}  // namespace warden::sanitize
