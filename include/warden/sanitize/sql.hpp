#pragma once

#include <warden/sanitize/sanitizer.hpp>

#include <string>
#include <string_view>

namespace warden::sanitize {

/// Guards the two places a query cannot be parameterized: dynamic
/// identifiers and LIKE patterns. Values belong in bound parameters.
///
/// Identifier mode accepts only an exact member of
/// `sanitize_options::allowed_identifiers`; there is no default list.
/// LIKE mode escapes `\`, `%` and `_` so the value matches literally; the
/// query must declare `ESCAPE '\'`.
struct sql_sanitizer final {
  static constexpr auto kind = sanitizer_kind::sql;

  sanitize_result sanitize(std::string_view value,
                           const warden::schema::taint_t& taint,
                           const sanitize_options& options) const;

  detect_result detect(std::string_view value) const;
};

std::string escape_like(std::string_view value);

}  // namespace warden::sanitize
