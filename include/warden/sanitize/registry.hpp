#pragma once

#include <warden/sanitize/deserialization.hpp>
#include <warden/sanitize/log_injection.hpp>
#include <warden/sanitize/path.hpp>
#include <warden/sanitize/prompt_injection.hpp>
#include <warden/sanitize/sanitizer.hpp>
#include <warden/sanitize/sql.hpp>
#include <warden/sanitize/ssrf.hpp>
#include <warden/sanitize/xss.hpp>

#include <array>
#include <optional>
#include <string_view>
#include <variant>

namespace warden::sanitize {

/// The closed set of sanitizers. New kinds are added here and to
/// `registry::entries`, never loaded at runtime.
using sanitizer_t = std::variant<xss_sanitizer,
                                 sql_sanitizer,
                                 path_sanitizer,
                                 prompt_injection_sanitizer,
                                 ssrf_sanitizer,
                                 log_injection_sanitizer,
                                 deserialization_sanitizer>;

/// Ordered dispatch table over every sanitizer kind.
class registry final {
 public:
  static constexpr auto entries = std::array<sanitizer_t, 7>{
      xss_sanitizer{},          sql_sanitizer{},
      path_sanitizer{},         prompt_injection_sanitizer{},
      ssrf_sanitizer{},         log_injection_sanitizer{},
      deserialization_sanitizer{}};

  static const sanitizer_t& find(sanitizer_kind kind);

  static sanitize_result sanitize(sanitizer_kind kind,
                                  std::string_view value,
                                  const warden::schema::taint_t& taint,
                                  const sanitize_options& options);

  static detect_result detect(sanitizer_kind kind, std::string_view value);

  /// Run every detector and report the kinds that flagged `value`.
  static std::vector<std::pair<sanitizer_kind, detect_result>> scan(
      std::string_view value);
};

std::optional<sanitizer_kind> try_sanitizer_kind(std::string_view name);

}  // namespace warden::sanitize
