#pragma once

#include <warden/sanitize/sanitizer.hpp>

#include <string>
#include <string_view>

namespace warden::sanitize {

/// Neutralizes markup before it reaches an HTML sink.
///
/// Decoding runs first so that percent-encoded or `\uXXXX`-escaped payloads
/// are seen in their final form. Script blocks, `javascript:` style URIs,
/// event-handler attributes and CSS `expression()` are neutralized on the
/// decoded text, and the five HTML-critical characters are entity-encoded
/// last, so the output never carries a raw `< > & " '`.
struct xss_sanitizer final {
  static constexpr auto kind = sanitizer_kind::xss;

  sanitize_result sanitize(std::string_view value,
                           const warden::schema::taint_t& taint,
                           const sanitize_options& options) const;

  detect_result detect(std::string_view value) const;
};

/// Percent-decode until the value stops changing, at most `max_rounds`.
std::string url_decode(std::string_view value, int max_rounds = 3);

/// Replace `\uXXXX` escapes (and surrogate pairs) with UTF-8.
std::string normalize_unicode_escapes(std::string_view value);

std::string encode_html_entities(std::string_view value);

}  // namespace warden::sanitize
