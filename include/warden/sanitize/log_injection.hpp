#pragma once

#include <warden/sanitize/sanitizer.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace warden::sanitize {

inline constexpr auto kTruncationMarker = std::string_view{"...[truncated]"};
inline constexpr auto kRedactionMarker = std::string_view{"[REDACTED]"};

/// Makes a value safe to embed in a single log line: no line breaks, no
/// terminal escape sequences, bounded length, and optionally no credentials.
struct log_injection_sanitizer final {
  static constexpr auto kind = sanitizer_kind::log_injection;

  sanitize_result sanitize(std::string_view value,
                           const warden::schema::taint_t& taint,
                           const sanitize_options& options) const;

  detect_result detect(std::string_view value) const;
};

/// Drop CR, LF, U+2028/U+2029, ANSI CSI/OSC sequences and every control
/// character other than tab.
std::string strip_control_sequences(std::string_view value);

/// Cut to at most `max_length` bytes on a UTF-8 boundary, ending with
/// `kTruncationMarker` when anything was removed.
std::string truncate(std::string_view value, std::size_t max_length);

/// Replace API keys, tokens, private key headers, passwords and connection
/// string credentials with `kRedactionMarker`.
std::string redact_credentials(std::string_view value);

/// Names of the credential kinds present in `value`.
std::vector<std::string> find_credentials(std::string_view value);

}  // namespace warden::sanitize
