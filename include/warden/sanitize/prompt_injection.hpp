#pragma once

#include <warden/sanitize/sanitizer.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace warden::sanitize {

inline constexpr auto kUntrustedTagPrefix = std::string_view{"untrusted_content_"};

/// Fences untrusted text for inclusion in a model prompt.
///
/// The fence tag embeds a per-call nonce that the caller also places in the
/// system instructions (see `system_instructions`), so content cannot close
/// the fence early. Text matching `fail_threshold` or more distinct
/// high-risk phrases is refused outright. Detection is heuristic: the
/// resulting confidence is never stronger than plausible.
struct prompt_injection_sanitizer final {
  static constexpr auto kind = sanitizer_kind::prompt_injection;

  sanitize_result sanitize(std::string_view value,
                           const warden::schema::taint_t& taint,
                           const sanitize_options& options) const;

  detect_result detect(std::string_view value) const;
};

/// 128-bit random nonce, hex encoded.
std::string make_nonce();

std::string wrap_untrusted(std::string_view value, std::string_view nonce);

/// Instruction text that tells the model how to treat content fenced with
/// `nonce`.
std::string system_instructions(std::string_view nonce);

/// Names of the distinct high-risk phrases present in `value`.
std::vector<std::string> match_high_risk_phrases(std::string_view value);

}  // namespace warden::sanitize
