#pragma once

#include <warden/sanitize/sanitizer.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace warden::sanitize {

/// Confines a caller-supplied path to `sanitize_options::allowed_root`.
///
/// The result is the canonical absolute path with symlinks resolved, so a
/// link inside the root that points outside it is rejected.
struct path_sanitizer final {
  static constexpr auto kind = sanitizer_kind::path_traversal;

  sanitize_result sanitize(std::string_view value,
                           const warden::schema::taint_t& taint,
                           const sanitize_options& options) const;

  detect_result detect(std::string_view value) const;
};

/// Reason the raw input is refused before any filesystem access: empty_path,
/// null_byte, backslash or encoded_traversal.
std::optional<std::string> reject_path_input(std::string_view value);

/// Canonical form of `value` resolved beneath `root`, or std::nullopt when it
/// escapes the root or the root itself cannot be canonicalized.
std::optional<std::filesystem::path> resolve_within(
    std::string_view value,
    const std::filesystem::path& root);

/// Join a relative component to `root`. Absolute components are refused.
std::optional<std::filesystem::path> safe_join(
    const std::filesystem::path& root,
    std::string_view component);

}  // namespace warden::sanitize
