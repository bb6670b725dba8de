#include <warden/sanitize/path.hpp>
#include <warden/sanitize/xss.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>
#include <utility>

namespace warden::sanitize {

namespace {

constexpr auto kEncodedTraversal = std::array<std::string_view, 9>{
    "%2e%2e", "%2e.", ".%2e", "%252e", "%c0%ae", "%c0%af", "%2f..", "..%2f",
    "%5c"};

std::string lowercase(const std::string_view value) {
  auto out = std::string{value};
  std::transform(std::begin(out), std::end(out), std::begin(out),
                 [](const unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return out;
}

bool has_dot_dot_segment(const std::string_view value) {
  auto path = std::filesystem::path{std::string{value}};
  for (const auto& part : path) {
    if (part == "..") {
      return true;
    }
  }
  return false;
}

bool is_within(const std::filesystem::path& candidate,
               const std::filesystem::path& root) {
  auto relative = candidate.lexically_relative(root);
  if (relative.empty()) {
    return false;
  }
  auto first = *relative.begin();
  return first != "..";
}

}  // namespace

std::optional<std::string> reject_path_input(const std::string_view value) {
  if (value.empty()) {
    return "empty_path";
  }
  if (value.find('\0') != std::string_view::npos) {
    return "null_byte";
  }
  if (value.find('\\') != std::string_view::npos) {
    return "backslash";
  }
  auto lowered = lowercase(value);
  for (const auto pattern : kEncodedTraversal) {
    if (lowered.find(pattern) != std::string::npos) {
      return "encoded_traversal";
    }
  }
  // Whatever a later layer decodes must not add separators or a `..`.
  auto decoded = url_decode(value);
  constexpr auto kHostile = std::string_view{"\\\0", 2};
  if (decoded.find_first_of(kHostile) != std::string::npos ||
      std::count(std::begin(decoded), std::end(decoded), '/') !=
          std::count(std::begin(value), std::end(value), '/') ||
      (has_dot_dot_segment(decoded) && !has_dot_dot_segment(value))) {
    return "encoded_traversal";
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> resolve_within(
    const std::string_view value,
    const std::filesystem::path& root) {
  auto error = std::error_code{};
  auto canonical_root = std::filesystem::canonical(root, error);
  if (error) {
    spdlog::error("Allowed root '{}' cannot be canonicalized: {}",
                  root.string(), error.message());
    return std::nullopt;
  }

  auto input = std::filesystem::path{std::string{value}};
  auto candidate =
      input.is_absolute() ? input : canonical_root / input;
  auto resolved = std::filesystem::weakly_canonical(candidate, error);
  if (error) {
    return std::nullopt;
  }
  if (!is_within(resolved, canonical_root)) {
    return std::nullopt;
  }
  return resolved;
}

std::optional<std::filesystem::path> safe_join(
    const std::filesystem::path& root,
    const std::string_view component) {
  if (reject_path_input(component).has_value() ||
      std::filesystem::path{std::string{component}}.is_absolute()) {
    return std::nullopt;
  }
  return resolve_within(component, root);
}

sanitize_result path_sanitizer::sanitize(
    const std::string_view value,
    const warden::schema::taint_t& taint,
    const sanitize_options& options) const {
  if (!options.allowed_root.has_value()) {
    return make_failure(warden::schema::sanitize_error_code::missing_option,
                        taint, "allowed_root");
  }
  if (auto reason = reject_path_input(value); reason.has_value()) {
    return make_failure(warden::schema::sanitize_error_code::path_traversal,
                        taint, *reason);
  }
  auto resolved = resolve_within(value, *options.allowed_root);
  if (!resolved.has_value()) {
    return make_failure(warden::schema::sanitize_error_code::path_traversal,
                        taint, "outside_allowed_root");
  }
  return make_success(resolved->string(), taint,
                      warden::schema::sanitization_t::path_traversal,
                      warden::schema::confidence_t::verified);
}

detect_result path_sanitizer::detect(const std::string_view value) const {
  auto patterns = std::vector<std::string>{};
  if (auto reason = reject_path_input(value);
      reason.has_value() && *reason != "empty_path") {
    patterns.push_back(*reason);
  }
  if (value.find('\0') == std::string_view::npos && has_dot_dot_segment(value)) {
    patterns.emplace_back("dot_dot_segment");
  }
  if (!value.empty() && value.front() == '/') {
    patterns.emplace_back("absolute_path");
  }
  return make_detection(std::move(patterns));
}

}  // namespace warden::sanitize
