#include <warden/sanitize/registry.hpp>

#include <warden/common/critical.hpp>

namespace warden::sanitize {

const sanitizer_t& registry::find(const sanitizer_kind kind) {
  for (const auto& entry : entries) {
    auto matches = std::visit(
        [&](const auto& sanitizer) { return sanitizer.kind == kind; }, entry);
    if (matches) {
      return entry;
    }
  }
  warden::common::critical("sanitizer registry is missing a kind");
}

sanitize_result registry::sanitize(const sanitizer_kind kind,
                                   const std::string_view value,
                                   const warden::schema::taint_t& taint,
                                   const sanitize_options& options) {
  return std::visit(
      [&](const auto& sanitizer) {
        return sanitizer.sanitize(value, taint, options);
      },
      find(kind));
}

detect_result registry::detect(const sanitizer_kind kind,
                               const std::string_view value) {
  return std::visit(
      [&](const auto& sanitizer) { return sanitizer.detect(value); },
      find(kind));
}

std::vector<std::pair<sanitizer_kind, detect_result>> registry::scan(
    const std::string_view value) {
  auto flagged = std::vector<std::pair<sanitizer_kind, detect_result>>{};
  for (const auto& entry : entries) {
    std::visit(
        [&](const auto& sanitizer) {
          auto result = sanitizer.detect(value);
          if (!result.safe) {
            flagged.emplace_back(sanitizer.kind, std::move(result));
          }
        },
        entry);
  }
  return flagged;
}

std::optional<sanitizer_kind> try_sanitizer_kind(const std::string_view name) {
  return warden::schema::from_string(name, kSanitizerKindMappings);
}

}  // namespace warden::sanitize
