#include <gtest/gtest.h>
#include <warden/sanitize/registry.hpp>
#include <warden/testing/common.hpp>

#include <algorithm>
#include <set>

namespace {

using warden::sanitize::sanitizer_kind;

bool flagged_by(
    const std::vector<std::pair<sanitizer_kind,
                                warden::sanitize::detect_result>>& flagged,
    const sanitizer_kind kind) {
  return std::any_of(std::begin(flagged), std::end(flagged),
                     [&](const auto& entry) { return entry.first == kind; });
}

}  // namespace

TEST(sanitize_registry, every_kind_has_one_entry) {
  auto kinds = std::set<sanitizer_kind>{};
  for (const auto& entry : warden::sanitize::registry::entries) {
    kinds.insert(std::visit([](const auto& s) { return s.kind; }, entry));
  }
  EXPECT_EQ(kinds.size(), warden::sanitize::kSanitizerKindMappings.size());
  for (const auto& [name, kind] : warden::sanitize::kSanitizerKindMappings) {
    auto found = std::visit([](const auto& s) { return s.kind; },
                            warden::sanitize::registry::find(kind));
    EXPECT_EQ(found, kind) << name;
  }
}

TEST(sanitize_registry, dispatches_by_kind) {
  auto options = warden::sanitize::sanitize_options{};
  auto result = warden::sanitize::registry::sanitize(
      sanitizer_kind::xss, "<b>", warden::testing::make_untrusted(), options);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value, "&lt;b&gt;");
  EXPECT_TRUE(warden::schema::is_sanitized(result.taint,
                                           warden::schema::sanitization_t::xss));

  auto logged = warden::sanitize::registry::sanitize(
      sanitizer_kind::log_injection, "a\nb", warden::testing::make_untrusted(),
      options);
  ASSERT_TRUE(logged.ok());
  EXPECT_EQ(logged.value, "ab");
}

TEST(sanitize_registry, scan_reports_flagging_detectors) {
  auto flagged =
      warden::sanitize::registry::scan("<script>alert(1)</script>\n");
  EXPECT_TRUE(flagged_by(flagged, sanitizer_kind::xss));
  EXPECT_TRUE(flagged_by(flagged, sanitizer_kind::log_injection));
  EXPECT_FALSE(flagged_by(flagged, sanitizer_kind::deserialization));

  auto safe_url = warden::sanitize::registry::scan("https://example.com/");
  EXPECT_FALSE(flagged_by(safe_url, sanitizer_kind::ssrf));
  EXPECT_FALSE(flagged_by(safe_url, sanitizer_kind::xss));
}

TEST(sanitize_registry, kind_names_round_trip) {
  EXPECT_EQ(warden::sanitize::to_string(sanitizer_kind::path_traversal),
            "path_traversal");
  EXPECT_EQ(warden::sanitize::try_sanitizer_kind("ssrf"), sanitizer_kind::ssrf);
  EXPECT_FALSE(warden::sanitize::try_sanitizer_kind("shell").has_value());
}
