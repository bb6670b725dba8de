#include <gtest/gtest.h>
#include <warden/sanitize/sql.hpp>
#include <warden/testing/common.hpp>

#include <string>
#include <vector>

TEST(sql, like_mode_escapes_wildcards_and_backslash) {
  auto options = warden::sanitize::sanitize_options{};
  options.sql_mode = warden::sanitize::sql_mode_t::like;
  auto result = warden::sanitize::sql_sanitizer{}.sanitize(
      "50%_off\\", warden::testing::make_untrusted(), options);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value, "50\\%\\_off\\\\");
  EXPECT_EQ(result.taint.confidence, warden::schema::confidence_t::plausible);
  EXPECT_TRUE(warden::schema::is_sanitized(
      result.taint, warden::schema::sanitization_t::sql_injection));
}

TEST(sql, like_escape_leaves_no_unescaped_wildcard) {
  auto escaped = warden::sanitize::escape_like("%%__\\%");
  for (std::size_t i = 0; i < escaped.size(); ++i) {
    if (escaped[i] == '\\') {
      ++i;
      continue;
    }
    EXPECT_NE(escaped[i], '%');
    EXPECT_NE(escaped[i], '_');
  }
}

TEST(sql, identifier_mode_requires_an_allowlist) {
  auto result = warden::sanitize::sql_sanitizer{}.sanitize(
      "name", warden::testing::make_untrusted(), {});
  EXPECT_EQ(result.code, warden::schema::sanitize_error_code::missing_option);
  EXPECT_EQ(result.detail, "allowed_identifiers");
  EXPECT_TRUE(result.value.empty());
}

TEST(sql, identifier_mode_accepts_exact_members_only) {
  auto options = warden::sanitize::sanitize_options{};
  options.allowed_identifiers = std::vector<std::string>{"name", "created_at"};
  auto sanitizer = warden::sanitize::sql_sanitizer{};

  auto accepted =
      sanitizer.sanitize("created_at", warden::testing::make_untrusted(),
                         options);
  ASSERT_TRUE(accepted.ok());
  EXPECT_EQ(accepted.value, "created_at");
  EXPECT_EQ(accepted.taint.confidence, warden::schema::confidence_t::verified);

  auto taint = warden::testing::make_untrusted();
  for (const auto* candidate :
       {"Name", "name; DROP TABLE users", "name ", "created_at--"}) {
    auto refused = sanitizer.sanitize(candidate, taint, options);
    EXPECT_EQ(refused.code,
              warden::schema::sanitize_error_code::identifier_not_allowed)
        << candidate;
    EXPECT_EQ(refused.detail, candidate);
    EXPECT_EQ(refused.taint.sanitizations, taint.sanitizations);
  }
}

TEST(sql, detect_scores_each_pattern) {
  auto sanitizer = warden::sanitize::sql_sanitizer{};
  auto union_only = sanitizer.detect("1 UNION SELECT password FROM users");
  EXPECT_FALSE(union_only.safe);
  ASSERT_EQ(union_only.patterns.size(), 1u);
  EXPECT_EQ(union_only.patterns[0], "union_select");
  EXPECT_DOUBLE_EQ(union_only.score, 0.34);

  auto tautology = sanitizer.detect("' OR 1=1 --");
  EXPECT_FALSE(tautology.safe);
  EXPECT_DOUBLE_EQ(tautology.score, 1.0);

  EXPECT_TRUE(sanitizer.detect("O'Brien").safe);
}

TEST(sql, detect_handles_long_values) {
  auto sanitizer = warden::sanitize::sql_sanitizer{};
  auto padded = sanitizer.detect("1 UNION SELECT " + std::string(60000, 'a'));
  ASSERT_EQ(padded.patterns.size(), 1u);
  EXPECT_EQ(padded.patterns[0], "union_select");

  auto oversized = sanitizer.detect(std::string(100000, 'a'));
  EXPECT_FALSE(oversized.safe);
  EXPECT_EQ(oversized.patterns[0], "too_large");
}
