#include <gtest/gtest.h>
#include <warden/schema/taint.hpp>

using warden::schema::confidence_t;
using warden::schema::sanitization_t;
using warden::schema::taint_level_t;
using warden::schema::taint_role_t;

TEST(taint, apply_sanitization_sets_bit_and_replaces_confidence) {
  auto taint = warden::schema::taint_t{};
  taint.source = "http";
  auto out = warden::schema::apply_sanitization(taint, sanitization_t::xss,
                                                confidence_t::verified);
  EXPECT_TRUE(warden::schema::is_sanitized(out, sanitization_t::xss));
  EXPECT_FALSE(
      warden::schema::is_sanitized(out, sanitization_t::sql_injection));
  EXPECT_EQ(out.confidence, confidence_t::verified);
  EXPECT_EQ(out.level, taint_level_t::untrusted);
  EXPECT_EQ(out.source, "http");
  EXPECT_EQ(taint.sanitizations, 0u);
}

TEST(taint, applied_bits_are_never_cleared) {
  auto taint = warden::schema::apply_sanitization(
      warden::schema::taint_t{}, sanitization_t::xss, confidence_t::verified);
  taint = warden::schema::apply_sanitization(
      taint, sanitization_t::prompt_injection, confidence_t::plausible);
  EXPECT_TRUE(warden::schema::is_sanitized(taint, sanitization_t::xss));
  EXPECT_TRUE(
      warden::schema::is_sanitized(taint, sanitization_t::prompt_injection));
  EXPECT_EQ(taint.confidence, confidence_t::plausible);
}

TEST(taint, has_sanitizations_requires_every_bit) {
  auto taint = warden::schema::apply_sanitization(
      warden::schema::taint_t{}, sanitization_t::ssrf, confidence_t::verified);
  auto ssrf = warden::schema::bit(sanitization_t::ssrf);
  auto xss = warden::schema::bit(sanitization_t::xss);
  EXPECT_TRUE(warden::schema::has_sanitizations(taint, ssrf));
  EXPECT_FALSE(warden::schema::has_sanitizations(
      taint, static_cast<uint8_t>(ssrf | xss)));
  EXPECT_FALSE(warden::schema::has_sanitizations(warden::schema::taint_t{}, xss));
}

TEST(taint, sanitization_names_follow_bit_order) {
  auto mask = static_cast<uint8_t>(
      warden::schema::bit(sanitization_t::deserialization) |
      warden::schema::bit(sanitization_t::xss) |
      warden::schema::bit(sanitization_t::path_traversal));
  auto names = warden::schema::sanitization_names(mask);
  ASSERT_EQ(names.size(), 3u);
  EXPECT_EQ(names[0], "xss");
  EXPECT_EQ(names[1], "path_traversal");
  EXPECT_EQ(names[2], "deserialization");
}

TEST(taint, merge_takes_dirtier_level_weaker_confidence_common_bits) {
  auto left = warden::schema::taint_t{};
  left.level = taint_level_t::derived;
  left.confidence = confidence_t::verified;
  left.sanitizations = static_cast<uint8_t>(
      warden::schema::bit(sanitization_t::xss) |
      warden::schema::bit(sanitization_t::ssrf));

  auto right = warden::schema::taint_t{};
  right.level = taint_level_t::hostile;
  right.confidence = confidence_t::plausible;
  right.sanitizations = warden::schema::bit(sanitization_t::xss);
  right.source = "upload";

  auto merged = warden::schema::merge(left, right);
  EXPECT_EQ(merged.level, taint_level_t::hostile);
  EXPECT_EQ(merged.confidence, confidence_t::plausible);
  EXPECT_EQ(merged.sanitizations, warden::schema::bit(sanitization_t::xss));
  EXPECT_EQ(merged.source, "upload");
}

TEST(taint, propagate_returns_dirtiest_level) {
  EXPECT_EQ(warden::schema::propagate({}), taint_level_t::trusted);
  EXPECT_EQ(warden::schema::propagate({taint_level_t::trusted,
                                       taint_level_t::untrusted,
                                       taint_level_t::derived}),
            taint_level_t::untrusted);
}

TEST(taint, control_positions_refuse_untrusted_values) {
  EXPECT_TRUE(
      warden::schema::can_use_as(taint_level_t::trusted, taint_role_t::control));
  EXPECT_TRUE(
      warden::schema::can_use_as(taint_level_t::derived, taint_role_t::control));
  EXPECT_FALSE(warden::schema::can_use_as(taint_level_t::untrusted,
                                          taint_role_t::control));
  EXPECT_TRUE(
      warden::schema::can_use_as(taint_level_t::untrusted, taint_role_t::data));
  EXPECT_FALSE(
      warden::schema::can_use_as(taint_level_t::hostile, taint_role_t::data));
}
