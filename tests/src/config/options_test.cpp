#include <gtest/gtest.h>
#include <warden/config/options.hpp>
#include <warden/testing/common.hpp>

#include <fstream>
#include <sstream>
#include <string>

namespace {

std::optional<warden::config::options> parse(const std::string& text,
                                             std::string& error) {
  auto input = std::istringstream{text};
  return warden::config::parse(input, error);
}

}  // namespace

TEST(config_options, defaults_from_empty_document) {
  auto error = std::string{};
  auto options = parse("", error);
  ASSERT_TRUE(options.has_value()) << error;

  EXPECT_FALSE(options->kernel.require_identity);
  EXPECT_FALSE(options->kernel.disclose_denial_reasons);
  EXPECT_FALSE(options->kernel.check_timeout.has_value());
  EXPECT_EQ(options->capabilities.max_per_principal, 1000u);
  EXPECT_EQ(options->capabilities.max_delegation_depth, 10u);
  EXPECT_DOUBLE_EQ(options->trust.weights.security, 0.25);
  EXPECT_EQ(options->trust.breaker_rules.size(), 3u);
  EXPECT_EQ(options->trust.decay.grace, 7 * warden::schema::kMillisecondsPerDay);
  EXPECT_FALSE(options->sanitize.allowed_root.has_value());
  EXPECT_EQ(options->sanitize.max_length, 4096u);
  EXPECT_EQ(options->log_level, "info");
}

TEST(config_options, reads_sections) {
  auto error = std::string{};
  auto options = parse(R"(
[kernel]
require_identity = true
check_timeout_ms = 250

[capabilities]
require_signatures = true
max_per_principal = 50

[trust]
weight_success_rate = 0.40
weight_uptime = 0.10
weight_security = 0.30
weight_test_pass = 0.10
weight_rollback = 0.10
circuit_breaker = false

[decay]
grace_days = 3
floor = 0

[sanitize]
allowed_root = /srv/workspace
redact = true

[log]
level = debug
file = /var/log/warden.log
)",
                       error);
  ASSERT_TRUE(options.has_value()) << error;

  EXPECT_TRUE(options->kernel.require_identity);
  ASSERT_TRUE(options->kernel.check_timeout.has_value());
  EXPECT_EQ(options->kernel.check_timeout->count(), 250);
  EXPECT_TRUE(options->capabilities.require_signatures);
  EXPECT_EQ(options->capabilities.max_per_principal, 50u);
  EXPECT_DOUBLE_EQ(options->trust.weights.success_rate, 0.40);
  EXPECT_FALSE(options->circuit_breaker);
  EXPECT_TRUE(options->trust.breaker_rules.empty());
  EXPECT_EQ(options->trust.decay.grace, 3 * warden::schema::kMillisecondsPerDay);
  EXPECT_EQ(options->trust.decay.floor, 0u);
  ASSERT_TRUE(options->sanitize.allowed_root.has_value());
  EXPECT_EQ(options->sanitize.allowed_root->string(), "/srv/workspace");
  EXPECT_TRUE(options->sanitize.redact);
  EXPECT_EQ(options->log_level, "debug");
  EXPECT_EQ(options->log_file, "/var/log/warden.log");
}

TEST(config_options, rejects_unknown_keys) {
  auto error = std::string{};
  EXPECT_FALSE(parse("[kernel]\nstrictness = high\n", error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(config_options, rejects_weights_not_summing_to_one) {
  auto error = std::string{};
  EXPECT_FALSE(parse("[trust]\nweight_security = 0.50\n", error).has_value());
  EXPECT_NE(error.find("sum to 1"), std::string::npos);
}

TEST(config_options, rejects_out_of_range_values) {
  auto error = std::string{};
  EXPECT_FALSE(
      parse("[capabilities]\nmax_delegation_depth = 300\n", error).has_value());
  EXPECT_FALSE(parse("[decay]\nfloor = 101\n", error).has_value());
  EXPECT_FALSE(parse("[log]\nlevel = verbose\n", error).has_value());
  EXPECT_NE(error.find("verbose"), std::string::npos);
  EXPECT_FALSE(parse("[kernel]\nrequire_identity = maybe\n", error).has_value());
}

TEST(config_options, load_reads_file) {
  const auto dir = warden::testing::make_temp_dir("warden_config");
  const auto path = (dir / "warden.ini").string();
  {
    auto file = std::ofstream{path};
    file << "[kernel]\ndisclose_denial_reasons = true\n";
  }

  auto error = std::string{};
  auto options = warden::config::load(path, error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_TRUE(options->kernel.disclose_denial_reasons);

  EXPECT_FALSE(
      warden::config::load((dir / "missing.ini").string(), error).has_value());
  EXPECT_NE(error.find("missing.ini"), std::string::npos);
  warden::testing::remove_path(dir);
}
