#include <gtest/gtest.h>
#include <warden/security/identity_registry.hpp>
#include <warden/testing/kernel_fixture.hpp>

#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

using warden::schema::authorization_code;
using warden::schema::trust_tier_t;

constexpr auto kMinute = 60 * warden::schema::kMillisecondsPerSecond;

warden::security::kernel_options disclosing() {
  auto options = warden::security::kernel_options{};
  options.disclose_denial_reasons = true;
  return options;
}

warden::security::escalation_t answer(
    const warden::security::escalation_decision_t decision,
    const std::string& pending_id = {}) {
  return [decision, pending_id](const auto&, const auto&) {
    return warden::security::escalation_result_t{decision, pending_id};
  };
}

}  // namespace

TEST(kernel, authorizes_granted_capability) {
  auto fixture = warden::testing::kernel_fixture{};
  auto grant = fixture.store().grant("agent_a", "arbor://fs/read/docs");
  ASSERT_TRUE(grant.ok());

  auto result =
      fixture.kernel().authorize("agent_a", "arbor://fs/read/docs", "read");
  EXPECT_TRUE(result.authorized());
  EXPECT_EQ(result.capability_id, grant.capability->id);
  EXPECT_TRUE(
      fixture.journal()
          .events(warden::schema::security_event_type_t::authorization_denied)
          .empty());
}

TEST(kernel, denies_without_capability) {
  auto fixture = warden::testing::kernel_fixture{};
  auto result =
      fixture.kernel().authorize("agent_a", "arbor://fs/read/docs", "read");
  EXPECT_EQ(result.code, authorization_code::unauthorized);
  EXPECT_EQ(result.reason, "not authorized");
  EXPECT_FALSE(result.capability_id.has_value());

  auto denied = fixture.journal().events(
      warden::schema::security_event_type_t::authorization_denied);
  ASSERT_EQ(denied.size(), 1u);
  EXPECT_EQ(denied.front().principal, "agent_a");
}

TEST(kernel, denial_reason_does_not_reveal_resource_existence) {
  auto fixture = warden::testing::kernel_fixture{};
  ASSERT_TRUE(fixture.store().grant("agent_b", "arbor://fs/read/secret").ok());

  auto other_agent =
      fixture.kernel().authorize("agent_a", "arbor://fs/read/secret", "read");
  auto nothing =
      fixture.kernel().authorize("agent_a", "arbor://fs/read/void", "read");
  auto malformed = fixture.kernel().authorize("agent_a", "not a uri", "read");
  EXPECT_EQ(other_agent.reason, nothing.reason);
  EXPECT_EQ(nothing.reason, malformed.reason);
  EXPECT_EQ(malformed.code, authorization_code::unauthorized);
}

TEST(kernel, discloses_reason_when_configured) {
  auto fixture = warden::testing::kernel_fixture{disclosing()};
  auto result =
      fixture.kernel().authorize("agent_a", "arbor://fs/read/docs", "read");
  EXPECT_EQ(result.reason, "no_capability");
}

TEST(kernel, frozen_agent_is_denied) {
  auto fixture = warden::testing::kernel_fixture{};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://fs/read/docs").ok());
  ASSERT_TRUE(fixture.trust().freeze("agent_a", "incident").ok());

  auto result =
      fixture.kernel().authorize("agent_a", "arbor://fs/read/docs", "read");
  EXPECT_EQ(result.code, authorization_code::trust_frozen);

  ASSERT_TRUE(fixture.trust().unfreeze("agent_a").ok());
  EXPECT_TRUE(fixture.kernel()
                  .authorize("agent_a", "arbor://fs/read/docs", "read")
                  .authorized());
}

TEST(kernel, tier_below_requirement_is_denied) {
  auto fixture = warden::testing::kernel_fixture{};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://fs/write/docs").ok());

  // No profile counts as untrusted.
  EXPECT_EQ(fixture.kernel()
                .authorize("agent_a", "arbor://fs/write/docs", "write")
                .code,
            authorization_code::insufficient_trust);

  fixture.make_trusted("agent_a");
  EXPECT_TRUE(fixture.kernel()
                  .authorize("agent_a", "arbor://fs/write/docs", "write")
                  .authorized());
}

TEST(kernel, ceiling_caps_behavioral_tier) {
  auto fixture = warden::testing::kernel_fixture{};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://fs/write/docs").ok());
  fixture.make_veteran("agent_a");
  fixture.policy().set_ceiling("agent_a", trust_tier_t::probationary);

  EXPECT_EQ(fixture.kernel()
                .authorize("agent_a", "arbor://fs/write/docs", "write")
                .code,
            authorization_code::insufficient_trust);

  fixture.policy().clear_ceiling("agent_a");
  EXPECT_TRUE(fixture.kernel()
                  .authorize("agent_a", "arbor://fs/write/docs", "write")
                  .authorized());
}

TEST(kernel, rate_limit_applies_per_capability) {
  auto fixture = warden::testing::kernel_fixture{};
  auto options = warden::security::grant_options{};
  options.constraints.rate_limit =
      warden::schema::rate_limit_constraint_t{2, kMinute};
  ASSERT_TRUE(
      fixture.store().grant("agent_a", "arbor://net/http", options).ok());
  fixture.make_trusted("agent_a");

  auto& kernel = fixture.kernel();
  EXPECT_TRUE(kernel.authorize("agent_a", "arbor://net/http", "http")
                  .authorized());
  EXPECT_TRUE(kernel.authorize("agent_a", "arbor://net/http", "http")
                  .authorized());
  EXPECT_EQ(kernel.authorize("agent_a", "arbor://net/http", "http").code,
            authorization_code::rate_limited);

  fixture.clock().advance(kMinute);
  EXPECT_TRUE(kernel.authorize("agent_a", "arbor://net/http", "http")
                  .authorized());
}

TEST(kernel, denied_requests_do_not_spend_rate_limit) {
  auto fixture = warden::testing::kernel_fixture{};
  auto grant = warden::security::grant_options{};
  grant.constraints.rate_limit =
      warden::schema::rate_limit_constraint_t{2, kMinute};
  ASSERT_TRUE(
      fixture.store().grant("agent_a", "arbor://shell/exec", grant).ok());
  fixture.make_veteran("agent_a");
  auto& kernel = fixture.kernel();

  kernel.set_escalation(
      answer(warden::security::escalation_decision_t::proceed));
  auto dangerous = warden::security::authorize_options{};
  dangerous.command = "rm -rf /";
  for (auto i = 0; i < 3; ++i) {
    EXPECT_EQ(
        kernel.authorize("agent_a", "arbor://shell/exec", "exec", dangerous)
            .code,
        authorization_code::reflex_blocked);
  }

  auto options = warden::security::authorize_options{};
  options.command = "ls -la";
  kernel.set_escalation(
      answer(warden::security::escalation_decision_t::pending, "approval_3"));
  for (auto i = 0; i < 3; ++i) {
    EXPECT_EQ(
        kernel.authorize("agent_a", "arbor://shell/exec", "exec", options).code,
        authorization_code::pending_approval);
  }

  kernel.set_escalation(
      answer(warden::security::escalation_decision_t::proceed));
  EXPECT_TRUE(kernel.authorize("agent_a", "arbor://shell/exec", "exec", options)
                  .authorized());
  EXPECT_TRUE(kernel.authorize("agent_a", "arbor://shell/exec", "exec", options)
                  .authorized());
  EXPECT_EQ(
      kernel.authorize("agent_a", "arbor://shell/exec", "exec", options).code,
      authorization_code::rate_limited);
}

TEST(kernel, time_window_constraint) {
  auto fixture = warden::testing::kernel_fixture{disclosing()};
  auto morning = warden::security::grant_options{};
  morning.constraints.time_window =
      warden::schema::time_window_constraint_t{0, 6};
  ASSERT_TRUE(
      fixture.store().grant("agent_a", "arbor://fs/read/a", morning).ok());

  auto result =
      fixture.kernel().authorize("agent_a", "arbor://fs/read/a", "read");
  EXPECT_EQ(result.code, authorization_code::constraint_violated);
  EXPECT_EQ(result.reason, "outside_time_window");

  auto overnight = warden::security::grant_options{};
  overnight.constraints.time_window =
      warden::schema::time_window_constraint_t{22, 13};
  ASSERT_TRUE(
      fixture.store().grant("agent_a", "arbor://fs/read/b", overnight).ok());
  EXPECT_TRUE(fixture.kernel()
                  .authorize("agent_a", "arbor://fs/read/b", "read")
                  .authorized());
}

TEST(kernel, custom_constraints_fail_closed) {
  auto fixture = warden::testing::kernel_fixture{};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://fs/read/docs").ok());

  fixture.kernel().add_constraint(
      "business_hours", [](const auto&, const auto&) { return true; });
  EXPECT_TRUE(fixture.kernel()
                  .authorize("agent_a", "arbor://fs/read/docs", "read")
                  .authorized());

  fixture.kernel().add_constraint(
      "broken", [](const auto&, const auto&) -> bool {
        throw std::runtime_error{"lookup failed"};
      });
  EXPECT_EQ(
      fixture.kernel().authorize("agent_a", "arbor://fs/read/docs", "read").code,
      authorization_code::constraint_violated);
}

TEST(kernel, slow_constraint_times_out) {
  auto options = warden::security::kernel_options{};
  options.check_timeout = std::chrono::milliseconds{20};
  auto fixture = warden::testing::kernel_fixture{options};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://fs/read/docs").ok());
  fixture.kernel().add_constraint("slow", [](const auto&, const auto&) {
    std::this_thread::sleep_for(std::chrono::milliseconds{500});
    return true;
  });

  EXPECT_EQ(
      fixture.kernel().authorize("agent_a", "arbor://fs/read/docs", "read").code,
      authorization_code::constraint_violated);
}

TEST(kernel, gated_action_needs_approval) {
  auto fixture = warden::testing::kernel_fixture{disclosing()};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://shell/exec").ok());
  fixture.make_veteran("agent_a");
  auto options = warden::security::authorize_options{};
  options.command = "ls -la";
  auto& kernel = fixture.kernel();

  auto unavailable =
      kernel.authorize("agent_a", "arbor://shell/exec", "exec", options);
  EXPECT_EQ(unavailable.code, authorization_code::unauthorized);
  EXPECT_EQ(unavailable.reason, "approval_unavailable");

  kernel.set_escalation(
      answer(warden::security::escalation_decision_t::pending, "approval_17"));
  auto pending =
      kernel.authorize("agent_a", "arbor://shell/exec", "exec", options);
  EXPECT_EQ(pending.code, authorization_code::pending_approval);
  EXPECT_EQ(pending.pending_id, "approval_17");
  EXPECT_FALSE(pending.authorized());

  kernel.set_escalation(answer(warden::security::escalation_decision_t::deny));
  EXPECT_EQ(
      kernel.authorize("agent_a", "arbor://shell/exec", "exec", options).code,
      authorization_code::unauthorized);

  kernel.set_escalation(
      answer(warden::security::escalation_decision_t::proceed));
  EXPECT_TRUE(kernel.authorize("agent_a", "arbor://shell/exec", "exec", options)
                  .authorized());
}

TEST(kernel, reflex_blocks_dangerous_command) {
  auto fixture = warden::testing::kernel_fixture{disclosing()};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://shell/exec").ok());
  fixture.make_veteran("agent_a");
  fixture.kernel().set_escalation(
      answer(warden::security::escalation_decision_t::proceed));

  auto options = warden::security::authorize_options{};
  options.command = "rm -rf /";
  auto result =
      fixture.kernel().authorize("agent_a", "arbor://shell/exec", "exec",
                                 options);
  EXPECT_EQ(result.code, authorization_code::reflex_blocked);
  EXPECT_NE(result.reason.find("rm_root"), std::string::npos);
}

TEST(kernel, reflex_blocks_sensitive_path) {
  auto fixture = warden::testing::kernel_fixture{};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://fs/read/home").ok());
  auto options = warden::security::authorize_options{};
  options.path = "/home/dev/.ssh/id_ed25519";

  EXPECT_EQ(fixture.kernel()
                .authorize("agent_a", "arbor://fs/read/home", "read", options)
                .code,
            authorization_code::reflex_blocked);
}

TEST(kernel, revoked_capability_no_longer_authorizes) {
  auto fixture = warden::testing::kernel_fixture{};
  auto grant = fixture.store().grant("agent_a", "arbor://fs/read/docs");
  ASSERT_TRUE(grant.ok());
  ASSERT_EQ(fixture.store().revoke(grant.capability->id),
            warden::schema::error_code::ok);

  EXPECT_EQ(
      fixture.kernel().authorize("agent_a", "arbor://fs/read/docs", "read").code,
      authorization_code::unauthorized);
}

TEST(kernel, identity_required_when_configured) {
  auto options = disclosing();
  options.require_identity = true;
  auto fixture = warden::testing::kernel_fixture{options};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://fs/read/docs").ok());

  auto result =
      fixture.kernel().authorize("agent_a", "arbor://fs/read/docs", "read");
  EXPECT_EQ(result.code, authorization_code::unauthorized);
  EXPECT_EQ(result.reason, "identity_required");
}

TEST(kernel, signed_request_must_match_call) {
  auto fixture = warden::testing::kernel_fixture{disclosing()};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://fs/read/docs").ok());

  auto options = warden::security::authorize_options{};
  options.signed_request = warden::schema::signed_request_t{};
  options.signed_request->agent_id = "agent_a";
  options.signed_request->resource = "arbor://fs/read/other";
  options.signed_request->action = "read";

  auto result = fixture.kernel().authorize("agent_a", "arbor://fs/read/docs",
                                           "read", options);
  EXPECT_EQ(result.code, authorization_code::unauthorized);
  EXPECT_EQ(result.reason, "identity_mismatch");
}

TEST(kernel, verifies_signed_identity) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable";
  }
  auto fixture = warden::testing::kernel_fixture{disclosing()};
  auto registry = warden::security::identity_registry{
      {}, fixture.clock().source()};
  fixture.kernel().set_identity_verifier(registry.verifier());

  auto keys = warden::crypto::generate_keypair();
  ASSERT_TRUE(keys.has_value());
  auto agent_id = registry.register_identity(keys->public_key).agent_id;
  ASSERT_TRUE(fixture.store().grant(agent_id, "arbor://fs/read/docs").ok());

  auto options = warden::security::authorize_options{};
  options.signed_request = warden::schema::signed_request_t{};
  options.signed_request->agent_id = agent_id;
  options.signed_request->resource = "arbor://fs/read/docs";
  options.signed_request->action = "read";
  options.signed_request->timestamp = fixture.clock().now();
  options.signed_request->nonce = "n1";
  ASSERT_TRUE(warden::security::sign_request(*options.signed_request,
                                             keys->private_key));

  EXPECT_TRUE(fixture.kernel()
                  .authorize(agent_id, "arbor://fs/read/docs", "read", options)
                  .authorized());

  auto replay = fixture.kernel().authorize(agent_id, "arbor://fs/read/docs",
                                           "read", options);
  EXPECT_EQ(replay.code, authorization_code::unauthorized);
  EXPECT_EQ(replay.reason, "identity_replayed");
}

TEST(kernel, exists_skips_dynamic_checks) {
  auto fixture = warden::testing::kernel_fixture{};
  ASSERT_TRUE(fixture.store().grant("agent_a", "arbor://fs/write/docs").ok());
  ASSERT_TRUE(fixture.trust().freeze("agent_a", "incident").ok());

  EXPECT_TRUE(
      fixture.kernel().exists("agent_a", "arbor://fs/write/docs", "write"));
  EXPECT_FALSE(fixture.kernel()
                   .authorize("agent_a", "arbor://fs/write/docs", "write")
                   .authorized());
}

TEST(kernel, time_window_wraps_midnight) {
  constexpr auto kHour = warden::schema::kMillisecondsPerHour;
  const auto midnight = warden::testing::kTestEpoch - 12 * kHour;
  auto overnight = warden::schema::time_window_constraint_t{22, 6};
  EXPECT_TRUE(warden::security::within_time_window(overnight, midnight));
  EXPECT_TRUE(
      warden::security::within_time_window(overnight, midnight + 5 * kHour));
  EXPECT_FALSE(
      warden::security::within_time_window(overnight, midnight + 6 * kHour));
  EXPECT_TRUE(
      warden::security::within_time_window(overnight, midnight + 23 * kHour));

  auto office = warden::schema::time_window_constraint_t{9, 17};
  EXPECT_TRUE(warden::security::within_time_window(
      office, warden::testing::kTestEpoch));
  EXPECT_FALSE(warden::security::within_time_window(office, midnight));
}
