#include <gtest/gtest.h>
#include <warden/crypto/verify.hpp>
#include <warden/security/capability_store.hpp>
#include <warden/testing/common.hpp>

#include <string>

namespace {

using warden::schema::error_code;

constexpr auto kHour = warden::schema::kMillisecondsPerHour;

}  // namespace

TEST(capability_store, grant_normalizes_and_defaults_action) {
  auto clock = warden::testing::manual_clock{};
  auto store = warden::security::capability_store{{}, clock.source()};

  auto result = store.grant("agent_a", "ARBOR://fs/read/docs");
  ASSERT_TRUE(result.ok());
  const auto& capability = *result.capability;
  EXPECT_TRUE(capability.id.starts_with("cap_"));
  EXPECT_EQ(capability.resource_uri, "arbor://fs/read/docs");
  EXPECT_EQ(capability.action, "read");
  EXPECT_EQ(capability.granted_at, warden::testing::kTestEpoch);
  EXPECT_EQ(capability.match_mode, warden::schema::match_mode_t::exact);
  EXPECT_TRUE(store.is_active(capability.id));
}

TEST(capability_store, grant_rejects_invalid_resource) {
  auto store = warden::security::capability_store{};
  EXPECT_EQ(store.grant("agent_a", "not a uri").code,
            error_code::invalid_resource);
  EXPECT_EQ(store.grant("", "arbor://fs/read/docs").code,
            error_code::invalid_resource);
}

TEST(capability_store, exists_matches_exact_resource_and_action) {
  auto store = warden::security::capability_store{};
  ASSERT_TRUE(store.grant("agent_a", "arbor://fs/read/docs").ok());

  EXPECT_TRUE(store.exists("agent_a", "arbor://fs/read/docs", "read"));
  EXPECT_TRUE(store.exists("agent_a", "arbor://fs/read/docs", ""));
  EXPECT_FALSE(store.exists("agent_a", "arbor://fs/read/docs", "write"));
  EXPECT_FALSE(store.exists("agent_a", "arbor://fs/read/docs/a.txt", "read"));
  EXPECT_FALSE(store.exists("agent_b", "arbor://fs/read/docs", "read"));
}

TEST(capability_store, prefix_mode_covers_descendants) {
  auto store = warden::security::capability_store{};
  auto options = warden::security::grant_options{};
  options.match_mode = warden::schema::match_mode_t::prefix;
  ASSERT_TRUE(store.grant("agent_a", "arbor://fs/read/docs", options).ok());

  EXPECT_TRUE(store.exists("agent_a", "arbor://fs/read/docs/a.txt", "read"));
  EXPECT_FALSE(
      store.exists("agent_a", "arbor://fs/read/docs-private/a.txt", "read"));
}

TEST(capability_store, expired_capabilities_stop_authorizing) {
  auto clock = warden::testing::manual_clock{};
  auto store = warden::security::capability_store{{}, clock.source()};
  auto options = warden::security::grant_options{};
  options.expires_at = warden::testing::kTestEpoch + kHour;
  auto result = store.grant("agent_a", "arbor://fs/read/docs", options);
  ASSERT_TRUE(result.ok());

  EXPECT_TRUE(store.exists("agent_a", "arbor://fs/read/docs", "read"));
  clock.advance(kHour);
  EXPECT_FALSE(store.exists("agent_a", "arbor://fs/read/docs", "read"));
  EXPECT_FALSE(store.is_active(result.capability->id));
  EXPECT_TRUE(store.list("agent_a").empty());
  EXPECT_EQ(store.list("agent_a", true).size(), 1u);

  EXPECT_EQ(store.cleanup_expired(), 1u);
  EXPECT_FALSE(store.get(result.capability->id).has_value());
  EXPECT_EQ(store.stats().total_expired, 1u);
}

TEST(capability_store, revoke_keeps_tombstone) {
  auto store = warden::security::capability_store{};
  auto result = store.grant("agent_a", "arbor://fs/read/docs");
  ASSERT_TRUE(result.ok());
  const auto id = result.capability->id;

  EXPECT_EQ(store.revoke(id), error_code::ok);
  EXPECT_FALSE(store.exists("agent_a", "arbor://fs/read/docs", "read"));
  auto tombstone = store.get(id);
  ASSERT_TRUE(tombstone.has_value());
  EXPECT_TRUE(tombstone->revoked_at.has_value());
  EXPECT_EQ(store.revoke("cap_missing"), error_code::not_found);
}

TEST(capability_store, delegation_narrows_and_cascades) {
  auto clock = warden::testing::manual_clock{};
  auto store = warden::security::capability_store{{}, clock.source()};
  auto options = warden::security::grant_options{};
  options.delegation_depth = 1;
  options.expires_at = warden::testing::kTestEpoch + 10 * kHour;
  auto parent = store.grant("agent_a", "arbor://fs/read/docs", options);
  ASSERT_TRUE(parent.ok());

  auto narrower = warden::security::grant_options{};
  narrower.expires_at = warden::testing::kTestEpoch + kHour;
  auto child = store.delegate(parent.capability->id, "agent_b", narrower);
  ASSERT_TRUE(child.ok());
  EXPECT_EQ(child.capability->delegation_depth, 0u);
  EXPECT_EQ(child.capability->parent_id, parent.capability->id);
  EXPECT_EQ(child.capability->issuer_id, "agent_a");
  EXPECT_EQ(child.capability->expires_at, warden::testing::kTestEpoch + kHour);

  auto wider = warden::security::grant_options{};
  wider.expires_at = warden::testing::kTestEpoch + 100 * kHour;
  auto sibling = store.delegate(parent.capability->id, "agent_c", wider);
  ASSERT_TRUE(sibling.ok());
  EXPECT_EQ(sibling.capability->expires_at,
            warden::testing::kTestEpoch + 10 * kHour);

  EXPECT_EQ(store.delegate(child.capability->id, "agent_d").code,
            error_code::delegation_not_allowed);
  EXPECT_EQ(store.delegate("cap_missing", "agent_d").code,
            error_code::not_found);

  EXPECT_EQ(store.revoke(parent.capability->id), error_code::ok);
  EXPECT_FALSE(store.is_active(child.capability->id));
  EXPECT_FALSE(store.is_active(sibling.capability->id));
  EXPECT_EQ(store.stats().cascade_revoked, 2u);
  EXPECT_EQ(store.stats().total_revoked, 3u);
}

TEST(capability_store, revoke_all_counts_active_grants) {
  auto store = warden::security::capability_store{};
  ASSERT_TRUE(store.grant("agent_a", "arbor://fs/read/a").ok());
  ASSERT_TRUE(store.grant("agent_a", "arbor://fs/read/b").ok());
  ASSERT_TRUE(store.grant("agent_b", "arbor://fs/read/a").ok());

  EXPECT_EQ(store.revoke_all("agent_a"), 2u);
  EXPECT_EQ(store.revoke_all("agent_a"), 0u);
  EXPECT_TRUE(store.exists("agent_b", "arbor://fs/read/a", "read"));
  EXPECT_EQ(store.stats().active, 1u);
}

TEST(capability_store, quotas_bound_grants) {
  auto options = warden::security::capability_store_options{};
  options.max_per_principal = 2;
  options.max_global = 3;
  options.max_delegation_depth = 4;
  auto store = warden::security::capability_store{options};

  ASSERT_TRUE(store.grant("agent_a", "arbor://fs/read/a").ok());
  ASSERT_TRUE(store.grant("agent_a", "arbor://fs/read/b").ok());
  EXPECT_EQ(store.grant("agent_a", "arbor://fs/read/c").code,
            error_code::quota_exceeded);
  ASSERT_TRUE(store.grant("agent_b", "arbor://fs/read/a").ok());
  EXPECT_EQ(store.grant("agent_c", "arbor://fs/read/a").code,
            error_code::quota_exceeded);

  auto deep = warden::security::grant_options{};
  deep.delegation_depth = 5;
  auto fresh = warden::security::capability_store{options};
  EXPECT_EQ(fresh.grant("agent_a", "arbor://fs/read/a", deep).code,
            error_code::quota_exceeded);
}

TEST(capability_store, unsigned_grants_refused_when_signatures_required) {
  auto options = warden::security::capability_store_options{};
  options.require_signatures = true;
  auto store = warden::security::capability_store{options};
  EXPECT_EQ(store.grant("agent_a", "arbor://fs/read/a").code,
            error_code::signature_required);
}

TEST(capability_store, signed_capabilities_verify_against_authority) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable";
  }
  auto authority = warden::crypto::generate_keypair();
  ASSERT_TRUE(authority.has_value());

  auto options = warden::security::capability_store_options{};
  options.require_signatures = true;
  auto store = warden::security::capability_store{options};
  store.set_capability_verifier(
      warden::security::make_authority_verifier(authority->public_key));

  auto payload = warden::security::capability_signing_payload(
      "agent_a", "arbor://fs/read/docs", "read", std::nullopt);
  auto signature = warden::crypto::sign(
      warden::schema::make_bytes_view(payload), authority->private_key);
  ASSERT_TRUE(signature.has_value());

  auto grant = warden::security::grant_options{};
  grant.signature = *signature;
  ASSERT_TRUE(store.grant("agent_a", "arbor://fs/read/docs", grant).ok());
  EXPECT_TRUE(store.exists("agent_a", "arbor://fs/read/docs", "read"));

  // Signed for a different resource.
  ASSERT_TRUE(store.grant("agent_a", "arbor://fs/read/other", grant).ok());
  EXPECT_FALSE(store.exists("agent_a", "arbor://fs/read/other", "read"));
}

TEST(capability_store, grants_emit_audit_events) {
  auto journal = warden::security::event_journal{};
  auto store = warden::security::capability_store{};
  store.set_event_sink(journal.sink());

  auto result = store.grant("agent_a", "arbor://fs/read/docs");
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(store.revoke(result.capability->id), error_code::ok);

  auto events = journal.events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].type,
            warden::schema::security_event_type_t::capability_granted);
  EXPECT_EQ(events[1].type,
            warden::schema::security_event_type_t::capability_revoked);
  EXPECT_EQ(events[1].capability_id, result.capability->id);
}
