#include <gtest/gtest.h>
#include <warden/security/identity_registry.hpp>
#include <warden/testing/common.hpp>

#include <optional>

namespace {

using warden::schema::error_code;
using warden::security::identity_check_t;
using warden::security::identity_status_t;

constexpr auto kMinute = 60 * warden::schema::kMillisecondsPerSecond;

class signing_agent final {
 public:
  explicit signing_agent(warden::security::identity_registry& registry)
      : keys_{*warden::crypto::generate_keypair()},
        agent_id_{registry.register_identity(keys_.public_key, "builder")
                      .agent_id} {}

  warden::schema::signed_request_t request(
      const warden::schema::timestamp_milliseconds_t timestamp,
      const std::string& nonce) const {
    auto request = warden::schema::signed_request_t{};
    request.agent_id = agent_id_;
    request.resource = "arbor://fs/read/docs";
    request.action = "read";
    request.timestamp = timestamp;
    request.nonce = nonce;
    EXPECT_TRUE(warden::security::sign_request(request, keys_.private_key));
    return request;
  }

  const warden::schema::agent_id_t& agent_id() const { return agent_id_; }

 private:
  warden::crypto::ed25519_keypair_t keys_;
  warden::schema::agent_id_t agent_id_;
};

warden::schema::ed25519_public_key_t fixed_key(const uint8_t fill) {
  auto key = warden::schema::ed25519_public_key_t{};
  key.fill(fill);
  return key;
}

}  // namespace

TEST(identity_registry, registers_under_derived_id) {
  auto registry = warden::security::identity_registry{};
  auto key = fixed_key(7);
  auto result = registry.register_identity(key, "builder");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.agent_id, warden::crypto::derive_agent_id(key));

  auto duplicate = registry.register_identity(key, "again");
  EXPECT_EQ(duplicate.code, error_code::already_exists);
  EXPECT_EQ(duplicate.agent_id, result.agent_id);

  auto record = registry.lookup(result.agent_id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->name, "builder");
}

TEST(identity_registry, lifecycle_transitions) {
  auto registry = warden::security::identity_registry{};
  auto id = registry.register_identity(fixed_key(1)).agent_id;

  EXPECT_EQ(registry.suspend(id, "investigating"), error_code::ok);
  EXPECT_EQ(registry.status(id), identity_status_t::suspended);
  EXPECT_FALSE(registry.lookup(id).has_value());

  EXPECT_EQ(registry.resume(id), error_code::ok);
  EXPECT_EQ(registry.status(id), identity_status_t::active);

  EXPECT_EQ(registry.revoke(id, "compromised"), error_code::ok);
  EXPECT_EQ(registry.resume(id), error_code::identity_revoked);
  EXPECT_EQ(registry.suspend(id), error_code::identity_revoked);
  EXPECT_EQ(registry.status(id), identity_status_t::revoked);

  EXPECT_EQ(registry.suspend("agent_missing"), error_code::not_found);
  EXPECT_FALSE(registry.status("agent_missing").has_value());
}

TEST(identity_registry, verifies_fresh_signed_requests) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable";
  }
  auto clock = warden::testing::manual_clock{};
  auto registry = warden::security::identity_registry{{}, clock.source()};
  auto agent = signing_agent{registry};

  auto request = agent.request(clock.now(), "n1");
  EXPECT_EQ(registry.verify(request), identity_check_t::verified);
  EXPECT_EQ(registry.verify(request), identity_check_t::replayed);
  EXPECT_EQ(registry.verify(agent.request(clock.now(), "n2")),
            identity_check_t::verified);
}

TEST(identity_registry, rejects_tampered_requests) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable";
  }
  auto clock = warden::testing::manual_clock{};
  auto registry = warden::security::identity_registry{{}, clock.source()};
  auto agent = signing_agent{registry};

  auto request = agent.request(clock.now(), "n1");
  request.action = "write";
  EXPECT_EQ(registry.verify(request), identity_check_t::invalid_signature);

  // A rejected request does not burn its nonce.
  EXPECT_EQ(registry.verify(agent.request(clock.now(), "n1")),
            identity_check_t::verified);
}

TEST(identity_registry, freshness_window_is_symmetric) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable";
  }
  auto clock = warden::testing::manual_clock{};
  auto registry = warden::security::identity_registry{{}, clock.source()};
  auto agent = signing_agent{registry};

  EXPECT_EQ(registry.verify(agent.request(clock.now() - 5 * kMinute, "a")),
            identity_check_t::verified);
  EXPECT_EQ(registry.verify(agent.request(clock.now() + 5 * kMinute, "b")),
            identity_check_t::verified);
  EXPECT_EQ(registry.verify(agent.request(clock.now() - 5 * kMinute - 1, "c")),
            identity_check_t::stale);
  EXPECT_EQ(registry.verify(agent.request(clock.now() + 6 * kMinute, "d")),
            identity_check_t::stale);
}

TEST(identity_registry, status_checked_before_signature) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable";
  }
  auto clock = warden::testing::manual_clock{};
  auto registry = warden::security::identity_registry{{}, clock.source()};
  auto agent = signing_agent{registry};
  auto request = agent.request(clock.now(), "n1");

  ASSERT_EQ(registry.suspend(agent.agent_id()), error_code::ok);
  EXPECT_EQ(registry.verify(request), identity_check_t::suspended);
  ASSERT_EQ(registry.revoke(agent.agent_id()), error_code::ok);
  EXPECT_EQ(registry.verify(request), identity_check_t::revoked);

  request.agent_id = "agent_unknown";
  EXPECT_EQ(registry.verify(request), identity_check_t::unknown_agent);
}

TEST(identity_registry, verifier_delegates_to_registry) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable";
  }
  auto clock = warden::testing::manual_clock{};
  auto registry = warden::security::identity_registry{{}, clock.source()};
  auto agent = signing_agent{registry};
  auto verifier = registry.verifier();

  EXPECT_EQ(verifier(agent.request(clock.now(), "n1")),
            identity_check_t::verified);
}
