#include <gtest/gtest.h>
#include <warden/crypto/verify.hpp>

#include <array>
#include <set>
#include <string>
#include <vector>

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto keypair = warden::crypto::generate_keypair();
  ASSERT_TRUE(keypair.has_value());

  auto message = std::vector<uint8_t>{'w', 'a', 'r', 'd', 'e', 'n'};
  auto signature = warden::crypto::sign(
      warden::schema::bytes_view_t{message.data(), message.size()},
      keypair->private_key);
  ASSERT_TRUE(signature.has_value());

  EXPECT_TRUE(warden::crypto::verify_signature(
      warden::schema::bytes_view_t{message.data(), message.size()},
      keypair->public_key, *signature));

  message[0] ^= 0x01;
  EXPECT_FALSE(warden::crypto::verify_signature(
      warden::schema::bytes_view_t{message.data(), message.size()},
      keypair->public_key, *signature));
}

TEST(crypto_verify, rejects_signature_from_other_key) {
  if (!warden::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto signer = warden::crypto::generate_keypair();
  auto other = warden::crypto::generate_keypair();
  ASSERT_TRUE(signer.has_value());
  ASSERT_TRUE(other.has_value());

  auto message = std::vector<uint8_t>{'a', 'b', 'c'};
  auto signature = warden::crypto::sign(
      warden::schema::bytes_view_t{message.data(), message.size()},
      signer->private_key);
  ASSERT_TRUE(signature.has_value());
  EXPECT_FALSE(warden::crypto::verify_signature(
      warden::schema::bytes_view_t{message.data(), message.size()},
      other->public_key, *signature));
}

TEST(crypto_verify, rejects_zero_signature) {
  auto public_key = warden::schema::ed25519_public_key_t{};
  public_key[0] = 1;
  auto signature = warden::schema::ed25519_signature_t{};
  auto message = std::array<uint8_t, 3>{'a', 'b', 'c'};
  EXPECT_FALSE(warden::crypto::verify_signature(
      warden::schema::bytes_view_t{message.data(), message.size()}, public_key,
      signature));
}

TEST(crypto_verify, sha256_matches_known_digest) {
  auto message = std::string{"abc"};
  auto digest = warden::crypto::sha256(warden::schema::make_bytes_view(message));
  EXPECT_EQ(warden::schema::to_hex(warden::schema::bytes_view_t{digest}),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(crypto_verify, random_hex_is_unique_and_sized) {
  auto seen = std::set<std::string>{};
  for (auto i = 0; i < 32; ++i) {
    auto value = warden::crypto::random_hex(16);
    EXPECT_EQ(value.size(), 32u);
    seen.insert(value);
  }
  EXPECT_EQ(seen.size(), 32u);
}

TEST(crypto_verify, derive_agent_id_is_stable_per_key) {
  auto key = warden::schema::ed25519_public_key_t{};
  key[0] = 7;
  auto first = warden::crypto::derive_agent_id(key);
  EXPECT_EQ(first, warden::crypto::derive_agent_id(key));
  EXPECT_EQ(first.rfind("agent_", 0), 0u);
  EXPECT_EQ(first.size(), 6u + 64u);
  key[0] = 8;
  EXPECT_NE(first, warden::crypto::derive_agent_id(key));
}
