#pragma once

#include <warden/schema/primitives.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace warden::crypto {

using ed25519_private_key_t = std::array<uint8_t, 32>;
using sha256_digest_t = std::array<uint8_t, 32>;

struct ed25519_keypair_t final {
  warden::schema::ed25519_public_key_t public_key{};
  ed25519_private_key_t private_key{};
};

/// True when the linked OpenSSL provides Ed25519.
bool available();

bool verify_signature(const warden::schema::bytes_view_t& message,
                      const warden::schema::ed25519_public_key_t& public_key,
                      const warden::schema::ed25519_signature_t& signature);

std::optional<ed25519_keypair_t> generate_keypair();

std::optional<warden::schema::ed25519_signature_t> sign(
    const warden::schema::bytes_view_t& message,
    const ed25519_private_key_t& private_key);

sha256_digest_t sha256(const warden::schema::bytes_view_t& data);

/// Bytes from the OpenSSL CSPRNG. Terminates when the generator cannot be
/// seeded; identifiers and nonces must never fall back to a weak source.
warden::schema::bytes_t random_bytes(std::size_t count);

std::string random_hex(std::size_t count);

/// "agent_" followed by the hex SHA-256 of the public key.
std::string derive_agent_id(
    const warden::schema::ed25519_public_key_t& public_key);

}  // namespace warden::crypto
