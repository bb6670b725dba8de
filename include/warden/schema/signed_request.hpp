#pragma once

#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: signed request.
// Proof that the caller holds the private key registered for agent_id.
namespace warden::schema {

template <uint16_t Version>
struct signed_request;

template <>
struct signed_request<1> final {
  uint16_t version{1};
  agent_id_t agent_id;
  std::string resource;
  std::string action;
  timestamp_milliseconds_t timestamp{};
  std::string nonce;
  ed25519_signature_t signature{};
};

using signed_request_t = signed_request<1>;

}  // namespace warden::schema
