#pragma once

#include <warden/common/clock.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/schema/enum_string.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/signed_request.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace warden::security {

enum class identity_status_t : uint8_t {
  active = 0,
  suspended = 1,
  /// Terminal.
  revoked = 2,
};

inline constexpr auto kIdentityStatusMappings = std::array{
    std::pair<std::string_view, identity_status_t>{"active",
                                                   identity_status_t::active},
    std::pair<std::string_view, identity_status_t>{
        "suspended", identity_status_t::suspended},
    std::pair<std::string_view, identity_status_t>{"revoked",
                                                   identity_status_t::revoked},
};

inline constexpr std::string_view to_string(const identity_status_t value) {
  return warden::schema::to_string(value, kIdentityStatusMappings)
      .value_or("unknown");
}

enum class identity_check_t : uint8_t {
  verified = 0,
  unknown_agent = 1,
  suspended = 2,
  revoked = 3,
  invalid_signature = 4,
  stale = 5,
  replayed = 6,
  /// The signed resource or action differs from the one being authorized.
  mismatch = 7,
};

inline constexpr auto kIdentityCheckMappings = std::array{
    std::pair<std::string_view, identity_check_t>{"verified",
                                                  identity_check_t::verified},
    std::pair<std::string_view, identity_check_t>{
        "unknown_agent", identity_check_t::unknown_agent},
    std::pair<std::string_view, identity_check_t>{"suspended",
                                                  identity_check_t::suspended},
    std::pair<std::string_view, identity_check_t>{"revoked",
                                                  identity_check_t::revoked},
    std::pair<std::string_view, identity_check_t>{
        "invalid_signature", identity_check_t::invalid_signature},
    std::pair<std::string_view, identity_check_t>{"stale",
                                                  identity_check_t::stale},
    std::pair<std::string_view, identity_check_t>{"replayed",
                                                  identity_check_t::replayed},
    std::pair<std::string_view, identity_check_t>{"mismatch",
                                                  identity_check_t::mismatch},
};

inline constexpr std::string_view to_string(const identity_check_t value) {
  return warden::schema::to_string(value, kIdentityCheckMappings)
      .value_or("unknown");
}

/// Kernel collaborator. Anything other than `verified` is a denial.
using identity_verifier_t =
    std::function<identity_check_t(const warden::schema::signed_request_t&)>;

struct identity_record_t final {
  warden::schema::agent_id_t agent_id;
  std::string name;
  warden::schema::ed25519_public_key_t public_key{};
  identity_status_t status{identity_status_t::active};
  std::string status_reason;
  warden::schema::timestamp_milliseconds_t created_at{};
  std::optional<warden::schema::timestamp_milliseconds_t> status_changed_at;
};

struct identity_result_t final {
  warden::schema::error_code code{warden::schema::error_code::ok};
  warden::schema::agent_id_t agent_id;

  bool ok() const { return code == warden::schema::error_code::ok; }
};

struct identity_registry_options final {
  /// Requests signed further than this from now, in either direction, are
  /// stale.
  warden::schema::duration_milliseconds_t freshness_window{
      5 * 60 * warden::schema::kMillisecondsPerSecond};
};

/// Bytes covered by a request signature.
warden::schema::bytes_t signing_payload(
    const warden::schema::signed_request_t& request);

/// Fill in `request.signature`. Returns false when signing is unavailable.
bool sign_request(warden::schema::signed_request_t& request,
                  const warden::crypto::ed25519_private_key_t& private_key);

/// Ed25519 identities keyed by derived agent id, with request freshness and
/// nonce replay protection.
class identity_registry final {
 public:
  explicit identity_registry(
      identity_registry_options options = {},
      warden::common::time_source_t clock = warden::common::system_now);

  identity_registry(const identity_registry&) = delete;
  identity_registry& operator=(const identity_registry&) = delete;

  identity_result_t register_identity(
      const warden::schema::ed25519_public_key_t& public_key,
      std::string name = {});

  warden::schema::error_code suspend(const warden::schema::agent_id_t& agent_id,
                                     std::string reason = {});
  warden::schema::error_code resume(const warden::schema::agent_id_t& agent_id);
  warden::schema::error_code revoke(const warden::schema::agent_id_t& agent_id,
                                    std::string reason = {});

  std::optional<identity_status_t> status(
      const warden::schema::agent_id_t& agent_id) const;

  /// Active identities only.
  std::optional<identity_record_t> lookup(
      const warden::schema::agent_id_t& agent_id) const;

  /// Checks status, freshness, signature and then the nonce, in that order.
  /// A nonce is only consumed by a request that passes every other check.
  identity_check_t verify(const warden::schema::signed_request_t& request);

  /// Verifier bound to this registry; the registry must outlive it.
  identity_verifier_t verifier();

 private:
  void prune_nonces(warden::schema::timestamp_milliseconds_t now);

  mutable std::shared_mutex mutex_;
  identity_registry_options options_;
  warden::common::time_source_t clock_;
  std::map<warden::schema::agent_id_t, identity_record_t> identities_;
  std::map<std::string, warden::schema::timestamp_milliseconds_t> seen_nonces_;
};

}  // namespace warden::security
