#pragma once

#include <warden/common/clock.hpp>
#include <warden/schema/capability.hpp>
#include <warden/schema/capability_result.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/security/event_journal.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace warden::security {

/// Validates a capability signature over `capability_signing_payload`.
using capability_verifier_t =
    std::function<bool(const warden::schema::bytes_view_t& message,
                       const warden::schema::ed25519_signature_t& signature)>;

struct capability_store_options final {
  /// Grants without a signature are refused and unsigned capabilities never
  /// authorize.
  bool require_signatures{false};
  bool enforce_quotas{true};
  uint32_t max_per_principal{1000};
  uint64_t max_global{100000};
  uint8_t max_delegation_depth{10};
};

struct grant_options final {
  /// Defaults to the action segment of the resource URI.
  std::optional<std::string> action;
  std::optional<warden::schema::timestamp_milliseconds_t> expires_at;
  std::optional<warden::schema::ed25519_signature_t> signature;
  warden::schema::capability_constraints_t constraints;
  uint8_t delegation_depth{3};
  warden::schema::match_mode_t match_mode{warden::schema::match_mode_t::exact};
  warden::schema::agent_id_t issuer_id;
};

struct capability_stats_t final {
  uint64_t active{};
  uint64_t total_granted{};
  uint64_t total_revoked{};
  uint64_t total_expired{};
  uint64_t cascade_revoked{};
};

/// Bytes an authority signs to mint a capability. The store id is not part
/// of the payload because it is assigned at grant time.
warden::schema::bytes_t capability_signing_payload(
    std::string_view principal,
    std::string_view resource_uri,
    std::string_view action,
    std::optional<warden::schema::timestamp_milliseconds_t> expires_at);

/// Verifier that checks capability signatures against one Ed25519 authority
/// key.
capability_verifier_t make_authority_verifier(
    const warden::schema::ed25519_public_key_t& authority_key);

/// Source of truth for static permissions.
///
/// Mutations (grant, delegate, revoke, cleanup) are serialized behind an
/// exclusive lock in arrival order. Queries take a shared lock and observe a
/// consistent snapshot. Revoked capabilities are kept as tombstones for
/// audit and never authorize again.
class capability_store final {
 public:
  explicit capability_store(
      capability_store_options options = {},
      warden::common::time_source_t clock = warden::common::system_now);

  capability_store(const capability_store&) = delete;
  capability_store& operator=(const capability_store&) = delete;

  /// Install the verifier for capability signatures. Without one, any
  /// signed capability fails verification.
  void set_capability_verifier(capability_verifier_t verifier);

  void set_event_sink(event_sink_t sink);

  /// Mint a capability for `principal` on `resource_uri`.
  ///
  /// Fails with `invalid_resource`, `signature_required` or
  /// `quota_exceeded`.
  warden::schema::capability_result_t grant(
      const warden::schema::agent_id_t& principal,
      std::string_view resource_uri,
      const grant_options& options = {});

  /// Derive a child of `parent_id` for `principal` with one less level of
  /// delegation. The child inherits the parent's resource, action, match
  /// mode, expiry bound and constraints; `options` may only narrow expiry.
  warden::schema::capability_result_t delegate(
      const warden::schema::capability_id_t& parent_id,
      const warden::schema::agent_id_t& principal,
      const grant_options& options = {});

  /// Tombstone `id` and every capability delegated from it.
  warden::schema::error_code revoke(const warden::schema::capability_id_t& id);

  /// Revoke every active capability held by `principal`; returns the count.
  uint64_t revoke_all(const warden::schema::agent_id_t& principal);

  /// Capabilities held by `principal` in grant order. Revoked and expired
  /// entries are included only on request.
  std::vector<warden::schema::capability_t> list(
      const warden::schema::agent_id_t& principal,
      bool include_inactive = false) const;

  std::optional<warden::schema::capability_t> get(
      const warden::schema::capability_id_t& id) const;

  /// Narrow probe: does an active capability cover this request?
  ///
  /// Skips identity, trust, constraint and rate-limit checks. It is not an
  /// authorization decision; use `kernel::authorize` for that.
  bool exists(const warden::schema::agent_id_t& principal,
              std::string_view resource_uri,
              std::string_view action) const;

  /// The earliest-granted active capability that covers the request and
  /// satisfies the signature policy.
  std::optional<warden::schema::capability_t> find_authorizing(
      const warden::schema::agent_id_t& principal,
      std::string_view resource_uri,
      std::string_view action) const;

  /// Unrevoked and unexpired right now.
  bool is_active(const warden::schema::capability_id_t& id) const;

  /// Drop expired capabilities from the indexes; returns the count.
  uint64_t cleanup_expired();

  capability_stats_t stats() const;

 private:
  bool active_at(const warden::schema::capability_t& capability,
                 warden::schema::timestamp_milliseconds_t now) const;
  bool signature_acceptable(
      const warden::schema::capability_t& capability) const;
  warden::schema::error_code check_quota(
      const warden::schema::agent_id_t& principal) const;
  warden::schema::capability_t& insert(warden::schema::capability_t capability);
  void revoke_locked(const warden::schema::capability_id_t& id,
                     warden::schema::timestamp_milliseconds_t now,
                     bool cascade,
                     std::vector<warden::schema::security_event_record_t>& out);
  void emit(const std::vector<warden::schema::security_event_record_t>& events);

  mutable std::shared_mutex mutex_;
  capability_store_options options_;
  warden::common::time_source_t clock_;
  capability_verifier_t capability_verifier_;
  event_sink_t event_sink_;
  std::map<warden::schema::capability_id_t, warden::schema::capability_t>
      by_id_;
  std::map<warden::schema::agent_id_t,
           std::vector<warden::schema::capability_id_t>>
      by_principal_;
  std::map<warden::schema::capability_id_t,
           std::vector<warden::schema::capability_id_t>>
      by_parent_;
  uint64_t unrevoked_count_{};
  capability_stats_t stats_;
};

}  // namespace warden::security
