#pragma once

#include <warden/common/clock.hpp>
#include <warden/reflex/registry.hpp>
#include <warden/schema/authorization_result.hpp>
#include <warden/schema/capability.hpp>
#include <warden/schema/signed_request.hpp>
#include <warden/security/capability_store.hpp>
#include <warden/security/event_journal.hpp>
#include <warden/security/identity_registry.hpp>
#include <warden/security/rate_limiter.hpp>
#include <warden/trust/engine.hpp>
#include <warden/trust/policy.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace warden::security {

enum class escalation_decision_t : uint8_t {
  proceed = 0,
  /// Suspend the decision until a human approves it.
  pending = 1,
  deny = 2,
};

struct escalation_result_t final {
  escalation_decision_t decision{escalation_decision_t::deny};
  std::string pending_id;
};

struct authorize_options final {
  /// Proof of identity; verified whenever present.
  std::optional<warden::schema::signed_request_t> signed_request;
  /// Shell command the action will run, for the reflex check.
  std::string command;
  /// Filesystem path the action will touch, for the reflex check.
  std::string path;
};

struct authorization_request_t final {
  warden::schema::agent_id_t principal;
  std::string resource_uri;
  std::string action;
  authorize_options options;
};

/// Asked before a gated action proceeds.
using escalation_t = std::function<escalation_result_t(
    const authorization_request_t&,
    const warden::schema::capability_t&)>;

/// Extra condition on a request. False, or an exception, is a denial.
using constraint_check_t = std::function<bool(
    const authorization_request_t&,
    const warden::schema::capability_t&)>;

struct kernel_options final {
  /// Requests without a signed request are refused.
  bool require_identity{false};
  /// Put the internal denial detail in `authorization_result::reason`.
  /// Off by default so callers cannot probe which resources exist.
  bool disclose_denial_reasons{false};
  std::optional<std::chrono::milliseconds> check_timeout;
};

/// Composes capability lookup, identity, trust tier, constraints, rate
/// limits, escalation and reflexes into one fail-closed decision.
///
/// The kernel does not own its collaborators; they must outlive it.
class kernel final {
 public:
  kernel(capability_store& store,
         warden::trust::engine& trust,
         warden::trust::tier_policy& policy,
         warden::reflex::reflex_registry& reflexes,
         rate_limiter& limiter,
         kernel_options options = {},
         warden::common::time_source_t clock = warden::common::system_now);

  kernel(const kernel&) = delete;
  kernel& operator=(const kernel&) = delete;

  void set_identity_verifier(identity_verifier_t verifier);
  void set_escalation(escalation_t escalation);
  void add_constraint(std::string name, constraint_check_t check);
  void set_event_sink(event_sink_t sink);

  /// Full authorization decision. Only `authorized` permits the action.
  warden::schema::authorization_result_t authorize(
      const warden::schema::agent_id_t& principal,
      std::string_view resource_uri,
      std::string_view action,
      const authorize_options& options = {}) const;

  /// Capability existence only; see `capability_store::exists`.
  bool exists(const warden::schema::agent_id_t& principal,
              std::string_view resource_uri,
              std::string_view action) const;

 private:
  struct named_constraint_t final {
    std::string name;
    constraint_check_t check;
  };

  warden::schema::authorization_result_t deny(
      const authorization_request_t& request,
      warden::schema::authorization_code code,
      const std::string& detail,
      const std::optional<warden::schema::capability_id_t>& capability_id)
      const;
  std::optional<std::string> check_identity(
      const authorization_request_t& request) const;
  warden::reflex::reflex_result_t guarded(warden::reflex::check_t check) const;

  capability_store& store_;
  warden::trust::engine& trust_;
  warden::trust::tier_policy& policy_;
  warden::reflex::reflex_registry& reflexes_;
  rate_limiter& limiter_;
  kernel_options options_;
  warden::common::time_source_t clock_;

  mutable std::shared_mutex mutex_;
  identity_verifier_t identity_verifier_;
  escalation_t escalation_;
  std::vector<named_constraint_t> constraints_;
  event_sink_t event_sink_;
};

/// True when `now` falls inside the UTC hour window.
bool within_time_window(const warden::schema::time_window_constraint_t& window,
                        warden::schema::timestamp_milliseconds_t now);

}  // namespace warden::security
