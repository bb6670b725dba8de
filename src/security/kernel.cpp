#include <warden/sanitize/log_injection.hpp>
#include <warden/security/kernel.hpp>
#include <warden/security/resource_uri.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <utility>

namespace warden::security {

namespace {

using warden::schema::authorization_code;

constexpr auto kMaxLoggedLength = std::size_t{256};

std::string loggable(const std::string_view value) {
  return warden::sanitize::truncate(
      warden::sanitize::strip_control_sequences(value), kMaxLoggedLength);
}

std::string_view public_reason(const authorization_code code) {
  switch (code) {
    case authorization_code::authorized:
      return "authorized";
    case authorization_code::pending_approval:
      return "approval pending";
    case authorization_code::unauthorized:
      return "not authorized";
    case authorization_code::trust_frozen:
      return "trust frozen";
    case authorization_code::insufficient_trust:
      return "insufficient trust tier";
    case authorization_code::constraint_violated:
      return "constraint not satisfied";
    case authorization_code::rate_limited:
      return "rate limit exceeded";
    case authorization_code::reflex_blocked:
      return "blocked by safety reflex";
  }
  return "not authorized";
}

}  // namespace

bool within_time_window(const warden::schema::time_window_constraint_t& window,
                        const warden::schema::timestamp_milliseconds_t now) {
  auto hour = (now / warden::schema::kMillisecondsPerHour) % 24;
  if (window.start_hour <= window.end_hour) {
    return hour >= window.start_hour && hour < window.end_hour;
  }
  return hour >= window.start_hour || hour < window.end_hour;
}

kernel::kernel(capability_store& store,
               warden::trust::engine& trust,
               warden::trust::tier_policy& policy,
               warden::reflex::reflex_registry& reflexes,
               rate_limiter& limiter,
               kernel_options options,
               warden::common::time_source_t clock)
    : store_{store},
      trust_{trust},
      policy_{policy},
      reflexes_{reflexes},
      limiter_{limiter},
      options_{std::move(options)},
      clock_{std::move(clock)} {}

void kernel::set_identity_verifier(identity_verifier_t verifier) {
  auto lock = std::unique_lock{mutex_};
  identity_verifier_ = std::move(verifier);
}

void kernel::set_escalation(escalation_t escalation) {
  auto lock = std::unique_lock{mutex_};
  escalation_ = std::move(escalation);
}

void kernel::add_constraint(std::string name, constraint_check_t check) {
  auto lock = std::unique_lock{mutex_};
  constraints_.push_back(named_constraint_t{std::move(name), std::move(check)});
}

void kernel::set_event_sink(event_sink_t sink) {
  auto lock = std::unique_lock{mutex_};
  event_sink_ = std::move(sink);
}

warden::schema::authorization_result_t kernel::authorize(
    const warden::schema::agent_id_t& principal,
    const std::string_view resource_uri,
    const std::string_view action,
    const authorize_options& options) const {
  auto request = authorization_request_t{principal, std::string{resource_uri},
                                         std::string{action}, options};

  if (!parse_resource_uri(resource_uri).has_value()) {
    return deny(request, authorization_code::unauthorized, "invalid_resource",
                std::nullopt);
  }

  // Capability.
  auto capability = store_.find_authorizing(principal, resource_uri, action);
  if (!capability.has_value()) {
    return deny(request, authorization_code::unauthorized, "no_capability",
                std::nullopt);
  }
  if (request.action.empty()) {
    request.action = capability->action;
  }

  // Identity.
  if (auto failure = check_identity(request); failure.has_value()) {
    return deny(request, authorization_code::unauthorized, *failure,
                capability->id);
  }

  // Trust tier.
  auto requirement = policy_.requirement(resource_uri);
  auto profile = trust_.evaluate(principal);
  if (profile.has_value() && profile->frozen) {
    return deny(request, authorization_code::trust_frozen,
                "frozen: " + profile->frozen_reason, capability->id);
  }
  auto behavioral = profile.has_value() ? profile->tier
                                        : warden::schema::trust_tier_t::untrusted;
  auto effective = policy_.effective_tier(principal, behavioral);
  if (!warden::trust::tier_sufficient(effective, requirement.minimum)) {
    return deny(request, authorization_code::insufficient_trust,
                std::string{"tier "} +
                    std::string{warden::schema::to_string(effective)} +
                    " below " +
                    std::string{warden::schema::to_string(requirement.minimum)},
                capability->id);
  }

  // Constraints.
  auto now = clock_();
  if (capability->constraints.time_window.has_value() &&
      !within_time_window(*capability->constraints.time_window, now)) {
    return deny(request, authorization_code::constraint_violated,
                "outside_time_window", capability->id);
  }

  auto constraints = std::vector<named_constraint_t>{};
  auto escalation = escalation_t{};
  {
    auto lock = std::shared_lock{mutex_};
    constraints = constraints_;
    escalation = escalation_;
  }
  for (const auto& constraint : constraints) {
    auto check = warden::reflex::check_t{};
    if (constraint.check) {
      check = [check_fn = constraint.check, request, capability = *capability] {
        return check_fn(request, capability);
      };
    }
    if (!guarded(std::move(check)).allowed()) {
      return deny(request, authorization_code::constraint_violated,
                  "constraint " + constraint.name, capability->id);
    }
  }

  // Rate limit. Only an authorized request is counted, below.
  const auto& rate = capability->constraints.rate_limit;
  const auto rate_key = principal + "|" + capability->id;
  if (rate.has_value()) {
    auto decision = limiter_.peek(rate_key, rate->limit, rate->window);
    if (!decision.allowed) {
      return deny(request, authorization_code::rate_limited,
                  "rate_limited until " + std::to_string(decision.reset_at),
                  capability->id);
    }
  }

  // Escalation.
  if (requirement.gated) {
    if (!escalation) {
      return deny(request, authorization_code::unauthorized,
                  "approval_unavailable", capability->id);
    }
    auto outcome = std::make_shared<escalation_result_t>();
    auto answered = guarded([escalation, outcome, request,
                             capability = *capability] {
      *outcome = escalation(request, capability);
      return true;
    });
    if (!answered.allowed() ||
        outcome->decision == escalation_decision_t::deny) {
      return deny(request, authorization_code::unauthorized,
                  "escalation_denied", capability->id);
    }
    if (outcome->decision == escalation_decision_t::pending) {
      auto result = deny(request, authorization_code::pending_approval,
                         "pending " + outcome->pending_id, capability->id);
      result.pending_id = outcome->pending_id;
      return result;
    }
  }

  // Reflexes.
  auto reflex = reflexes_.check(warden::reflex::reflex_context_t{
      request.action, options.command, options.path, request.resource_uri});
  if (!reflex.allowed()) {
    return deny(request, authorization_code::reflex_blocked,
                "reflex " + reflex.detail + " (" +
                    std::string{warden::reflex::to_string(reflex.reason)} +
                    ")",
                capability->id);
  }

  // A revoke that returned while this call was in flight wins.
  if (!store_.is_active(capability->id)) {
    return deny(request, authorization_code::unauthorized, "revoked",
                capability->id);
  }

  if (rate.has_value()) {
    auto decision = limiter_.consume(rate_key, rate->limit, rate->window);
    if (!decision.allowed) {
      return deny(request, authorization_code::rate_limited,
                  "rate_limited until " + std::to_string(decision.reset_at),
                  capability->id);
    }
  }

  auto result = warden::schema::authorization_result_t{};
  result.code = authorization_code::authorized;
  result.reason = std::string{public_reason(result.code)};
  result.capability_id = capability->id;
  spdlog::debug("Authorized '{}' on '{}' via {}", loggable(principal),
                loggable(resource_uri), capability->id);
  return result;
}

bool kernel::exists(const warden::schema::agent_id_t& principal,
                    const std::string_view resource_uri,
                    const std::string_view action) const {
  return store_.exists(principal, resource_uri, action);
}

warden::schema::authorization_result_t kernel::deny(
    const authorization_request_t& request,
    const authorization_code code,
    const std::string& detail,
    const std::optional<warden::schema::capability_id_t>& capability_id)
    const {
  auto result = warden::schema::authorization_result_t{};
  result.code = code;
  result.reason = options_.disclose_denial_reasons
                      ? detail
                      : std::string{public_reason(code)};
  result.capability_id = capability_id;

  spdlog::warn("Denied '{}' {} on '{}': {} ({})", loggable(request.principal),
               loggable(request.action), loggable(request.resource_uri),
               warden::schema::to_string(code), loggable(detail));

  auto sink = event_sink_t{};
  {
    auto lock = std::shared_lock{mutex_};
    sink = event_sink_;
  }
  if (sink) {
    auto event = warden::schema::security_event_record_t{};
    event.type = warden::schema::security_event_type_t::authorization_denied;
    event.severity = code == authorization_code::pending_approval
                         ? warden::schema::security_event_severity_t::info
                         : warden::schema::security_event_severity_t::warning;
    event.principal = request.principal;
    event.capability_id = capability_id;
    event.resource = request.resource_uri;
    event.message = std::string{warden::schema::to_string(code)} + ": " + detail;
    event.recorded_at = clock_();
    sink(event);
  }
  return result;
}

std::optional<std::string> kernel::check_identity(
    const authorization_request_t& request) const {
  const auto& signed_request = request.options.signed_request;
  if (!signed_request.has_value()) {
    if (options_.require_identity) {
      return "identity_required";
    }
    return std::nullopt;
  }

  if (signed_request->agent_id != request.principal ||
      signed_request->resource != request.resource_uri ||
      signed_request->action != request.action) {
    return std::string{"identity_"} +
           std::string{to_string(identity_check_t::mismatch)};
  }

  auto verifier = identity_verifier_t{};
  {
    auto lock = std::shared_lock{mutex_};
    verifier = identity_verifier_;
  }
  if (!verifier) {
    return "identity_verifier_unavailable";
  }

  auto outcome =
      std::make_shared<identity_check_t>(identity_check_t::unknown_agent);
  auto answered = guarded([verifier, outcome, proof = *signed_request] {
    *outcome = verifier(proof);
    return true;
  });
  if (!answered.allowed()) {
    return "identity_check_failed";
  }
  if (*outcome != identity_check_t::verified) {
    return std::string{"identity_"} + std::string{to_string(*outcome)};
  }
  return std::nullopt;
}

warden::reflex::reflex_result_t kernel::guarded(
    warden::reflex::check_t check) const {
  if (options_.check_timeout.has_value()) {
    return warden::reflex::wrap(std::move(check), *options_.check_timeout);
  }
  return warden::reflex::wrap(check);
}

}  // namespace warden::security
