#include <warden/crypto/verify.hpp>
#include <warden/security/capability_store.hpp>
#include <warden/security/resource_uri.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <utility>

namespace warden::security {

namespace {

using warden::schema::error_code;

warden::schema::security_event_record_t make_event(
    const warden::schema::security_event_type_t type,
    const warden::schema::capability_t& capability,
    const warden::schema::timestamp_milliseconds_t now,
    std::string message) {
  auto event = warden::schema::security_event_record_t{};
  event.type = type;
  event.severity = warden::schema::security_event_severity_t::info;
  event.principal = capability.principal_id;
  event.capability_id = capability.id;
  event.resource = capability.resource_uri;
  event.message = std::move(message);
  event.recorded_at = now;
  return event;
}

std::optional<std::string> normalize(const std::string_view resource_uri) {
  auto uri = parse_resource_uri(resource_uri);
  if (!uri.has_value()) {
    return std::nullopt;
  }
  return uri->to_string();
}

}  // namespace

warden::schema::bytes_t capability_signing_payload(
    const std::string_view principal,
    const std::string_view resource_uri,
    const std::string_view action,
    const std::optional<warden::schema::timestamp_milliseconds_t> expires_at) {
  auto text = std::string{"warden-capability-v1\n"};
  text.append(principal);
  text.push_back('\n');
  text.append(normalize(resource_uri).value_or(std::string{resource_uri}));
  text.push_back('\n');
  text.append(action);
  text.push_back('\n');
  if (expires_at.has_value()) {
    text.append(std::to_string(*expires_at));
  }
  return warden::schema::make_bytes(std::string_view{text});
}

capability_verifier_t make_authority_verifier(
    const warden::schema::ed25519_public_key_t& authority_key) {
  return [authority_key](const warden::schema::bytes_view_t& message,
                         const warden::schema::ed25519_signature_t& signature) {
    return warden::crypto::verify_signature(message, authority_key, signature);
  };
}

capability_store::capability_store(capability_store_options options,
                                   warden::common::time_source_t clock)
    : options_{std::move(options)}, clock_{std::move(clock)} {
  spdlog::info(
      "Capability store ready (signatures {}, quotas {} per principal / {} "
      "global)",
      options_.require_signatures ? "required" : "optional",
      options_.max_per_principal, options_.max_global);
}

void capability_store::set_capability_verifier(capability_verifier_t verifier) {
  auto lock = std::unique_lock{mutex_};
  capability_verifier_ = std::move(verifier);
}

void capability_store::set_event_sink(event_sink_t sink) {
  auto lock = std::unique_lock{mutex_};
  event_sink_ = std::move(sink);
}

warden::schema::capability_result_t capability_store::grant(
    const warden::schema::agent_id_t& principal,
    const std::string_view resource_uri,
    const grant_options& options) {
  auto result = warden::schema::capability_result_t{};
  auto uri = parse_resource_uri(resource_uri);
  if (!uri.has_value() || principal.empty()) {
    spdlog::warn("Refusing grant to '{}': unparseable resource", principal);
    result.code = error_code::invalid_resource;
    result.log = "invalid resource uri";
    return result;
  }
  if (options_.require_signatures && !options.signature.has_value()) {
    spdlog::warn("Refusing unsigned grant to '{}' on '{}'", principal,
                 uri->to_string());
    result.code = error_code::signature_required;
    result.log = "signature required";
    return result;
  }
  if (options_.enforce_quotas &&
      options.delegation_depth > options_.max_delegation_depth) {
    result.code = error_code::quota_exceeded;
    result.log = "delegation depth exceeds limit";
    return result;
  }

  auto events = std::vector<warden::schema::security_event_record_t>{};
  {
    auto lock = std::unique_lock{mutex_};
    if (auto quota = check_quota(principal); quota != error_code::ok) {
      spdlog::warn("Capability quota exceeded for '{}'", principal);
      result.code = quota;
      result.log = "capability quota exceeded";
      return result;
    }

    auto capability = warden::schema::capability_t{};
    capability.id = "cap_" + warden::crypto::random_hex(16);
    capability.principal_id = principal;
    capability.resource_uri = uri->to_string();
    capability.action = options.action.value_or(uri->action);
    capability.granted_at = clock_();
    capability.expires_at = options.expires_at;
    capability.signature = options.signature;
    capability.issuer_id = options.issuer_id;
    capability.delegation_depth = options.delegation_depth;
    capability.match_mode = options.match_mode;
    capability.constraints = options.constraints;

    const auto& stored = insert(std::move(capability));
    events.push_back(make_event(
        warden::schema::security_event_type_t::capability_granted, stored,
        stored.granted_at, "granted " + stored.action));
    result.capability = stored;
  }
  emit(events);
  spdlog::info("Granted {} to '{}' on '{}'", result.capability->id, principal,
               result.capability->resource_uri);
  return result;
}

warden::schema::capability_result_t capability_store::delegate(
    const warden::schema::capability_id_t& parent_id,
    const warden::schema::agent_id_t& principal,
    const grant_options& options) {
  auto result = warden::schema::capability_result_t{};
  auto events = std::vector<warden::schema::security_event_record_t>{};
  {
    auto lock = std::unique_lock{mutex_};
    auto now = clock_();
    auto parent_it = by_id_.find(parent_id);
    if (parent_it == std::end(by_id_) || !active_at(parent_it->second, now)) {
      result.code = error_code::not_found;
      result.log = "parent capability not found";
      return result;
    }
    const auto parent = parent_it->second;
    if (parent.delegation_depth == 0) {
      spdlog::warn("Capability {} cannot be delegated further", parent_id);
      result.code = error_code::delegation_not_allowed;
      result.log = "delegation depth exhausted";
      return result;
    }
    if (options_.require_signatures && !options.signature.has_value()) {
      result.code = error_code::signature_required;
      result.log = "signature required";
      return result;
    }
    if (auto quota = check_quota(principal); quota != error_code::ok) {
      result.code = quota;
      result.log = "capability quota exceeded";
      return result;
    }

    auto child = warden::schema::capability_t{};
    child.id = "cap_" + warden::crypto::random_hex(16);
    child.principal_id = principal;
    child.resource_uri = parent.resource_uri;
    child.action = parent.action;
    child.granted_at = now;
    child.expires_at = parent.expires_at;
    if (options.expires_at.has_value() &&
        (!child.expires_at.has_value() ||
         *options.expires_at < *child.expires_at)) {
      child.expires_at = options.expires_at;
    }
    child.signature = options.signature;
    child.issuer_id = parent.principal_id;
    child.parent_id = parent.id;
    child.delegation_depth = static_cast<uint8_t>(parent.delegation_depth - 1);
    child.match_mode = parent.match_mode;
    child.constraints = parent.constraints;

    const auto& stored = insert(std::move(child));
    by_parent_[parent.id].push_back(stored.id);
    events.push_back(make_event(
        warden::schema::security_event_type_t::capability_granted, stored, now,
        "delegated from " + parent.id));
    result.capability = stored;
  }
  emit(events);
  spdlog::info("Delegated {} from {} to '{}'", result.capability->id,
               parent_id, principal);
  return result;
}

warden::schema::error_code capability_store::revoke(
    const warden::schema::capability_id_t& id) {
  auto events = std::vector<warden::schema::security_event_record_t>{};
  {
    auto lock = std::unique_lock{mutex_};
    if (!by_id_.contains(id)) {
      return error_code::not_found;
    }
    revoke_locked(id, clock_(), false, events);
  }
  emit(events);
  spdlog::info("Revoked {} ({} capability record(s) affected)", id,
               events.size());
  return error_code::ok;
}

uint64_t capability_store::revoke_all(
    const warden::schema::agent_id_t& principal) {
  auto events = std::vector<warden::schema::security_event_record_t>{};
  auto count = uint64_t{};
  {
    auto lock = std::unique_lock{mutex_};
    auto it = by_principal_.find(principal);
    if (it == std::end(by_principal_)) {
      return 0;
    }
    auto now = clock_();
    for (const auto& id : it->second) {
      if (!by_id_.at(id).revoked_at.has_value()) {
        revoke_locked(id, now, false, events);
        ++count;
      }
    }
  }
  emit(events);
  spdlog::info("Revoked {} capability(ies) held by '{}'", count, principal);
  return count;
}

std::vector<warden::schema::capability_t> capability_store::list(
    const warden::schema::agent_id_t& principal,
    const bool include_inactive) const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<warden::schema::capability_t>{};
  auto it = by_principal_.find(principal);
  if (it == std::end(by_principal_)) {
    return out;
  }
  auto now = clock_();
  for (const auto& id : it->second) {
    const auto& capability = by_id_.at(id);
    if (include_inactive || active_at(capability, now)) {
      out.push_back(capability);
    }
  }
  return out;
}

std::optional<warden::schema::capability_t> capability_store::get(
    const warden::schema::capability_id_t& id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = by_id_.find(id);
  if (it == std::end(by_id_)) {
    return std::nullopt;
  }
  return it->second;
}

bool capability_store::exists(const warden::schema::agent_id_t& principal,
                              const std::string_view resource_uri,
                              const std::string_view action) const {
  auto found = find_authorizing(principal, resource_uri, action).has_value();
  spdlog::debug("Narrow capability probe principal='{}' action='{}' -> {}",
                principal, action, found);
  return found;
}

std::optional<warden::schema::capability_t>
capability_store::find_authorizing(
    const warden::schema::agent_id_t& principal,
    const std::string_view resource_uri,
    const std::string_view action) const {
  auto requested = parse_resource_uri(resource_uri);
  if (!requested.has_value()) {
    return std::nullopt;
  }
  auto normalized = requested->to_string();
  auto wanted_action =
      action.empty() ? std::string_view{requested->action} : action;

  auto lock = std::shared_lock{mutex_};
  auto it = by_principal_.find(principal);
  if (it == std::end(by_principal_)) {
    return std::nullopt;
  }
  auto now = clock_();
  for (const auto& id : it->second) {
    const auto& capability = by_id_.at(id);
    if (!active_at(capability, now) || capability.action != wanted_action) {
      continue;
    }
    auto prefix = capability.match_mode == warden::schema::match_mode_t::prefix;
    if (!resource_matches(capability.resource_uri, normalized, prefix)) {
      continue;
    }
    if (!signature_acceptable(capability)) {
      spdlog::warn("Capability {} failed signature policy", capability.id);
      continue;
    }
    return capability;
  }
  return std::nullopt;
}

bool capability_store::is_active(
    const warden::schema::capability_id_t& id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = by_id_.find(id);
  return it != std::end(by_id_) && active_at(it->second, clock_());
}

uint64_t capability_store::cleanup_expired() {
  auto lock = std::unique_lock{mutex_};
  auto now = clock_();
  auto expired = std::vector<warden::schema::capability_id_t>{};
  for (const auto& [id, capability] : by_id_) {
    if (!capability.revoked_at.has_value() &&
        capability.expires_at.has_value() && now >= *capability.expires_at) {
      expired.push_back(id);
    }
  }

  for (const auto& id : expired) {
    auto principal = by_id_.at(id).principal_id;
    auto& held = by_principal_[principal];
    held.erase(std::remove(std::begin(held), std::end(held), id),
               std::end(held));
    if (held.empty()) {
      by_principal_.erase(principal);
    }
    by_parent_.erase(id);
    by_id_.erase(id);
  }
  unrevoked_count_ -= std::min<uint64_t>(unrevoked_count_, expired.size());
  stats_.total_expired += expired.size();
  if (!expired.empty()) {
    spdlog::info("Removed {} expired capability(ies)", expired.size());
  }
  return expired.size();
}

capability_stats_t capability_store::stats() const {
  auto lock = std::shared_lock{mutex_};
  auto out = stats_;
  auto now = clock_();
  out.active = static_cast<uint64_t>(std::count_if(
      std::begin(by_id_), std::end(by_id_),
      [&](const auto& entry) { return active_at(entry.second, now); }));
  return out;
}

bool capability_store::active_at(
    const warden::schema::capability_t& capability,
    const warden::schema::timestamp_milliseconds_t now) const {
  if (capability.revoked_at.has_value()) {
    return false;
  }
  return !capability.expires_at.has_value() || now < *capability.expires_at;
}

bool capability_store::signature_acceptable(
    const warden::schema::capability_t& capability) const {
  if (!capability.signature.has_value()) {
    return !options_.require_signatures;
  }
  if (!capability_verifier_) {
    return false;
  }
  auto payload = capability_signing_payload(
      capability.principal_id, capability.resource_uri, capability.action,
      capability.expires_at);
  return capability_verifier_(warden::schema::make_bytes_view(payload),
                              *capability.signature);
}

warden::schema::error_code capability_store::check_quota(
    const warden::schema::agent_id_t& principal) const {
  if (!options_.enforce_quotas) {
    return error_code::ok;
  }
  if (unrevoked_count_ >= options_.max_global) {
    return error_code::quota_exceeded;
  }
  auto it = by_principal_.find(principal);
  if (it == std::end(by_principal_)) {
    return error_code::ok;
  }
  auto now = clock_();
  auto held = std::count_if(
      std::begin(it->second), std::end(it->second),
      [&](const auto& id) { return active_at(by_id_.at(id), now); });
  return static_cast<uint64_t>(held) >= options_.max_per_principal
             ? error_code::quota_exceeded
             : error_code::ok;
}

warden::schema::capability_t& capability_store::insert(
    warden::schema::capability_t capability) {
  auto id = capability.id;
  by_principal_[capability.principal_id].push_back(id);
  auto [it, inserted] = by_id_.emplace(id, std::move(capability));
  static_cast<void>(inserted);
  ++unrevoked_count_;
  ++stats_.total_granted;
  return it->second;
}

void capability_store::revoke_locked(
    const warden::schema::capability_id_t& id,
    const warden::schema::timestamp_milliseconds_t now,
    const bool cascade,
    std::vector<warden::schema::security_event_record_t>& out) {
  auto& capability = by_id_.at(id);
  if (!capability.revoked_at.has_value()) {
    capability.revoked_at = now;
    --unrevoked_count_;
    ++stats_.total_revoked;
    if (cascade) {
      ++stats_.cascade_revoked;
    }
    out.push_back(make_event(
        warden::schema::security_event_type_t::capability_revoked, capability,
        now, cascade ? "revoked with parent" : "revoked"));
  }

  auto children = by_parent_.find(id);
  if (children == std::end(by_parent_)) {
    return;
  }
  for (const auto& child : children->second) {
    if (by_id_.contains(child)) {
      revoke_locked(child, now, true, out);
    }
  }
}

void capability_store::emit(
    const std::vector<warden::schema::security_event_record_t>& events) {
  auto sink = event_sink_t{};
  {
    auto lock = std::shared_lock{mutex_};
    sink = event_sink_;
  }
  if (!sink) {
    return;
  }
  for (const auto& event : events) {
    sink(event);
  }
}

}  // namespace warden::security
