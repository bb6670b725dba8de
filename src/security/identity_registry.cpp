#include <warden/security/identity_registry.hpp>

#include <spdlog/spdlog.h>

#include <mutex>
#include <utility>

namespace warden::security {

namespace {

using warden::schema::error_code;

bool fresh(const warden::schema::timestamp_milliseconds_t signed_at,
           const warden::schema::timestamp_milliseconds_t now,
           const warden::schema::duration_milliseconds_t window) {
  auto skew = signed_at > now ? signed_at - now : now - signed_at;
  return skew <= window;
}

}  // namespace

warden::schema::bytes_t signing_payload(
    const warden::schema::signed_request_t& request) {
  auto text = request.agent_id;
  text.push_back('|');
  text.append(request.resource);
  text.push_back('|');
  text.append(request.action);
  text.push_back('|');
  text.append(std::to_string(request.timestamp));
  text.push_back('|');
  text.append(request.nonce);
  return warden::schema::make_bytes(std::string_view{text});
}

bool sign_request(warden::schema::signed_request_t& request,
                  const warden::crypto::ed25519_private_key_t& private_key) {
  auto payload = signing_payload(request);
  auto signature = warden::crypto::sign(
      warden::schema::make_bytes_view(payload), private_key);
  if (!signature.has_value()) {
    return false;
  }
  request.signature = *signature;
  return true;
}

identity_registry::identity_registry(identity_registry_options options,
                                     warden::common::time_source_t clock)
    : options_{std::move(options)}, clock_{std::move(clock)} {}

identity_result_t identity_registry::register_identity(
    const warden::schema::ed25519_public_key_t& public_key,
    std::string name) {
  auto result = identity_result_t{};
  result.agent_id = warden::crypto::derive_agent_id(public_key);

  auto lock = std::unique_lock{mutex_};
  if (identities_.contains(result.agent_id)) {
    result.code = error_code::already_exists;
    return result;
  }
  auto record = identity_record_t{};
  record.agent_id = result.agent_id;
  record.name = std::move(name);
  record.public_key = public_key;
  record.created_at = clock_();
  identities_.emplace(result.agent_id, std::move(record));
  spdlog::info("Registered identity '{}'", result.agent_id);
  return result;
}

warden::schema::error_code identity_registry::suspend(
    const warden::schema::agent_id_t& agent_id,
    std::string reason) {
  auto lock = std::unique_lock{mutex_};
  auto it = identities_.find(agent_id);
  if (it == std::end(identities_)) {
    return error_code::not_found;
  }
  if (it->second.status == identity_status_t::revoked) {
    return error_code::identity_revoked;
  }
  it->second.status = identity_status_t::suspended;
  it->second.status_reason = std::move(reason);
  it->second.status_changed_at = clock_();
  spdlog::warn("Suspended identity '{}'", agent_id);
  return error_code::ok;
}

warden::schema::error_code identity_registry::resume(
    const warden::schema::agent_id_t& agent_id) {
  auto lock = std::unique_lock{mutex_};
  auto it = identities_.find(agent_id);
  if (it == std::end(identities_)) {
    return error_code::not_found;
  }
  if (it->second.status == identity_status_t::revoked) {
    return error_code::identity_revoked;
  }
  it->second.status = identity_status_t::active;
  it->second.status_reason.clear();
  it->second.status_changed_at = clock_();
  spdlog::info("Resumed identity '{}'", agent_id);
  return error_code::ok;
}

warden::schema::error_code identity_registry::revoke(
    const warden::schema::agent_id_t& agent_id,
    std::string reason) {
  auto lock = std::unique_lock{mutex_};
  auto it = identities_.find(agent_id);
  if (it == std::end(identities_)) {
    return error_code::not_found;
  }
  it->second.status = identity_status_t::revoked;
  it->second.status_reason = std::move(reason);
  it->second.status_changed_at = clock_();
  spdlog::warn("Revoked identity '{}'", agent_id);
  return error_code::ok;
}

std::optional<identity_status_t> identity_registry::status(
    const warden::schema::agent_id_t& agent_id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = identities_.find(agent_id);
  if (it == std::end(identities_)) {
    return std::nullopt;
  }
  return it->second.status;
}

std::optional<identity_record_t> identity_registry::lookup(
    const warden::schema::agent_id_t& agent_id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = identities_.find(agent_id);
  if (it == std::end(identities_) ||
      it->second.status != identity_status_t::active) {
    return std::nullopt;
  }
  return it->second;
}

identity_check_t identity_registry::verify(
    const warden::schema::signed_request_t& request) {
  auto now = clock_();
  auto public_key = warden::schema::ed25519_public_key_t{};
  {
    auto lock = std::shared_lock{mutex_};
    auto it = identities_.find(request.agent_id);
    if (it == std::end(identities_)) {
      return identity_check_t::unknown_agent;
    }
    if (it->second.status == identity_status_t::suspended) {
      return identity_check_t::suspended;
    }
    if (it->second.status == identity_status_t::revoked) {
      return identity_check_t::revoked;
    }
    public_key = it->second.public_key;
  }

  if (!fresh(request.timestamp, now, options_.freshness_window)) {
    spdlog::warn("Stale signed request from '{}'", request.agent_id);
    return identity_check_t::stale;
  }

  auto payload = signing_payload(request);
  if (!warden::crypto::verify_signature(
          warden::schema::make_bytes_view(payload), public_key,
          request.signature)) {
    spdlog::warn("Invalid request signature from '{}'", request.agent_id);
    return identity_check_t::invalid_signature;
  }

  auto lock = std::unique_lock{mutex_};
  prune_nonces(now);
  auto key = request.agent_id + "|" + request.nonce;
  if (!seen_nonces_.emplace(key, request.timestamp).second) {
    spdlog::warn("Replayed nonce from '{}'", request.agent_id);
    return identity_check_t::replayed;
  }
  return identity_check_t::verified;
}

identity_verifier_t identity_registry::verifier() {
  return [this](const warden::schema::signed_request_t& request) {
    return verify(request);
  };
}

void identity_registry::prune_nonces(
    const warden::schema::timestamp_milliseconds_t now) {
  for (auto it = std::begin(seen_nonces_); it != std::end(seen_nonces_);) {
    if (!fresh(it->second, now, options_.freshness_window)) {
      it = seen_nonces_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace warden::security
