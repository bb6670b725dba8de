#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: trust event type.
// Behavioral observations fed to the trust engine.
namespace warden::schema {

enum class trust_event_type_t : uint8_t {
  action_success = 1,
  action_failure = 2,
  test_passed = 3,
  test_failed = 4,
  rollback_executed = 5,
  security_violation = 6,
  improvement_applied = 7,
  proposal_submitted = 8,
  proposal_approved = 9,
  proposal_rejected = 10,
  installation_success = 11,
  installation_rollback = 12,
};

inline constexpr auto kTrustEventTypeMappings = std::array{
    std::pair<std::string_view, trust_event_type_t>{
        "action_success", trust_event_type_t::action_success},
    std::pair<std::string_view, trust_event_type_t>{
        "action_failure", trust_event_type_t::action_failure},
    std::pair<std::string_view, trust_event_type_t>{
        "test_passed", trust_event_type_t::test_passed},
    std::pair<std::string_view, trust_event_type_t>{
        "test_failed", trust_event_type_t::test_failed},
    std::pair<std::string_view, trust_event_type_t>{
        "rollback_executed", trust_event_type_t::rollback_executed},
    std::pair<std::string_view, trust_event_type_t>{
        "security_violation", trust_event_type_t::security_violation},
    std::pair<std::string_view, trust_event_type_t>{
        "improvement_applied", trust_event_type_t::improvement_applied},
    std::pair<std::string_view, trust_event_type_t>{
        "proposal_submitted", trust_event_type_t::proposal_submitted},
    std::pair<std::string_view, trust_event_type_t>{
        "proposal_approved", trust_event_type_t::proposal_approved},
    std::pair<std::string_view, trust_event_type_t>{
        "proposal_rejected", trust_event_type_t::proposal_rejected},
    std::pair<std::string_view, trust_event_type_t>{
        "installation_success", trust_event_type_t::installation_success},
    std::pair<std::string_view, trust_event_type_t>{
        "installation_rollback", trust_event_type_t::installation_rollback},
};

template <>
inline std::optional<trust_event_type_t> try_from_string<trust_event_type_t>(
    const std::string_view value) {
  return from_string(value, kTrustEventTypeMappings);
}

inline constexpr std::string_view to_string(const trust_event_type_t value) {
  return to_string(value, kTrustEventTypeMappings).value_or("unknown");
}

}  // namespace warden::schema
