#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: points event type.
// Validated contributions and penalties applied to the trust points ledger.
namespace warden::schema {

enum class points_event_type_t : uint8_t {
  proposal_approved = 1,
  installation_successful = 2,
  high_impact_feature = 3,
  bug_fix_passed = 4,
  documentation_improvement = 5,
  implementation_failure = 6,
  installation_rolled_back = 7,
  security_violation = 8,
  circuit_breaker_triggered = 9,
};

inline constexpr auto kPointsEventTypeMappings = std::array{
    std::pair<std::string_view, points_event_type_t>{
        "proposal_approved", points_event_type_t::proposal_approved},
    std::pair<std::string_view, points_event_type_t>{
        "installation_successful",
        points_event_type_t::installation_successful},
    std::pair<std::string_view, points_event_type_t>{
        "high_impact_feature", points_event_type_t::high_impact_feature},
    std::pair<std::string_view, points_event_type_t>{
        "bug_fix_passed", points_event_type_t::bug_fix_passed},
    std::pair<std::string_view, points_event_type_t>{
        "documentation_improvement",
        points_event_type_t::documentation_improvement},
    std::pair<std::string_view, points_event_type_t>{
        "implementation_failure", points_event_type_t::implementation_failure},
    std::pair<std::string_view, points_event_type_t>{
        "installation_rolled_back",
        points_event_type_t::installation_rolled_back},
    std::pair<std::string_view, points_event_type_t>{
        "security_violation", points_event_type_t::security_violation},
    std::pair<std::string_view, points_event_type_t>{
        "circuit_breaker_triggered",
        points_event_type_t::circuit_breaker_triggered},
};

template <>
inline std::optional<points_event_type_t>
try_from_string<points_event_type_t>(const std::string_view value) {
  return from_string(value, kPointsEventTypeMappings);
}

inline constexpr std::string_view to_string(const points_event_type_t value) {
  return to_string(value, kPointsEventTypeMappings).value_or("unknown");
}

}  // namespace warden::schema
