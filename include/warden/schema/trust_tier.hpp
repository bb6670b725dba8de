#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: trust tier.
// Named bands shared by the behavioral score and the points ledger. The
// underlying value is the band rank used for every comparison.
namespace warden::schema {

enum class trust_tier_t : uint8_t {
  untrusted = 0,
  probationary = 1,
  trusted = 2,
  veteran = 3,
  autonomous = 4,
};

inline constexpr auto kTrustTierMappings = std::array{
    std::pair<std::string_view, trust_tier_t>{"untrusted",
                                              trust_tier_t::untrusted},
    std::pair<std::string_view, trust_tier_t>{"probationary",
                                              trust_tier_t::probationary},
    std::pair<std::string_view, trust_tier_t>{"trusted",
                                              trust_tier_t::trusted},
    std::pair<std::string_view, trust_tier_t>{"veteran",
                                              trust_tier_t::veteran},
    std::pair<std::string_view, trust_tier_t>{"autonomous",
                                              trust_tier_t::autonomous},
};

template <>
inline std::optional<trust_tier_t> try_from_string<trust_tier_t>(
    const std::string_view value) {
  return from_string(value, kTrustTierMappings);
}

inline constexpr std::string_view to_string(const trust_tier_t value) {
  return to_string(value, kTrustTierMappings).value_or("unknown");
}

inline constexpr uint8_t rank(const trust_tier_t value) {
  return static_cast<uint8_t>(value);
}

}  // namespace warden::schema
