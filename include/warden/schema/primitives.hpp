#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

using agent_id_t = std::string;
using capability_id_t = std::string;

using ed25519_public_key_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;

inline constexpr auto kMillisecondsPerSecond = duration_milliseconds_t{1000};
inline constexpr auto kMillisecondsPerHour =
    duration_milliseconds_t{3600} * kMillisecondsPerSecond;
inline constexpr auto kMillisecondsPerDay = 24 * kMillisecondsPerHour;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace warden::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
