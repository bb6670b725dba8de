#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace warden::reflex {

enum class verdict_t : uint8_t {
  allow = 0,
  deny = 1,
};

enum class deny_reason_t : uint8_t {
  none = 0,
  check_failed = 1,
  exception = 2,
  timeout = 3,
  blocked_pattern = 4,
  too_large = 5,
};

inline constexpr auto kDenyReasonMappings = std::array{
    std::pair<std::string_view, deny_reason_t>{"none", deny_reason_t::none},
    std::pair<std::string_view, deny_reason_t>{"check_failed",
                                               deny_reason_t::check_failed},
    std::pair<std::string_view, deny_reason_t>{"exception",
                                               deny_reason_t::exception},
    std::pair<std::string_view, deny_reason_t>{"timeout",
                                               deny_reason_t::timeout},
    std::pair<std::string_view, deny_reason_t>{"blocked_pattern",
                                               deny_reason_t::blocked_pattern},
    std::pair<std::string_view, deny_reason_t>{"too_large",
                                               deny_reason_t::too_large},
};

inline constexpr std::string_view to_string(const deny_reason_t value) {
  return warden::schema::to_string(value, kDenyReasonMappings)
      .value_or("unknown");
}

struct reflex_result_t final {
  verdict_t verdict{verdict_t::deny};
  deny_reason_t reason{deny_reason_t::check_failed};
  std::string detail;

  bool allowed() const { return verdict == verdict_t::allow; }
};

/// A safety-critical predicate. True means safe to proceed.
using check_t = std::function<bool()>;

/// Run `check` and fail closed: false, an empty check or an exception all
/// deny.
reflex_result_t wrap(const check_t& check);

/// As above, and a check that has not answered within `timeout` denies. The
/// abandoned check keeps running on its own thread and its answer is
/// discarded.
reflex_result_t wrap(check_t check, std::chrono::milliseconds timeout);

}  // namespace warden::reflex
