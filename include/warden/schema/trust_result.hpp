#pragma once

#include <warden/schema/error_code.hpp>
#include <warden/schema/trust_profile.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct trust_result;

template <>
struct trust_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::optional<trust_profile_t> profile;
  std::string log;

  bool ok() const { return code == error_code::ok; }
};

using trust_result_t = trust_result<1>;

}  // namespace warden::schema
