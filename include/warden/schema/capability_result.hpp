#pragma once

#include <warden/schema/capability.hpp>
#include <warden/schema/error_code.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct capability_result;

template <>
struct capability_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::optional<capability_t> capability;
  std::string log;

  bool ok() const { return code == error_code::ok; }
};

using capability_result_t = capability_result<1>;

}  // namespace warden::schema
