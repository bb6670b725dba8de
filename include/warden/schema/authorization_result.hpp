#pragma once

#include <warden/schema/authorization_code.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct authorization_result;

/// `reason` is safe to hand back to the caller; it never distinguishes a
/// missing resource from a missing grant.
template <>
struct authorization_result<1> final {
  uint16_t version{1};
  authorization_code code{authorization_code::unauthorized};
  std::string reason;
  std::optional<capability_id_t> capability_id;
  std::optional<std::string> pending_id;

  bool authorized() const { return code == authorization_code::authorized; }
};

using authorization_result_t = authorization_result<1>;

}  // namespace warden::schema
