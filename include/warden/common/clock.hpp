#pragma once

#include <warden/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace warden::common {

/// Millisecond wall clock. Components take one so tests can drive time.
using time_source_t = std::function<warden::schema::timestamp_milliseconds_t()>;

inline warden::schema::timestamp_milliseconds_t system_now() {
  return static_cast<warden::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace warden::common
