#pragma once

#include <warden/common/clock.hpp>
#include <warden/sanitize/sanitizer.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/taint.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace warden::testing {

/// 2023-11-14 12:00:00 UTC.
inline constexpr auto kTestEpoch =
    warden::schema::timestamp_milliseconds_t{1'699'963'200'000};

/// Hand-driven clock. Copies of `source()` observe every later advance.
class manual_clock final {
 public:
  explicit manual_clock(
      const warden::schema::timestamp_milliseconds_t start = kTestEpoch)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  warden::common::time_source_t source() const {
    return [now = now_] { return now->load(); };
  }

  warden::schema::timestamp_milliseconds_t now() const { return now_->load(); }

  void advance(const warden::schema::duration_milliseconds_t by) {
    now_->fetch_add(by);
  }

  void set(const warden::schema::timestamp_milliseconds_t value) {
    now_->store(value);
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

inline warden::schema::taint_t make_untrusted(
    const std::string_view source = "test") {
  auto taint = warden::schema::taint_t{};
  taint.source = std::string{source};
  return taint;
}

inline warden::sanitize::resolver_t fixed_resolver(
    std::vector<std::string> addresses) {
  return [addresses = std::move(addresses)](std::string_view,
                                            std::chrono::milliseconds) {
    return std::optional<std::vector<std::string>>{addresses};
  };
}

inline warden::sanitize::resolver_t failing_resolver() {
  return [](std::string_view, std::chrono::milliseconds) {
    return std::optional<std::vector<std::string>>{};
  };
}

inline std::filesystem::path make_temp_dir(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  std::filesystem::create_directories(path);
  return path;
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace warden::testing
