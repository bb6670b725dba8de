#include <warden/sanitize/sanitizer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace warden::sanitize {

sanitize_result make_success(std::string value,
                             const warden::schema::taint_t& taint,
                             const warden::schema::sanitization_t applied,
                             const warden::schema::confidence_t certified,
                             std::string detail) {
  auto result = sanitize_result{};
  result.value = std::move(value);
  result.taint = warden::schema::apply_sanitization(taint, applied, certified);
  result.detail = std::move(detail);
  return result;
}

sanitize_result make_failure(const warden::schema::sanitize_error_code code,
                             const warden::schema::taint_t& taint,
                             std::string detail,
                             std::vector<std::string> patterns) {
  spdlog::warn("Sanitizer rejected value: {} ({} pattern(s))",
               warden::schema::to_string(code), patterns.size());
  auto result = sanitize_result{};
  result.code = code;
  result.taint = taint;
  result.detail = std::move(detail);
  result.patterns = std::move(patterns);
  return result;
}

detect_result make_detection(std::vector<std::string> patterns,
                             const double score_per_pattern) {
  auto result = detect_result{};
  result.safe = patterns.empty();
  result.score = std::min(
      1.0, score_per_pattern * static_cast<double>(patterns.size()));
  result.patterns = std::move(patterns);
  return result;
}

}  // namespace warden::sanitize
