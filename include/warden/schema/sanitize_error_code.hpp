#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: sanitize error code.
// A non-ok code always means the value must not reach its sink.
namespace warden::schema {

enum class sanitize_error_code : uint32_t {
  ok = 0,
  blocked_scheme = 1,
  blocked_port = 2,
  metadata_endpoint = 3,
  private_ip = 4,
  dns_resolution_failed = 5,
  path_traversal = 6,
  prompt_injection_detected = 7,
  max_depth_exceeded = 8,
  max_size_exceeded = 9,
  unsafe_term = 10,
  json_decode_error = 11,
  identifier_not_allowed = 12,
  missing_option = 13,
  too_large = 14,
  invalid_url = 15,
  term_decode_error = 16,
};

inline constexpr auto kSanitizeErrorCodeMappings = std::array{
    std::pair<std::string_view, sanitize_error_code>{"ok",
                                                     sanitize_error_code::ok},
    std::pair<std::string_view, sanitize_error_code>{
        "blocked_scheme", sanitize_error_code::blocked_scheme},
    std::pair<std::string_view, sanitize_error_code>{
        "blocked_port", sanitize_error_code::blocked_port},
    std::pair<std::string_view, sanitize_error_code>{
        "metadata_endpoint", sanitize_error_code::metadata_endpoint},
    std::pair<std::string_view, sanitize_error_code>{
        "private_ip", sanitize_error_code::private_ip},
    std::pair<std::string_view, sanitize_error_code>{
        "dns_resolution_failed", sanitize_error_code::dns_resolution_failed},
    std::pair<std::string_view, sanitize_error_code>{
        "path_traversal", sanitize_error_code::path_traversal},
    std::pair<std::string_view, sanitize_error_code>{
        "prompt_injection_detected",
        sanitize_error_code::prompt_injection_detected},
    std::pair<std::string_view, sanitize_error_code>{
        "max_depth_exceeded", sanitize_error_code::max_depth_exceeded},
    std::pair<std::string_view, sanitize_error_code>{
        "max_size_exceeded", sanitize_error_code::max_size_exceeded},
    std::pair<std::string_view, sanitize_error_code>{
        "unsafe_term", sanitize_error_code::unsafe_term},
    std::pair<std::string_view, sanitize_error_code>{
        "json_decode_error", sanitize_error_code::json_decode_error},
    std::pair<std::string_view, sanitize_error_code>{
        "identifier_not_allowed", sanitize_error_code::identifier_not_allowed},
    std::pair<std::string_view, sanitize_error_code>{
        "missing_option", sanitize_error_code::missing_option},
    std::pair<std::string_view, sanitize_error_code>{
        "too_large", sanitize_error_code::too_large},
    std::pair<std::string_view, sanitize_error_code>{
        "invalid_url", sanitize_error_code::invalid_url},
    std::pair<std::string_view, sanitize_error_code>{
        "term_decode_error", sanitize_error_code::term_decode_error},
};

inline constexpr std::string_view to_string(const sanitize_error_code value) {
  return to_string(value, kSanitizeErrorCodeMappings).value_or("unknown");
}

}  // namespace warden::schema
