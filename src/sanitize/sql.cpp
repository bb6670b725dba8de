#include <warden/sanitize/sql.hpp>

#include <boost/regex.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

namespace warden::sanitize {

namespace {

struct named_pattern_t final {
  std::string_view name;
  boost::regex pattern;
};

const std::vector<named_pattern_t>& injection_patterns() {
  static const auto patterns = [] {
    const auto flags =
        boost::regex::perl | boost::regex::icase | boost::regex::no_mod_m;
    return std::vector<named_pattern_t>{
        {"union_select",
         boost::regex{R"(\bunion\b(\s+all)?\s+select\b)", flags}},
        {"tautology",
         boost::regex{R"(['"]?\s*\bor\b\s+['"]?(\w+)['"]?\s*=\s*['"]?\1\b)",
                      flags}},
        {"comment_sequence", boost::regex{R"((--|#|/\*))", flags}},
        {"stacked_query",
         boost::regex{
             R"(;\s*(drop|delete|insert|update|alter|create|truncate|exec|grant)\b)",
             flags}},
        {"time_based",
         boost::regex{R"(\b(sleep|benchmark|pg_sleep|waitfor\s+delay)\s*\()",
                      flags}},
        {"quote_breakout",
         boost::regex{R"('\s*(;|\)|\bor\b|\band\b))", flags}},
    };
  }();
  return patterns;
}

}  // namespace

std::string escape_like(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size());
  for (const auto c : value) {
    if (c == '\\' || c == '%' || c == '_') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

sanitize_result sql_sanitizer::sanitize(
    const std::string_view value,
    const warden::schema::taint_t& taint,
    const sanitize_options& options) const {
  if (options.sql_mode == sql_mode_t::like) {
    return make_success(escape_like(value), taint,
                        warden::schema::sanitization_t::sql_injection,
                        warden::schema::confidence_t::plausible);
  }

  if (!options.allowed_identifiers.has_value()) {
    return make_failure(warden::schema::sanitize_error_code::missing_option,
                        taint, "allowed_identifiers");
  }
  const auto& allowed = *options.allowed_identifiers;
  if (std::find(std::begin(allowed), std::end(allowed), value) ==
      std::end(allowed)) {
    return make_failure(
        warden::schema::sanitize_error_code::identifier_not_allowed, taint,
        std::string{value});
  }
  return make_success(std::string{value}, taint,
                      warden::schema::sanitization_t::sql_injection,
                      warden::schema::confidence_t::verified);
}

detect_result sql_sanitizer::detect(const std::string_view value) const {
  if (value.size() > kDefaultMaxInputBytes) {
    return make_detection({"too_large"});
  }
  auto text = std::string{value};
  auto patterns = std::vector<std::string>{};
  for (const auto& [name, pattern] : injection_patterns()) {
    try {
      if (boost::regex_search(text, pattern)) {
        patterns.emplace_back(name);
      }
    } catch (const std::runtime_error& e) {
      spdlog::warn("SQL pattern '{}' gave up: {}", name, e.what());
      patterns.emplace_back("unscannable");
      break;
    }
  }
  return make_detection(std::move(patterns), 0.34);
}

}  // namespace warden::sanitize
