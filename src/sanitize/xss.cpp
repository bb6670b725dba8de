#include <warden/sanitize/xss.hpp>

#include <boost/regex.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace warden::sanitize {

namespace {

const auto kIcase =
    boost::regex::perl | boost::regex::icase | boost::regex::no_mod_m;

const boost::regex& script_block_pattern() {
  static const auto pattern = boost::regex{
      R"(<\s*script\b[^>]*>[\s\S]*?<\s*/\s*script\s*>)", kIcase};
  return pattern;
}

const boost::regex& script_tag_pattern() {
  static const auto pattern =
      boost::regex{R"(<\s*/?\s*script\b[^>]*>?)", kIcase};
  return pattern;
}

const boost::regex& script_uri_pattern() {
  static const auto pattern = boost::regex{
      R"((j\s*a\s*v\s*a\s*s\s*c\s*r\s*i\s*p\s*t|v\s*b\s*s\s*c\s*r\s*i\s*p\s*t|l\s*i\s*v\s*e\s*s\s*c\s*r\s*i\s*p\s*t)\s*:)",
      kIcase};
  return pattern;
}

const boost::regex& data_html_pattern() {
  static const auto pattern =
      boost::regex{R"(data\s*:\s*text/html)", kIcase};
  return pattern;
}

const boost::regex& event_handler_pattern() {
  static const auto pattern = boost::regex{R"(\bon[a-z]{3,}\s*=)", kIcase};
  return pattern;
}

const boost::regex& css_expression_pattern() {
  static const auto pattern = boost::regex{R"(expression\s*\()", kIcase};
  return pattern;
}

const boost::regex& html_tag_pattern() {
  static const auto pattern =
      boost::regex{R"(<\s*/?\s*(iframe|object|embed|svg|img|style|link|meta|base|form)\b)",
                 kIcase};
  return pattern;
}

std::optional<uint8_t> hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::string url_decode_once(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      auto high = hex_value(value[i + 1]);
      auto low = hex_value(value[i + 2]);
      if (high && low) {
        out.push_back(static_cast<char>((*high << 4u) | *low));
        i += 2;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

std::optional<uint32_t> parse_code_unit(const std::string_view value,
                                        const std::size_t offset) {
  if (offset + 6 > value.size() || value[offset] != '\\' ||
      (value[offset + 1] != 'u' && value[offset + 1] != 'U')) {
    return std::nullopt;
  }
  auto unit = uint32_t{};
  for (std::size_t i = offset + 2; i < offset + 6; ++i) {
    auto nibble = hex_value(value[i]);
    if (!nibble) {
      return std::nullopt;
    }
    unit = (unit << 4u) | *nibble;
  }
  return unit;
}

void append_utf8(std::string& out, const uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xc0 | (code_point >> 6u)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3fu)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xe0 | (code_point >> 12u)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6u) & 0x3fu)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3fu)));
  } else {
    out.push_back(static_cast<char>(0xf0 | (code_point >> 18u)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12u) & 0x3fu)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6u) & 0x3fu)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3fu)));
  }
}

std::string neutralize(std::string value) {
  value = boost::regex_replace(value, script_block_pattern(), "");
  value = boost::regex_replace(value, script_tag_pattern(), "");
  value = boost::regex_replace(value, script_uri_pattern(), "blocked:");
  value = boost::regex_replace(value, data_html_pattern(), "blocked:");
  value = boost::regex_replace(value, event_handler_pattern(), "data-blocked=");
  value = boost::regex_replace(value, css_expression_pattern(), "blocked(");
  return value;
}

std::string decode(const std::string_view value) {
  return normalize_unicode_escapes(url_decode(value));
}

}  // namespace

std::string url_decode(const std::string_view value, const int max_rounds) {
  auto current = std::string{value};
  for (auto round = 0; round < max_rounds; ++round) {
    auto next = url_decode_once(current);
    if (next == current) {
      break;
    }
    current = std::move(next);
  }
  return current;
}

std::string normalize_unicode_escapes(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size();) {
    auto unit = parse_code_unit(value, i);
    if (!unit) {
      out.push_back(value[i]);
      ++i;
      continue;
    }
    i += 6;
    auto code_point = *unit;
    if (code_point >= 0xd800 && code_point <= 0xdbff) {
      auto low = parse_code_unit(value, i);
      if (low && *low >= 0xdc00 && *low <= 0xdfff) {
        code_point = 0x10000 + ((code_point - 0xd800) << 10u) + (*low - 0xdc00);
        i += 6;
      } else {
        code_point = 0xfffd;
      }
    } else if (code_point >= 0xdc00 && code_point <= 0xdfff) {
      code_point = 0xfffd;
    }
    append_utf8(out, code_point);
  }
  return out;
}

std::string encode_html_entities(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size());
  for (const auto c : value) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#x27;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

sanitize_result xss_sanitizer::sanitize(
    const std::string_view value,
    const warden::schema::taint_t& taint,
    const sanitize_options& options) const {
  if (value.size() > options.max_input_bytes) {
    return make_failure(warden::schema::sanitize_error_code::too_large, taint,
                        fmt::format("{} bytes exceeds {}", value.size(),
                                    options.max_input_bytes));
  }
  auto neutralized = std::string{};
  try {
    neutralized = neutralize(decode(value));
  } catch (const std::runtime_error& e) {
    spdlog::warn("XSS neutralization gave up: {}", e.what());
    return make_failure(warden::schema::sanitize_error_code::too_large, taint,
                        "pattern matching limit");
  }
  return make_success(encode_html_entities(neutralized), taint,
                      warden::schema::sanitization_t::xss,
                      warden::schema::confidence_t::verified);
}

detect_result xss_sanitizer::detect(const std::string_view value) const {
  if (value.size() > kDefaultMaxInputBytes) {
    return make_detection({"too_large"});
  }
  auto decoded = decode(value);
  auto patterns = std::vector<std::string>{};
  try {
    if (boost::regex_search(decoded, script_tag_pattern())) {
      patterns.emplace_back("script_tag");
    }
    if (boost::regex_search(decoded, script_uri_pattern()) ||
        boost::regex_search(decoded, data_html_pattern())) {
      patterns.emplace_back("script_uri");
    }
    if (boost::regex_search(decoded, event_handler_pattern())) {
      patterns.emplace_back("event_handler");
    }
    if (boost::regex_search(decoded, css_expression_pattern())) {
      patterns.emplace_back("css_expression");
    }
    if (boost::regex_search(decoded, html_tag_pattern())) {
      patterns.emplace_back("dangerous_tag");
    }
  } catch (const std::runtime_error& e) {
    spdlog::warn("XSS detection gave up: {}", e.what());
    patterns.emplace_back("unscannable");
  }
  if (!patterns.empty() && decoded != value) {
    patterns.emplace_back("encoded_payload");
  }
  return make_detection(std::move(patterns));
}

}  // namespace warden::sanitize
