#include <warden/sanitize/log_injection.hpp>

#include <boost/regex.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace warden::sanitize {

namespace {

constexpr auto kEscape = '\x1b';
constexpr auto kBell = '\x07';

struct credential_pattern_t final {
  std::string_view name;
  boost::regex pattern;
};

const std::vector<credential_pattern_t>& credential_patterns() {
  static const auto patterns = [] {
    const auto plain = boost::regex::perl | boost::regex::no_mod_m;
    const auto icase = plain | boost::regex::icase;
    return std::vector<credential_pattern_t>{
        {"private_key",
         boost::regex{
             R"(-----BEGIN\s+(RSA\s+|EC\s+|DSA\s+|OPENSSH\s+)?PRIVATE\s+KEY-----)",
             plain}},
        {"anthropic_key",
         boost::regex{R"(sk-ant-[A-Za-z0-9\-_]{20,})", plain}},
        {"openai_key", boost::regex{R"(sk-(?!ant-)[a-zA-Z0-9]{32,})", plain}},
        {"github_token",
         boost::regex{
             R"(gh[pousr]_[a-zA-Z0-9]{36,}|github_pat_[a-zA-Z0-9_]{40,})",
             plain}},
        {"gitlab_token", boost::regex{R"(glpat-[a-zA-Z0-9\-_]{20,})", plain}},
        {"slack_token", boost::regex{R"(xox[baprs]-[a-zA-Z0-9-]+)", plain}},
        {"aws_access_key",
         boost::regex{R"(\b(AKIA|ABIA|ACCA|ASIA)[0-9A-Z]{16}\b)", plain}},
        {"aws_secret_key",
         boost::regex{
             R"(aws[_-]?secret[_-]?access[_-]?key\s*[:=]\s*["']?[A-Za-z0-9/+=]{40}["']?)",
             icase}},
        {"google_api_key", boost::regex{R"(AIza[0-9A-Za-z\-_]{35})", plain}},
        {"stripe_key",
         boost::regex{R"([sp]k_(live|test)_[a-zA-Z0-9]{24,})", plain}},
        {"jwt",
         boost::regex{R"(eyJ[a-zA-Z0-9_-]*\.eyJ[a-zA-Z0-9_-]*\.[a-zA-Z0-9_-]*)",
                      plain}},
        {"bearer_token",
         boost::regex{R"(Bearer\s+[a-zA-Z0-9\-._~+/]{20,}=*)", plain}},
        {"connection_string",
         boost::regex{
             R"((mongodb|postgres|postgresql|mysql|redis|amqp)://[^:\s]+:[^@\s]+@)",
             plain}},
        {"api_key_assignment",
         boost::regex{
             R"((api[_-]?key|apikey|secret[_-]?key|auth[_-]?token|access[_-]?token)\s*[:=]\s*["']?[a-zA-Z0-9_\-]{16,}["']?)",
             icase}},
        {"password_assignment",
         boost::regex{R"((password|passwd|pwd)\s*[:=]\s*("[^"]*"|'[^']*'|\S+))",
                      icase}},
    };
  }();
  return patterns;
}

std::size_t skip_escape_sequence(const std::string_view value,
                                 std::size_t index) {
  // `index` points at ESC.
  if (index + 1 >= value.size()) {
    return value.size();
  }
  auto introducer = value[index + 1];
  if (introducer == '[') {
    index += 2;
    while (index < value.size()) {
      auto c = static_cast<unsigned char>(value[index]);
      ++index;
      if (c >= 0x40 && c <= 0x7e) {
        break;
      }
    }
    return index;
  }
  if (introducer == ']') {
    index += 2;
    while (index < value.size()) {
      if (value[index] == kBell) {
        return index + 1;
      }
      if (value[index] == kEscape && index + 1 < value.size() &&
          value[index + 1] == '\\') {
        return index + 2;
      }
      ++index;
    }
    return index;
  }
  return index + 2;
}

}  // namespace

std::string strip_control_sequences(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size();) {
    auto c = static_cast<unsigned char>(value[i]);
    if (c == static_cast<unsigned char>(kEscape)) {
      i = skip_escape_sequence(value, i);
      continue;
    }
    // U+2028 LINE SEPARATOR and U+2029 PARAGRAPH SEPARATOR.
    if (c == 0xe2 && i + 2 < value.size() &&
        static_cast<unsigned char>(value[i + 1]) == 0x80 &&
        (static_cast<unsigned char>(value[i + 2]) == 0xa8 ||
         static_cast<unsigned char>(value[i + 2]) == 0xa9)) {
      i += 3;
      continue;
    }
    if ((c < 0x20 && c != '\t') || c == 0x7f) {
      ++i;
      continue;
    }
    out.push_back(value[i]);
    ++i;
  }
  return out;
}

std::string truncate(const std::string_view value,
                     const std::size_t max_length) {
  if (value.size() <= max_length) {
    return std::string{value};
  }
  if (max_length <= kTruncationMarker.size()) {
    auto cut = max_length;
    while (cut > 0 &&
           (static_cast<unsigned char>(value[cut]) & 0xc0u) == 0x80u) {
      --cut;
    }
    return std::string{value.substr(0, cut)};
  }
  auto cut = max_length - kTruncationMarker.size();
  while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xc0u) == 0x80u) {
    --cut;
  }
  auto out = std::string{value.substr(0, cut)};
  out.append(kTruncationMarker);
  return out;
}

std::string redact_credentials(const std::string_view value) {
  auto out = std::string{value};
  for (const auto& [name, pattern] : credential_patterns()) {
    try {
      out = boost::regex_replace(out, pattern, std::string{kRedactionMarker});
    } catch (const std::runtime_error& e) {
      spdlog::warn("Credential pattern '{}' gave up: {}", name, e.what());
      return std::string{kRedactionMarker};
    }
  }
  return out;
}

std::vector<std::string> find_credentials(const std::string_view value) {
  auto text = std::string{value};
  auto found = std::vector<std::string>{};
  for (const auto& [name, pattern] : credential_patterns()) {
    try {
      if (boost::regex_search(text, pattern)) {
        found.emplace_back(name);
      }
    } catch (const std::runtime_error& e) {
      spdlog::warn("Credential pattern '{}' gave up: {}", name, e.what());
      found.emplace_back("unscannable");
      break;
    }
  }
  return found;
}

sanitize_result log_injection_sanitizer::sanitize(
    const std::string_view value,
    const warden::schema::taint_t& taint,
    const sanitize_options& options) const {
  auto cleaned = strip_control_sequences(value);
  if (options.redact) {
    cleaned = redact_credentials(cleaned);
  }
  return make_success(truncate(cleaned, options.max_length), taint,
                      warden::schema::sanitization_t::log_injection,
                      warden::schema::confidence_t::verified);
}

detect_result log_injection_sanitizer::detect(
    const std::string_view value) const {
  auto patterns = std::vector<std::string>{};
  if (value.find_first_of("\r\n") != std::string_view::npos) {
    patterns.emplace_back("line_break");
  }
  if (value.find(kEscape) != std::string_view::npos) {
    patterns.emplace_back("ansi_escape");
  }
  auto stripped = strip_control_sequences(value);
  if (patterns.empty() && stripped.size() != value.size()) {
    patterns.emplace_back("control_character");
  }
  for (auto& credential : find_credentials(value)) {
    patterns.push_back("credential:" + credential);
  }
  return make_detection(std::move(patterns));
}

}  // namespace warden::sanitize
