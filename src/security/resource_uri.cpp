#include <warden/security/resource_uri.hpp>

#include <algorithm>
#include <cctype>

namespace warden::security {

namespace {

bool valid_segment(const std::string_view segment) {
  return !segment.empty() &&
         std::all_of(std::begin(segment), std::end(segment), [](const char c) {
           auto u = static_cast<unsigned char>(c);
           return u > 0x20 && u < 0x7f && c != '?' && c != '#';
         });
}

}  // namespace

std::string resource_uri_t::to_string() const {
  auto out = scheme + "://" + domain + "/" + action;
  if (!path.empty()) {
    out += "/" + path;
  }
  return out;
}

std::optional<resource_uri_t> parse_resource_uri(const std::string_view value) {
  auto separator = value.find("://");
  if (separator == std::string_view::npos || separator == 0) {
    return std::nullopt;
  }

  auto uri = resource_uri_t{};
  for (const auto c : value.substr(0, separator)) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' &&
        c != '.') {
      return std::nullopt;
    }
    uri.scheme.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  auto rest = value.substr(separator + 3);
  auto domain_end = rest.find('/');
  if (domain_end == std::string_view::npos) {
    return std::nullopt;
  }
  uri.domain = std::string{rest.substr(0, domain_end)};
  rest.remove_prefix(domain_end + 1);

  auto action_end = rest.find('/');
  uri.action = std::string{rest.substr(0, action_end)};
  if (action_end != std::string_view::npos) {
    uri.path = std::string{rest.substr(action_end + 1)};
  }

  if (!valid_segment(uri.domain) || !valid_segment(uri.action)) {
    return std::nullopt;
  }
  if (!uri.path.empty() && !valid_segment(uri.path)) {
    return std::nullopt;
  }
  return uri;
}

bool resource_matches(const std::string_view granted,
                      const std::string_view requested,
                      const bool prefix) {
  if (granted == requested) {
    return true;
  }
  if (!prefix || requested.size() <= granted.size() ||
      !requested.starts_with(granted)) {
    return false;
  }
  return granted.ends_with('/') || requested[granted.size()] == '/';
}

}  // namespace warden::security
