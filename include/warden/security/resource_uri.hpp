#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace warden::security {

/// `scheme://domain/action[/path...]`. ASCII only; the scheme is
/// case-insensitive and normalized to lower case, everything after it is
/// case-sensitive.
struct resource_uri_t final {
  std::string scheme;
  std::string domain;
  std::string action;
  std::string path;

  std::string to_string() const;
};

std::optional<resource_uri_t> parse_resource_uri(std::string_view value);

/// True when `requested` equals `granted`, or, for prefix grants, lies
/// beneath it on a `/` boundary.
bool resource_matches(std::string_view granted,
                      std::string_view requested,
                      bool prefix);

}  // namespace warden::security
