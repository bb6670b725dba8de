#pragma once

#include <warden/sanitize/sanitizer.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::sanitize {

/// Cloud instance metadata services, matched exactly against the host and
/// against every resolved address.
inline constexpr auto kMetadataHosts = std::array<std::string_view, 9>{
    "169.254.169.254",  "metadata.google.internal", "metadata.goog",
    "metadata",         "100.100.100.200",          "fd00:ec2::254",
    "instance-data",    "instance-data.ec2.internal", "169.254.170.2"};

struct parsed_url_t final {
  std::string scheme;
  std::string host;
  std::optional<uint16_t> port;
  std::string path;
};

/// Validates an outbound URL before a server-side fetch.
///
/// Checks run in a fixed order: scheme, port, metadata host, then DNS
/// resolution, then the private-range test on every resolved address. On
/// success `sanitize_result::detail` carries the first vetted address; the
/// caller must connect to that address rather than resolving the host again.
struct ssrf_sanitizer final {
  static constexpr auto kind = sanitizer_kind::ssrf;

  sanitize_result sanitize(std::string_view value,
                           const warden::schema::taint_t& taint,
                           const sanitize_options& options) const;

  detect_result detect(std::string_view value) const;
};

std::optional<parsed_url_t> parse_url(std::string_view value);

/// Explicit port, or the scheme default (http 80, https 443).
std::optional<uint16_t> effective_port(const parsed_url_t& url);

bool is_ip_literal(std::string_view host);

/// Loopback, private, link-local, CGNAT, multicast, reserved and
/// unspecified ranges for IPv4 and IPv6, including IPv4-mapped and NAT64
/// forms. Unparseable input counts as private.
bool is_private_address(std::string_view address);

/// getaddrinfo on a detached worker; IPv4 results precede IPv6.
std::optional<std::vector<std::string>> resolve_host(
    std::string_view host,
    std::chrono::milliseconds timeout);

}  // namespace warden::sanitize
