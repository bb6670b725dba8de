#include <warden/sanitize/ssrf.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <future>
#include <memory>
#include <thread>
#include <utility>

namespace warden::sanitize {

namespace {

using addrinfo_ptr = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;

constexpr auto kDefaultSchemes = std::array<std::string_view, 2>{"http", "https"};
constexpr auto kDefaultPorts = std::array<uint16_t, 2>{80, 443};

std::string lowercase(std::string_view value) {
  auto out = std::string{value};
  std::transform(std::begin(out), std::end(out), std::begin(out),
                 [](const unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return out;
}

bool valid_scheme(const std::string_view scheme) {
  if (scheme.empty() ||
      !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
    return false;
  }
  return std::all_of(std::begin(scheme), std::end(scheme), [](const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' ||
           c == '-' || c == '.';
  });
}

bool is_metadata_host(const std::string_view host) {
  return std::find(std::begin(kMetadataHosts), std::end(kMetadataHosts),
                   host) != std::end(kMetadataHosts);
}

bool in_v4_range(const uint32_t address,
                 const uint32_t network,
                 const uint32_t prefix) {
  if (prefix == 0) {
    return true;
  }
  auto mask = prefix == 32 ? 0xffffffffu : ~(0xffffffffu >> prefix);
  return (address & mask) == (network & mask);
}

bool is_private_v4(const uint32_t address) {
  struct range_t final {
    uint32_t network;
    uint32_t prefix;
  };
  static constexpr auto kRanges = std::array<range_t, 14>{{
      {0x00000000u, 8},   // this network
      {0x0a000000u, 8},   // 10/8
      {0x64400000u, 10},  // carrier-grade NAT
      {0x7f000000u, 8},   // loopback
      {0xa9fe0000u, 16},  // link-local
      {0xac100000u, 12},  // 172.16/12
      {0xc0000000u, 24},  // IETF protocol assignments
      {0xc0000200u, 24},  // TEST-NET-1
      {0xc0a80000u, 16},  // 192.168/16
      {0xc6120000u, 15},  // benchmarking
      {0xc6336400u, 24},  // TEST-NET-2
      {0xcb007100u, 24},  // TEST-NET-3
      {0xe0000000u, 4},   // multicast
      {0xf0000000u, 4},   // reserved and broadcast
  }};
  return std::any_of(std::begin(kRanges), std::end(kRanges),
                     [&](const range_t& range) {
                       return in_v4_range(address, range.network, range.prefix);
                     });
}

uint32_t embedded_v4(const in6_addr& address) {
  return (static_cast<uint32_t>(address.s6_addr[12]) << 24u) |
         (static_cast<uint32_t>(address.s6_addr[13]) << 16u) |
         (static_cast<uint32_t>(address.s6_addr[14]) << 8u) |
         static_cast<uint32_t>(address.s6_addr[15]);
}

bool is_private_v6(const in6_addr& address) {
  const auto* bytes = address.s6_addr;
  if (IN6_IS_ADDR_UNSPECIFIED(&address) || IN6_IS_ADDR_LOOPBACK(&address)) {
    return true;
  }
  if (IN6_IS_ADDR_V4MAPPED(&address) || IN6_IS_ADDR_V4COMPAT(&address)) {
    return is_private_v4(embedded_v4(address));
  }
  // 64:ff9b::/96 NAT64
  if (bytes[0] == 0x00 && bytes[1] == 0x64 && bytes[2] == 0xff &&
      bytes[3] == 0x9b &&
      std::all_of(bytes + 4, bytes + 12, [](const uint8_t b) { return b == 0; })) {
    return is_private_v4(embedded_v4(address));
  }
  if ((bytes[0] & 0xfeu) == 0xfc) {  // unique local fc00::/7
    return true;
  }
  if (bytes[0] == 0xfe && (bytes[1] & 0xc0u) == 0x80) {  // link-local
    return true;
  }
  if (bytes[0] == 0xfe && (bytes[1] & 0xc0u) == 0xc0) {  // site-local
    return true;
  }
  if (bytes[0] == 0xff) {  // multicast
    return true;
  }
  // 2001:db8::/32 documentation
  return bytes[0] == 0x20 && bytes[1] == 0x01 && bytes[2] == 0x0d &&
         bytes[3] == 0xb8;
}

std::optional<std::vector<std::string>> lookup(const std::string& host) {
  auto hints = addrinfo{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  auto* raw = static_cast<addrinfo*>(nullptr);
  auto status = getaddrinfo(host.c_str(), nullptr, &hints, &raw);
  if (status != 0) {
    spdlog::debug("getaddrinfo failed: {}", gai_strerror(status));
    return std::nullopt;
  }
  auto results = addrinfo_ptr{raw, freeaddrinfo};

  auto v4 = std::vector<std::string>{};
  auto v6 = std::vector<std::string>{};
  for (auto* entry = results.get(); entry != nullptr; entry = entry->ai_next) {
    auto buffer = std::array<char, INET6_ADDRSTRLEN>{};
    if (entry->ai_family == AF_INET) {
      const auto* in = reinterpret_cast<const sockaddr_in*>(entry->ai_addr);
      if (inet_ntop(AF_INET, &in->sin_addr, buffer.data(), buffer.size()) !=
          nullptr) {
        v4.emplace_back(buffer.data());
      }
    } else if (entry->ai_family == AF_INET6) {
      const auto* in6 = reinterpret_cast<const sockaddr_in6*>(entry->ai_addr);
      if (inet_ntop(AF_INET6, &in6->sin6_addr, buffer.data(), buffer.size()) !=
          nullptr) {
        v6.emplace_back(buffer.data());
      }
    }
  }

  auto addresses = std::vector<std::string>{};
  for (auto* family : {&v4, &v6}) {
    for (auto& address : *family) {
      if (std::find(std::begin(addresses), std::end(addresses), address) ==
          std::end(addresses)) {
        addresses.push_back(std::move(address));
      }
    }
  }
  return addresses;
}

// Clients disagree on where an authority holding these ends.
bool ambiguous_character(const char c) {
  auto byte = static_cast<unsigned char>(c);
  return c == '\\' || byte <= 0x20 || byte == 0x7f;
}

bool valid_host(const std::string_view host) {
  if (host.front() == '[') {
    return std::all_of(std::begin(host) + 1, std::end(host) - 1,
                       [](const char c) {
                         return std::isxdigit(static_cast<unsigned char>(c)) ||
                                c == ':' || c == '.';
                       });
  }
  return std::all_of(std::begin(host), std::end(host), [](const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
           c == '.' || c == '_';
  });
}

std::string unbracket(const std::string& host) {
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    return host.substr(1, host.size() - 2);
  }
  return host;
}

}  // namespace

std::optional<parsed_url_t> parse_url(const std::string_view value) {
  if (std::any_of(std::begin(value), std::end(value), ambiguous_character)) {
    return std::nullopt;
  }
  auto separator = value.find("://");
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  auto url = parsed_url_t{};
  url.scheme = lowercase(value.substr(0, separator));
  if (!valid_scheme(url.scheme)) {
    return std::nullopt;
  }

  auto rest = value.substr(separator + 3);
  auto authority_end = rest.find_first_of("/?#");
  auto authority = rest.substr(0, authority_end);
  url.path = authority_end == std::string_view::npos
                 ? std::string{"/"}
                 : std::string{rest.substr(authority_end)};

  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }

  auto host = std::string_view{};
  auto port_text = std::string_view{};
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    host = authority.substr(0, close + 1);
    auto tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return std::nullopt;
      }
      port_text = tail.substr(1);
    }
  } else {
    auto colon = authority.rfind(':');
    host = authority.substr(0, colon);
    if (colon != std::string_view::npos) {
      port_text = authority.substr(colon + 1);
    }
  }

  url.host = lowercase(host);
  while (!url.host.empty() && url.host.back() == '.') {
    url.host.pop_back();
  }
  if (url.host.empty() || url.host == "[]" || !valid_host(url.host)) {
    return std::nullopt;
  }

  if (!port_text.empty()) {
    auto port = uint32_t{};
    auto [end, error] = std::from_chars(
        port_text.data(), port_text.data() + port_text.size(), port);
    if (error != std::errc{} || end != port_text.data() + port_text.size() ||
        port == 0 || port > 65535) {
      return std::nullopt;
    }
    url.port = static_cast<uint16_t>(port);
  }
  return url;
}

std::optional<uint16_t> effective_port(const parsed_url_t& url) {
  if (url.port.has_value()) {
    return url.port;
  }
  if (url.scheme == "http") {
    return uint16_t{80};
  }
  if (url.scheme == "https") {
    return uint16_t{443};
  }
  return std::nullopt;
}

bool is_ip_literal(const std::string_view host) {
  auto text = unbracket(std::string{host});
  auto v4 = in_addr{};
  auto v6 = in6_addr{};
  return inet_pton(AF_INET, text.c_str(), &v4) == 1 ||
         inet_pton(AF_INET6, text.c_str(), &v6) == 1;
}

bool is_private_address(const std::string_view address) {
  auto text = unbracket(std::string{address});
  auto v4 = in_addr{};
  if (inet_pton(AF_INET, text.c_str(), &v4) == 1) {
    return is_private_v4(ntohl(v4.s_addr));
  }
  auto v6 = in6_addr{};
  if (inet_pton(AF_INET6, text.c_str(), &v6) == 1) {
    return is_private_v6(v6);
  }
  return true;
}

std::optional<std::vector<std::string>> resolve_host(
    const std::string_view host,
    const std::chrono::milliseconds timeout) {
  using resolution_t = std::optional<std::vector<std::string>>;
  auto promise = std::make_shared<std::promise<resolution_t>>();
  auto future = promise->get_future();
  std::thread([promise, name = std::string{host}] {
    promise->set_value(lookup(name));
  }).detach();

  if (future.wait_for(timeout) != std::future_status::ready) {
    spdlog::warn("DNS resolution timed out after {} ms", timeout.count());
    return std::nullopt;
  }
  return future.get();
}

sanitize_result ssrf_sanitizer::sanitize(
    const std::string_view value,
    const warden::schema::taint_t& taint,
    const sanitize_options& options) const {
  using warden::schema::sanitize_error_code;

  auto url = parse_url(value);
  if (!url.has_value()) {
    return make_failure(sanitize_error_code::invalid_url, taint, "");
  }

  auto scheme_allowed =
      options.allowed_schemes.has_value()
          ? std::find(std::begin(*options.allowed_schemes),
                      std::end(*options.allowed_schemes),
                      url->scheme) != std::end(*options.allowed_schemes)
          : std::find(std::begin(kDefaultSchemes), std::end(kDefaultSchemes),
                      url->scheme) != std::end(kDefaultSchemes);
  if (!scheme_allowed) {
    return make_failure(sanitize_error_code::blocked_scheme, taint,
                        url->scheme);
  }

  auto port = effective_port(*url);
  auto port_allowed =
      port.has_value() &&
      (options.allowed_ports.has_value()
           ? std::find(std::begin(*options.allowed_ports),
                       std::end(*options.allowed_ports),
                       *port) != std::end(*options.allowed_ports)
           : std::find(std::begin(kDefaultPorts), std::end(kDefaultPorts),
                       *port) != std::end(kDefaultPorts));
  if (!port_allowed) {
    return make_failure(sanitize_error_code::blocked_port, taint,
                        port.has_value() ? std::to_string(*port) : "");
  }

  auto host = unbracket(url->host);
  if (is_metadata_host(host)) {
    return make_failure(sanitize_error_code::metadata_endpoint, taint, host);
  }

  auto addresses = std::optional<std::vector<std::string>>{};
  if (is_ip_literal(host)) {
    addresses = std::vector<std::string>{host};
  } else if (options.resolver) {
    addresses = options.resolver(host, options.resolve_timeout);
  } else {
    addresses = resolve_host(host, options.resolve_timeout);
  }
  if (!addresses.has_value() || addresses->empty()) {
    return make_failure(sanitize_error_code::dns_resolution_failed, taint,
                        host);
  }

  for (const auto& address : *addresses) {
    if (is_metadata_host(address)) {
      return make_failure(sanitize_error_code::metadata_endpoint, taint,
                          address);
    }
    if (!options.allow_private && is_private_address(address)) {
      return make_failure(sanitize_error_code::private_ip, taint, address);
    }
  }

  spdlog::debug("Outbound URL vetted; pinned to {}", addresses->front());
  return make_success(std::string{value}, taint,
                      warden::schema::sanitization_t::ssrf,
                      warden::schema::confidence_t::verified,
                      addresses->front());
}

detect_result ssrf_sanitizer::detect(const std::string_view value) const {
  auto patterns = std::vector<std::string>{};
  auto url = parse_url(value);
  if (!url.has_value()) {
    patterns.emplace_back("invalid_url");
    return make_detection(std::move(patterns));
  }
  auto host = unbracket(url->host);
  if (std::find(std::begin(kDefaultSchemes), std::end(kDefaultSchemes),
                url->scheme) == std::end(kDefaultSchemes)) {
    patterns.emplace_back("non_http_scheme");
  }
  if (is_metadata_host(host)) {
    patterns.emplace_back("metadata_host");
  }
  if (is_ip_literal(host) && is_private_address(host)) {
    patterns.emplace_back("private_literal");
  }
  auto numeric = !host.empty() &&
                 std::all_of(std::begin(host), std::end(host), [](const char c) {
                   return std::isdigit(static_cast<unsigned char>(c)) ||
                          c == '.';
                 });
  if (!is_ip_literal(host) && (numeric || host.starts_with("0x"))) {
    patterns.emplace_back("numeric_host_encoding");
  }
  auto authority_start = value.find("://") + 3;
  auto authority = value.substr(
      authority_start,
      value.find_first_of("/?#", authority_start) - authority_start);
  if (authority.find('@') != std::string_view::npos) {
    patterns.emplace_back("embedded_credentials");
  }
  if (host == "localhost" || host.ends_with(".localhost")) {
    patterns.emplace_back("localhost");
  }
  return make_detection(std::move(patterns));
}

}  // namespace warden::sanitize
