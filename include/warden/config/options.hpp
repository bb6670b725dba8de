#pragma once

#include <warden/sanitize/sanitizer.hpp>
#include <warden/security/capability_store.hpp>
#include <warden/security/kernel.hpp>
#include <warden/trust/engine.hpp>

#include <boost/program_options/options_description.hpp>

#include <istream>
#include <optional>
#include <string>

namespace warden::config {

/// Everything an embedding process tunes at start-up.
struct options final {
  warden::security::kernel_options kernel;
  warden::security::capability_store_options capabilities;
  warden::trust::engine_options trust;
  bool circuit_breaker{true};
  /// Defaults merged into every sanitize call.
  warden::sanitize::sanitize_options sanitize;
  std::string log_file{"warden.log"};
  std::string log_level{"info"};
};

/// INI keys, grouped by section (`[kernel]`, `[capabilities]`, `[trust]`,
/// `[decay]`, `[sanitize]`, `[log]`).
boost::program_options::options_description describe();

/// Parse an INI document. Unknown keys and out-of-range values are errors;
/// `error` explains the first one.
std::optional<options> parse(std::istream& input, std::string& error);

std::optional<options> load(const std::string& path, std::string& error);

}  // namespace warden::config
