#include <warden/config/options.hpp>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <fstream>
#include <string_view>

namespace po = boost::program_options;

namespace warden::config {

namespace {

constexpr auto kWeightTolerance = 0.001;

const auto kLogLevels = std::array<std::string_view, 7>{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

}  // namespace

po::options_description describe() {
  auto description = po::options_description{"warden configuration"};
  // clang-format off
  description.add_options()
      ("kernel.require_identity", po::value<bool>()->default_value(false),
       "Refuse requests without a signed request")
      ("kernel.disclose_denial_reasons", po::value<bool>()->default_value(false),
       "Return internal denial detail to callers")
      ("kernel.check_timeout_ms", po::value<uint64_t>()->default_value(0),
       "Deadline for collaborator checks, 0 for none")
      ("capabilities.require_signatures", po::value<bool>()->default_value(false),
       "Only signed capabilities authorize")
      ("capabilities.enforce_quotas", po::value<bool>()->default_value(true),
       "Apply per-principal and global capability quotas")
      ("capabilities.max_per_principal", po::value<uint32_t>()->default_value(1000),
       "Active capabilities per principal")
      ("capabilities.max_global", po::value<uint64_t>()->default_value(100000),
       "Unrevoked capabilities in the store")
      ("capabilities.max_delegation_depth", po::value<uint32_t>()->default_value(10),
       "Largest delegation depth a grant may carry")
      ("trust.weight_success_rate", po::value<double>()->default_value(0.30), "")
      ("trust.weight_uptime", po::value<double>()->default_value(0.15), "")
      ("trust.weight_security", po::value<double>()->default_value(0.25), "")
      ("trust.weight_test_pass", po::value<double>()->default_value(0.20), "")
      ("trust.weight_rollback", po::value<double>()->default_value(0.10), "")
      ("trust.event_history", po::value<std::size_t>()->default_value(1000),
       "Recorded events kept per agent")
      ("trust.circuit_breaker", po::value<bool>()->default_value(true),
       "Freeze or demote agents on bursts of failures")
      ("decay.grace_days", po::value<uint64_t>()->default_value(7), "")
      ("decay.points_per_day", po::value<uint32_t>()->default_value(1), "")
      ("decay.floor", po::value<uint32_t>()->default_value(10), "")
      ("sanitize.allowed_root", po::value<std::string>(),
       "Root for the path traversal sanitizer")
      ("sanitize.allow_private", po::value<bool>()->default_value(false), "")
      ("sanitize.resolve_timeout_ms", po::value<uint64_t>()->default_value(2000), "")
      ("sanitize.fail_threshold", po::value<uint32_t>()->default_value(2), "")
      ("sanitize.max_depth", po::value<uint32_t>()->default_value(32), "")
      ("sanitize.max_size", po::value<uint64_t>()->default_value(10000), "")
      ("sanitize.max_byte_size", po::value<uint64_t>()->default_value(1024 * 1024), "")
      ("sanitize.max_length", po::value<std::size_t>()->default_value(4096), "")
      ("sanitize.redact", po::value<bool>()->default_value(false), "")
      ("log.file", po::value<std::string>()->default_value("warden.log"), "")
      ("log.level", po::value<std::string>()->default_value("info"), "");
  // clang-format on
  return description;
}

std::optional<options> parse(std::istream& input, std::string& error) {
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(input, describe(), false), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    error = e.what();
    return std::nullopt;
  }

  auto out = options{};

  out.kernel.require_identity = vm["kernel.require_identity"].as<bool>();
  out.kernel.disclose_denial_reasons =
      vm["kernel.disclose_denial_reasons"].as<bool>();
  if (auto timeout = vm["kernel.check_timeout_ms"].as<uint64_t>();
      timeout > 0) {
    out.kernel.check_timeout = std::chrono::milliseconds{timeout};
  }

  out.capabilities.require_signatures =
      vm["capabilities.require_signatures"].as<bool>();
  out.capabilities.enforce_quotas =
      vm["capabilities.enforce_quotas"].as<bool>();
  out.capabilities.max_per_principal =
      vm["capabilities.max_per_principal"].as<uint32_t>();
  out.capabilities.max_global = vm["capabilities.max_global"].as<uint64_t>();
  auto depth = vm["capabilities.max_delegation_depth"].as<uint32_t>();
  if (depth > 255) {
    error = fmt::format("capabilities.max_delegation_depth {} exceeds 255",
                        depth);
    return std::nullopt;
  }
  out.capabilities.max_delegation_depth = static_cast<uint8_t>(depth);

  auto& weights = out.trust.weights;
  weights.success_rate = vm["trust.weight_success_rate"].as<double>();
  weights.uptime = vm["trust.weight_uptime"].as<double>();
  weights.security = vm["trust.weight_security"].as<double>();
  weights.test_pass = vm["trust.weight_test_pass"].as<double>();
  weights.rollback = vm["trust.weight_rollback"].as<double>();
  auto sum = weights.success_rate + weights.uptime + weights.security +
             weights.test_pass + weights.rollback;
  if (weights.success_rate < 0 || weights.uptime < 0 ||
      weights.security < 0 || weights.test_pass < 0 || weights.rollback < 0 ||
      std::abs(sum - 1.0) > kWeightTolerance) {
    error = fmt::format("trust weights must be non-negative and sum to 1 "
                        "(got {:.3f})",
                        sum);
    return std::nullopt;
  }
  out.trust.event_history = vm["trust.event_history"].as<std::size_t>();
  out.circuit_breaker = vm["trust.circuit_breaker"].as<bool>();
  if (!out.circuit_breaker) {
    out.trust.breaker_rules.clear();
  }

  out.trust.decay.grace = vm["decay.grace_days"].as<uint64_t>() *
                          warden::schema::kMillisecondsPerDay;
  out.trust.decay.points_per_day = vm["decay.points_per_day"].as<uint32_t>();
  out.trust.decay.floor = vm["decay.floor"].as<uint32_t>();
  if (out.trust.decay.floor > 100) {
    error = fmt::format("decay.floor {} exceeds 100", out.trust.decay.floor);
    return std::nullopt;
  }

  auto& sanitize = out.sanitize;
  if (vm.contains("sanitize.allowed_root")) {
    sanitize.allowed_root = vm["sanitize.allowed_root"].as<std::string>();
  }
  sanitize.allow_private = vm["sanitize.allow_private"].as<bool>();
  sanitize.resolve_timeout =
      std::chrono::milliseconds{vm["sanitize.resolve_timeout_ms"].as<uint64_t>()};
  sanitize.fail_threshold = vm["sanitize.fail_threshold"].as<uint32_t>();
  sanitize.max_depth = vm["sanitize.max_depth"].as<uint32_t>();
  sanitize.max_size = vm["sanitize.max_size"].as<uint64_t>();
  sanitize.max_byte_size = vm["sanitize.max_byte_size"].as<uint64_t>();
  sanitize.max_length = vm["sanitize.max_length"].as<std::size_t>();
  sanitize.redact = vm["sanitize.redact"].as<bool>();

  out.log_file = vm["log.file"].as<std::string>();
  out.log_level = vm["log.level"].as<std::string>();
  if (std::find(std::begin(kLogLevels), std::end(kLogLevels),
                out.log_level) == std::end(kLogLevels)) {
    error = fmt::format("unknown log.level '{}'", out.log_level);
    return std::nullopt;
  }
  return out;
}

std::optional<options> load(const std::string& path, std::string& error) {
  auto input = std::ifstream{path};
  if (!input) {
    error = fmt::format("cannot open configuration file '{}'", path);
    return std::nullopt;
  }
  auto parsed = parse(input, error);
  if (parsed.has_value()) {
    spdlog::info("Loaded configuration from {}", path);
  }
  return parsed;
}

}  // namespace warden::config
