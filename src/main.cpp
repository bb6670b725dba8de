#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <warden/common/critical.hpp>
#include <warden/config/options.hpp>
#include <warden/sanitize/registry.hpp>
#include <warden/schema/taint.hpp>
#include <warden/trust/score.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

void configure_logging(const std::string& log_file,
                       const spdlog::level::level_enum level) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "warden", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  logger->set_level(level);
  spdlog::set_default_logger(logger);
}

int print_score(const std::vector<double>& components,
                const warden::trust::score_weights& weights) {
  if (components.size() != 5) {
    std::cerr << "--score takes five values: success uptime security "
                 "test_pass rollback"
              << std::endl;
    return 2;
  }
  auto profile = warden::schema::trust_profile_t{};
  profile.success_rate_score = components[0];
  profile.uptime_score = components[1];
  profile.security_score = components[2];
  profile.test_pass_score = components[3];
  profile.rollback_score = components[4];
  auto score = warden::trust::weighted_score(profile, weights);
  std::cout << "trust_score=" << score << " tier="
            << warden::schema::to_string(warden::trust::tier_for_score(score))
            << std::endl;
  return 0;
}

int run_detect(const warden::sanitize::sanitizer_kind kind,
               const std::string& input) {
  auto result = warden::sanitize::registry::detect(kind, input);
  std::cout << (result.safe ? "safe" : "unsafe") << " score=" << result.score;
  for (const auto& pattern : result.patterns) {
    std::cout << " " << pattern;
  }
  std::cout << std::endl;
  return result.safe ? 0 : 1;
}

int run_sanitize(const warden::sanitize::sanitizer_kind kind,
                 const std::string& input,
                 const warden::sanitize::sanitize_options& options) {
  auto result = warden::sanitize::registry::sanitize(
      kind, input, warden::schema::taint_t{}, options);
  if (!result.ok()) {
    std::cout << "error " << warden::schema::to_string(result.code);
    if (!result.detail.empty()) {
      std::cout << " " << result.detail;
    }
    for (const auto& pattern : result.patterns) {
      std::cout << " " << pattern;
    }
    std::cout << std::endl;
    return 1;
  }
  std::cout << result.value << std::endl;
  std::cout << "confidence="
            << warden::schema::to_string(result.taint.confidence)
            << " sanitizations=";
  for (const auto& name :
       warden::schema::sanitization_names(result.taint.sanitizations)) {
    std::cout << name << ",";
  }
  std::cout << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto config_path = std::string{};
  auto sanitizer = std::string{};
  auto input = std::string{};
  auto score = std::vector<double>{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Warden"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "INI configuration file")("verbose,v", "Enable verbose output")(
      "sanitizer,s", boost::program_options::value<std::string>(&sanitizer),
      "Sanitizer to run: xss, sql, path_traversal, prompt_injection, ssrf, "
      "log_injection, deserialization")(
      "detect,d", "Only report what the sanitizer would flag")(
      "input,i", boost::program_options::value<std::string>(&input),
      "Value to sanitize")(
      "score",
      boost::program_options::value<std::vector<double>>(&score)->multitoken(),
      "Trust score for five component values");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto options = warden::config::options{};
  auto config_error = std::string{};
  if (!config_path.empty()) {
    auto loaded = warden::config::load(config_path, config_error);
    if (!loaded.has_value()) {
      configure_logging(options.log_file, spdlog::level::info);
      warden::common::critical(config_error);
    }
    options = std::move(*loaded);
  }

  auto level = vm.contains("verbose")
                   ? spdlog::level::debug
                   : spdlog::level::from_str(options.log_level);
  configure_logging(options.log_file, level);

  auto status = 0;
  if (vm.contains("score")) {
    status = print_score(score, options.trust.weights);
  } else if (!sanitizer.empty()) {
    auto kind = warden::sanitize::try_sanitizer_kind(sanitizer);
    if (!kind.has_value()) {
      std::cerr << "unknown sanitizer '" << sanitizer << "'" << std::endl;
      status = 2;
    } else if (vm.contains("detect")) {
      status = run_detect(*kind, input);
    } else {
      status = run_sanitize(*kind, input, options.sanitize);
    }
  } else {
    std::cout << description << std::endl;
  }

  spdlog::shutdown();
  return status;
}
