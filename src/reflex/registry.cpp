#include <warden/reflex/registry.hpp>

#include <boost/regex.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <utility>

namespace warden::reflex {

namespace {

reflex_t pattern_reflex(std::string name,
                        std::string description,
                        const std::string& pattern,
                        std::string reflex_context_t::*field) {
  auto expression = std::make_shared<const boost::regex>(
      pattern,
      boost::regex::perl | boost::regex::icase | boost::regex::no_mod_m);
  return reflex_t{std::move(name), std::move(description),
                  [expression, field](const reflex_context_t& context) {
                    const auto& value = context.*field;
                    return value.empty() ||
                           !boost::regex_search(value, *expression);
                  }};
}

}  // namespace

reflex_t command_reflex(std::string name,
                        std::string description,
                        const std::string& pattern) {
  return pattern_reflex(std::move(name), std::move(description), pattern,
                        &reflex_context_t::command);
}

reflex_t path_reflex(std::string name,
                     std::string description,
                     const std::string& pattern) {
  return pattern_reflex(std::move(name), std::move(description), pattern,
                        &reflex_context_t::path);
}

std::vector<reflex_t> builtin_reflexes() {
  return {
      command_reflex(
          "rm_root", "recursive delete of the filesystem root",
          R"(\brm\s+([^;&|\s]+\s+)*?(-[a-z]*[rf][a-z]*|--recursive|--force)\s+([^;&|\s]+\s+)*(/\*?|~/?\*?|\*)(\s|$|[;&|]))"),
      command_reflex("mkfs", "filesystem format", R"(\bmkfs(\.\w+)?\b)"),
      command_reflex("dd_device", "raw write to a block device",
                     R"(\bdd\b.*\bof=/dev/)"),
      command_reflex("fork_bomb", "fork bomb", R"(:\s*\(\s*\)\s*\{.*:\s*\|\s*:)"),
      command_reflex("chmod_root", "world-writable filesystem root",
                     R"(\bchmod\s+(-[a-z]+\s+)*0?777\s+/(\s|$))"),
      command_reflex("privilege_escalation", "privilege escalation",
                     R"((^|[;&|]\s*|\s)(sudo|su|doas)(\s|$))"),
      command_reflex("raw_network", "raw network tooling",
                     R"((^|[;&|]\s*|\s)(nc|ncat|netcat|socat)(\s|$))"),
      command_reflex("pipe_to_shell", "remote script piped into a shell",
                     R"(\b(curl|wget)\b[^|]*\|\s*(sudo\s+)?(ba|z|k|da)?sh\b)"),
      path_reflex("shadow_file", "system credential store",
                  R"(^/etc/(shadow|gshadow|sudoers)(/|$))"),
      path_reflex("ssh_keys", "ssh keys and configuration",
                  R"((^|/)\.ssh(/|$))"),
      path_reflex("process_memory", "process memory",
                  R"(^/proc/(\d+|self)/(mem|environ)$)"),
  };
}

reflex_registry::reflex_registry(
    std::vector<reflex_t> reflexes,
    std::optional<std::chrono::milliseconds> timeout)
    : reflexes_{std::move(reflexes)}, timeout_{timeout} {}

void reflex_registry::add(reflex_t reflex) {
  auto lock = std::scoped_lock{mutex_};
  auto it = std::find_if(
      std::begin(reflexes_), std::end(reflexes_),
      [&](const auto& existing) { return existing.name == reflex.name; });
  if (it != std::end(reflexes_)) {
    *it = std::move(reflex);
    return;
  }
  reflexes_.push_back(std::move(reflex));
}

bool reflex_registry::remove(const std::string& name) {
  auto lock = std::scoped_lock{mutex_};
  auto it = std::remove_if(
      std::begin(reflexes_), std::end(reflexes_),
      [&](const auto& existing) { return existing.name == name; });
  if (it == std::end(reflexes_)) {
    return false;
  }
  reflexes_.erase(it, std::end(reflexes_));
  return true;
}

std::vector<std::string> reflex_registry::names() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<std::string>{};
  for (const auto& reflex : reflexes_) {
    out.push_back(reflex.name);
  }
  return out;
}

reflex_result_t reflex_registry::check(const reflex_context_t& context) const {
  if (context.command.size() > kMaxInspectedBytes ||
      context.path.size() > kMaxInspectedBytes) {
    spdlog::warn("Reflexes refused oversized input for action '{}'",
                 context.action);
    return reflex_result_t{verdict_t::deny, deny_reason_t::too_large,
                           "input"};
  }

  auto reflexes = std::vector<reflex_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    reflexes = reflexes_;
  }

  for (const auto& reflex : reflexes) {
    auto check = check_t{};
    if (reflex.safe) {
      check = [safe = reflex.safe, context] { return safe(context); };
    }
    auto result = timeout_.has_value() ? wrap(check, *timeout_) : wrap(check);
    if (result.allowed()) {
      continue;
    }
    if (result.reason == deny_reason_t::check_failed) {
      result.reason = deny_reason_t::blocked_pattern;
    }
    result.detail = reflex.name;
    spdlog::warn("Reflex '{}' blocked action '{}' ({})", reflex.name,
                 context.action, to_string(result.reason));
    return result;
  }
  return reflex_result_t{verdict_t::allow, deny_reason_t::none, {}};
}

}  // namespace warden::reflex
