#pragma once

#include <warden/reflex/wrapper.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::reflex {

/// What an action is about to touch. Empty fields are not inspected.
struct reflex_context_t final {
  std::string action;
  std::string command;
  std::string path;
  std::string resource;
};

struct reflex_t final {
  std::string name;
  std::string description;
  /// True when the context is safe.
  std::function<bool(const reflex_context_t&)> safe;
};

/// Commands and paths longer than this are denied without being matched.
inline constexpr std::size_t kMaxInspectedBytes = 64 * 1024;

/// Blocks when `pattern` (Perl syntax, case-insensitive) matches the command.
reflex_t command_reflex(std::string name,
                        std::string description,
                        const std::string& pattern);

/// Blocks when `pattern` (Perl syntax, case-insensitive) matches the path.
reflex_t path_reflex(std::string name,
                     std::string description,
                     const std::string& pattern);

/// Destructive commands, privilege escalation, raw network tools,
/// credential stores and process memory.
std::vector<reflex_t> builtin_reflexes();

/// Ordered set of reflexes, each evaluated through `wrap`.
class reflex_registry final {
 public:
  explicit reflex_registry(
      std::vector<reflex_t> reflexes = builtin_reflexes(),
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /// Replaces a reflex with the same name.
  void add(reflex_t reflex);
  bool remove(const std::string& name);
  std::vector<std::string> names() const;

  /// First reflex that does not pass decides. `detail` names it. A context
  /// field over `kMaxInspectedBytes` denies with `too_large`.
  reflex_result_t check(const reflex_context_t& context) const;

 private:
  mutable std::mutex mutex_;
  std::vector<reflex_t> reflexes_;
  std::optional<std::chrono::milliseconds> timeout_;
};

}  // namespace warden::reflex
