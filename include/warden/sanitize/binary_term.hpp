#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/sanitize_error_code.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden::sanitize {

// Decoded form of the external binary term format (version 131). Only plain
// data is representable; references, process ids, ports and closures are
// rejected by the decoder.
struct term_t;

struct term_atom_t final {
  std::string name;
};

struct term_binary_t final {
  warden::schema::bytes_t data;
};

struct term_tuple_t final {
  std::vector<term_t> elements;
};

struct term_list_t final {
  std::vector<term_t> elements;
};

struct term_map_t final {
  std::vector<term_t> keys;
  std::vector<term_t> values;
};

struct term_t final {
  std::variant<int64_t,
               double,
               term_atom_t,
               term_binary_t,
               term_tuple_t,
               term_list_t,
               term_map_t>
      value;
};

struct term_limits_t final {
  uint32_t max_depth{32};
  uint64_t max_size{10000};
  /// Atoms the caller already knows. Any other atom is refused so that
  /// untrusted input can never grow the atom table.
  std::set<std::string, std::less<>> known_atoms;
};

struct term_decode_result final {
  warden::schema::sanitize_error_code code{
      warden::schema::sanitize_error_code::ok};
  std::optional<term_t> term;
  std::string detail;
};

/// Atoms every decoder accepts: true, false, nil, undefined, ok, error.
std::set<std::string, std::less<>> default_known_atoms();

term_decode_result decode_term(const warden::schema::bytes_view_t& input,
                               const term_limits_t& limits);

/// Compact textual rendering, e.g. `{ok,[1,2],<<"abc">>}`.
std::string format_term(const term_t& term);

}  // namespace warden::sanitize
