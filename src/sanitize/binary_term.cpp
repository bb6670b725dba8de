#include <warden/sanitize/binary_term.hpp>

#include <boost/endian/conversion.hpp>
#include <spdlog/fmt/fmt.h>

#include <bit>
#include <cstdint>
#include <cstring>
#include <utility>

namespace warden::sanitize {

namespace {

namespace tag {
constexpr uint8_t kVersion = 131;
constexpr uint8_t kNewFloat = 70;
constexpr uint8_t kBitBinary = 77;
constexpr uint8_t kCompressed = 80;
constexpr uint8_t kAtomCacheRef = 82;
constexpr uint8_t kNewPid = 88;
constexpr uint8_t kNewPort = 89;
constexpr uint8_t kNewerReference = 90;
constexpr uint8_t kSmallInteger = 97;
constexpr uint8_t kInteger = 98;
constexpr uint8_t kFloat = 99;
constexpr uint8_t kAtom = 100;
constexpr uint8_t kReference = 101;
constexpr uint8_t kPort = 102;
constexpr uint8_t kPid = 103;
constexpr uint8_t kSmallTuple = 104;
constexpr uint8_t kLargeTuple = 105;
constexpr uint8_t kNil = 106;
constexpr uint8_t kString = 107;
constexpr uint8_t kList = 108;
constexpr uint8_t kBinary = 109;
constexpr uint8_t kSmallBig = 110;
constexpr uint8_t kLargeBig = 111;
constexpr uint8_t kNewFun = 112;
constexpr uint8_t kExport = 113;
constexpr uint8_t kNewReference = 114;
constexpr uint8_t kSmallAtom = 115;
constexpr uint8_t kMap = 116;
constexpr uint8_t kFun = 117;
constexpr uint8_t kAtomUtf8 = 118;
constexpr uint8_t kSmallAtomUtf8 = 119;
constexpr uint8_t kV4Port = 120;
constexpr uint8_t kLocal = 121;
}  // namespace tag

using warden::schema::sanitize_error_code;

class decoder final {
 public:
  decoder(const warden::schema::bytes_view_t& input,
          const term_limits_t& limits)
      : input_{input}, limits_{limits} {}

  term_decode_result run() {
    auto version = read_u8();
    if (!version || *version != tag::kVersion) {
      return fail(sanitize_error_code::term_decode_error, "bad version byte");
    }
    auto term = read_term(0);
    if (!term) {
      return result_;
    }
    if (offset_ != input_.size()) {
      return fail(sanitize_error_code::term_decode_error, "trailing bytes");
    }
    result_.term = std::move(*term);
    return result_;
  }

 private:
  term_decode_result fail(const sanitize_error_code code, std::string detail) {
    if (result_.code == sanitize_error_code::ok) {
      result_.code = code;
      result_.detail = std::move(detail);
    }
    return result_;
  }

  std::optional<uint8_t> read_u8() {
    if (offset_ + 1 > input_.size()) {
      return std::nullopt;
    }
    return input_[offset_++];
  }

  std::optional<uint16_t> read_u16() {
    if (offset_ + 2 > input_.size()) {
      return std::nullopt;
    }
    auto value = boost::endian::load_big_u16(input_.data() + offset_);
    offset_ += 2;
    return value;
  }

  std::optional<uint32_t> read_u32() {
    if (offset_ + 4 > input_.size()) {
      return std::nullopt;
    }
    auto value = boost::endian::load_big_u32(input_.data() + offset_);
    offset_ += 4;
    return value;
  }

  std::optional<warden::schema::bytes_view_t> read_bytes(const std::size_t n) {
    if (n > input_.size() - offset_) {
      return std::nullopt;
    }
    auto view = input_.subspan(offset_, n);
    offset_ += n;
    return view;
  }

  bool count_element() {
    ++elements_;
    if (elements_ > limits_.max_size) {
      fail(sanitize_error_code::max_size_exceeded,
           fmt::format("more than {} elements", limits_.max_size));
      return false;
    }
    return true;
  }

  /// Every element needs at least one byte; reject arities the remaining
  /// input cannot hold before allocating for them.
  bool check_arity(const uint64_t arity) {
    if (arity > limits_.max_size) {
      fail(sanitize_error_code::max_size_exceeded,
           fmt::format("arity {} exceeds {}", arity, limits_.max_size));
      return false;
    }
    if (arity > input_.size() - offset_) {
      fail(sanitize_error_code::term_decode_error, "truncated input");
      return false;
    }
    return true;
  }

  std::optional<term_t> truncated() {
    fail(sanitize_error_code::term_decode_error, "truncated input");
    return std::nullopt;
  }

  std::optional<term_t> read_atom(const std::size_t length) {
    auto bytes = read_bytes(length);
    if (!bytes) {
      return truncated();
    }
    auto name = warden::schema::make_string(*bytes);
    if (!limits_.known_atoms.contains(name)) {
      fail(sanitize_error_code::unsafe_term, "unknown atom");
      return std::nullopt;
    }
    return term_t{term_atom_t{std::move(name)}};
  }

  bool read_elements(const uint64_t arity,
                     const uint32_t depth,
                     std::vector<term_t>& out) {
    if (!check_arity(arity)) {
      return false;
    }
    out.reserve(static_cast<std::size_t>(arity));
    for (auto i = uint64_t{}; i < arity; ++i) {
      auto element = read_term(depth + 1);
      if (!element) {
        return false;
      }
      out.push_back(std::move(*element));
    }
    return true;
  }

  std::optional<term_t> read_big(const uint64_t length) {
    auto sign = read_u8();
    auto digits = sign ? read_bytes(length) : std::nullopt;
    if (!digits) {
      return truncated();
    }
    if (length > 8) {
      fail(sanitize_error_code::term_decode_error, "integer out of range");
      return std::nullopt;
    }
    auto magnitude = uint64_t{};
    for (auto i = length; i > 0; --i) {
      magnitude = (magnitude << 8u) | (*digits)[i - 1];
    }
    if (*sign == 0 && magnitude <= static_cast<uint64_t>(INT64_MAX)) {
      return term_t{static_cast<int64_t>(magnitude)};
    }
    if (*sign != 0 && magnitude <= static_cast<uint64_t>(INT64_MAX) + 1) {
      return term_t{static_cast<int64_t>(0 - magnitude)};
    }
    fail(sanitize_error_code::term_decode_error, "integer out of range");
    return std::nullopt;
  }

  std::optional<term_t> read_term(const uint32_t depth) {
    if (!count_element()) {
      return std::nullopt;
    }
    auto kind = read_u8();
    if (!kind) {
      return truncated();
    }

    switch (*kind) {
      case tag::kSmallInteger: {
        auto value = read_u8();
        return value ? std::optional{term_t{static_cast<int64_t>(*value)}}
                     : truncated();
      }
      case tag::kInteger: {
        auto value = read_u32();
        return value ? std::optional{term_t{static_cast<int64_t>(
                           static_cast<int32_t>(*value))}}
                     : truncated();
      }
      case tag::kNewFloat: {
        auto bytes = read_bytes(8);
        if (!bytes) {
          return truncated();
        }
        auto bits = boost::endian::load_big_u64(bytes->data());
        return term_t{std::bit_cast<double>(bits)};
      }
      case tag::kSmallBig: {
        auto length = read_u8();
        return length ? read_big(*length) : truncated();
      }
      case tag::kLargeBig: {
        auto length = read_u32();
        return length ? read_big(*length) : truncated();
      }
      case tag::kAtom:
      case tag::kAtomUtf8: {
        auto length = read_u16();
        return length ? read_atom(*length) : truncated();
      }
      case tag::kSmallAtom:
      case tag::kSmallAtomUtf8: {
        auto length = read_u8();
        return length ? read_atom(*length) : truncated();
      }
      case tag::kBinary: {
        auto length = read_u32();
        auto bytes = length ? read_bytes(*length) : std::nullopt;
        if (!bytes) {
          return truncated();
        }
        return term_t{term_binary_t{warden::schema::make_bytes(*bytes)}};
      }
      case tag::kString: {
        auto length = read_u16();
        auto bytes = length ? read_bytes(*length) : std::nullopt;
        if (!bytes) {
          return truncated();
        }
        auto list = term_list_t{};
        for (const auto byte : *bytes) {
          if (!count_element()) {
            return std::nullopt;
          }
          list.elements.push_back(term_t{static_cast<int64_t>(byte)});
        }
        return term_t{std::move(list)};
      }
      case tag::kNil:
        return term_t{term_list_t{}};
      default:
        break;
    }

    if (*kind == tag::kSmallTuple || *kind == tag::kLargeTuple ||
        *kind == tag::kList || *kind == tag::kMap) {
      if (depth + 1 > limits_.max_depth) {
        fail(sanitize_error_code::max_depth_exceeded,
             fmt::format("nesting deeper than {}", limits_.max_depth));
        return std::nullopt;
      }
    }

    switch (*kind) {
      case tag::kSmallTuple:
      case tag::kLargeTuple: {
        auto arity = std::optional<uint32_t>{};
        if (*kind == tag::kSmallTuple) {
          if (auto small = read_u8(); small) {
            arity = *small;
          }
        } else {
          arity = read_u32();
        }
        if (!arity) {
          return truncated();
        }
        auto tuple = term_tuple_t{};
        if (!read_elements(*arity, depth, tuple.elements)) {
          return std::nullopt;
        }
        return term_t{std::move(tuple)};
      }
      case tag::kList: {
        auto arity = read_u32();
        if (!arity) {
          return truncated();
        }
        auto list = term_list_t{};
        if (!read_elements(*arity, depth, list.elements)) {
          return std::nullopt;
        }
        auto tail = read_u8();
        if (!tail) {
          return truncated();
        }
        if (*tail != tag::kNil) {
          fail(sanitize_error_code::term_decode_error, "improper list");
          return std::nullopt;
        }
        return term_t{std::move(list)};
      }
      case tag::kMap: {
        auto arity = read_u32();
        if (!arity) {
          return truncated();
        }
        if (!check_arity(uint64_t{*arity} * 2)) {
          return std::nullopt;
        }
        auto map = term_map_t{};
        for (auto i = uint32_t{}; i < *arity; ++i) {
          auto key = read_term(depth + 1);
          if (!key) {
            return std::nullopt;
          }
          auto value = read_term(depth + 1);
          if (!value) {
            return std::nullopt;
          }
          map.keys.push_back(std::move(*key));
          map.values.push_back(std::move(*value));
        }
        return term_t{std::move(map)};
      }
      case tag::kReference:
      case tag::kNewReference:
      case tag::kNewerReference:
        fail(sanitize_error_code::unsafe_term, "reference");
        return std::nullopt;
      case tag::kPid:
      case tag::kNewPid:
        fail(sanitize_error_code::unsafe_term, "process id");
        return std::nullopt;
      case tag::kPort:
      case tag::kNewPort:
      case tag::kV4Port:
        fail(sanitize_error_code::unsafe_term, "port");
        return std::nullopt;
      case tag::kFun:
      case tag::kNewFun:
      case tag::kExport:
        fail(sanitize_error_code::unsafe_term, "function");
        return std::nullopt;
      case tag::kAtomCacheRef:
        fail(sanitize_error_code::unsafe_term, "atom cache reference");
        return std::nullopt;
      case tag::kCompressed:
        fail(sanitize_error_code::unsafe_term, "compressed term");
        return std::nullopt;
      case tag::kLocal:
        fail(sanitize_error_code::unsafe_term, "local term");
        return std::nullopt;
      case tag::kBitBinary:
      case tag::kFloat:
      default:
        fail(sanitize_error_code::term_decode_error,
             fmt::format("unsupported tag {}", *kind));
        return std::nullopt;
    }
  }

  warden::schema::bytes_view_t input_;
  const term_limits_t& limits_;
  std::size_t offset_{};
  uint64_t elements_{};
  term_decode_result result_;
};

void format_into(std::string& out, const term_t& term);

void format_sequence(std::string& out,
                     const std::vector<term_t>& elements,
                     const char open,
                     const char close) {
  out.push_back(open);
  for (std::size_t i = 0; i < elements.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    format_into(out, elements[i]);
  }
  out.push_back(close);
}

void format_into(std::string& out, const term_t& term) {
  std::visit(
      overloaded{
          [&](const int64_t value) { out += std::to_string(value); },
          [&](const double value) { out += fmt::format("{}", value); },
          [&](const term_atom_t& value) { out += value.name; },
          [&](const term_binary_t& value) {
            out += "<<\"";
            for (const auto byte : value.data) {
              if (byte >= 0x20 && byte < 0x7f && byte != '"' && byte != '\\') {
                out.push_back(static_cast<char>(byte));
              } else {
                out += fmt::format("\\x{:02x}", byte);
              }
            }
            out += "\">>";
          },
          [&](const term_tuple_t& value) {
            format_sequence(out, value.elements, '{', '}');
          },
          [&](const term_list_t& value) {
            format_sequence(out, value.elements, '[', ']');
          },
          [&](const term_map_t& value) {
            out += "#{";
            for (std::size_t i = 0; i < value.keys.size(); ++i) {
              if (i > 0) {
                out.push_back(',');
              }
              format_into(out, value.keys[i]);
              out += "=>";
              format_into(out, value.values[i]);
            }
            out.push_back('}');
          }},
      term.value);
}

}  // namespace

std::set<std::string, std::less<>> default_known_atoms() {
  return {"true", "false", "nil", "undefined", "ok", "error"};
}

term_decode_result decode_term(const warden::schema::bytes_view_t& input,
                               const term_limits_t& limits) {
  return decoder{input, limits}.run();
}

std::string format_term(const term_t& term) {
  auto out = std::string{};
  format_into(out, term);
  return out;
}

}  // namespace warden::sanitize
