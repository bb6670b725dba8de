#include <warden/sanitize/deserialization.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <utility>

namespace warden::sanitize {

namespace {

using warden::schema::sanitize_error_code;

struct json_shape_t final {
  uint32_t depth{};
  uint64_t elements{};
};

void measure(const Json::Value& value,
             const uint32_t depth,
             json_shape_t& shape) {
  ++shape.elements;
  if (!value.isArray() && !value.isObject()) {
    return;
  }
  shape.depth = std::max(shape.depth, depth + 1);
  for (const auto& child : value) {
    measure(child, depth + 1, shape);
  }
}

std::string write_compact(const Json::Value& value) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

sanitize_result sanitize_term(const std::string_view value,
                              const warden::schema::taint_t& taint,
                              const sanitize_options& options) {
  auto limits = term_limits_t{};
  limits.max_depth = options.max_depth;
  limits.max_size = options.max_size;
  limits.known_atoms = default_known_atoms();
  limits.known_atoms.insert(std::begin(options.known_atoms),
                            std::end(options.known_atoms));

  auto decoded =
      decode_term(warden::schema::make_bytes_view(value), limits);
  if (decoded.code != sanitize_error_code::ok) {
    return make_failure(decoded.code, taint, decoded.detail);
  }
  return make_success(format_term(*decoded.term), taint,
                      warden::schema::sanitization_t::deserialization,
                      warden::schema::confidence_t::verified);
}

}  // namespace

uint32_t scan_json_depth(const std::string_view input) {
  auto depth = uint32_t{};
  auto deepest = uint32_t{};
  auto in_string = false;
  auto escaped = false;
  for (const auto c : input) {
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    switch (c) {
      case '"':
        in_string = true;
        break;
      case '[':
      case '{':
        ++depth;
        deepest = std::max(deepest, depth);
        break;
      case ']':
      case '}':
        if (depth > 0) {
          --depth;
        }
        break;
      default:
        break;
    }
  }
  return deepest;
}

json_decode_result decode_json(const std::string_view input,
                               const uint32_t max_depth,
                               const uint64_t max_size) {
  auto result = json_decode_result{};
  if (scan_json_depth(input) > max_depth) {
    result.code = sanitize_error_code::max_depth_exceeded;
    result.detail = fmt::format("nesting deeper than {}", max_depth);
    return result;
  }

  auto builder = Json::CharReaderBuilder{};
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  builder["strictRoot"] = false;
  builder["failIfExtra"] = true;
  builder["rejectDupKeys"] = true;
  builder["allowSpecialFloats"] = false;
  builder["stackLimit"] = static_cast<Json::UInt>(max_depth) + 8;

  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  auto errors = std::string{};
  try {
    if (!reader->parse(input.data(), input.data() + input.size(),
                       &result.value, &errors)) {
      result.code = sanitize_error_code::json_decode_error;
      result.detail = errors;
      return result;
    }
  } catch (const Json::Exception& ex) {
    result.code = sanitize_error_code::json_decode_error;
    result.detail = ex.what();
    return result;
  }

  auto shape = json_shape_t{};
  measure(result.value, 0, shape);
  if (shape.depth > max_depth) {
    result.code = sanitize_error_code::max_depth_exceeded;
    result.detail = fmt::format("nesting deeper than {}", max_depth);
  } else if (shape.elements > max_size) {
    result.code = sanitize_error_code::max_size_exceeded;
    result.detail = fmt::format("{} elements exceeds {}", shape.elements,
                                max_size);
  }
  return result;
}

sanitize_result deserialization_sanitizer::sanitize(
    const std::string_view value,
    const warden::schema::taint_t& taint,
    const sanitize_options& options) const {
  if (value.size() > options.max_byte_size) {
    return make_failure(sanitize_error_code::too_large, taint,
                        fmt::format("{} bytes exceeds {}", value.size(),
                                    options.max_byte_size));
  }

  if (options.format == payload_format_t::binary_term) {
    return sanitize_term(value, taint, options);
  }

  auto decoded = decode_json(value, options.max_depth, options.max_size);
  if (decoded.code != sanitize_error_code::ok) {
    return make_failure(decoded.code, taint, decoded.detail);
  }
  return make_success(write_compact(decoded.value), taint,
                      warden::schema::sanitization_t::deserialization,
                      warden::schema::confidence_t::verified);
}

detect_result deserialization_sanitizer::detect(
    const std::string_view value) const {
  static const auto defaults = sanitize_options{};
  auto patterns = std::vector<std::string>{};
  if (!value.empty() && static_cast<uint8_t>(value.front()) == 131) {
    patterns.emplace_back("binary_term");
    return make_detection(std::move(patterns), 0.25);
  }
  if (value.size() > defaults.max_byte_size) {
    patterns.emplace_back("oversized_payload");
  }
  if (scan_json_depth(value) > defaults.max_depth) {
    patterns.emplace_back("deep_nesting");
  }
  if (value.find("__proto__") != std::string_view::npos ||
      value.find("\"constructor\"") != std::string_view::npos) {
    patterns.emplace_back("prototype_key");
  }
  return make_detection(std::move(patterns));
}

}  // namespace warden::sanitize
