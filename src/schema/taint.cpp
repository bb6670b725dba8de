#include <warden/schema/taint.hpp>

#include <algorithm>

namespace warden::schema {

taint_t apply_sanitization(const taint_t& taint,
                           const sanitization_t applied,
                           const confidence_t certified) {
  auto out = taint;
  out.sanitizations = static_cast<uint8_t>(out.sanitizations | bit(applied));
  out.confidence = certified;
  return out;
}

bool is_sanitized(const taint_t& taint, const sanitization_t sanitization) {
  return (taint.sanitizations & bit(sanitization)) != 0;
}

bool has_sanitizations(const taint_t& taint, const uint8_t required_mask) {
  return (taint.sanitizations & required_mask) == required_mask;
}

std::vector<std::string_view> sanitization_names(const uint8_t mask) {
  auto names = std::vector<std::string_view>{};
  for (const auto& [name, value] : kSanitizationMappings) {
    if ((mask & bit(value)) != 0) {
      names.push_back(name);
    }
  }
  return names;
}

taint_t merge(const taint_t& left, const taint_t& right) {
  auto out = taint_t{};
  out.level = std::max(left.level, right.level);
  out.confidence = std::min(left.confidence, right.confidence);
  out.sanitizations =
      static_cast<uint8_t>(left.sanitizations & right.sanitizations);
  out.source = left.source.empty() ? right.source : left.source;
  return out;
}

taint_level_t propagate(const std::vector<taint_level_t>& levels) {
  auto out = taint_level_t::trusted;
  for (const auto level : levels) {
    out = std::max(out, level);
  }
  return out;
}

bool can_use_as(const taint_level_t level, const taint_role_t role) {
  switch (role) {
    case taint_role_t::control:
      return level == taint_level_t::trusted ||
             level == taint_level_t::derived;
    case taint_role_t::data:
      return level != taint_level_t::hostile;
  }
  return false;
}

}  // namespace warden::schema
