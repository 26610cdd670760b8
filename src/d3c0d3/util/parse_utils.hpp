#pragma once

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <utility>

#include "d3c0d3/util/string_utils.hpp"

namespace d3c0d3::util {

template <typename Enum>
bool parse_enum(std::string_view value, const std::initializer_list<std::pair<const char*, Enum>>& mapping, Enum& out) {
  std::string lower = to_lower(trim_view(value));
  for (const auto& entry : mapping) {
    if (lower == to_lower(entry.first)) {
      out = entry.second;
      return true;
    }
  }
  return false;
}

// decimal integer with optional sign and surrounding whitespace; fails on overflow
bool parse_integer(std::string_view text, int64_t& out);

// finite decimal floating literal with optional sign and surrounding whitespace
bool parse_floating(std::string_view text, double& out);

// "true"/"1" and "false"/"0", exact spelling
bool parse_boolean(std::string_view text, bool& out);

} // namespace d3c0d3::util
