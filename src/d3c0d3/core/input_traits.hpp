#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "d3c0d3/core/value.hpp"
#include "d3c0d3/util/value_formatter.hpp"

namespace d3c0d3 {

/**
 * @brief Capabilities the decoding engine needs from an input type
 *
 * Specialize for every type decoders should run over. A specialization provides:
 *   - is_null, as_string, as_integer, as_number, as_boolean: scalar probes
 *   - is_mapping, find: key lookup (find returns nullptr for a missing key)
 *   - is_sequence, size, at: index lookup
 *   - describe: rendering used in error messages
 * Elements returned by find/at have the same type as the container.
 */
template <typename I> struct input_traits;

template <> struct input_traits<value> {
  static bool is_null(const value& input) noexcept { return input.is_null(); }

  static const std::string* as_string(const value& input) noexcept { return input.if_string(); }

  static std::optional<int64_t> as_integer(const value& input) noexcept {
    if (const auto* v = input.if_integer()) {
      return *v;
    }
    return std::nullopt;
  }

  // integers are widened to double
  static std::optional<double> as_number(const value& input) noexcept {
    if (const auto* v = input.if_floating()) {
      return *v;
    }
    if (const auto* v = input.if_integer()) {
      return static_cast<double>(*v);
    }
    return std::nullopt;
  }

  static std::optional<bool> as_boolean(const value& input) noexcept {
    if (const auto* v = input.if_boolean()) {
      return *v;
    }
    return std::nullopt;
  }

  static bool is_mapping(const value& input) noexcept { return input.is_mapping(); }

  static const value* find(const value& input, std::string_view key) noexcept { return input.find(key); }

  static bool is_sequence(const value& input) noexcept { return input.is_sequence(); }

  static size_t size(const value& input) noexcept { return input.size(); }

  static const value& at(const value& input, size_t index) { return input.at(index); }

  static std::string describe(const value& input) { return util::describe(input); }
};

// input rendering wrapped in backticks, as it appears in error messages
template <typename I> std::string describe_input(const I& input) {
  return "`" + input_traits<I>::describe(input) + "`";
}

} // namespace d3c0d3
