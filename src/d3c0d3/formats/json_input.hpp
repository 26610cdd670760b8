#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "d3c0d3/core/input_traits.hpp"
#include "d3c0d3/core/result.hpp"
#include "d3c0d3/core/value.hpp"

namespace d3c0d3 {

// lets decoders run directly over parsed json documents
template <> struct input_traits<nlohmann::json> {
  static bool is_null(const nlohmann::json& input) noexcept { return input.is_null(); }

  static const std::string* as_string(const nlohmann::json& input) {
    if (!input.is_string()) {
      return nullptr;
    }
    return &input.get_ref<const std::string&>();
  }

  // unsigned numbers above the int64_t range are not integers here
  static std::optional<int64_t> as_integer(const nlohmann::json& input) {
    if (input.is_number_unsigned()) {
      auto number = input.get<uint64_t>();
      if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
      }
      return static_cast<int64_t>(number);
    }
    if (input.is_number_integer()) {
      return input.get<int64_t>();
    }
    return std::nullopt;
  }

  static std::optional<double> as_number(const nlohmann::json& input) {
    if (!input.is_number()) {
      return std::nullopt;
    }
    return input.get<double>();
  }

  static std::optional<bool> as_boolean(const nlohmann::json& input) {
    if (!input.is_boolean()) {
      return std::nullopt;
    }
    return input.get<bool>();
  }

  static bool is_mapping(const nlohmann::json& input) noexcept { return input.is_object(); }

  static const nlohmann::json* find(const nlohmann::json& input, std::string_view key) {
    if (!input.is_object()) {
      return nullptr;
    }
    auto it = input.find(std::string(key));
    if (it == input.end()) {
      return nullptr;
    }
    return &*it;
  }

  static bool is_sequence(const nlohmann::json& input) noexcept { return input.is_array(); }

  static size_t size(const nlohmann::json& input) noexcept { return input.is_array() ? input.size() : 0; }

  static const nlohmann::json& at(const nlohmann::json& input, size_t index) { return input.at(index); }

  static std::string describe(const nlohmann::json& input);
};

// converts a json document into an in-memory value; mapping entries follow the json object's key order
value to_value(const nlohmann::json& document);

// parses json text; syntax errors come back as an error result
result<value> parse_value(std::string_view text);

} // namespace d3c0d3
