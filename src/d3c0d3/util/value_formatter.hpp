#pragma once

#include <cstddef>
#include <string>

#include "d3c0d3/core/value.hpp"

namespace d3c0d3::util {

/**
 * @brief Renders decoder inputs for error messages
 *
 * Output is a compact, JSON-like rendering with length, item and depth limits so that a failure on a
 * large document does not produce an unbounded message.
 */
class value_formatter {
public:
  // formatting options
  struct format_options {
    size_t max_string_length = 64;
    size_t max_items = 8;
    size_t max_depth = 3;
    size_t max_length = 256; // cap on the whole rendering
    bool quote_strings = true;

    format_options() : max_string_length(64), max_items(8), max_depth(3), max_length(256), quote_strings(true) {}
  };

  // format a string with escaping and length limits
  static std::string format_string(const std::string& str, const format_options& opts = {});

  static std::string format_bool(bool value);

  // shortest round-trip style rendering; integral doubles keep a trailing ".0"
  static std::string format_double(double value);

  static std::string format_value(const value& input, const format_options& opts = {});

  // cuts already-rendered text down to max_length, marking the cut with "..."
  static std::string truncate(std::string text, size_t max_length);

private:
  static std::string escape_string(const std::string& str);
  static void append_value(std::string& out, const value& input, const format_options& opts, size_t depth);
};

// description used inside decoder error messages
inline std::string describe(const value& input) { return value_formatter::format_value(input); }

} // namespace d3c0d3::util
