#include "value_formatter.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace d3c0d3::util {

std::string value_formatter::format_string(const std::string& str, const format_options& opts) {
  std::string result = str;

  // truncate if needed
  if (result.length() > opts.max_string_length) {
    result = result.substr(0, opts.max_string_length) + "...";
  }

  result = escape_string(result);

  if (opts.quote_strings) {
    result = "\"" + result + "\"";
  }

  return result;
}

std::string value_formatter::format_bool(bool value) { return value ? "true" : "false"; }

std::string value_formatter::format_double(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value < 0 ? "-inf" : "inf";
  }

  std::ostringstream ss;
  ss << std::setprecision(15) << value;
  std::string text = ss.str();
  if (text.find_first_of(".e") == std::string::npos) {
    text += ".0";
  }
  return text;
}

std::string value_formatter::format_value(const value& input, const format_options& opts) {
  std::string out;
  append_value(out, input, opts, 0);
  return truncate(std::move(out), opts.max_length);
}

std::string value_formatter::truncate(std::string text, size_t max_length) {
  if (text.size() <= max_length) {
    return text;
  }
  text.resize(max_length);
  text += "...";
  return text;
}

void value_formatter::append_value(std::string& out, const value& input, const format_options& opts, size_t depth) {
  switch (input.type()) {
  case value::kind::null:
    out += "null";
    return;
  case value::kind::boolean:
    out += format_bool(*input.if_boolean());
    return;
  case value::kind::integer:
    out += std::to_string(*input.if_integer());
    return;
  case value::kind::floating:
    out += format_double(*input.if_floating());
    return;
  case value::kind::string:
    out += format_string(*input.if_string(), opts);
    return;
  case value::kind::sequence: {
    const auto& items = *input.if_sequence();
    if (depth >= opts.max_depth && !items.empty()) {
      out += "[...]";
      return;
    }
    out += "[";
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      if (i >= opts.max_items) {
        out += "...";
        break;
      }
      append_value(out, items[i], opts, depth + 1);
    }
    out += "]";
    return;
  }
  case value::kind::mapping: {
    const auto& entries = *input.if_mapping();
    if (depth >= opts.max_depth && !entries.empty()) {
      out += "{...}";
      return;
    }
    out += "{";
    for (size_t i = 0; i < entries.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      if (i >= opts.max_items) {
        out += "...";
        break;
      }
      out += format_string(entries[i].first, opts);
      out += ": ";
      append_value(out, entries[i].second, opts, depth + 1);
    }
    out += "}";
    return;
  }
  }
}

std::string value_formatter::escape_string(const std::string& str) {
  std::ostringstream ss;

  for (char c : str) {
    switch (c) {
    case '\n':
      ss << "\\n";
      break;
    case '\r':
      ss << "\\r";
      break;
    case '\t':
      ss << "\\t";
      break;
    case '\\':
      ss << "\\\\";
      break;
    case '"':
      ss << "\\\"";
      break;
    default:
      if (c >= 32 && c < 127) {
        ss << c;
      } else {
        ss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(static_cast<unsigned char>(c));
      }
      break;
    }
  }

  return ss.str();
}

} // namespace d3c0d3::util
