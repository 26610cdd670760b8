#include "parse_utils.hpp"

#include <charconv>
#include <cctype>
#include <cmath>
#include <system_error>

namespace d3c0d3::util {

namespace {

// drops a leading '+' when it is followed by a digit or a decimal point; from_chars only knows '-'
std::string_view strip_plus(std::string_view text) {
  if (text.size() > 1 && text.front() == '+') {
    unsigned char next = static_cast<unsigned char>(text[1]);
    if (std::isdigit(next) || next == '.') {
      return text.substr(1);
    }
  }
  return text;
}

} // namespace

bool parse_integer(std::string_view text, int64_t& out) {
  std::string_view digits = strip_plus(trim_view(text));
  if (digits.empty()) {
    return false;
  }

  int64_t parsed = 0;
  const char* end = digits.data() + digits.size();
  auto [ptr, ec] = std::from_chars(digits.data(), end, parsed, 10);
  if (ec != std::errc() || ptr != end) {
    return false;
  }

  out = parsed;
  return true;
}

bool parse_floating(std::string_view text, double& out) {
  std::string_view literal = strip_plus(trim_view(text));
  if (literal.empty()) {
    return false;
  }

  double parsed = 0.0;
  const char* end = literal.data() + literal.size();
  auto [ptr, ec] = std::from_chars(literal.data(), end, parsed, std::chars_format::general);
  if (ec != std::errc() || ptr != end || !std::isfinite(parsed)) {
    return false;
  }

  out = parsed;
  return true;
}

bool parse_boolean(std::string_view text, bool& out) {
  if (text == "true" || text == "1") {
    out = true;
    return true;
  }
  if (text == "false" || text == "0") {
    out = false;
    return true;
  }
  return false;
}

} // namespace d3c0d3::util
