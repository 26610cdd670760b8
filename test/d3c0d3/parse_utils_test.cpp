#include <doctest/doctest.h>

#include <cstdint>

#include "d3c0d3/util/parse_utils.hpp"
#include "d3c0d3/util/string_utils.hpp"

namespace {

using d3c0d3::util::parse_boolean;
using d3c0d3::util::parse_enum;
using d3c0d3::util::parse_floating;
using d3c0d3::util::parse_integer;

enum class color { red, green };

} // namespace

TEST_CASE("parse_integer accepts signed decimal text") {
  int64_t out = 0;
  CHECK(parse_integer("42", out));
  CHECK(out == 42);
  CHECK(parse_integer("-17", out));
  CHECK(out == -17);
  CHECK(parse_integer("+5", out));
  CHECK(out == 5);
  CHECK(parse_integer("\t9\n", out));
  CHECK(out == 9);
  CHECK(parse_integer("9223372036854775807", out));
  CHECK(out == INT64_MAX);
}

TEST_CASE("parse_integer leaves out untouched on failure") {
  int64_t out = 11;
  CHECK_FALSE(parse_integer("", out));
  CHECK_FALSE(parse_integer("   ", out));
  CHECK_FALSE(parse_integer("+", out));
  CHECK_FALSE(parse_integer("+-1", out));
  CHECK_FALSE(parse_integer("1 2", out));
  CHECK_FALSE(parse_integer("0x10", out));
  CHECK_FALSE(parse_integer("9223372036854775808", out));
  CHECK(out == 11);
}

TEST_CASE("parse_floating accepts finite decimal literals") {
  double out = 0.0;
  CHECK(parse_floating("1.25", out));
  CHECK(out == doctest::Approx(1.25));
  CHECK(parse_floating("+.5", out));
  CHECK(out == doctest::Approx(0.5));
  CHECK(parse_floating("-2e2", out));
  CHECK(out == doctest::Approx(-200.0));

  CHECK_FALSE(parse_floating("", out));
  CHECK_FALSE(parse_floating("1.2.3", out));
  CHECK_FALSE(parse_floating("infinity", out));
  CHECK_FALSE(parse_floating("NaN", out));
}

TEST_CASE("parse_boolean uses an exact vocabulary") {
  bool out = false;
  CHECK(parse_boolean("true", out));
  CHECK(out);
  CHECK(parse_boolean("0", out));
  CHECK_FALSE(out);
  CHECK_FALSE(parse_boolean("yes", out));
  CHECK_FALSE(parse_boolean(" true", out));
}

TEST_CASE("parse_enum matches case-insensitively") {
  color out = color::red;
  CHECK(parse_enum<color>("GREEN", {{"red", color::red}, {"green", color::green}}, out));
  CHECK(out == color::green);
  CHECK_FALSE(parse_enum<color>("blue", {{"red", color::red}, {"green", color::green}}, out));
}

TEST_CASE("trim_view strips ascii whitespace") {
  CHECK(d3c0d3::util::trim_view("  a b\t") == "a b");
  CHECK(d3c0d3::util::trim_view(" \n ").empty());
  CHECK(d3c0d3::util::to_lower("MiXeD") == "mixed");
}
