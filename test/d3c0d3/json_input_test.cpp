#include <doctest/doctest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "d3c0d3/core/combinators.hpp"
#include "d3c0d3/core/primitives.hpp"
#include "d3c0d3/formats/json_input.hpp"

namespace {

using nlohmann::json;

using d3c0d3::from_key;
using d3c0d3::map_n;
using d3c0d3::parse_value;
using d3c0d3::to_value;
using d3c0d3::value;

} // namespace

TEST_CASE("primitives run over json documents") {
  CHECK(d3c0d3::string<json>().run_or_throw(json("a")) == "a");
  CHECK(d3c0d3::integer<json>().run_or_throw(json(3)) == 3);
  CHECK(d3c0d3::integer<json>().run(json(3.5)).is_error());
  CHECK(d3c0d3::floating<json>().run_or_throw(json(3)) == doctest::Approx(3.0));
  CHECK(d3c0d3::boolean<json>().run_or_throw(json(true)) == true);
  CHECK(d3c0d3::nil<json>().run(json(nullptr)).ok());
  CHECK(d3c0d3::str_to_int<json>().run_or_throw(json("42")) == 42);
  CHECK(d3c0d3::str_to_int<json>().run(json(42)).is_error());
  CHECK(d3c0d3::match<json>("x").run(json("x")).ok());
  CHECK(d3c0d3::match<json>("x").run(json("y")).is_error());
}

TEST_CASE("json error messages render the document") {
  auto failed = d3c0d3::integer<json>().run(json("x"));
  REQUIRE(failed.is_error());
  CHECK(failed.unwrap_error() == "`\"x\"` is not an Integer");
  CHECK(failed.unwrap_error() == d3c0d3::integer().run(value("x")).unwrap_error());
}

TEST_CASE("json integers beyond int64 are only floats") {
  json big = std::numeric_limits<uint64_t>::max();
  CHECK(d3c0d3::integer<json>().run(big).is_error());
  CHECK(d3c0d3::floating<json>().run(big).ok());

  json fits = uint64_t{42};
  CHECK(d3c0d3::integer<json>().run_or_throw(fits) == 42);
}

TEST_CASE("structural accessors run over json documents") {
  auto doc = json::parse(R"({"a": "24", "b": "42", "list": ["1", "2"], "nested": {"x": [true, false]}})");

  auto pair = map_n(
      [](int64_t a, int64_t b) { return std::vector<int64_t>{a, b}; }, from_key("a", d3c0d3::str_to_int<json>()),
      from_key("b", d3c0d3::str_to_int<json>())
  );
  CHECK(pair.run_or_throw(doc) == std::vector<int64_t>{24, 42});

  auto list = from_key("list", d3c0d3::array(d3c0d3::str_to_int<json>()));
  CHECK(list.run_or_throw(doc) == std::vector<int64_t>{1, 2});

  auto second = from_key("nested", from_key("x", d3c0d3::at_index(1, d3c0d3::boolean<json>())));
  CHECK(second.run_or_throw(doc) == false);

  auto missing = from_key("c", d3c0d3::str_to_int<json>()).run(doc);
  REQUIRE(missing.is_error());
  CHECK(missing.unwrap_error().find("`c`") != std::string::npos);

  CHECK(from_key("a", d3c0d3::raw<json>()).run(json::array()).is_error());
  CHECK(d3c0d3::array(d3c0d3::raw<json>()).run(json::object()).is_error());
}

TEST_CASE("to_value converts every json kind") {
  auto doc = json::parse(R"({"n": null, "b": true, "i": -4, "u": 7, "f": 1.5, "s": "t", "l": [1, "x"], "o": {"k": 0}})");
  value converted = to_value(doc);

  REQUIRE(converted.is_mapping());
  CHECK(converted.find("n")->is_null());
  CHECK(*converted.find("b") == value(true));
  CHECK(*converted.find("i") == value(-4));
  CHECK(*converted.find("u") == value(7));
  CHECK(*converted.find("f") == value(1.5));
  CHECK(*converted.find("s") == value("t"));
  CHECK(*converted.find("l") == value::sequence({1, "x"}));
  CHECK(*converted.find("o") == value::mapping({{"k", 0}}));

  json big = std::numeric_limits<uint64_t>::max();
  CHECK(to_value(big).is_floating());
}

TEST_CASE("parse_value reports syntax errors as results") {
  auto parsed = parse_value(R"(["1", "2"])");
  REQUIRE(parsed.ok());
  CHECK(parsed.unwrap() == value::sequence({"1", "2"}));

  auto broken = parse_value("{oops");
  REQUIRE(broken.is_error());
  CHECK(broken.unwrap_error().rfind("invalid json", 0) == 0);

  CHECK(parse_value("").is_error());
}

TEST_CASE("decoders over parsed values and raw json agree") {
  const char* text = R"({"name": "ada", "tags": ["x", "y"]})";
  auto from_json = map_n(
      [](std::string name, std::vector<std::string> tags) { return name + ":" + std::to_string(tags.size()); },
      from_key("name", d3c0d3::string<json>()), from_key("tags", d3c0d3::array(d3c0d3::string<json>()))
  );
  auto from_value = map_n(
      [](std::string name, std::vector<std::string> tags) { return name + ":" + std::to_string(tags.size()); },
      from_key("name", d3c0d3::string()), from_key("tags", d3c0d3::array(d3c0d3::string()))
  );

  CHECK(from_json.run_or_throw(json::parse(text)) == "ada:2");
  CHECK(from_value.run_or_throw(parse_value(text).unwrap()) == "ada:2");
}
