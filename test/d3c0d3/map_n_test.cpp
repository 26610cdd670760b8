#include <doctest/doctest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "d3c0d3/core/combinators.hpp"
#include "d3c0d3/core/primitives.hpp"
#include "d3c0d3/test_helpers.hpp"

namespace {

using d3c0d3::from_key;
using d3c0d3::is_combinable_v;
using d3c0d3::map_n;
using d3c0d3::str_to_int;
using d3c0d3::value;
using d3c0d3::test_helpers::counting;

auto pair_decoder() {
  return map_n(
      [](int64_t a, int64_t b) { return std::vector<int64_t>{a, b}; }, from_key("a", str_to_int()),
      from_key("b", str_to_int())
  );
}

} // namespace

TEST_CASE("map_n passes values in decoder order") {
  auto d = pair_decoder();
  CHECK(d.run_or_throw(value::mapping({{"a", "24"}, {"b", "42"}})) == std::vector<int64_t>{24, 42});
  CHECK(d.run_or_throw(value::mapping({{"b", "42"}, {"a", "24"}})) == std::vector<int64_t>{24, 42});
}

TEST_CASE("map_n fails when any decoder fails") {
  auto d = pair_decoder();
  CHECK(d.run(value::mapping({{"a", "a"}, {"b", "42"}})).is_error());
  CHECK(d.run(value::mapping({{"a", "24"}, {"b", "b"}})).is_error());
  CHECK(d.run(value::mapping({{"a", "24"}})).is_error());
  CHECK(d.run(value::mapping({{"b", "42"}})).is_error());
}

TEST_CASE("map_n reports the first failure in decoder order") {
  auto d = pair_decoder();
  auto failed = d.run(value::mapping({{"a", "x"}, {"b", "y"}}));
  REQUIRE(failed.is_error());
  CHECK(failed.unwrap_error() == str_to_int().run(value("x")).unwrap_error());

  auto missing_both = d.run(value::mapping({}));
  REQUIRE(missing_both.is_error());
  CHECK(missing_both.unwrap_error().find("`a`") != std::string::npos);
}

TEST_CASE("map_n runs every decoder even after a failure") {
  auto first_calls = std::make_shared<int>(0);
  auto second_calls = std::make_shared<int>(0);
  int combine_calls = 0;

  auto d = map_n(
      [&combine_calls](int64_t a, int64_t b) {
        ++combine_calls;
        return a + b;
      },
      counting(first_calls, from_key("a", str_to_int())), counting(second_calls, from_key("b", str_to_int()))
  );

  CHECK(d.run(value::mapping({{"a", "x"}, {"b", "2"}})).is_error());
  CHECK(*first_calls == 1);
  CHECK(*second_calls == 1);
  CHECK(combine_calls == 0);

  CHECK(d.run_or_throw(value::mapping({{"a", "1"}, {"b", "2"}})) == 3);
  CHECK(combine_calls == 1);
}

TEST_CASE("map_n mixes output types") {
  struct person {
    std::string name;
    int64_t age = 0;
    bool admin = false;
  };

  auto d = map_n(
      [](std::string name, int64_t age, bool admin) { return person{std::move(name), age, admin}; },
      from_key("name", d3c0d3::string()), from_key("age", d3c0d3::integer()), from_key("admin", d3c0d3::boolean())
  );

  auto decoded = d.run_or_throw(value::mapping({{"name", "ada"}, {"age", 36}, {"admin", true}}));
  CHECK(decoded.name == "ada");
  CHECK(decoded.age == 36);
  CHECK(decoded.admin);

  auto single = map_n([](int64_t n) { return n * 2; }, d3c0d3::integer());
  CHECK(single.run_or_throw(value(21)) == 42);
}

TEST_CASE("map_n arity is checked at compile time") {
  auto two_args = [](int64_t a, int64_t b) { return a + b; };
  static_assert(is_combinable_v<decltype(two_args), int64_t, int64_t>);
  static_assert(!is_combinable_v<decltype(two_args), int64_t>);
  static_assert(!is_combinable_v<decltype(two_args), int64_t, int64_t, int64_t>);
  static_assert(!is_combinable_v<decltype(two_args), std::string, int64_t>);
  CHECK(two_args(1, 2) == 3);
}
