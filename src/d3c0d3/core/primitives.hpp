#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "d3c0d3/core/decoder.hpp"
#include "d3c0d3/core/input_traits.hpp"
#include "d3c0d3/core/result.hpp"
#include "d3c0d3/core/value.hpp"
#include "d3c0d3/util/parse_utils.hpp"

// leaf decoders; each is a type guard or a text conversion over input_traits<I>

namespace d3c0d3 {

template <typename I = value> decoder<I, std::string> string() {
  return decoder<I, std::string>([](const I& input) -> result<std::string> {
    if (const std::string* text = input_traits<I>::as_string(input)) {
      return ok_result(*text);
    }
    return error_result<std::string>(describe_input(input) + " is not a String");
  });
}

template <typename I = value> decoder<I, int64_t> integer() {
  return decoder<I, int64_t>([](const I& input) -> result<int64_t> {
    if (auto number = input_traits<I>::as_integer(input)) {
      return ok_result(*number);
    }
    return error_result<int64_t>(describe_input(input) + " is not an Integer");
  });
}

// accepts integers too, converting them to double
template <typename I = value> decoder<I, double> floating() {
  return decoder<I, double>([](const I& input) -> result<double> {
    if (auto number = input_traits<I>::as_number(input)) {
      return ok_result(*number);
    }
    return error_result<double>(describe_input(input) + " is not a Float");
  });
}

template <typename I = value> decoder<I, bool> boolean() {
  return decoder<I, bool>([](const I& input) -> result<bool> {
    if (auto flag = input_traits<I>::as_boolean(input)) {
      return ok_result(*flag);
    }
    return error_result<bool>(describe_input(input) + " is not a Boolean");
  });
}

template <typename I = value> decoder<I, std::monostate> nil() {
  return decoder<I, std::monostate>([](const I& input) -> result<std::monostate> {
    if (input_traits<I>::is_null(input)) {
      return ok_result(std::monostate{});
    }
    return error_result<std::monostate>(describe_input(input) + " isn't nil");
  });
}

// always succeeds with a copy of the input
template <typename I = value> decoder<I, I> raw() {
  return decoder<I, I>([](const I& input) { return result<I>::success(input); });
}

// succeeds with the input when it compares equal to constant; no type coercion
template <typename I = value, typename C> decoder<I, I> match(C constant) {
  I expected(std::move(constant));
  return decoder<I, I>([expected = std::move(expected)](const I& input) -> result<I> {
    if (input == expected) {
      return result<I>::success(input);
    }
    return error_result<I>(describe_input(input) + " doesn't match " + describe_input(expected));
  });
}

template <typename I = value, typename V> decoder<I, std::decay_t<V>> succeed(V constant) {
  using output = std::decay_t<V>;
  return decoder<I, output>([constant = std::move(constant)](const I&) { return result<output>::success(constant); });
}

template <typename O, typename I = value> decoder<I, O> fail(std::string message) {
  return decoder<I, O>([message = std::move(message)](const I&) { return error_result<O>(message); });
}

template <typename I = value> decoder<I, int64_t> str_to_int() {
  return decoder<I, int64_t>([](const I& input) -> result<int64_t> {
    const std::string* text = input_traits<I>::as_string(input);
    if (!text) {
      return error_result<int64_t>(describe_input(input) + " is not a String");
    }

    int64_t number = 0;
    if (!util::parse_integer(*text, number)) {
      return error_result<int64_t>(describe_input(input) + " can't be converted to an integer");
    }
    return ok_result(number);
  });
}

template <typename I = value> decoder<I, double> str_to_float() {
  return decoder<I, double>([](const I& input) -> result<double> {
    const std::string* text = input_traits<I>::as_string(input);
    if (!text) {
      return error_result<double>(describe_input(input) + " is not a String");
    }

    double number = 0.0;
    if (!util::parse_floating(*text, number)) {
      return error_result<double>(describe_input(input) + " can't be converted to a float");
    }
    return ok_result(number);
  });
}

template <typename I = value> decoder<I, bool> str_to_bool() {
  return decoder<I, bool>([](const I& input) -> result<bool> {
    const std::string* text = input_traits<I>::as_string(input);
    if (!text) {
      return error_result<bool>(describe_input(input) + " is not a String");
    }

    bool flag = false;
    if (!util::parse_boolean(*text, flag)) {
      return error_result<bool>(describe_input(input) + " can not be converted to a Boolean");
    }
    return ok_result(flag);
  });
}

} // namespace d3c0d3
