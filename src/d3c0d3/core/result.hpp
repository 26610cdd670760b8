#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace d3c0d3 {

// thrown when a result is read through the accessor of the variant it does not hold
class bad_result_access : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// failure payload; the message is the whole error
struct failure {
  std::string message;
};

template <typename T> class result;

template <typename T> struct is_result : std::false_type {};
template <typename T> struct is_result<result<T>> : std::true_type {};
template <typename T> inline constexpr bool is_result_v = is_result<std::decay_t<T>>::value;

// result carries either a decoded value or a failure message, never both
template <typename T> class result {
public:
  using value_type = T;

  static result success(T value) { return result(std::in_place_index<0>, std::move(value)); }
  static result error(std::string message) { return result(std::in_place_index<1>, failure{std::move(message)}); }

  bool ok() const noexcept { return state_.index() == 0; }
  bool is_error() const noexcept { return state_.index() == 1; }

  const T& unwrap() const& {
    if (is_error()) {
      throw bad_result_access("can't unwrap error result: " + std::get<1>(state_).message);
    }
    return std::get<0>(state_);
  }

  T unwrap() && {
    if (is_error()) {
      throw bad_result_access("can't unwrap error result: " + std::get<1>(state_).message);
    }
    return std::get<0>(std::move(state_));
  }

  const std::string& unwrap_error() const {
    if (!is_error()) {
      throw bad_result_access("can't unwrap_error an ok result");
    }
    return std::get<1>(state_).message;
  }

  // on ok, returns f(value); on error, forwards the message without calling f
  template <typename F> auto and_then(F&& f) const& {
    using next = std::invoke_result_t<F, const T&>;
    static_assert(is_result_v<next>, "and_then callback must return a result");
    if (is_error()) {
      return next::error(std::get<1>(state_).message);
    }
    return std::invoke(std::forward<F>(f), std::get<0>(state_));
  }

  template <typename F> auto and_then(F&& f) && {
    using next = std::invoke_result_t<F, T&&>;
    static_assert(is_result_v<next>, "and_then callback must return a result");
    if (is_error()) {
      return next::error(std::move(std::get<1>(state_).message));
    }
    return std::invoke(std::forward<F>(f), std::get<0>(std::move(state_)));
  }

private:
  template <std::size_t index, typename V>
  result(std::in_place_index_t<index> tag, V&& payload) : state_(tag, std::forward<V>(payload)) {}

  std::variant<T, failure> state_;
};

template <typename T> inline result<std::decay_t<T>> ok_result(T&& value) {
  return result<std::decay_t<T>>::success(std::forward<T>(value));
}

template <typename T> inline result<T> error_result(std::string message) {
  return result<T>::error(std::move(message));
}

} // namespace d3c0d3
