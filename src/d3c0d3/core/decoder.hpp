#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <redlog.hpp>

#include "d3c0d3/core/result.hpp"

namespace d3c0d3 {

// thrown by run_or_throw; what() is the decode failure message verbatim
class decode_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

template <typename I, typename O> class decoder;

template <typename T> struct is_decoder : std::false_type {};
template <typename I, typename O> struct is_decoder<decoder<I, O>> : std::true_type {};
template <typename T> inline constexpr bool is_decoder_v = is_decoder<std::decay_t<T>>::value;

/**
 * @brief Immutable wrapper around a transform from an input to a result
 *
 * Copies share the wrapped transform. Combinators build new decoders and never modify the ones they
 * were built from, so a decoder can be run repeatedly and from several threads at once.
 */
template <typename I, typename O> class decoder {
public:
  using input_type = I;
  using output_type = O;
  using transform = std::function<result<O>(const I&)>;

  explicit decoder(transform fn) : fn_(std::make_shared<const transform>(std::move(fn))) {}

  result<O> run(const I& input) const { return (*fn_)(input); }

  O run_or_throw(const I& input) const {
    result<O> decoded = run(input);
    if (decoded.is_error()) {
      auto log = redlog::get_logger("d3c0d3.decoder");
      log.dbg("decode failed", redlog::field("error", decoded.unwrap_error()));
      throw decode_error(decoded.unwrap_error());
    }
    return std::move(decoded).unwrap();
  }

  // applies f to a decoded value; failures pass through and f is not called
  template <typename F> auto map(F f) const {
    using mapped = std::decay_t<std::invoke_result_t<const F&, O&&>>;
    auto self = fn_;
    return decoder<I, mapped>([self, f = std::move(f)](const I& input) -> result<mapped> {
      result<O> decoded = (*self)(input);
      if (decoded.is_error()) {
        return error_result<mapped>(decoded.unwrap_error());
      }
      return result<mapped>::success(std::invoke(f, std::move(decoded).unwrap()));
    });
  }

  /**
   * @brief Chooses the next decoder from the decoded value
   *
   * The decoder returned by f runs against the same input this decoder received, not against the
   * decoded value. This lets one field (a tag, a version) select how the rest of the input is read.
   */
  template <typename F> auto bind(F f) const {
    using next = std::decay_t<std::invoke_result_t<const F&, O&&>>;
    static_assert(is_decoder_v<next>, "bind callback must return a decoder");
    static_assert(
        std::is_same_v<typename next::input_type, I>, "bind callback must return a decoder over the same input type"
    );
    using next_output = typename next::output_type;

    auto self = fn_;
    return decoder<I, next_output>([self, f = std::move(f)](const I& input) -> result<next_output> {
      return (*self)(input).and_then([&f, &input](O&& decoded) {
        return std::invoke(f, std::move(decoded)).run(input);
      });
    });
  }

  // tries this decoder first; other only runs, on the same input, when this one fails
  decoder or_else(decoder other) const {
    auto self = fn_;
    return decoder([self, other = std::move(other)](const I& input) -> result<O> {
      result<O> first = (*self)(input);
      if (!first.is_error()) {
        return first;
      }
      return other.run(input);
    });
  }

  template <typename V> auto replace_with(V constant) const {
    return map([constant = std::move(constant)](const O&) { return constant; });
  }

private:
  std::shared_ptr<const transform> fn_;
};

} // namespace d3c0d3
