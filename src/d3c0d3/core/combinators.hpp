#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <redlog.hpp>

#include "d3c0d3/core/decoder.hpp"
#include "d3c0d3/core/input_traits.hpp"
#include "d3c0d3/core/primitives.hpp"
#include "d3c0d3/core/result.hpp"

namespace d3c0d3 {

// --- structural accessors ---

// runs inner on the value stored under key
template <typename I, typename O> decoder<I, O> from_key(std::string key, decoder<I, O> inner) {
  return decoder<I, O>([key = std::move(key), inner = std::move(inner)](const I& input) -> result<O> {
    using traits = input_traits<I>;
    if (!traits::is_mapping(input)) {
      return error_result<O>(describe_input(input) + " is not a mapping");
    }

    const I* found = traits::find(input, key);
    if (!found) {
      return error_result<O>(describe_input(input) + " doesn't contain key `" + key + "`");
    }
    return inner.run(*found);
  });
}

// runs inner on the element at index; negative indices are out of range
template <typename I, typename O> decoder<I, O> at_index(std::ptrdiff_t index, decoder<I, O> inner) {
  return decoder<I, O>([index, inner = std::move(inner)](const I& input) -> result<O> {
    using traits = input_traits<I>;
    if (!traits::is_sequence(input)) {
      return error_result<O>(describe_input(input) + " is not a sequence");
    }

    if (index < 0 || static_cast<size_t>(index) >= traits::size(input)) {
      return error_result<O>("index " + std::to_string(index) + " is out of range for " + describe_input(input));
    }
    return inner.run(traits::at(input, static_cast<size_t>(index)));
  });
}

/**
 * @brief Decodes every element of a sequence, in order
 *
 * Stops at the first element inner rejects and returns that element's error unchanged; no partial
 * output is produced. On success the output has the input's length and order.
 */
template <typename I, typename O> decoder<I, std::vector<O>> array(decoder<I, O> inner) {
  return decoder<I, std::vector<O>>([inner = std::move(inner)](const I& input) -> result<std::vector<O>> {
    using traits = input_traits<I>;
    if (!traits::is_sequence(input)) {
      return error_result<std::vector<O>>(describe_input(input) + " is not a sequence");
    }

    const size_t count = traits::size(input);
    std::vector<O> decoded;
    decoded.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      result<O> element = inner.run(traits::at(input, i));
      if (element.is_error()) {
        return error_result<std::vector<O>>(element.unwrap_error());
      }
      decoded.push_back(std::move(element).unwrap());
    }
    return ok_result(std::move(decoded));
  });
}

// --- aggregation ---

// true when combine accepts exactly the given decoder outputs, in order
template <typename F, typename... Os> inline constexpr bool is_combinable_v = std::is_invocable_v<const F&, Os&&...>;

namespace detail {

template <typename R, typename F, typename... Os, size_t... Is>
result<R> combine_results(const F& combine, std::tuple<result<Os>...>& results, std::index_sequence<Is...>) {
  const std::string* first_error = nullptr;
  (void)((std::get<Is>(results).is_error() && (first_error = &std::get<Is>(results).unwrap_error(), true)) || ...);
  if (first_error) {
    return error_result<R>(*first_error);
  }
  return result<R>::success(std::invoke(combine, std::move(std::get<Is>(results)).unwrap()...));
}

} // namespace detail

/**
 * @brief Runs several decoders on one input and combines their outputs
 *
 * Every decoder runs, in argument order, even after an earlier one failed. When any failed, the
 * first failure in argument order is returned; otherwise combine receives the decoded values in
 * argument order. combine must take exactly one parameter per decoder; a mismatch does not compile.
 */
template <typename F, typename I, typename... Os> auto map_n(F combine, decoder<I, Os>... decoders) {
  static_assert(sizeof...(Os) > 0, "map_n needs at least one decoder");
  static_assert(is_combinable_v<F, Os...>, "map_n combine must take exactly one argument per decoder, in order");
  using combined = std::decay_t<std::invoke_result_t<const F&, Os&&...>>;

  return decoder<I, combined>([combine = std::move(combine), decoders...](const I& input) -> result<combined> {
    // braced initialization evaluates left to right
    std::tuple<result<Os>...> results{decoders.run(input)...};
    return detail::combine_results<combined>(combine, results, std::index_sequence_for<Os...>{});
  });
}

// --- recursion ---

/**
 * @brief Defers decoder construction until run time
 *
 * thunk is called on every run and its decoder is not cached, so a function building a decoder can
 * refer to itself through lazy without recursing at construction.
 */
template <typename Thunk> auto lazy(Thunk thunk) {
  using inner = std::decay_t<std::invoke_result_t<const Thunk&>>;
  static_assert(is_decoder_v<inner>, "lazy thunk must return a decoder");
  using input = typename inner::input_type;
  using output = typename inner::output_type;

  return decoder<input, output>([thunk = std::move(thunk)](const input& in) -> result<output> {
    auto log = redlog::get_logger("d3c0d3.lazy");
    log.ped("resolving lazy decoder");
    return std::invoke(thunk).run(in);
  });
}

// --- optional values ---

// null decodes to nullopt; anything else goes through inner
template <typename I, typename O> decoder<I, std::optional<O>> nullable(decoder<I, O> inner) {
  return nil<I>()
      .replace_with(std::optional<O>{})
      .or_else(inner.map([](O&& decoded) { return std::optional<O>(std::move(decoded)); }));
}

} // namespace d3c0d3
