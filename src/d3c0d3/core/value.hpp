#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace d3c0d3 {

/**
 * @brief In-memory dynamic value used as decoder input
 *
 * Holds exactly one of: null, boolean, signed integer, double, string, sequence or mapping.
 * Mappings keep insertion order and unique string keys. Unsigned integers above INT64_MAX are stored
 * as doubles, the same way json documents convert.
 */
class value {
  template <typename T>
  static constexpr bool is_character_v = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                                         std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> ||
                                         std::is_same_v<T, char32_t>;

public:
  enum class kind { null, boolean, integer, floating, string, sequence, mapping };

  using sequence_type = std::vector<value>;
  using mapping_entry = std::pair<std::string, value>;
  using mapping_type = std::vector<mapping_entry>;

  value() noexcept = default;
  value(std::nullptr_t) noexcept {}
  value(bool v) : data_(v) {}
  // a null pointer gives a null value
  value(const char* v) {
    if (v) {
      data_ = std::string(v);
    }
  }
  value(std::string v) : data_(std::move(v)) {}
  value(sequence_type v) : data_(std::move(v)) {}
  value(mapping_type v);

  template <
      typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> && !is_character_v<T>, int> = 0>
  value(T v) {
    if constexpr (std::is_unsigned_v<T>) {
      if (static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        data_ = static_cast<double>(v);
        return;
      }
    }
    data_ = static_cast<int64_t>(v);
  }

  // characters are neither numbers nor strings
  template <typename T, std::enable_if_t<is_character_v<T>, int> = 0> value(T) = delete;

  template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
  value(T v) : data_(static_cast<double>(v)) {}

  static value sequence(std::initializer_list<value> items);
  static value mapping(std::initializer_list<mapping_entry> entries);

  kind type() const noexcept { return static_cast<kind>(data_.index()); }

  bool is_null() const noexcept { return type() == kind::null; }
  bool is_boolean() const noexcept { return type() == kind::boolean; }
  bool is_integer() const noexcept { return type() == kind::integer; }
  bool is_floating() const noexcept { return type() == kind::floating; }
  bool is_string() const noexcept { return type() == kind::string; }
  bool is_sequence() const noexcept { return type() == kind::sequence; }
  bool is_mapping() const noexcept { return type() == kind::mapping; }

  const bool* if_boolean() const noexcept { return std::get_if<bool>(&data_); }
  const int64_t* if_integer() const noexcept { return std::get_if<int64_t>(&data_); }
  const double* if_floating() const noexcept { return std::get_if<double>(&data_); }
  const std::string* if_string() const noexcept { return std::get_if<std::string>(&data_); }
  const sequence_type* if_sequence() const noexcept { return std::get_if<sequence_type>(&data_); }
  const mapping_type* if_mapping() const noexcept { return std::get_if<mapping_type>(&data_); }

  // element count for sequences and mappings, 0 for scalars
  size_t size() const noexcept;

  // mapping lookup; nullptr when not a mapping or the key is absent
  const value* find(std::string_view key) const noexcept;

  // sequence element; throws std::out_of_range when not a sequence or past the end
  const value& at(size_t index) const;

  // inserts or replaces a mapping entry; turns a null value into an empty mapping first
  void set(std::string key, value item);

  // appends to a sequence; turns a null value into an empty sequence first
  void push_back(value item);

  friend bool operator==(const value& left, const value& right);

private:
  std::variant<std::monostate, bool, int64_t, double, std::string, sequence_type, mapping_type> data_;
};

// lowercase name of a kind, used in diagnostics
const char* kind_name(value::kind kind);

} // namespace d3c0d3
