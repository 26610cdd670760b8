#pragma once

#include <initializer_list>
#include <string>
#include <utility>

#include <redlog.hpp>

#include "d3c0d3/util/parse_utils.hpp"

namespace d3c0d3::util {

/**
 * @brief Reads prefixed environment variables with typed defaults
 *
 * A variable that is unset or empty yields the default. A variable that is set but malformed also
 * yields the default, after a warning naming the variable.
 */
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  bool is_set(const std::string& name) const;

  template <typename enum_type>
  enum_type get_enum(
      const std::initializer_list<std::pair<const char*, enum_type>>& mapping, const std::string& name,
      enum_type default_value
  ) const;

  std::string build_env_name(const std::string& name) const;

private:
  std::string prefix_;
  std::string get_env_value(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;

template <typename enum_type>
enum_type env_config::get_enum(
    const std::initializer_list<std::pair<const char*, enum_type>>& mapping, const std::string& name,
    enum_type default_value
) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  enum_type parsed = default_value;
  if (parse_enum(value, mapping, parsed)) {
    return parsed;
  }

  auto log = redlog::get_logger("d3c0d3.env_config");
  log.wrn("unknown value, using default", redlog::field("name", build_env_name(name)), redlog::field("value", value));
  return default_value;
}

} // namespace d3c0d3::util
