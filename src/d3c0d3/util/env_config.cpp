#include "env_config.hpp"

#include <cstdlib>
#include <limits>

namespace d3c0d3::util {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? trim_copy(value) : std::string();
}

bool env_config::is_set(const std::string& name) const { return !get_env_value(name).empty(); }

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  if (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on") {
    return true;
  }
  if (lower_value == "0" || lower_value == "false" || lower_value == "no" || lower_value == "off") {
    return false;
  }

  auto log = redlog::get_logger("d3c0d3.env_config");
  log.wrn("failed to parse boolean, using default", redlog::field("name", build_env_name(name)),
          redlog::field("value", value));
  return default_value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  int64_t parsed = 0;
  if (!parse_integer(value, parsed) || parsed < std::numeric_limits<int>::min() ||
      parsed > std::numeric_limits<int>::max()) {
    auto log = redlog::get_logger("d3c0d3.env_config");
    log.wrn("failed to parse int, using default", redlog::field("name", build_env_name(name)),
            redlog::field("value", value));
    return default_value;
  }
  return static_cast<int>(parsed);
}

} // namespace d3c0d3::util
