#pragma once

#include <optional>
#include <string>

#include <redlog.hpp>

namespace d3c0d3::config {

// environment prefix for every library setting
inline constexpr const char* k_env_prefix = "D3C0D3";

// logging settings; an explicit level wins over the verbosity count
struct logging_config {
  int verbosity = 0;
  std::optional<redlog::level> level;

  // reads <prefix>_VERBOSE and <prefix>_LOG_LEVEL
  static logging_config from_environment(const std::string& prefix = k_env_prefix);

  redlog::level effective_level() const;
};

redlog::level level_from_verbosity(int count);

void apply_logging(const logging_config& config);

} // namespace d3c0d3::config
