#include "logging_config.hpp"

#include "d3c0d3/util/env_config.hpp"

namespace d3c0d3::config {

logging_config logging_config::from_environment(const std::string& prefix) {
  util::env_config env(prefix);
  logging_config config;
  config.verbosity = env.get<int>("VERBOSE", 0);

  // unknown names warn inside get_enum and leave the level unset
  config.level = env.get_enum<std::optional<redlog::level>>(
      {{"info", redlog::level::info},
       {"verbose", redlog::level::verbose},
       {"trace", redlog::level::trace},
       {"debug", redlog::level::debug},
       {"pedantic", redlog::level::pedantic},
       {"warn", redlog::level::warn},
       {"warning", redlog::level::warn},
       {"error", redlog::level::error}},
      "LOG_LEVEL", std::nullopt
  );

  return config;
}

redlog::level logging_config::effective_level() const {
  if (level) {
    return *level;
  }
  return level_from_verbosity(verbosity);
}

redlog::level level_from_verbosity(int count) {
  if (count <= 0) {
    return redlog::level::info;
  }
  if (count == 1) {
    return redlog::level::verbose;
  }
  if (count == 2) {
    return redlog::level::trace;
  }
  if (count == 3) {
    return redlog::level::debug;
  }
  return redlog::level::pedantic;
}

void apply_logging(const logging_config& config) { redlog::set_level(config.effective_level()); }

} // namespace d3c0d3::config
