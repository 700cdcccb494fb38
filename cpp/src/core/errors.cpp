#include "../../include/errors.hpp"

namespace ipd {

InvalidMoveError::InvalidMoveError(const std::string& strategy, int round, char value)
    : std::invalid_argument("Invalid move '" + std::string(1, value) + "' from " + strategy +
                            " in round " + std::to_string(round)),
      strategy_(strategy),
      round_(round),
      value_(value) {}

ConfigError::ConfigError(const std::string& what)
    : std::invalid_argument("Configuration error: " + what) {}

} // namespace ipd
