#pragma once
#include <stdexcept>
#include <string>

namespace ipd {

// A strategy produced something other than Cooperate or Defect.
class InvalidMoveError : public std::invalid_argument {
public:
    InvalidMoveError(const std::string& strategy, int round, char value);

    const std::string& strategy() const { return strategy_; }
    int round() const { return round_; }
    char value() const { return value_; }

private:
    std::string strategy_;
    int round_;
    char value_;
};

// Rejected before any match starts.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what);
};

} // namespace ipd
