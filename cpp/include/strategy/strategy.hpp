#pragma once
#include "../common.hpp"
#include <string>

namespace ipd::strategy {

// Capability every match participant provides
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual std::string name() const = 0;

    // Called once per round, before update_history
    virtual Move decide_move() const = 0;

    // Called once per round with the moves actually played (after noise)
    virtual void update_history(Move own_move, Move opponent_move) = 0;

    // Clears all per-match state
    virtual void reset() = 0;
};

} // namespace ipd::strategy
