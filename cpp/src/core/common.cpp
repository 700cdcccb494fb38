#include "../../include/common.hpp"
#include "../../include/errors.hpp"

namespace ipd {

bool is_valid_move(Move move) {
    return move == Move::Cooperate || move == Move::Defect;
}

Move flip(Move move) {
    return move == Move::Cooperate ? Move::Defect : Move::Cooperate;
}

char to_char(Move move) {
    return static_cast<char>(move);
}

Move move_from_char(char c) {
    if (c == 'C' || c == 'c') {
        return Move::Cooperate;
    }
    if (c == 'D' || c == 'd') {
        return Move::Defect;
    }
    throw InvalidMoveError("input", 0, c);
}

std::string to_string(Move move) {
    return std::string(1, to_char(move));
}

Payoff payoff(Move first, Move second) {
    if (!is_valid_move(first)) {
        throw InvalidMoveError("payoff lookup", 0, to_char(first));
    }
    if (!is_valid_move(second)) {
        throw InvalidMoveError("payoff lookup", 0, to_char(second));
    }

    if (first == Move::Cooperate) {
        return second == Move::Cooperate ? Payoff{kReward, kReward}
                                         : Payoff{kSucker, kTemptation};
    }
    return second == Move::Cooperate ? Payoff{kTemptation, kSucker}
                                     : Payoff{kPunishment, kPunishment};
}

} // namespace ipd
