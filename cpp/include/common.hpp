#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace ipd {

// Underlying char doubles as the wire/display form ('C' / 'D').
enum class Move : char {
    Cooperate = 'C',
    Defect = 'D'
};

using MovePair = std::pair<Move, Move>;

// Ordered, append-only per-player record of moves
using History = std::vector<Move>;

// Shared pseudo-random source threaded through matches and the Random opponent
using Rng = std::mt19937_64;

struct Payoff {
    int first;
    int second;

    bool operator==(const Payoff& other) const {
        return first == other.first && second == other.second;
    }
};

// Canonical Prisoner's Dilemma table
inline constexpr int kReward = 3;       // (C,C)
inline constexpr int kSucker = 0;       // cooperated against a defector
inline constexpr int kTemptation = 5;   // defected against a cooperator
inline constexpr int kPunishment = 1;   // (D,D)

bool is_valid_move(Move move);
Move flip(Move move);
char to_char(Move move);
Move move_from_char(char c);
std::string to_string(Move move);

// Throws InvalidMoveError for anything outside {Cooperate, Defect}
Payoff payoff(Move first, Move second);

} // namespace ipd
