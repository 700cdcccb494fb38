#pragma once
#include "../common.hpp"
#include "../strategy/strategy.hpp"
#include <vector>

namespace ipd::sim {

// Keeps every per-match and per-tournament score well inside its integer type
inline constexpr int kMaxRounds = 1000000;

// Per-match rates derived from the recorded move pairs
struct MatchStats {
    int score1 = 0;
    int score2 = 0;
    double avg_score1 = 0.0;
    double avg_score2 = 0.0;
    double cooperation_rate1 = 0.0;
    double cooperation_rate2 = 0.0;
    int rounds = 0;
};

/**
 * One fixed-length game between two strategies.
 *
 * Each round both moves are validated, then each is flipped independently
 * with probability `noise`. Scoring and both strategies' histories only ever
 * see the post-noise moves.
 */
class Match {
public:
    /**
     * @param first  Strategy scored as player one (the strategy under test)
     * @param second Strategy scored as player two
     * @param rounds Number of rounds, in [1, kMaxRounds]
     * @param noise  Flip probability per move, in [0, 1)
     * @param rng    Shared random source; required when noise > 0
     */
    Match(strategy::Strategy& first,
          strategy::Strategy& second,
          int rounds = 200,
          double noise = 0.0,
          Rng* rng = nullptr);

    // Runs every round; returns (score1, score2)
    std::pair<int, int> play();

    MatchStats get_stats() const;

    const std::vector<MovePair>& history() const { return history_; }
    int score1() const { return score1_; }
    int score2() const { return score2_; }
    int rounds() const { return rounds_; }
    bool finished() const { return played_; }

private:
    Move perturb(Move move);

    strategy::Strategy& first_;
    strategy::Strategy& second_;
    int rounds_;
    double noise_;
    Rng* rng_;
    int score1_;
    int score2_;
    bool played_;
    std::vector<MovePair> history_;
};

} // namespace ipd::sim
