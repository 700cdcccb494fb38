#include "../../include/sim/match.hpp"
#include "../../include/errors.hpp"
#include <stdexcept>

namespace ipd::sim {

Match::Match(strategy::Strategy& first,
             strategy::Strategy& second,
             int rounds,
             double noise,
             Rng* rng)
    : first_(first),
      second_(second),
      rounds_(rounds),
      noise_(noise),
      rng_(rng),
      score1_(0),
      score2_(0),
      played_(false) {

    if (rounds_ < 1 || rounds_ > kMaxRounds) {
        throw ConfigError("rounds must be in [1, " + std::to_string(kMaxRounds) +
                          "], got " + std::to_string(rounds_));
    }
    if (!(noise_ >= 0.0 && noise_ < 1.0)) {
        throw ConfigError("noise must be in [0, 1), got " + std::to_string(noise_));
    }
    if (noise_ > 0.0 && rng_ == nullptr) {
        throw ConfigError("a random source is required when noise > 0");
    }
}

Move Match::perturb(Move move) {
    if (noise_ <= 0.0) {
        return move;
    }
    std::bernoulli_distribution flip_draw(noise_);
    return flip_draw(*rng_) ? flip(move) : move;
}

std::pair<int, int> Match::play() {
    if (played_) {
        throw std::logic_error("Match has already been played");
    }

    history_.reserve(rounds_);

    for (int round = 0; round < rounds_; round++) {
        Move intended1 = first_.decide_move();
        Move intended2 = second_.decide_move();

        if (!is_valid_move(intended1)) {
            throw InvalidMoveError(first_.name(), round + 1, to_char(intended1));
        }
        if (!is_valid_move(intended2)) {
            throw InvalidMoveError(second_.name(), round + 1, to_char(intended2));
        }

        // Execution error: independent flips, player one drawn first
        Move move1 = perturb(intended1);
        Move move2 = perturb(intended2);

        Payoff p = payoff(move1, move2);
        score1_ += p.first;
        score2_ += p.second;

        history_.emplace_back(move1, move2);

        first_.update_history(move1, move2);
        second_.update_history(move2, move1);
    }

    played_ = true;
    return {score1_, score2_};
}

MatchStats Match::get_stats() const {
    MatchStats stats;
    stats.score1 = score1_;
    stats.score2 = score2_;
    stats.rounds = static_cast<int>(history_.size());

    if (stats.rounds == 0) {
        return stats;
    }

    int coop1 = 0;
    int coop2 = 0;
    for (const auto& [m1, m2] : history_) {
        if (m1 == Move::Cooperate) coop1++;
        if (m2 == Move::Cooperate) coop2++;
    }

    stats.avg_score1 = static_cast<double>(score1_) / stats.rounds;
    stats.avg_score2 = static_cast<double>(score2_) / stats.rounds;
    stats.cooperation_rate1 = static_cast<double>(coop1) / stats.rounds;
    stats.cooperation_rate2 = static_cast<double>(coop2) / stats.rounds;
    return stats;
}

} // namespace ipd::sim
