#pragma once
#include "../common.hpp"
#include "../strategy/strategy.hpp"
#include "../strategy/opponent.hpp"
#include "match.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ipd::sim {

struct TournamentConfig {
    int rounds = 200;
    double noise = 0.0;
    std::uint64_t seed = 42;

    // Throws ConfigError
    void validate() const;
};

// Outcome of one match, seen from the strategy under test
struct MatchResult {
    std::string opponent;
    int our_score = 0;
    int opponent_score = 0;
    double our_avg = 0.0;
    double opponent_avg = 0.0;
    double our_coop = 0.0;
    double opp_coop = 0.0;
    bool won = false;  // strictly higher score; ties count as losses
    int score_difference = 0;
    std::vector<MovePair> moves;
};

struct TournamentSummary {
    int total_matches = 0;
    std::int64_t total_score = 0;
    double average_score = 0.0;
    int wins = 0;
    int losses = 0;
    double win_rate = 0.0;
    std::vector<MatchResult> results;
};

// Produces a fresh, unshared strategy-under-test for every match
using EngineFactory = std::function<std::unique_ptr<strategy::Strategy>()>;

EngineFactory decision_engine_factory();

/**
 * Plays the strategy under test against every roster entry in order.
 *
 * run() threads one generator, reseeded from config.seed, through all
 * matches, so roster order is part of the reproducible setup.
 * run_sharded() instead gives match i its own generator derived from
 * (seed, i) and plays matches concurrently.
 */
class Tournament {
public:
    Tournament(EngineFactory factory,
               std::vector<strategy::Opponent> roster,
               TournamentConfig config = {});

    Tournament(const Tournament&) = delete;
    Tournament& operator=(const Tournament&) = delete;

    TournamentSummary run();

    /**
     * Play matches in parallel, at most num_threads at a time.
     *
     * @param num_threads Worker count; <= 0 picks hardware concurrency
     * @return Summary with results in roster order
     */
    TournamentSummary run_sharded(int num_threads = 0);

    // Progress lines go here; nullptr (the default) disables them
    void set_log_stream(std::ostream* log) { log_ = log; }

    const TournamentConfig& config() const { return config_; }
    const std::vector<strategy::Opponent>& roster() const { return roster_; }

    // Most recent completed summary, if any
    const std::optional<TournamentSummary>& last_summary() const { return last_summary_; }

private:
    void validate() const;
    std::unique_ptr<strategy::Strategy> make_engine();
    MatchResult play_one(strategy::Opponent& opponent, Rng& rng);
    void log_result(const MatchResult& result) const;
    TournamentSummary summarize(std::vector<MatchResult> results) const;

    EngineFactory factory_;
    std::vector<strategy::Opponent> roster_;
    TournamentConfig config_;
    Rng rng_;
    std::ostream* log_;
    std::mutex factory_mutex_;  // factory may be shared by sharded tasks
    std::optional<TournamentSummary> last_summary_;
};

// Per-match generator for sharded runs
Rng shard_rng(std::uint64_t seed, std::size_t index);

} // namespace ipd::sim
