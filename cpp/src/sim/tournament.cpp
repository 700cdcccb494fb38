#include "../../include/sim/tournament.hpp"
#include "../../include/errors.hpp"
#include "../../include/strategy/decision_engine.hpp"
#include <algorithm>
#include <future>
#include <iomanip>
#include <stdexcept>
#include <thread>

namespace ipd::sim {

void TournamentConfig::validate() const {
    if (rounds < 1 || rounds > kMaxRounds) {
        throw ConfigError("rounds must be in [1, " + std::to_string(kMaxRounds) +
                          "], got " + std::to_string(rounds));
    }
    if (!(noise >= 0.0 && noise < 1.0)) {
        throw ConfigError("noise must be in [0, 1), got " + std::to_string(noise));
    }
}

EngineFactory decision_engine_factory() {
    return []() -> std::unique_ptr<strategy::Strategy> {
        return std::make_unique<strategy::DecisionEngine>();
    };
}

Rng shard_rng(std::uint64_t seed, std::size_t index) {
    std::seed_seq seq{static_cast<std::uint32_t>(seed),
                      static_cast<std::uint32_t>(seed >> 32),
                      static_cast<std::uint32_t>(index)};
    return Rng(seq);
}

Tournament::Tournament(EngineFactory factory,
                       std::vector<strategy::Opponent> roster,
                       TournamentConfig config)
    : factory_(std::move(factory)),
      roster_(std::move(roster)),
      config_(config),
      rng_(config.seed),
      log_(nullptr) {}

void Tournament::validate() const {
    config_.validate();
    if (roster_.empty()) {
        throw ConfigError("opponent roster is empty");
    }
    if (!factory_) {
        throw ConfigError("no engine factory supplied");
    }
}

std::unique_ptr<strategy::Strategy> Tournament::make_engine() {
    std::unique_ptr<strategy::Strategy> engine;
    {
        std::lock_guard<std::mutex> lock(factory_mutex_);
        engine = factory_();
    }
    if (!engine) {
        throw std::logic_error("Engine factory returned null");
    }
    return engine;
}

MatchResult Tournament::play_one(strategy::Opponent& opponent, Rng& rng) {
    opponent.reset();
    opponent.bind_random_source(rng);
    std::unique_ptr<strategy::Strategy> engine = make_engine();

    Match match(*engine, opponent, config_.rounds, config_.noise, &rng);
    auto [our_score, opp_score] = match.play();
    MatchStats stats = match.get_stats();

    MatchResult result;
    result.opponent = opponent.name();
    result.our_score = our_score;
    result.opponent_score = opp_score;
    result.our_avg = stats.avg_score1;
    result.opponent_avg = stats.avg_score2;
    result.our_coop = stats.cooperation_rate1;
    result.opp_coop = stats.cooperation_rate2;
    result.won = our_score > opp_score;
    result.score_difference = our_score - opp_score;
    result.moves = match.history();
    return result;
}

TournamentSummary Tournament::run() {
    validate();
    rng_.seed(config_.seed);

    if (log_) {
        *log_ << "Tournament: " << roster_.size() << " opponents, "
              << config_.rounds << " rounds per match, noise " << config_.noise
              << ", seed " << config_.seed << "\n";
    }

    std::vector<MatchResult> results;
    results.reserve(roster_.size());
    for (auto& opponent : roster_) {
        results.push_back(play_one(opponent, rng_));
        log_result(results.back());
    }

    last_summary_ = summarize(std::move(results));
    return *last_summary_;
}

TournamentSummary Tournament::run_sharded(int num_threads) {
    validate();

    if (num_threads <= 0) {
        num_threads = static_cast<int>(std::thread::hardware_concurrency());
        if (num_threads <= 0) {
            num_threads = 4;  // Fallback
        }
    }

    if (log_) {
        *log_ << "Tournament (sharded, " << num_threads << " threads): "
              << roster_.size() << " opponents, " << config_.rounds
              << " rounds per match, noise " << config_.noise
              << ", seed " << config_.seed << "\n";
    }

    std::vector<MatchResult> results;
    results.reserve(roster_.size());

    size_t batch = static_cast<size_t>(num_threads);
    for (size_t start = 0; start < roster_.size(); start += batch) {
        size_t end = std::min(roster_.size(), start + batch);

        // Each task owns its opponent copy and generator
        std::vector<std::future<MatchResult>> futures;
        for (size_t i = start; i < end; i++) {
            strategy::Opponent opponent = roster_[i];
            futures.push_back(std::async(std::launch::async, [this, opponent, i]() mutable {
                Rng rng = shard_rng(config_.seed, i);
                return play_one(opponent, rng);
            }));
        }

        // Collected in roster order regardless of completion order
        for (auto& future : futures) {
            results.push_back(future.get());
            log_result(results.back());
        }
    }

    last_summary_ = summarize(std::move(results));
    return *last_summary_;
}

void Tournament::log_result(const MatchResult& result) const {
    if (!log_) {
        return;
    }
    std::ostream& out = *log_;
    std::ios_base::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();
    out << std::left << std::setw(20) << result.opponent << std::right
        << " | Score: " << std::setw(3) << result.our_score
        << " vs " << std::setw(3) << result.opponent_score
        << " (" << (result.won ? "WIN" : "LOSS") << ")\n"
        << std::fixed << std::setprecision(1)
        << "  -> Our cooperation: " << result.our_coop * 100.0 << "%"
        << " | Opponent: " << result.opp_coop * 100.0 << "%\n";
    out.flags(flags);
    out.precision(precision);
}

TournamentSummary Tournament::summarize(std::vector<MatchResult> results) const {
    TournamentSummary summary;
    summary.total_matches = static_cast<int>(results.size());
    for (const auto& r : results) {
        summary.total_score += r.our_score;
        if (r.won) {
            summary.wins++;
        }
    }
    summary.losses = summary.total_matches - summary.wins;

    if (summary.total_matches > 0) {
        summary.average_score = static_cast<double>(summary.total_score) / summary.total_matches;
        summary.win_rate = static_cast<double>(summary.wins) / summary.total_matches;
    }

    summary.results = std::move(results);
    return summary;
}

} // namespace ipd::sim
