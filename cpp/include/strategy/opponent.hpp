#pragma once
#include "strategy.hpp"
#include "../common.hpp"
#include <string>
#include <variant>
#include <vector>

namespace ipd::strategy {

enum class OpponentKind {
    AlwaysCooperate,
    AlwaysDefect,
    TitForTat,
    TitForTwoTats,
    Grudger,
    Random,
    Suspicious
};

// Behaviors: each decides from the opponent's history only
struct AlwaysCooperate {
    Move decide(const History&) const { return Move::Cooperate; }
};

struct AlwaysDefect {
    Move decide(const History&) const { return Move::Defect; }
};

struct TitForTat {
    Move decide(const History& opponent) const;
};

struct TitForTwoTats {
    Move decide(const History& opponent) const;
};

struct Grudger {
    Move decide(const History& opponent) const;
};

struct RandomChoice {
    Rng* rng = nullptr;
    Move decide(const History& opponent) const;
};

struct Suspicious {
    Move decide(const History& opponent) const;
};

using Behavior = std::variant<AlwaysCooperate, AlwaysDefect, TitForTat, TitForTwoTats,
                              Grudger, RandomChoice, Suspicious>;

/**
 * Reference opponent from the fixed roster.
 *
 * Value type: copying an Opponent copies its histories, which is how the
 * sharded tournament gives each task its own instance.
 */
class Opponent : public Strategy {
public:
    Opponent(OpponentKind kind, std::string name);
    explicit Opponent(OpponentKind kind);

    std::string name() const override { return name_; }
    Move decide_move() const override;
    void update_history(Move own_move, Move opponent_move) override;
    void reset() override;

    // Only the Random behavior draws from it; harmless for the others
    void bind_random_source(Rng& rng);

    OpponentKind kind() const { return kind_; }
    const History& own_history() const { return own_history_; }
    const History& opponent_history() const { return opponent_history_; }

private:
    OpponentKind kind_;
    std::string name_;
    Behavior behavior_;
    History own_history_;
    History opponent_history_;
};

const char* to_string(OpponentKind kind);

// Throws ConfigError for unknown names
OpponentKind parse_opponent_kind(const std::string& name);

Opponent make_opponent(OpponentKind kind);
Opponent make_opponent(OpponentKind kind, Rng& rng);

// The seven reference opponents in canonical order
std::vector<Opponent> reference_roster();
std::vector<Opponent> make_roster(const std::vector<std::string>& names);

} // namespace ipd::strategy
