#include "../../include/strategy/opponent.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace ipd::strategy {

namespace {

Behavior make_behavior(OpponentKind kind) {
    switch (kind) {
        case OpponentKind::AlwaysCooperate: return AlwaysCooperate{};
        case OpponentKind::AlwaysDefect: return AlwaysDefect{};
        case OpponentKind::TitForTat: return TitForTat{};
        case OpponentKind::TitForTwoTats: return TitForTwoTats{};
        case OpponentKind::Grudger: return Grudger{};
        case OpponentKind::Random: return RandomChoice{};
        case OpponentKind::Suspicious: return Suspicious{};
    }
    throw std::logic_error("Unhandled opponent kind");
}

const OpponentKind kAllKinds[] = {
    OpponentKind::AlwaysCooperate,
    OpponentKind::AlwaysDefect,
    OpponentKind::TitForTat,
    OpponentKind::TitForTwoTats,
    OpponentKind::Grudger,
    OpponentKind::Random,
    OpponentKind::Suspicious,
};

} // namespace

Move TitForTat::decide(const History& opponent) const {
    if (opponent.empty()) {
        return Move::Cooperate;
    }
    return opponent.back();
}

Move TitForTwoTats::decide(const History& opponent) const {
    size_t n = opponent.size();
    if (n < 2) {
        return Move::Cooperate;
    }
    if (opponent[n - 1] == Move::Defect && opponent[n - 2] == Move::Defect) {
        return Move::Defect;
    }
    return Move::Cooperate;
}

Move Grudger::decide(const History& opponent) const {
    bool betrayed = std::find(opponent.begin(), opponent.end(), Move::Defect) != opponent.end();
    return betrayed ? Move::Defect : Move::Cooperate;
}

Move RandomChoice::decide(const History&) const {
    if (rng == nullptr) {
        throw std::logic_error("Random opponent has no random source bound");
    }
    std::bernoulli_distribution coin(0.5);
    return coin(*rng) ? Move::Cooperate : Move::Defect;
}

Move Suspicious::decide(const History& opponent) const {
    if (opponent.empty()) {
        return Move::Defect;
    }
    return opponent.back();
}

Opponent::Opponent(OpponentKind kind, std::string name)
    : kind_(kind), name_(std::move(name)), behavior_(make_behavior(kind)) {}

Opponent::Opponent(OpponentKind kind)
    : Opponent(kind, to_string(kind)) {}

Move Opponent::decide_move() const {
    return std::visit([this](const auto& b) { return b.decide(opponent_history_); }, behavior_);
}

void Opponent::update_history(Move own_move, Move opponent_move) {
    own_history_.push_back(own_move);
    opponent_history_.push_back(opponent_move);
}

void Opponent::reset() {
    own_history_.clear();
    opponent_history_.clear();
}

void Opponent::bind_random_source(Rng& rng) {
    if (auto* random = std::get_if<RandomChoice>(&behavior_)) {
        random->rng = &rng;
    }
}

const char* to_string(OpponentKind kind) {
    switch (kind) {
        case OpponentKind::AlwaysCooperate: return "AlwaysCooperate";
        case OpponentKind::AlwaysDefect: return "AlwaysDefect";
        case OpponentKind::TitForTat: return "TitForTat";
        case OpponentKind::TitForTwoTats: return "TitForTwoTats";
        case OpponentKind::Grudger: return "Grudger";
        case OpponentKind::Random: return "Random";
        case OpponentKind::Suspicious: return "Suspicious";
    }
    return "Unknown";
}

OpponentKind parse_opponent_kind(const std::string& name) {
    for (OpponentKind kind : kAllKinds) {
        if (name == to_string(kind)) {
            return kind;
        }
    }
    throw ConfigError("unknown opponent '" + name + "'");
}

Opponent make_opponent(OpponentKind kind) {
    return Opponent(kind);
}

Opponent make_opponent(OpponentKind kind, Rng& rng) {
    Opponent opponent(kind);
    opponent.bind_random_source(rng);
    return opponent;
}

std::vector<Opponent> reference_roster() {
    std::vector<Opponent> roster;
    for (OpponentKind kind : kAllKinds) {
        roster.emplace_back(kind);
    }
    return roster;
}

std::vector<Opponent> make_roster(const std::vector<std::string>& names) {
    std::vector<Opponent> roster;
    roster.reserve(names.size());
    for (const auto& name : names) {
        roster.emplace_back(parse_opponent_kind(name));
    }
    return roster;
}

} // namespace ipd::strategy
