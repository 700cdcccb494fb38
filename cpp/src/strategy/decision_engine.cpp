#include "../../include/strategy/decision_engine.hpp"
#include <algorithm>

namespace ipd::strategy {

Move DecisionEngine::decide_move() const {
    return evaluate().move;
}

DecisionEngine::Decision DecisionEngine::evaluate() const {
    if (state_.opponent_history.empty()) {
        return {Move::Cooperate, Rule::Opening, state_.retaliation, false};
    }

    Features f = features();

    // A running retaliation is a fixed commitment
    if (state_.retaliation.rounds_remaining > 0) {
        Retaliation next;
        next.rounds_remaining = state_.retaliation.rounds_remaining - 1;
        next.active = next.rounds_remaining > 0;
        return {Move::Defect, Rule::Retaliating, next, false};
    }

    if (should_forgive(f)) {
        return {Move::Cooperate, Rule::Forgiveness, Retaliation{}, true};
    }

    if (state_.opponent_history.back() == Move::Defect) {
        return handle_defection(f);
    }
    return handle_cooperation(f);
}

void DecisionEngine::update_history(Move own_move, Move opponent_move) {
    // Commit the transition of the decision made for this round
    Decision decision = evaluate();
    state_.retaliation = decision.retaliation;
    if (decision.forgave) {
        state_.consecutive_defections = 0;
    }

    state_.own_history.push_back(own_move);
    state_.opponent_history.push_back(opponent_move);

    if (own_move == Move::Cooperate) {
        state_.own_cooperations++;
    }

    bool betrayed = false;
    if (opponent_move == Move::Defect) {
        state_.opponent_defections++;
        state_.consecutive_defections++;
        betrayed = own_move == Move::Cooperate;
    } else {
        state_.consecutive_defections = 0;
    }

    if (betrayed) {
        state_.betrayals++;
        state_.rounds_since_betrayal = 0;
    } else {
        state_.rounds_since_betrayal++;
    }
}

void DecisionEngine::reset() {
    state_ = State{};
}

DecisionEngine::Features DecisionEngine::features() const {
    Features f;
    const History& opp = state_.opponent_history;
    int total = static_cast<int>(opp.size());
    f.total_rounds = total;
    f.aggressive_streak = state_.consecutive_defections >= 2;

    if (total == 0) {
        return f;
    }

    int coop_count = total - state_.opponent_defections;
    f.overall_coop = static_cast<double>(coop_count) / total;

    int window = std::min(kRecentWindow, total);
    int recent_coop = static_cast<int>(std::count(opp.end() - window, opp.end(), Move::Cooperate));
    f.recent_coop = static_cast<double>(recent_coop) / window;

    // Too few own cooperations to say anything about exploitation yet
    if (state_.own_cooperations >= kMinRoundsForJudgment) {
        f.betrayal_rate = static_cast<double>(state_.betrayals) / state_.own_cooperations;
    }

    return f;
}

// Only reached with no retaliation running; evaluate() handles that case first
DecisionEngine::Decision DecisionEngine::retaliate(Rule rule, int rounds) const {
    return {Move::Defect, rule, Retaliation{rounds, rounds > 0}, false};
}

DecisionEngine::Decision DecisionEngine::handle_defection(const Features& f) const {
    int streak = state_.consecutive_defections;

    // Isolated slip by an otherwise cooperative opponent
    if (f.overall_coop > kCooperativeThreshold && streak <= kNoiseTolerance) {
        return {Move::Cooperate, Rule::NoiseTolerance, state_.retaliation, false};
    }

    if (streak == 1) {
        return retaliate(Rule::FirstDefection, 1);
    }

    if (f.aggressive_streak) {
        return retaliate(Rule::AggressiveStreak, std::min(kEscalationCap, streak));
    }

    // A streak of two or more is always aggressive, so the two rules below
    // only act if the streak thresholds above are changed
    if (f.betrayal_rate > kBetrayalThreshold) {
        return retaliate(Rule::HighBetrayal, kDefensiveRetaliation);
    }

    return {Move::Defect, Rule::DefaultDefect, state_.retaliation, false};
}

DecisionEngine::Decision DecisionEngine::handle_cooperation(const Features& f) const {
    if (f.overall_coop > kCooperativeThreshold) {
        return {Move::Cooperate, Rule::RewardCooperation, state_.retaliation, false};
    }

    if (f.recent_coop > kImprovingRecentCoop) {
        return {Move::Cooperate, Rule::RewardImprovement, state_.retaliation, false};
    }

    // Cautious probing of an exploiter
    if (f.betrayal_rate > kBetrayalThreshold) {
        Move move = (f.total_rounds % kProbePeriod == 0) ? Move::Cooperate : Move::Defect;
        return {move, Rule::Probe, state_.retaliation, false};
    }

    return {Move::Cooperate, Rule::DefaultCooperate, state_.retaliation, false};
}

bool DecisionEngine::should_forgive(const Features& f) const {
    if (f.total_rounds < kMinRoundsForJudgment || f.total_rounds < kForgivenessWindow) {
        return false;
    }

    const History& opp = state_.opponent_history;
    bool reformed = std::all_of(opp.end() - kForgivenessWindow, opp.end(),
                                [](Move m) { return m == Move::Cooperate; });

    return reformed &&
           state_.rounds_since_betrayal >= kForgivenessWindow &&
           f.recent_coop > kForgivenessRecentCoop;
}

const char* to_string(DecisionEngine::Rule rule) {
    switch (rule) {
        case DecisionEngine::Rule::Opening: return "opening";
        case DecisionEngine::Rule::Retaliating: return "retaliating";
        case DecisionEngine::Rule::Forgiveness: return "forgiveness";
        case DecisionEngine::Rule::NoiseTolerance: return "noise_tolerance";
        case DecisionEngine::Rule::FirstDefection: return "first_defection";
        case DecisionEngine::Rule::AggressiveStreak: return "aggressive_streak";
        case DecisionEngine::Rule::HighBetrayal: return "high_betrayal";
        case DecisionEngine::Rule::DefaultDefect: return "default_defect";
        case DecisionEngine::Rule::RewardCooperation: return "reward_cooperation";
        case DecisionEngine::Rule::RewardImprovement: return "reward_improvement";
        case DecisionEngine::Rule::Probe: return "probe";
        case DecisionEngine::Rule::DefaultCooperate: return "default_cooperate";
    }
    return "unknown";
}

} // namespace ipd::strategy
