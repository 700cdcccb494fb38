#pragma once
#include "strategy.hpp"
#include "../common.hpp"

namespace ipd::strategy {

/**
 * Rule-based IPD policy under evaluation.
 *
 * Opens with cooperation, retaliates proportionally against defection,
 * tolerates isolated noise from cooperative opponents and forgives once an
 * opponent shows sustained reform. Thresholds are fixed constants.
 */
class DecisionEngine : public Strategy {
public:
    static constexpr double kCooperativeThreshold = 0.70;
    static constexpr double kBetrayalThreshold = 0.30;
    static constexpr int kRecentWindow = 15;
    static constexpr int kNoiseTolerance = 1;
    static constexpr int kForgivenessWindow = 5;
    static constexpr int kMinRoundsForJudgment = 10;
    static constexpr double kForgivenessRecentCoop = 0.80;
    static constexpr double kImprovingRecentCoop = 0.60;
    static constexpr int kEscalationCap = 2;
    static constexpr int kDefensiveRetaliation = 2;
    static constexpr int kProbePeriod = 4;

    // Which step of the cascade produced a decision
    enum class Rule {
        Opening,
        Retaliating,
        Forgiveness,
        NoiseTolerance,
        FirstDefection,
        AggressiveStreak,
        HighBetrayal,
        DefaultDefect,
        RewardCooperation,
        RewardImprovement,
        Probe,
        DefaultCooperate
    };

    // Read-only view recomputed from history every round
    struct Features {
        double overall_coop = 0.0;
        double recent_coop = 0.0;
        double betrayal_rate = 0.0;
        bool aggressive_streak = false;
        int total_rounds = 0;
    };

    struct Retaliation {
        int rounds_remaining = 0;
        bool active = false;
    };

    // All mutable counters, written only by update_history
    struct State {
        History own_history;
        History opponent_history;
        int opponent_defections = 0;
        int own_cooperations = 0;
        int betrayals = 0;
        int consecutive_defections = 0;
        int rounds_since_betrayal = 0;
        Retaliation retaliation;
    };

    struct Decision {
        Move move;
        Rule rule;
        Retaliation retaliation;  // retaliation state once this decision is played
        bool forgave;
    };

    DecisionEngine() = default;

    std::string name() const override { return "DecisionEngine"; }
    Move decide_move() const override;
    void update_history(Move own_move, Move opponent_move) override;
    void reset() override;

    // Full cascade, including the state transition it commits to
    Decision evaluate() const;

    Features features() const;
    const State& state() const { return state_; }
    // Rule behind the move decide_move() would return now
    Rule current_rule() const { return evaluate().rule; }

private:
    Decision handle_defection(const Features& features) const;
    Decision handle_cooperation(const Features& features) const;
    bool should_forgive(const Features& features) const;
    Decision retaliate(Rule rule, int rounds) const;

    State state_;
};

const char* to_string(DecisionEngine::Rule rule);

} // namespace ipd::strategy
