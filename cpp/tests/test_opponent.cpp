#include "../include/strategy/opponent.hpp"
#include "../include/errors.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace ipd::strategy {
namespace {

// Feeds the opponent a scripted sequence of moves, returns what it played
std::vector<Move> play_script(Opponent& opponent, const std::vector<Move>& script) {
    std::vector<Move> played;
    for (Move theirs : script) {
        Move own = opponent.decide_move();
        opponent.update_history(own, theirs);
        played.push_back(own);
    }
    return played;
}

const Move C = Move::Cooperate;
const Move D = Move::Defect;

TEST(OpponentTest, OpeningMoves) {
    EXPECT_EQ(make_opponent(OpponentKind::AlwaysCooperate).decide_move(), C);
    EXPECT_EQ(make_opponent(OpponentKind::AlwaysDefect).decide_move(), D);
    EXPECT_EQ(make_opponent(OpponentKind::TitForTat).decide_move(), C);
    EXPECT_EQ(make_opponent(OpponentKind::TitForTwoTats).decide_move(), C);
    EXPECT_EQ(make_opponent(OpponentKind::Grudger).decide_move(), C);
    EXPECT_EQ(make_opponent(OpponentKind::Suspicious).decide_move(), D);
}

TEST(OpponentTest, TitForTatMirrors) {
    Opponent tft(OpponentKind::TitForTat);
    std::vector<Move> played = play_script(tft, {D, C, C, D, D});
    EXPECT_EQ(played, (std::vector<Move>{C, D, C, C, D}));
}

TEST(OpponentTest, TitForTwoTatsNeedsTwoDefections) {
    Opponent tf2t(OpponentKind::TitForTwoTats);
    std::vector<Move> played = play_script(tf2t, {D, C, D, D, D, C, C});
    EXPECT_EQ(played, (std::vector<Move>{C, C, C, C, D, D, C}));
}

TEST(OpponentTest, GrudgerNeverForgives) {
    Opponent grudger(OpponentKind::Grudger);
    std::vector<Move> script(50, C);
    script[3] = D;
    std::vector<Move> played = play_script(grudger, script);

    for (size_t i = 0; i <= 3; i++) {
        EXPECT_EQ(played[i], C) << "round " << i + 1;
    }
    for (size_t i = 4; i < played.size(); i++) {
        EXPECT_EQ(played[i], D) << "round " << i + 1;
    }
}

TEST(OpponentTest, SuspiciousOpensDefectThenMirrors) {
    Opponent suspicious(OpponentKind::Suspicious);
    std::vector<Move> played = play_script(suspicious, {C, C, D, C});
    EXPECT_EQ(played, (std::vector<Move>{D, C, C, D}));
}

TEST(OpponentTest, ConstantStrategiesIgnoreHistory) {
    Opponent always_c(OpponentKind::AlwaysCooperate);
    Opponent always_d(OpponentKind::AlwaysDefect);
    std::vector<Move> script = {D, D, C, D};
    EXPECT_EQ(play_script(always_c, script), std::vector<Move>(4, C));
    EXPECT_EQ(play_script(always_d, script), std::vector<Move>(4, D));
}

TEST(OpponentTest, RandomRequiresBoundSource) {
    Opponent random(OpponentKind::Random);
    EXPECT_THROW(random.decide_move(), std::logic_error);
}

TEST(OpponentTest, RandomIsReproducibleFromSeed) {
    Rng rng_a(1234);
    Rng rng_b(1234);
    Opponent a = make_opponent(OpponentKind::Random, rng_a);
    Opponent b = make_opponent(OpponentKind::Random, rng_b);

    int cooperations = 0;
    for (int i = 0; i < 400; i++) {
        Move ma = a.decide_move();
        EXPECT_EQ(ma, b.decide_move());
        if (ma == C) cooperations++;
    }
    // Both moves show up
    EXPECT_GT(cooperations, 100);
    EXPECT_LT(cooperations, 300);
}

TEST(OpponentTest, ResetClearsBothHistories) {
    Opponent grudger(OpponentKind::Grudger);
    play_script(grudger, {D, C});
    EXPECT_EQ(grudger.own_history().size(), 2u);
    EXPECT_EQ(grudger.decide_move(), D);

    grudger.reset();
    EXPECT_TRUE(grudger.own_history().empty());
    EXPECT_TRUE(grudger.opponent_history().empty());
    EXPECT_EQ(grudger.decide_move(), C);
}

TEST(OpponentTest, NamesRoundTrip) {
    for (const auto& opponent : reference_roster()) {
        EXPECT_EQ(parse_opponent_kind(opponent.name()), opponent.kind());
    }
    EXPECT_THROW(parse_opponent_kind("Pavlov"), ConfigError);
}

TEST(OpponentTest, ReferenceRosterOrder) {
    std::vector<std::string> names;
    for (const auto& opponent : reference_roster()) {
        names.push_back(opponent.name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{
        "AlwaysCooperate", "AlwaysDefect", "TitForTat", "TitForTwoTats",
        "Grudger", "Random", "Suspicious"}));
}

TEST(OpponentTest, MakeRosterFromNames) {
    std::vector<Opponent> roster = make_roster({"Grudger", "TitForTat"});
    ASSERT_EQ(roster.size(), 2u);
    EXPECT_EQ(roster[0].kind(), OpponentKind::Grudger);
    EXPECT_EQ(roster[1].kind(), OpponentKind::TitForTat);
    EXPECT_THROW(make_roster({"Grudger", "Nobody"}), ConfigError);
}

TEST(OpponentTest, CustomName) {
    Opponent named(OpponentKind::TitForTat, "TFT-1");
    EXPECT_EQ(named.name(), "TFT-1");
}

} // namespace
} // namespace ipd::strategy
