#include "../include/sim/report.hpp"
#include "../include/sim/config_file.hpp"
#include "../include/errors.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

namespace ipd::sim {
namespace {

TournamentSummary sample_summary() {
    TournamentSummary summary;
    MatchResult win;
    win.opponent = "AlwaysCooperate";
    win.our_score = 700;
    win.opponent_score = 500;
    win.our_avg = 3.5;
    win.opponent_avg = 2.5;
    win.our_coop = 0.75;
    win.opp_coop = 1.0;
    win.won = true;
    win.score_difference = 200;

    MatchResult loss;
    loss.opponent = "AlwaysDefect";
    loss.our_score = 199;
    loss.opponent_score = 204;
    loss.our_avg = 0.995;
    loss.opponent_avg = 1.02;
    loss.our_coop = 0.005;
    loss.opp_coop = 0.0;
    loss.won = false;
    loss.score_difference = -5;

    summary.results = {win, loss};
    summary.total_matches = 2;
    summary.total_score = 899;
    summary.average_score = 449.5;
    summary.wins = 1;
    summary.losses = 1;
    summary.win_rate = 0.5;
    return summary;
}

TEST(ReportTest, JsonFollowsSummarySchema) {
    nlohmann::json doc = to_json(sample_summary());

    for (const char* key : {"total_matches", "total_score", "average_score",
                            "wins", "losses", "win_rate", "results"}) {
        EXPECT_TRUE(doc.contains(key)) << key;
    }
    EXPECT_EQ(doc["total_matches"], 2);
    EXPECT_EQ(doc["total_score"], 899);
    EXPECT_DOUBLE_EQ(doc["win_rate"].get<double>(), 0.5);

    ASSERT_EQ(doc["results"].size(), 2u);
    const nlohmann::json& first = doc["results"][0];
    for (const char* key : {"opponent", "our_score", "opponent_score", "our_avg",
                            "our_coop", "opp_coop", "won", "score_difference"}) {
        EXPECT_TRUE(first.contains(key)) << key;
    }
    EXPECT_EQ(first["opponent"], "AlwaysCooperate");
    EXPECT_EQ(first["won"], true);
    EXPECT_EQ(doc["results"][1]["score_difference"], -5);
}

TEST(ReportTest, JsonStringParsesBack) {
    std::string text = summary_to_json_string(sample_summary(), 4);
    nlohmann::json doc = nlohmann::json::parse(text);
    EXPECT_EQ(doc["wins"], 1);
    EXPECT_EQ(doc["results"][1]["opponent"], "AlwaysDefect");
}

TEST(ReportTest, ComparisonTable) {
    std::string table = format_comparison_table(sample_summary());
    EXPECT_NE(table.find("Opponent"), std::string::npos);
    EXPECT_NE(table.find("AlwaysCooperate"), std::string::npos);
    EXPECT_NE(table.find("75.0%"), std::string::npos);
    EXPECT_NE(table.find("WIN"), std::string::npos);
    EXPECT_NE(table.find("LOSS"), std::string::npos);
}

TEST(ReportTest, SummaryBlock) {
    std::string text = format_summary(sample_summary());
    EXPECT_NE(text.find("Total Score: 899"), std::string::npos);
    EXPECT_NE(text.find("Average Score per Match: 449.50"), std::string::npos);
    EXPECT_NE(text.find("Wins: 1/2 (50.0%)"), std::string::npos);
}

TEST(SettingsTest, PartialDocumentKeepsDefaults) {
    RunSettings settings = settings_from_json(nlohmann::json{{"noise", 0.05}});
    EXPECT_EQ(settings.config.rounds, 200);
    EXPECT_DOUBLE_EQ(settings.config.noise, 0.05);
    EXPECT_EQ(settings.config.seed, 42u);
    EXPECT_TRUE(settings.opponents.empty());
}

TEST(SettingsTest, FullDocument) {
    nlohmann::json doc = {
        {"rounds", 50},
        {"noise", 0.0},
        {"seed", 9},
        {"opponents", {"Grudger", "Random"}},
    };
    RunSettings settings = settings_from_json(doc);
    EXPECT_EQ(settings.config.rounds, 50);
    EXPECT_EQ(settings.config.seed, 9u);
    EXPECT_EQ(settings.opponents, (std::vector<std::string>{"Grudger", "Random"}));
}

TEST(SettingsTest, RejectsBadValues) {
    EXPECT_THROW(settings_from_json(nlohmann::json{{"rounds", "many"}}), ConfigError);
    EXPECT_THROW(settings_from_json(nlohmann::json{{"rounds", 5000000000LL}}), ConfigError);
    EXPECT_THROW(settings_from_json(nlohmann::json{{"seed", -1}}), ConfigError);
    EXPECT_THROW(settings_from_json(nlohmann::json{{"opponents", {"Nobody"}}}), ConfigError);
    EXPECT_THROW(settings_from_json(nlohmann::json::array()), ConfigError);
}

TEST(SettingsTest, RangesCheckedAfterMerge) {
    // A file value that is out of range may still be overridden later
    RunSettings settings = settings_from_json(nlohmann::json{{"rounds", 0}, {"noise", 1.5}});
    EXPECT_EQ(settings.config.rounds, 0);
    EXPECT_THROW(settings.config.validate(), ConfigError);

    settings = settings_from_json(nlohmann::json{{"rounds", 10}, {"noise", 0.1}}, settings);
    EXPECT_NO_THROW(settings.config.validate());
}

TEST(SettingsTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "ipd_settings_test.json";
    {
        std::ofstream out(path);
        out << R"({"rounds": 25, "opponents": ["TitForTat"]})";
    }
    RunSettings settings = load_settings(path);
    EXPECT_EQ(settings.config.rounds, 25);
    ASSERT_EQ(settings.opponents.size(), 1u);
    EXPECT_EQ(settings.opponents[0], "TitForTat");
    std::remove(path.c_str());

    EXPECT_THROW(load_settings(path), ConfigError);
}

TEST(SettingsTest, MalformedFile) {
    std::string path = ::testing::TempDir() + "ipd_settings_bad.json";
    {
        std::ofstream out(path);
        out << "{ rounds: ";
    }
    EXPECT_THROW(load_settings(path), ConfigError);
    std::remove(path.c_str());
}

} // namespace
} // namespace ipd::sim
