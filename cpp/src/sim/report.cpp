#include "../../include/sim/report.hpp"
#include <iomanip>
#include <sstream>

namespace ipd::sim {

nlohmann::json to_json(const MatchResult& result) {
    return nlohmann::json{
        {"opponent", result.opponent},
        {"our_score", result.our_score},
        {"opponent_score", result.opponent_score},
        {"our_avg", result.our_avg},
        {"opponent_avg", result.opponent_avg},
        {"our_coop", result.our_coop},
        {"opp_coop", result.opp_coop},
        {"won", result.won},
        {"score_difference", result.score_difference},
    };
}

nlohmann::json to_json(const TournamentSummary& summary) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& r : summary.results) {
        results.push_back(to_json(r));
    }

    return nlohmann::json{
        {"total_matches", summary.total_matches},
        {"total_score", summary.total_score},
        {"average_score", summary.average_score},
        {"wins", summary.wins},
        {"losses", summary.losses},
        {"win_rate", summary.win_rate},
        {"results", results},
    };
}

std::string summary_to_json_string(const TournamentSummary& summary, int indent) {
    return to_json(summary).dump(indent);
}

std::string format_comparison_table(const TournamentSummary& summary) {
    std::ostringstream out;
    std::string rule(72, '=');

    out << rule << "\n"
        << std::left << std::setw(20) << "Opponent" << std::right
        << " | " << std::setw(9) << "Our Score"
        << " | " << std::setw(11) << "Their Score"
        << " | " << std::setw(8) << "Our Coop"
        << " | " << std::setw(6) << "Result" << "\n"
        << std::string(72, '-') << "\n";

    out << std::fixed << std::setprecision(1);
    for (const auto& r : summary.results) {
        out << std::left << std::setw(20) << r.opponent << std::right
            << " | " << std::setw(9) << r.our_score
            << " | " << std::setw(11) << r.opponent_score
            << " | " << std::setw(7) << r.our_coop * 100.0 << "%"
            << " | " << std::setw(6) << (r.won ? "WIN" : "LOSS") << "\n";
    }

    out << rule << "\n";
    return out.str();
}

std::string format_summary(const TournamentSummary& summary) {
    std::ostringstream out;
    out << "TOURNAMENT SUMMARY\n"
        << "Total Score: " << summary.total_score << "\n"
        << std::fixed << std::setprecision(2)
        << "Average Score per Match: " << summary.average_score << "\n"
        << std::setprecision(1)
        << "Wins: " << summary.wins << "/" << summary.total_matches
        << " (" << summary.win_rate * 100.0 << "%)\n";
    return out.str();
}

} // namespace ipd::sim
