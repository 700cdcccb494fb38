#pragma once
#include "tournament.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ipd::sim {

// Summary document handed to the analysis side
nlohmann::json to_json(const MatchResult& result);
nlohmann::json to_json(const TournamentSummary& summary);
std::string summary_to_json_string(const TournamentSummary& summary, int indent = 2);

// Fixed-width per-opponent table
std::string format_comparison_table(const TournamentSummary& summary);

// Totals block printed after a run
std::string format_summary(const TournamentSummary& summary);

} // namespace ipd::sim
