#pragma once
#include "tournament.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ipd::sim {

// Everything needed to set up a tournament from the outside
struct RunSettings {
    TournamentConfig config;
    std::vector<std::string> opponents;  // empty means the reference roster
};

/**
 * Apply a JSON object of the form
 *   { "rounds": 200, "noise": 0.0, "seed": 42, "opponents": ["TitForTat", ...] }
 * on top of `base`. Missing keys keep their base value.
 *
 * Throws ConfigError on wrongly typed values or unknown opponent names.
 * Ranges are not checked here: later overrides may still fix them, so
 * callers validate the merged TournamentConfig.
 */
RunSettings settings_from_json(const nlohmann::json& doc, RunSettings base = {});

// Reads and parses the file, then defers to settings_from_json
RunSettings load_settings(const std::string& path, RunSettings base = {});

} // namespace ipd::sim
