#include "../../include/sim/config_file.hpp"
#include "../../include/errors.hpp"
#include "../../include/strategy/opponent.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include <string>

namespace ipd::sim {

RunSettings settings_from_json(const nlohmann::json& doc, RunSettings base) {
    if (!doc.is_object()) {
        throw ConfigError("settings must be a JSON object");
    }

    RunSettings settings = std::move(base);
    try {
        if (doc.contains("rounds")) {
            const auto rounds = doc.at("rounds").get<std::int64_t>();
            if (rounds < std::numeric_limits<int>::min() || rounds > std::numeric_limits<int>::max()) {
                throw ConfigError("rounds " + std::to_string(rounds) + " is out of range");
            }
            settings.config.rounds = static_cast<int>(rounds);
        }
        if (doc.contains("noise")) {
            settings.config.noise = doc.at("noise").get<double>();
        }
        if (doc.contains("seed")) {
            // get<uint64_t> would silently wrap a negative integer
            if (doc.at("seed").is_number_integer() && !doc.at("seed").is_number_unsigned()) {
                throw ConfigError("seed must be non-negative");
            }
            settings.config.seed = doc.at("seed").get<std::uint64_t>();
        }
        if (doc.contains("opponents")) {
            settings.opponents = doc.at("opponents").get<std::vector<std::string>>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("bad settings value: ") + e.what());
    }

    // Reject unknown names up front rather than mid-tournament
    for (const auto& name : settings.opponents) {
        strategy::parse_opponent_kind(name);
    }

    return settings;
}

RunSettings load_settings(const std::string& path, RunSettings base) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open settings file '" + path + "'");
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("settings file '" + path + "' is not valid JSON: " + e.what());
    }
    return settings_from_json(doc, std::move(base));
}

} // namespace ipd::sim
