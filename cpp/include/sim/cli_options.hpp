#pragma once
#include "config_file.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace ipd::sim {

struct CliOptions {
    RunSettings settings;
    int threads = 0;
    std::string json_path;
    bool quiet = false;
    bool help = false;
};

/**
 * Parses the command line (without the program name).
 *
 * Every --config file is applied first, in order, then the remaining flags
 * override it. The merged TournamentConfig is validated once at the end.
 *
 * @throws ConfigError on unknown flags, missing or malformed values, or an
 *         out-of-range merged configuration
 */
CliOptions parse_cli_args(const std::vector<std::string>& args);

void print_usage(std::ostream& out, const std::string& prog);

} // namespace ipd::sim
