#include "../include/errors.hpp"
#include "../include/sim/cli_options.hpp"
#include "../include/sim/report.hpp"
#include "../include/sim/tournament.hpp"
#include "../include/strategy/opponent.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    ipd::sim::CliOptions opts;
    std::vector<ipd::strategy::Opponent> roster;
    try {
        opts = ipd::sim::parse_cli_args(std::vector<std::string>(argv + 1, argv + argc));
        roster = opts.settings.opponents.empty()
                     ? ipd::strategy::reference_roster()
                     : ipd::strategy::make_roster(opts.settings.opponents);
    } catch (const ipd::ConfigError& e) {
        std::cerr << e.what() << "\n";
        ipd::sim::print_usage(std::cout, argv[0]);
        return 1;
    }

    if (opts.help) {
        ipd::sim::print_usage(std::cout, argv[0]);
        return 0;
    }

    ipd::sim::Tournament tournament(ipd::sim::decision_engine_factory(),
                                    std::move(roster),
                                    opts.settings.config);
    if (!opts.quiet) {
        tournament.set_log_stream(&std::cout);
    }

    ipd::sim::TournamentSummary summary;
    try {
        summary = opts.threads > 0 ? tournament.run_sharded(opts.threads) : tournament.run();
    } catch (const ipd::ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const ipd::InvalidMoveError& e) {
        std::cerr << "Tournament aborted: " << e.what() << "\n";
        return 2;
    }

    if (!opts.quiet) {
        std::cout << "\n" << ipd::sim::format_summary(summary)
                  << "\n" << ipd::sim::format_comparison_table(summary);
    }

    if (!opts.json_path.empty()) {
        std::ofstream out(opts.json_path);
        if (!out) {
            std::cerr << "Cannot write " << opts.json_path << "\n";
            return 1;
        }
        out << ipd::sim::summary_to_json_string(summary) << "\n";
        if (!opts.quiet) {
            std::cout << "Summary written to " << opts.json_path << "\n";
        }
    }

    return 0;
}
