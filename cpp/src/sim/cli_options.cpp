#include "../../include/sim/cli_options.hpp"
#include "../../include/errors.hpp"
#include <cstdint>
#include <sstream>
#include <type_traits>

namespace ipd::sim {

namespace {

std::vector<std::string> split_names(const std::string& list) {
    std::vector<std::string> names;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            names.push_back(item);
        }
    }
    return names;
}

template <typename T>
T parse_number(const std::string& flag, const std::string& text) {
    // istream wraps "-1" into a huge unsigned value instead of failing
    if constexpr (std::is_unsigned_v<T>) {
        const auto first = text.find_first_not_of(" \t");
        if (first != std::string::npos && text[first] == '-') {
            throw ConfigError("invalid value '" + text + "' for " + flag);
        }
    }
    std::istringstream in(text);
    T value{};
    if (!(in >> value) || !in.eof()) {
        throw ConfigError("invalid value '" + text + "' for " + flag);
    }
    return value;
}

} // namespace

void print_usage(std::ostream& out, const std::string& prog) {
    out << "Usage: " << prog << " [options]\n"
        << "  --rounds N         rounds per match (default 200, at most " << kMaxRounds << ")\n"
        << "  --noise P          per-move flip probability in [0,1) (default 0)\n"
        << "  --seed S           random seed, non-negative (default 42)\n"
        << "  --opponents A,B    comma separated roster (default: all seven)\n"
        << "  --threads N        play matches in parallel, per-match seeds (default 0: sequential)\n"
        << "  --config PATH      JSON settings file; flags override it\n"
        << "  --json PATH        write the tournament summary as JSON\n"
        << "  --quiet            only print errors\n"
        << "  --help             show this message\n";
}

CliOptions parse_cli_args(const std::vector<std::string>& args) {
    CliOptions opts;

    // Settings file first so explicit flags win
    for (size_t i = 0; i + 1 < args.size(); i++) {
        if (args[i] == "--config") {
            opts.settings = load_settings(args[i + 1], opts.settings);
        }
    }

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& flag = args[i];
        if (flag == "--help" || flag == "-h") {
            opts.help = true;
            continue;
        }
        if (flag == "--quiet") {
            opts.quiet = true;
            continue;
        }
        if (i + 1 >= args.size()) {
            throw ConfigError("missing value for " + flag);
        }
        const std::string& value = args[++i];

        if (flag == "--rounds") {
            opts.settings.config.rounds = parse_number<int>(flag, value);
        } else if (flag == "--noise") {
            opts.settings.config.noise = parse_number<double>(flag, value);
        } else if (flag == "--seed") {
            opts.settings.config.seed = parse_number<std::uint64_t>(flag, value);
        } else if (flag == "--opponents") {
            opts.settings.opponents = split_names(value);
        } else if (flag == "--threads") {
            opts.threads = parse_number<int>(flag, value);
        } else if (flag == "--json") {
            opts.json_path = value;
        } else if (flag == "--config") {
            // already applied
        } else {
            throw ConfigError("unknown option " + flag);
        }
    }

    opts.settings.config.validate();
    return opts;
}

} // namespace ipd::sim
