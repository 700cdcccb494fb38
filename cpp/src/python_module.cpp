#include "../include/python_module.hpp"
#include <pybind11/stl.h>
#include "../include/common.hpp"
#include "../include/errors.hpp"
#include "../include/strategy/strategy.hpp"
#include "../include/strategy/decision_engine.hpp"
#include "../include/strategy/opponent.hpp"
#include "../include/strategy/python_callback_strategy.hpp"
#include "../include/sim/match.hpp"
#include "../include/sim/tournament.hpp"
#include "../include/sim/report.hpp"

using ipd::strategy::DecisionEngine;
using ipd::strategy::Opponent;
using ipd::strategy::OpponentKind;
using ipd::strategy::Strategy;

namespace {

ipd::sim::TournamentSummary run_tournament(std::vector<Opponent> roster,
                                           const ipd::sim::TournamentConfig& config,
                                           int num_threads) {
    ipd::sim::Tournament tournament(ipd::sim::decision_engine_factory(), std::move(roster), config);
    return num_threads > 0 ? tournament.run_sharded(num_threads) : tournament.run();
}

} // namespace

void ipd::bind_python_module(py::module_& m) {
    m.doc() = "C++ Iterated Prisoner's Dilemma strategy evaluator";

    py::register_exception<ipd::InvalidMoveError>(m, "InvalidMoveError", PyExc_ValueError);
    py::register_exception<ipd::ConfigError>(m, "ConfigError", PyExc_ValueError);

    py::enum_<ipd::Move>(m, "Move")
        .value("Cooperate", ipd::Move::Cooperate)
        .value("Defect", ipd::Move::Defect);

    py::class_<ipd::Payoff>(m, "Payoff")
        .def_readonly("first", &ipd::Payoff::first)
        .def_readonly("second", &ipd::Payoff::second);

    m.def("payoff", &ipd::payoff, py::arg("first"), py::arg("second"),
          "Payoff pair for one round");

    // Strategy interface
    py::class_<Strategy, std::shared_ptr<Strategy>>(m, "Strategy")
        .def("name", &Strategy::name)
        .def("decide_move", &Strategy::decide_move, "Move for the next round")
        .def("update_history", &Strategy::update_history,
             py::arg("own_move"), py::arg("opponent_move"),
             "Record the moves actually played")
        .def("reset", &Strategy::reset, "Clear per-match state");

    py::class_<DecisionEngine::Features>(m, "Features")
        .def_readonly("overall_coop", &DecisionEngine::Features::overall_coop)
        .def_readonly("recent_coop", &DecisionEngine::Features::recent_coop)
        .def_readonly("betrayal_rate", &DecisionEngine::Features::betrayal_rate)
        .def_readonly("aggressive_streak", &DecisionEngine::Features::aggressive_streak)
        .def_readonly("total_rounds", &DecisionEngine::Features::total_rounds);

    py::class_<DecisionEngine, Strategy, std::shared_ptr<DecisionEngine>>(m, "DecisionEngine")
        .def(py::init<>(), "Create the strategy under test")
        .def("features", &DecisionEngine::features, "Behavioral features of the opponent")
        .def("current_rule", [](const DecisionEngine& e) {
            return std::string(ipd::strategy::to_string(e.current_rule()));
        }, "Cascade rule behind the next decision");

    py::enum_<OpponentKind>(m, "OpponentKind")
        .value("AlwaysCooperate", OpponentKind::AlwaysCooperate)
        .value("AlwaysDefect", OpponentKind::AlwaysDefect)
        .value("TitForTat", OpponentKind::TitForTat)
        .value("TitForTwoTats", OpponentKind::TitForTwoTats)
        .value("Grudger", OpponentKind::Grudger)
        .value("Random", OpponentKind::Random)
        .value("Suspicious", OpponentKind::Suspicious);

    py::class_<ipd::Rng>(m, "Rng")
        .def(py::init<std::uint64_t>(), py::arg("seed") = 42);

    // Random opponents keep a pointer to their generator; keep_alive pins it
    py::class_<Opponent, Strategy, std::shared_ptr<Opponent>>(m, "Opponent")
        .def(py::init<OpponentKind>(), py::arg("kind"))
        .def(py::init([](const std::string& name) {
            return Opponent(ipd::strategy::parse_opponent_kind(name));
        }), py::arg("name"), "Create an opponent from its roster name")
        .def(py::init([](OpponentKind kind, ipd::Rng& rng) {
            return ipd::strategy::make_opponent(kind, rng);
        }), py::arg("kind"), py::arg("rng"), py::keep_alive<1, 3>(),
             "Create an opponent drawing from rng")
        .def("bind_random_source", &Opponent::bind_random_source,
             py::arg("rng"), py::keep_alive<1, 2>(),
             "Generator used by the Random behavior")
        .def("kind", &Opponent::kind);

    m.def("reference_roster", &ipd::strategy::reference_roster,
          "The seven reference opponents in canonical order");

    // PythonCallbackStrategy - lets a Python object play in a C++ match
    py::class_<ipd::strategy::PythonCallbackStrategy, Strategy,
               std::shared_ptr<ipd::strategy::PythonCallbackStrategy>>(m, "PythonCallbackStrategy")
        .def(py::init<py::object, std::string>(),
             py::arg("py_strategy"),
             py::arg("name") = "",
             "Wrap an object with decide_move() and update_history(own, opponent)");

    py::class_<ipd::sim::MatchStats>(m, "MatchStats")
        .def_readonly("score1", &ipd::sim::MatchStats::score1)
        .def_readonly("score2", &ipd::sim::MatchStats::score2)
        .def_readonly("avg_score1", &ipd::sim::MatchStats::avg_score1)
        .def_readonly("avg_score2", &ipd::sim::MatchStats::avg_score2)
        .def_readonly("cooperation_rate1", &ipd::sim::MatchStats::cooperation_rate1)
        .def_readonly("cooperation_rate2", &ipd::sim::MatchStats::cooperation_rate2)
        .def_readonly("rounds", &ipd::sim::MatchStats::rounds);

    py::class_<ipd::sim::Match>(m, "Match")
        .def(py::init<Strategy&, Strategy&, int, double, ipd::Rng*>(),
             py::arg("first"),
             py::arg("second"),
             py::arg("rounds") = 200,
             py::arg("noise") = 0.0,
             py::arg("rng") = nullptr,
             py::keep_alive<1, 2>(),
             py::keep_alive<1, 3>(),
             py::keep_alive<1, 6>())
        .def("play", &ipd::sim::Match::play, "Play every round, return (score1, score2)")
        .def("get_stats", &ipd::sim::Match::get_stats)
        .def("history", &ipd::sim::Match::history);

    py::class_<ipd::sim::TournamentConfig>(m, "TournamentConfig")
        .def(py::init<>())
        .def_readwrite("rounds", &ipd::sim::TournamentConfig::rounds)
        .def_readwrite("noise", &ipd::sim::TournamentConfig::noise)
        .def_readwrite("seed", &ipd::sim::TournamentConfig::seed)
        .def("validate", &ipd::sim::TournamentConfig::validate);

    py::class_<ipd::sim::MatchResult>(m, "MatchResult")
        .def_readonly("opponent", &ipd::sim::MatchResult::opponent)
        .def_readonly("our_score", &ipd::sim::MatchResult::our_score)
        .def_readonly("opponent_score", &ipd::sim::MatchResult::opponent_score)
        .def_readonly("our_avg", &ipd::sim::MatchResult::our_avg)
        .def_readonly("opponent_avg", &ipd::sim::MatchResult::opponent_avg)
        .def_readonly("our_coop", &ipd::sim::MatchResult::our_coop)
        .def_readonly("opp_coop", &ipd::sim::MatchResult::opp_coop)
        .def_readonly("won", &ipd::sim::MatchResult::won)
        .def_readonly("score_difference", &ipd::sim::MatchResult::score_difference);

    py::class_<ipd::sim::TournamentSummary>(m, "TournamentSummary")
        .def_readonly("total_matches", &ipd::sim::TournamentSummary::total_matches)
        .def_readonly("total_score", &ipd::sim::TournamentSummary::total_score)
        .def_readonly("average_score", &ipd::sim::TournamentSummary::average_score)
        .def_readonly("wins", &ipd::sim::TournamentSummary::wins)
        .def_readonly("losses", &ipd::sim::TournamentSummary::losses)
        .def_readonly("win_rate", &ipd::sim::TournamentSummary::win_rate)
        .def_readonly("results", &ipd::sim::TournamentSummary::results)
        .def("to_json", [](const ipd::sim::TournamentSummary& s, int indent) {
            return ipd::sim::summary_to_json_string(s, indent);
        }, py::arg("indent") = 2, "Summary document as a JSON string");

    m.def("summary_to_json", &ipd::sim::summary_to_json_string,
          py::arg("summary"),
          py::arg("indent") = 2,
          "Summary document as a JSON string");

    // Engine factory is fixed to the DecisionEngine on the Python side
    py::class_<ipd::sim::Tournament>(m, "Tournament")
        .def(py::init([](std::vector<Opponent> roster, const ipd::sim::TournamentConfig& config) {
            return std::make_unique<ipd::sim::Tournament>(
                ipd::sim::decision_engine_factory(), std::move(roster), config);
        }), py::arg("roster"), py::arg("config") = ipd::sim::TournamentConfig{})
        .def("run", &ipd::sim::Tournament::run,
             "Play the roster in order on one shared generator",
             py::call_guard<py::gil_scoped_release>())
        .def("run_sharded", &ipd::sim::Tournament::run_sharded,
             py::arg("num_threads") = 0,
             "Play matches in parallel with per-match generators",
             py::call_guard<py::gil_scoped_release>())
        .def("config", &ipd::sim::Tournament::config)
        .def("roster", &ipd::sim::Tournament::roster)
        .def("last_summary", &ipd::sim::Tournament::last_summary,
             "Most recent summary, or None");

    m.def("run_tournament", &run_tournament,
          py::arg("roster"),
          py::arg("config") = ipd::sim::TournamentConfig{},
          py::arg("num_threads") = 0,
          "Run the decision engine against every roster entry",
          py::call_guard<py::gil_scoped_release>());

    m.attr("__version__") = "1.0.0";
}
