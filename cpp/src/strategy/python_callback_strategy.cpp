#include "strategy/python_callback_strategy.hpp"
#include <stdexcept>

namespace ipd::strategy {

PythonCallbackStrategy::PythonCallbackStrategy(py::object py_strategy, std::string name)
    : py_strategy_(std::move(py_strategy)), name_(std::move(name)) {

    // Verify the Python object has the required methods
    if (!py::hasattr(py_strategy_, "decide_move")) {
        throw std::runtime_error("Python strategy must have a 'decide_move()' method");
    }
    if (!py::hasattr(py_strategy_, "update_history")) {
        throw std::runtime_error("Python strategy must have an 'update_history(own, opponent)' method");
    }

    if (name_.empty()) {
        name_ = py::hasattr(py_strategy_, "name")
                    ? py_strategy_.attr("name").cast<std::string>()
                    : std::string("PythonStrategy");
    }
}

Move PythonCallbackStrategy::decide_move() const {
    std::string result = py_strategy_.attr("decide_move")().cast<std::string>();
    if (result.size() != 1) {
        // Map to a value the match rejects instead of guessing
        return static_cast<Move>('?');
    }
    return static_cast<Move>(result[0]);
}

void PythonCallbackStrategy::update_history(Move own_move, Move opponent_move) {
    py_strategy_.attr("update_history")(to_string(own_move), to_string(opponent_move));
}

void PythonCallbackStrategy::reset() {
    if (py::hasattr(py_strategy_, "reset")) {
        py_strategy_.attr("reset")();
    }
}

} // namespace ipd::strategy
