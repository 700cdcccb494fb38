#pragma once

#include "strategy.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace ipd::strategy {

/**
 * Strategy that calls back into a Python object.
 *
 * Lets strategies written on the Python side enter a C++ match. Moves cross
 * the boundary as one-character strings ("C" / "D") and are passed through
 * unchecked; the match validates them like any other move.
 */
class PythonCallbackStrategy : public Strategy {
public:
    /**
     * Create strategy with Python object.
     *
     * @param py_strategy Object with decide_move() -> str and
     *                    update_history(own, opponent) methods; reset() is optional
     * @param name Label used in results; falls back to py_strategy.name
     */
    explicit PythonCallbackStrategy(py::object py_strategy, std::string name = "");

    ~PythonCallbackStrategy() override = default;

    std::string name() const override { return name_; }
    Move decide_move() const override;
    void update_history(Move own_move, Move opponent_move) override;
    void reset() override;

private:
    py::object py_strategy_;  // Python strategy object
    std::string name_;
};

} // namespace ipd::strategy
