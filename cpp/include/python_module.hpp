#pragma once
#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace ipd {

// Registers every ipd_cpp type and function on m
void bind_python_module(py::module_& m);

} // namespace ipd
