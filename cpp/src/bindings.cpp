#include "../include/python_module.hpp"

PYBIND11_MODULE(ipd_cpp, m) {
    ipd::bind_python_module(m);
}
