// common includes for all binding modules
#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

namespace py = pybind11;

// forward declarations for bind functions
void bind_data(py::module_ &m);
void bind_tests(py::module_ &m);
void bind_analysis(py::module_ &m);
