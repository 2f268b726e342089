#pragma once
#include <pybind11/pybind11.h>
#include <nlohmann/json.hpp>
namespace py = pybind11;

void bind_enums_and_structs(py::module_& m);
void bind_exceptions(py::module_& m);
void bind_core(py::module_& m);
void bind_monitors(py::module_& m);
void bind_typed(py::module_& m);

// JSON values cross the boundary through Python's json module
py::object json_to_python(const nlohmann::json& value);
nlohmann::json json_from_python(const py::handle& value);
