#include "bind_forward.hpp"
#include <callguard/callguard.hpp>
#include <pybind11/stl.h>

using namespace callguard;

// ---------------------------------------------------------------------------
// JSON conversion
// ---------------------------------------------------------------------------
py::object json_to_python(const nlohmann::json& value) {
    return py::module_::import("json").attr("loads")(value.dump());
}

nlohmann::json json_from_python(const py::handle& value) {
    std::string text = py::str(py::module_::import("json").attr("dumps")(value));
    return nlohmann::json::parse(text);
}

// ---------------------------------------------------------------------------
// bind_typed  --  Shape, ShapeField, TypedResult, payload helpers
// ---------------------------------------------------------------------------
void bind_typed(py::module_& m) {

    py::enum_<Shape::Kind>(m, "ShapeKind")
        .value("String",  Shape::Kind::String)
        .value("Integer", Shape::Kind::Integer)
        .value("Number",  Shape::Kind::Number)
        .value("Boolean", Shape::Kind::Boolean)
        .value("List",    Shape::Kind::List)
        .value("Mapping", Shape::Kind::Mapping)
        .value("Object",  Shape::Kind::Object)
        .export_values();

    py::enum_<TypedState>(m, "TypedState")
        .value("Drafting",   TypedState::Drafting)
        .value("Calling",    TypedState::Calling)
        .value("Parsing",    TypedState::Parsing)
        .value("Validating", TypedState::Validating)
        .value("Succeeded",  TypedState::Succeeded)
        .value("Exhausted",  TypedState::Exhausted)
        .export_values();

    // ===================================================================
    // Shape
    // ===================================================================
    py::class_<Shape>(m, "Shape")
        // Factories
        .def_static("string",  &Shape::string,
                    py::arg("allowed") = std::vector<std::string>{})
        .def_static("integer", &Shape::integer,
                    py::arg("min") = std::nullopt, py::arg("max") = std::nullopt)
        .def_static("number",  &Shape::number,
                    py::arg("min") = std::nullopt, py::arg("max") = std::nullopt)
        .def_static("boolean", &Shape::boolean)
        .def_static("list",    &Shape::list,
                    py::arg("element"),
                    py::arg("min_items") = std::nullopt,
                    py::arg("max_items") = std::nullopt)
        .def_static("mapping", &Shape::mapping, py::arg("value"))
        .def_static("object",  &Shape::object, py::arg("fields"))
        // Getters
        .def("kind",           &Shape::kind)
        .def("is_scalar",      &Shape::is_scalar)
        .def("allowed_values", &Shape::allowed_values)
        .def("minimum",        &Shape::minimum)
        .def("maximum",        &Shape::maximum)
        .def("min_items",      &Shape::min_items)
        .def("max_items",      &Shape::max_items)
        .def("element",        &Shape::element, py::return_value_policy::copy)
        .def("fields",         &Shape::fields)
        // Rendering and checking
        .def("describe",       &Shape::describe)
        .def("json_schema", [](const Shape& s) { return json_to_python(s.json_schema()); })
        .def("validate", [](const Shape& s, const py::object& value) {
                 return s.validate(json_from_python(value));
             }, py::arg("value"),
             "Return the first mismatch as '<path>: <problem>', or None.")
        .def("__repr__", [](const Shape& s) {
            return "<Shape kind=" + std::string(to_string(s.kind())) + ">";
        });

    // ===================================================================
    // ShapeField
    // ===================================================================
    py::class_<ShapeField>(m, "ShapeField")
        .def(py::init([](std::string name, Shape shape, std::string description, bool required) {
                 return ShapeField{std::move(name), std::move(shape),
                                   std::move(description), required};
             }),
             py::arg("name"), py::arg("shape"),
             py::arg("description") = "", py::arg("required") = true)
        .def_readwrite("name",        &ShapeField::name)
        .def_readwrite("shape",       &ShapeField::shape)
        .def_readwrite("description", &ShapeField::description)
        .def_readwrite("required",    &ShapeField::required);

    // ===================================================================
    // TypedResult
    // ===================================================================
    py::class_<TypedResult>(m, "TypedResult")
        .def_property_readonly("value",
            [](const TypedResult& r) { return json_to_python(r.value); })
        .def_readonly("attempts",   &TypedResult::attempts)
        .def_readonly("calls",      &TypedResult::calls)
        .def_readonly("total_cost", &TypedResult::total_cost);

    // ---- Payload helpers --------------------------------------------------

    m.def("strip_code_fences", &strip_code_fences, py::arg("text"));
    m.def("format_instructions", &format_instructions, py::arg("shape"));
    m.def("correction_note", &correction_note,
          py::arg("previous_output"), py::arg("problem"));
    m.def("parse_payload",
          [](const std::string& text, const Shape& shape) -> py::object {
              ParsedPayload parsed = parse_payload(text, shape);
              if (!parsed.value.has_value()) {
                  throw py::value_error(parsed.error);
              }
              return json_to_python(parsed.value.value());
          },
          py::arg("text"), py::arg("shape"),
          "Extract a JSON value for shape from text; raises ValueError if none is found.");
}
