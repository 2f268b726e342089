#include "callguard/shape.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace callguard {

namespace {

// -2^63; its negation is the first whole double past the int64 range
constexpr double kInt64Lowest = static_cast<double>(std::numeric_limits<std::int64_t>::min());

std::string format_number(double value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

std::string quote_list(const std::vector<std::string>& values) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += nlohmann::json(values[i]).dump();
    }
    return out;
}

std::string bounds_text(std::optional<double> min, std::optional<double> max) {
    if (min.has_value() && max.has_value()) {
        return " between " + format_number(min.value()) + " and " +
               format_number(max.value()) + " inclusive";
    }
    if (min.has_value()) return " no less than " + format_number(min.value());
    if (max.has_value()) return " no greater than " + format_number(max.value());
    return {};
}

std::string items_text(std::optional<std::size_t> min, std::optional<std::size_t> max) {
    if (min.has_value() && max.has_value()) {
        if (min.value() == max.value()) {
            return " (exactly " + std::to_string(min.value()) + " items)";
        }
        return " (" + std::to_string(min.value()) + " to " +
               std::to_string(max.value()) + " items)";
    }
    if (min.has_value()) return " (at least " + std::to_string(min.value()) + " items)";
    if (max.has_value()) return " (at most " + std::to_string(max.value()) + " items)";
    return {};
}

std::string indent(int depth) {
    return std::string(static_cast<std::size_t>(depth) * 2, ' ');
}

} // anonymous namespace

const char* to_string(Shape::Kind kind) {
    switch (kind) {
        case Shape::Kind::String:  return "string";
        case Shape::Kind::Integer: return "integer";
        case Shape::Kind::Number:  return "number";
        case Shape::Kind::Boolean: return "boolean";
        case Shape::Kind::List:    return "list";
        case Shape::Kind::Mapping: return "mapping";
        case Shape::Kind::Object:  return "object";
    }
    return "unknown";
}

// ========== Construction ==========

Shape::Shape(Kind kind) : kind_(kind) {}

Shape Shape::string(std::vector<std::string> allowed) {
    Shape s(Kind::String);
    s.allowed_ = std::move(allowed);
    return s;
}

Shape Shape::integer(std::optional<double> min, std::optional<double> max) {
    if (min.has_value() && max.has_value() && min.value() > max.value()) {
        throw std::invalid_argument("Integer shape minimum exceeds maximum");
    }
    Shape s(Kind::Integer);
    s.min_ = min;
    s.max_ = max;
    return s;
}

Shape Shape::number(std::optional<double> min, std::optional<double> max) {
    if (min.has_value() && max.has_value() && min.value() > max.value()) {
        throw std::invalid_argument("Number shape minimum exceeds maximum");
    }
    Shape s(Kind::Number);
    s.min_ = min;
    s.max_ = max;
    return s;
}

Shape Shape::boolean() {
    return Shape(Kind::Boolean);
}

Shape Shape::list(Shape element, std::optional<std::size_t> min_items,
                  std::optional<std::size_t> max_items) {
    if (min_items.has_value() && max_items.has_value() &&
        min_items.value() > max_items.value()) {
        throw std::invalid_argument("List shape min_items exceeds max_items");
    }
    Shape s(Kind::List);
    s.element_ = std::make_shared<const Shape>(std::move(element));
    s.min_items_ = min_items;
    s.max_items_ = max_items;
    return s;
}

Shape Shape::mapping(Shape value) {
    Shape s(Kind::Mapping);
    s.element_ = std::make_shared<const Shape>(std::move(value));
    return s;
}

Shape Shape::object(std::vector<ShapeField> fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].name.empty()) {
            throw std::invalid_argument("Object shape field names must not be empty");
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (fields[j].name == fields[i].name) {
                throw std::invalid_argument("Duplicate object shape field: " + fields[i].name);
            }
        }
    }
    Shape s(Kind::Object);
    s.fields_ = std::move(fields);
    return s;
}

bool Shape::is_scalar() const noexcept {
    switch (kind_) {
        case Kind::String:
        case Kind::Integer:
        case Kind::Number:
        case Kind::Boolean:
            return true;
        default:
            return false;
    }
}

const Shape& Shape::element() const {
    if (!element_) {
        throw std::logic_error(std::string("A ") + to_string(kind_) +
                               " shape has no element shape");
    }
    return *element_;
}

// ========== Description ==========

std::string Shape::describe() const {
    std::string out;
    describe_into(out, 0);
    return out;
}

void Shape::describe_into(std::string& out, int depth) const {
    switch (kind_) {
        case Kind::String:
            if (allowed_.empty()) {
                out += "a string";
            } else {
                out += "exactly one of the strings " + quote_list(allowed_);
            }
            break;
        case Kind::Integer:
            out += "an integer" + bounds_text(min_, max_);
            break;
        case Kind::Number:
            out += "a number" + bounds_text(min_, max_);
            break;
        case Kind::Boolean:
            out += "a boolean (true or false)";
            break;
        case Kind::List:
            out += "a JSON array" + items_text(min_items_, max_items_) + " where each item is ";
            element_->describe_into(out, depth);
            break;
        case Kind::Mapping:
            out += "a JSON object with string keys where each value is ";
            element_->describe_into(out, depth);
            break;
        case Kind::Object:
            out += "a JSON object with these fields:";
            for (auto& field : fields_) {
                out += "\n" + indent(depth + 1) + "- " + nlohmann::json(field.name).dump() +
                       (field.required ? " (required): " : " (optional): ");
                field.shape.describe_into(out, depth + 1);
                if (!field.description.empty()) {
                    out += ". " + field.description;
                }
            }
            break;
    }
}

nlohmann::json Shape::json_schema() const {
    nlohmann::json schema;
    switch (kind_) {
        case Kind::String:
            schema["type"] = "string";
            if (!allowed_.empty()) schema["enum"] = allowed_;
            break;
        case Kind::Integer:
        case Kind::Number:
            schema["type"] = (kind_ == Kind::Integer) ? "integer" : "number";
            if (min_.has_value()) schema["minimum"] = min_.value();
            if (max_.has_value()) schema["maximum"] = max_.value();
            break;
        case Kind::Boolean:
            schema["type"] = "boolean";
            break;
        case Kind::List:
            schema["type"] = "array";
            schema["items"] = element_->json_schema();
            if (min_items_.has_value()) schema["minItems"] = min_items_.value();
            if (max_items_.has_value()) schema["maxItems"] = max_items_.value();
            break;
        case Kind::Mapping:
            schema["type"] = "object";
            schema["additionalProperties"] = element_->json_schema();
            break;
        case Kind::Object: {
            schema["type"] = "object";
            nlohmann::json properties = nlohmann::json::object();
            nlohmann::json required = nlohmann::json::array();
            for (auto& field : fields_) {
                nlohmann::json property = field.shape.json_schema();
                if (!field.description.empty()) {
                    property["description"] = field.description;
                }
                properties[field.name] = std::move(property);
                if (field.required) required.push_back(field.name);
            }
            schema["properties"] = std::move(properties);
            schema["required"] = std::move(required);
            break;
        }
    }
    return schema;
}

// ========== Validation ==========

std::optional<std::string> Shape::validate(const nlohmann::json& value) const {
    return validate_at(value, "$");
}

std::optional<std::string> Shape::check_bounds(double value, const std::string& path) const {
    if ((min_.has_value() && value < min_.value()) ||
        (max_.has_value() && value > max_.value())) {
        return path + ": " + format_number(value) + " is outside the allowed range" +
               bounds_text(min_, max_);
    }
    return std::nullopt;
}

std::optional<std::string> Shape::validate_at(const nlohmann::json& value,
                                              const std::string& path) const {
    auto mismatch = [&](const std::string& expected) {
        return path + ": expected " + expected + ", got " + value.type_name() +
               " " + value.dump();
    };

    switch (kind_) {
        case Kind::String: {
            if (!value.is_string()) return mismatch("a string");
            if (allowed_.empty()) return std::nullopt;
            const auto& s = value.get_ref<const std::string&>();
            for (auto& allowed : allowed_) {
                if (s == allowed) return std::nullopt;
            }
            return path + ": " + value.dump() + " is not one of " + quote_list(allowed_);
        }
        case Kind::Integer: {
            if (value.is_number_integer()) {
                return check_bounds(value.get<double>(), path);
            }
            // 3.0 is an integer, 3.5 is not; 1e30 does not fit an int64
            if (value.is_number_float()) {
                double d = value.get<double>();
                if (std::isfinite(d) && std::floor(d) == d &&
                    d >= kInt64Lowest && d < -kInt64Lowest) {
                    return check_bounds(d, path);
                }
            }
            return mismatch("an integer");
        }
        case Kind::Number:
            if (!value.is_number()) return mismatch("a number");
            return check_bounds(value.get<double>(), path);
        case Kind::Boolean:
            if (!value.is_boolean()) return mismatch("a boolean");
            return std::nullopt;
        case Kind::List: {
            if (!value.is_array()) return mismatch("an array");
            std::size_t n = value.size();
            if ((min_items_.has_value() && n < min_items_.value()) ||
                (max_items_.has_value() && n > max_items_.value())) {
                return path + ": array has " + std::to_string(n) + " items, expected" +
                       items_text(min_items_, max_items_);
            }
            for (std::size_t i = 0; i < n; ++i) {
                auto problem = element_->validate_at(value[i], path + "[" + std::to_string(i) + "]");
                if (problem.has_value()) return problem;
            }
            return std::nullopt;
        }
        case Kind::Mapping: {
            if (!value.is_object()) return mismatch("an object");
            for (auto it = value.begin(); it != value.end(); ++it) {
                auto problem = element_->validate_at(it.value(), path + "." + it.key());
                if (problem.has_value()) return problem;
            }
            return std::nullopt;
        }
        case Kind::Object: {
            if (!value.is_object()) return mismatch("an object");
            for (auto& field : fields_) {
                auto it = value.find(field.name);
                if (it == value.end()) {
                    if (field.required) {
                        return path + ": missing required field " + nlohmann::json(field.name).dump();
                    }
                    continue;
                }
                auto problem = field.shape.validate_at(*it, path + "." + field.name);
                if (problem.has_value()) return problem;
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace callguard
