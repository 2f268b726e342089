#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace callguard {

struct ShapeField;

// Expected structure of a typed result. Built through the static factories
// and walked recursively for both the prompt description and validation.
class Shape {
public:
    enum class Kind { String, Integer, Number, Boolean, List, Mapping, Object };

    // allowed: if non-empty, the value must be one of these
    static Shape string(std::vector<std::string> allowed = {});
    static Shape integer(std::optional<double> min = std::nullopt,
                         std::optional<double> max = std::nullopt);
    static Shape number(std::optional<double> min = std::nullopt,
                        std::optional<double> max = std::nullopt);
    static Shape boolean();
    static Shape list(Shape element,
                      std::optional<std::size_t> min_items = std::nullopt,
                      std::optional<std::size_t> max_items = std::nullopt);
    static Shape mapping(Shape value);
    static Shape object(std::vector<ShapeField> fields);

    Kind kind() const noexcept { return kind_; }
    bool is_scalar() const noexcept;

    const std::vector<std::string>& allowed_values() const noexcept { return allowed_; }
    std::optional<double> minimum() const noexcept { return min_; }
    std::optional<double> maximum() const noexcept { return max_; }
    std::optional<std::size_t> min_items() const noexcept { return min_items_; }
    std::optional<std::size_t> max_items() const noexcept { return max_items_; }

    // List element or Mapping value; throws std::logic_error for other kinds
    const Shape& element() const;
    const std::vector<ShapeField>& fields() const noexcept { return fields_; }

    // Human-readable structure, suitable for a prompt
    std::string describe() const;

    // JSON Schema rendering of the same structure
    nlohmann::json json_schema() const;

    // First mismatch as "<path>: <problem>", or nullopt when value fits
    std::optional<std::string> validate(const nlohmann::json& value) const;

private:
    explicit Shape(Kind kind);

    void describe_into(std::string& out, int depth) const;
    std::optional<std::string> validate_at(const nlohmann::json& value,
                                           const std::string& path) const;
    std::optional<std::string> check_bounds(double value, const std::string& path) const;

    Kind kind_;
    std::vector<std::string> allowed_;
    std::optional<double> min_;
    std::optional<double> max_;
    std::optional<std::size_t> min_items_;
    std::optional<std::size_t> max_items_;
    std::shared_ptr<const Shape> element_;
    std::vector<ShapeField> fields_;
};

struct ShapeField {
    std::string name;
    Shape shape;
    std::string description;
    bool required = true;
};

const char* to_string(Shape::Kind kind);

} // namespace callguard
