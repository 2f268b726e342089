#pragma once

#include "callguard/call_envelope.hpp"
#include "callguard/exceptions.hpp"
#include "callguard/shape.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace callguard {

// Steps of one typed invocation. Succeeded and Exhausted are terminal.
enum class TypedState {
    Drafting,
    Calling,
    Parsing,
    Validating,
    Succeeded,
    Exhausted
};

const char* to_string(TypedState state);

struct TypedResult {
    nlohmann::json value;
    std::vector<TypedAttempt> attempts;

    // One record per executed semantic attempt
    std::vector<CallRecord> calls;
    Dollars total_cost{0.0};
};

struct ParsedPayload {
    std::optional<nlohmann::json> value;
    std::string error;
};

// Removes a surrounding ``` or ```json fence, if any
std::string strip_code_fences(const std::string& text);

// Pulls a JSON value for shape out of free-form model output
ParsedPayload parse_payload(const std::string& text, const Shape& shape);

// Text appended to the caller's prompt telling the model what to return
std::string format_instructions(const Shape& shape);

// Note appended after a rejected attempt
std::string correction_note(const std::string& previous_output, const std::string& problem);

// Drives repeated calls until the output parses and matches a shape.
// Transport failures from the envelope propagate unchanged.
class TypedInvoker {
public:
    explicit TypedInvoker(CallEnvelope& envelope);

    // max_attempts defaults to the endpoint's default_typed_attempts.
    // Throws TypeValidationExhaustedException after that many rejections.
    TypedResult invoke(const ProviderRequest& request, const Shape& shape,
                       std::optional<std::uint32_t> max_attempts = std::nullopt,
                       const CallOptions& options = {});

    // Converts through nlohmann::json's from_json. A value that fits the
    // shape but not T counts as a rejected attempt.
    template <typename T>
    T invoke_as(const ProviderRequest& request, const Shape& shape,
                std::optional<std::uint32_t> max_attempts = std::nullopt,
                const CallOptions& options = {}) {
        auto converts = [](const nlohmann::json& value) -> std::optional<std::string> {
            try {
                (void)value.get<T>();
                return std::nullopt;
            } catch (const nlohmann::json::exception& e) {
                return std::string("$: value does not convert: ") + e.what();
            }
        };
        TypedResult result = run(request, format_instructions(shape),
                                 shape_parser(shape), shape_validator(shape, converts),
                                 max_attempts, options);
        return result.value.get<T>();
    }

    // Maps the response to true or false by whichever keyword occurs last.
    // Retries when neither occurs.
    bool invoke_boolean(const ProviderRequest& request,
                        const std::string& true_keyword = "YES",
                        const std::string& false_keyword = "NO",
                        std::optional<std::uint32_t> max_attempts = std::nullopt,
                        const CallOptions& options = {});

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    using Parser = std::function<ParsedPayload(const std::string&)>;
    using Validator = std::function<std::optional<std::string>(const nlohmann::json&)>;

    CallEnvelope& envelope_;

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    static Parser shape_parser(const Shape& shape);
    static Validator shape_validator(const Shape& shape, Validator extra = nullptr);

    TypedResult run(const ProviderRequest& request, const std::string& instructions,
                    const Parser& parse, const Validator& validate,
                    std::optional<std::uint32_t> max_attempts, const CallOptions& options);

    void emit_event(EventType type, const std::string& message, std::uint32_t attempt,
                    std::optional<Dollars> amount = std::nullopt);
};

} // namespace callguard
