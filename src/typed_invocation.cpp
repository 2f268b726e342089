#include "callguard/typed_invocation.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace callguard {

namespace {

// Longest stretch of a rejected response quoted back to the model
constexpr std::size_t kMaxQuotedOutput = 2000;

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

std::optional<nlohmann::json> try_parse(const std::string& text) {
    nlohmann::json value = nlohmann::json::parse(text, nullptr, false);
    if (value.is_discarded()) return std::nullopt;
    return value;
}

// Earliest '{' or '[' that has a matching closer later on, through the
// last such closer
std::optional<std::string> outermost_span(const std::string& text) {
    auto last_brace = text.rfind('}');
    auto last_bracket = text.rfind(']');
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '{' && last_brace != std::string::npos && last_brace > i) {
            return text.substr(i, last_brace - i + 1);
        }
        if (text[i] == '[' && last_bracket != std::string::npos && last_bracket > i) {
            return text.substr(i, last_bracket - i + 1);
        }
    }
    return std::nullopt;
}

std::optional<nlohmann::json> bare_scalar(const std::string& text, Shape::Kind kind) {
    std::smatch match;
    if (kind == Shape::Kind::Boolean) {
        static const std::regex boolean_re(R"(\b(true|false)\b)", std::regex::icase);
        if (std::regex_search(text, match, boolean_re)) {
            std::string word = match.str(1);
            std::transform(word.begin(), word.end(), word.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return nlohmann::json(word == "true");
        }
        return std::nullopt;
    }
    if (kind == Shape::Kind::Integer || kind == Shape::Kind::Number) {
        // Prose with several different numbers is ambiguous; leave it to a correction
        static const std::regex number_re(R"(-?\d+(?:\.\d+)?(?:[eE][+-]?\d+)?)");
        std::optional<nlohmann::json> found;
        for (std::sregex_iterator it(text.begin(), text.end(), number_re), end; it != end; ++it) {
            auto value = try_parse(it->str(0));
            if (!value.has_value()) continue;
            if (found.has_value() && found.value() != value.value()) return std::nullopt;
            found = std::move(value);
        }
        return found;
    }
    return std::nullopt;
}

} // anonymous namespace

const char* to_string(TypedState state) {
    switch (state) {
        case TypedState::Drafting:   return "Drafting";
        case TypedState::Calling:    return "Calling";
        case TypedState::Parsing:    return "Parsing";
        case TypedState::Validating: return "Validating";
        case TypedState::Succeeded:  return "Succeeded";
        case TypedState::Exhausted:  return "Exhausted";
    }
    return "Unknown";
}

// ========== Payload Extraction ==========

std::string strip_code_fences(const std::string& text) {
    std::string s = trim(text);
    if (s.rfind("```", 0) != 0) return s;

    auto first_newline = s.find('\n');
    if (first_newline == std::string::npos) {
        return trim(s.substr(3));
    }
    std::string body = s.substr(first_newline + 1);
    auto closing = body.rfind("```");
    if (closing != std::string::npos) {
        body = body.substr(0, closing);
    }
    return trim(body);
}

ParsedPayload parse_payload(const std::string& text, const Shape& shape) {
    ParsedPayload out;
    const std::string cleaned = strip_code_fences(text);

    if (shape.kind() == Shape::Kind::String) {
        auto parsed = try_parse(cleaned);
        if (parsed.has_value() && parsed->is_string()) {
            out.value = std::move(parsed);
        } else {
            out.value = nlohmann::json(cleaned);
        }
        return out;
    }

    if (shape.kind() == Shape::Kind::List && cleaned.empty()) {
        out.value = nlohmann::json::array();
        return out;
    }

    if (auto whole = try_parse(cleaned)) {
        out.value = std::move(whole);
        return out;
    }

    if (auto span = outermost_span(cleaned)) {
        if (auto inner = try_parse(span.value())) {
            out.value = std::move(inner);
            return out;
        }
    }

    if (shape.is_scalar()) {
        if (auto scalar = bare_scalar(cleaned, shape.kind())) {
            out.value = std::move(scalar);
            return out;
        }
    }

    out.error = cleaned.empty() ? std::string("Response was empty")
                                : std::string("No parsable JSON value found in response");
    return out;
}

std::string format_instructions(const Shape& shape) {
    if (shape.kind() == Shape::Kind::String) {
        if (shape.allowed_values().empty()) {
            return "Respond with only the requested text, without any preamble.";
        }
        return "Respond with " + shape.describe() + " and nothing else.";
    }
    return "Respond with only a JSON value and no surrounding commentary. "
           "The value must be " + shape.describe() +
           "\n\nIt must conform to this JSON Schema:\n```json\n" +
           shape.json_schema().dump(2) + "\n```";
}

std::string correction_note(const std::string& previous_output, const std::string& problem) {
    std::string quoted = previous_output.size() > kMaxQuotedOutput
        ? previous_output.substr(0, kMaxQuotedOutput) + "..."
        : previous_output;
    return "Your previous response was:\n" + quoted +
           "\n\nIt was rejected because: " + problem +
           "\nRespond again, following the format instructions exactly.";
}

// ========== TypedInvoker ==========

TypedInvoker::TypedInvoker(CallEnvelope& envelope)
    : envelope_(envelope)
{}

TypedResult TypedInvoker::invoke(const ProviderRequest& request, const Shape& shape,
                                 std::optional<std::uint32_t> max_attempts,
                                 const CallOptions& options) {
    return run(request, format_instructions(shape), shape_parser(shape),
               shape_validator(shape), max_attempts, options);
}

bool TypedInvoker::invoke_boolean(const ProviderRequest& request,
                                  const std::string& true_keyword,
                                  const std::string& false_keyword,
                                  std::optional<std::uint32_t> max_attempts,
                                  const CallOptions& options) {
    if (true_keyword.empty() || false_keyword.empty() || true_keyword == false_keyword) {
        throw InvalidRequestException("Boolean keywords must be distinct and non-empty");
    }

    Parser parse = [true_keyword, false_keyword](const std::string& text) {
        ParsedPayload out;
        auto true_at = text.rfind(true_keyword);
        auto false_at = text.rfind(false_keyword);
        if (true_at == std::string::npos && false_at == std::string::npos) {
            out.error = "Response contains neither " + true_keyword + " nor " + false_keyword;
        } else if (false_at == std::string::npos) {
            out.value = true;
        } else if (true_at == std::string::npos) {
            out.value = false;
        } else {
            // Last occurrence wins
            out.value = true_at > false_at;
        }
        return out;
    };
    Validator accept = [](const nlohmann::json&) -> std::optional<std::string> {
        return std::nullopt;
    };

    std::string instructions = "Finish your response with " + true_keyword + " or " +
                               false_keyword + ".";
    TypedResult result = run(request, instructions, parse, accept, max_attempts, options);
    return result.value.get<bool>();
}

void TypedInvoker::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

TypedInvoker::Parser TypedInvoker::shape_parser(const Shape& shape) {
    return [shape](const std::string& text) { return parse_payload(text, shape); };
}

TypedInvoker::Validator TypedInvoker::shape_validator(const Shape& shape, Validator extra) {
    return [shape, extra](const nlohmann::json& value) -> std::optional<std::string> {
        if (auto problem = shape.validate(value)) return problem;
        if (extra) return extra(value);
        return std::nullopt;
    };
}

TypedResult TypedInvoker::run(const ProviderRequest& request, const std::string& instructions,
                              const Parser& parse, const Validator& validate,
                              std::optional<std::uint32_t> max_attempts,
                              const CallOptions& options) {
    const std::uint32_t attempts_allowed =
        max_attempts.value_or(envelope_.config().default_typed_attempts);
    if (attempts_allowed == 0) {
        throw InvalidRequestException("max_attempts must be at least 1");
    }

    TypedResult result;
    TypedState state = TypedState::Drafting;
    std::vector<std::string> corrections;
    ProviderRequest attempt_request = request;
    TypedAttempt current;
    nlohmann::json candidate;

    auto reject = [&](ValidationOutcome outcome, const std::string& detail) {
        current.outcome = outcome;
        current.detail = detail;
        result.attempts.push_back(current);
        emit_event(EventType::TypedAttemptRejected,
                   std::string(to_string(outcome)) + ": " + detail, current.attempt);
        corrections.push_back(correction_note(current.raw_response, detail));
        return (result.attempts.size() >= attempts_allowed) ? TypedState::Exhausted
                                                            : TypedState::Drafting;
    };

    while (state != TypedState::Succeeded && state != TypedState::Exhausted) {
        switch (state) {
            case TypedState::Drafting: {
                current = TypedAttempt{};
                current.attempt = static_cast<std::uint32_t>(result.attempts.size()) + 1;
                std::string prompt = request.prompt + "\n\n" + instructions;
                for (auto& note : corrections) {
                    prompt += "\n\n" + note;
                }
                attempt_request.prompt = prompt;
                current.prompt = std::move(prompt);
                state = TypedState::Calling;
                break;
            }
            case TypedState::Calling: {
                CallResult call = envelope_.execute(attempt_request, options);
                current.raw_response = call.text;
                result.total_cost += call.cost;
                result.calls.push_back(std::move(call.record));
                state = TypedState::Parsing;
                break;
            }
            case TypedState::Parsing: {
                ParsedPayload payload = parse(current.raw_response);
                if (payload.value.has_value()) {
                    candidate = std::move(payload.value.value());
                    state = TypedState::Validating;
                } else {
                    state = reject(ValidationOutcome::ParseFailed, payload.error);
                }
                break;
            }
            case TypedState::Validating: {
                if (auto problem = validate(candidate)) {
                    state = reject(ValidationOutcome::ShapeMismatch, problem.value());
                } else {
                    current.outcome = ValidationOutcome::Valid;
                    result.attempts.push_back(current);
                    result.value = std::move(candidate);
                    state = TypedState::Succeeded;
                }
                break;
            }
            case TypedState::Succeeded:
            case TypedState::Exhausted:
                break;
        }
    }

    const auto used = static_cast<std::uint32_t>(result.attempts.size());
    if (state == TypedState::Exhausted) {
        emit_event(EventType::TypedInvocationExhausted,
                   "No valid value after " + std::to_string(used) + " attempts",
                   used, result.total_cost);
        throw TypeValidationExhaustedException(envelope_.endpoint(), std::move(result.attempts));
    }

    emit_event(EventType::TypedInvocationSucceeded, "Valid value received",
               used, result.total_cost);
    return result;
}

void TypedInvoker::emit_event(EventType type, const std::string& message,
                              std::uint32_t attempt, std::optional<Dollars> amount) {
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        mon = monitor_;
    }

    MonitorEvent event{};
    event.type = type;
    event.message = message;
    event.endpoint = envelope_.endpoint();
    event.attempt = attempt;
    event.amount = amount;
    emit(mon, std::move(event));
}

} // namespace callguard
