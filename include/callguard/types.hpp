#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace callguard {

// Unique identifiers
using ScopeId = std::uint64_t;
using TicketId = std::uint64_t;
using EndpointId = std::string;

// Token counts (may be reconciled downwards, so signed)
using TokenCount = std::int64_t;

// Monetary amounts in USD
using Dollars = double;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Outcome of a single transport attempt or of a whole call
enum class CallOutcome {
    Pending,
    Success,
    Timeout,
    RateLimited,
    TransientError,
    FatalError,
    Cancelled,
    BudgetBlocked
};

// Provider failure classification
enum class ProviderErrorKind {
    Transient,    // network blip, 5xx, overloaded
    RateLimited,  // provider-side 429
    Fatal         // bad credentials, malformed request
};

// Outcome of one semantic (typed) attempt
enum class ValidationOutcome {
    Valid,
    ParseFailed,
    ShapeMismatch
};

struct TokenUsage {
    TokenCount prompt_tokens{0};
    TokenCount completion_tokens{0};
    TokenCount total_tokens{0};
};

// One transport attempt inside a call
struct AttemptRecord {
    std::uint32_t attempt{0};
    CallOutcome outcome{CallOutcome::Pending};
    std::string error;
    Timestamp started_at{};
    Duration elapsed{};
    Duration admission_wait{};
};

// Per logical call, finalized exactly once
struct CallRecord {
    EndpointId endpoint;
    TokenCount estimated_tokens{0};
    std::optional<TokenUsage> actual_usage;
    std::optional<Dollars> cost;
    CallOutcome outcome{CallOutcome::Pending};
    std::uint32_t attempts{0};
    std::vector<AttemptRecord> history;
    std::vector<ScopeId> scope_chain;
    Timestamp started_at{};
    Timestamp finished_at{};

    bool finalized() const noexcept { return outcome != CallOutcome::Pending; }
};

// One semantic attempt of a typed invocation
struct TypedAttempt {
    std::uint32_t attempt{0};
    std::string prompt;
    std::string raw_response;
    ValidationOutcome outcome{ValidationOutcome::ParseFailed};
    std::string detail;  // parse error or shape mismatch, empty when valid
};

inline const char* to_string(CallOutcome o) {
    switch (o) {
        case CallOutcome::Pending:        return "Pending";
        case CallOutcome::Success:        return "Success";
        case CallOutcome::Timeout:        return "Timeout";
        case CallOutcome::RateLimited:    return "RateLimited";
        case CallOutcome::TransientError: return "TransientError";
        case CallOutcome::FatalError:     return "FatalError";
        case CallOutcome::Cancelled:      return "Cancelled";
        case CallOutcome::BudgetBlocked:  return "BudgetBlocked";
    }
    return "Unknown";
}

inline const char* to_string(ProviderErrorKind k) {
    switch (k) {
        case ProviderErrorKind::Transient:   return "Transient";
        case ProviderErrorKind::RateLimited: return "RateLimited";
        case ProviderErrorKind::Fatal:       return "Fatal";
    }
    return "Unknown";
}

inline const char* to_string(ValidationOutcome v) {
    switch (v) {
        case ValidationOutcome::Valid:         return "Valid";
        case ValidationOutcome::ParseFailed:   return "ParseFailed";
        case ValidationOutcome::ShapeMismatch: return "ShapeMismatch";
    }
    return "Unknown";
}

} // namespace callguard
