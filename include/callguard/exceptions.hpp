#pragma once

#include "callguard/types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace callguard {

class CallGuardException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidConfigException : public CallGuardException {
public:
    using CallGuardException::CallGuardException;
};

class InvalidRequestException : public CallGuardException {
public:
    using CallGuardException::CallGuardException;
};

class EndpointNotFoundException : public InvalidRequestException {
public:
    explicit EndpointNotFoundException(const EndpointId& endpoint)
        : InvalidRequestException("Endpoint not found: " + endpoint)
        , endpoint_(endpoint) {}

    const EndpointId& endpoint() const noexcept { return endpoint_; }

private:
    EndpointId endpoint_;
};

class QueueFullException : public CallGuardException {
public:
    explicit QueueFullException(const EndpointId& endpoint)
        : CallGuardException("Admission queue is full for endpoint " + endpoint) {}
};

class ScopeClosedException : public InvalidRequestException {
public:
    explicit ScopeClosedException(ScopeId id)
        : InvalidRequestException("Scope is closed or unknown: " + std::to_string(id))
        , scope_id_(id) {}

    ScopeId scope_id() const noexcept { return scope_id_; }

private:
    ScopeId scope_id_;
};

class BudgetExceededException : public CallGuardException {
public:
    BudgetExceededException(ScopeId scope, Dollars cap, Dollars total,
                            bool spend_occurred, std::vector<ScopeId> scope_chain)
        : CallGuardException(
            std::string(spend_occurred ? "Charge pushed scope " : "Scope ") +
            std::to_string(scope) + " to " + std::to_string(total) +
            (spend_occurred ? ", exceeding its cap of " : ", already at its cap of ") +
            std::to_string(cap))
        , scope_id_(scope)
        , cap_(cap)
        , total_(total)
        , spend_occurred_(spend_occurred)
        , scope_chain_(std::move(scope_chain)) {}

    // The scope whose cap was reached
    ScopeId scope_id() const noexcept { return scope_id_; }
    Dollars cap() const noexcept { return cap_; }
    Dollars total() const noexcept { return total_; }

    // false: blocked before any spend; true: a completed call was charged
    bool spend_occurred() const noexcept { return spend_occurred_; }
    const std::vector<ScopeId>& scope_chain() const noexcept { return scope_chain_; }

    // Filled in by CallEnvelope when the breach happened inside a call
    const CallRecord& record() const noexcept { return record_; }
    void set_record(CallRecord record) { record_ = std::move(record); }

private:
    ScopeId scope_id_;
    Dollars cap_;
    Dollars total_;
    bool spend_occurred_;
    std::vector<ScopeId> scope_chain_;
    CallRecord record_;
};

class AdmissionTimeoutException : public CallGuardException {
public:
    AdmissionTimeoutException(const EndpointId& endpoint, Duration waited)
        : CallGuardException(
            "Admission deadline elapsed after " +
            std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(waited).count()) +
            "ms waiting for endpoint " + endpoint)
        , endpoint_(endpoint)
        , waited_(waited) {}

    const EndpointId& endpoint() const noexcept { return endpoint_; }
    Duration waited() const noexcept { return waited_; }

    // Filled in by CallEnvelope; keeps the history of earlier attempts
    const CallRecord& record() const noexcept { return record_; }
    void set_record(CallRecord record) { record_ = std::move(record); }

private:
    EndpointId endpoint_;
    Duration waited_;
    CallRecord record_;
};

// Describes an attempt that outlived its timeout. Not thrown: the message
// goes into AttemptRecord::error and the attempt is retried.
class CallTimeoutException : public CallGuardException {
public:
    CallTimeoutException(const EndpointId& endpoint, Duration timeout)
        : CallGuardException(
            "No response from " + endpoint + " within " +
            std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()) +
            "ms")
        , endpoint_(endpoint)
        , timeout_(timeout) {}

    const EndpointId& endpoint() const noexcept { return endpoint_; }
    Duration timeout() const noexcept { return timeout_; }

private:
    EndpointId endpoint_;
    Duration timeout_;
};

// Thrown by ProviderAdapter implementations
class ProviderException : public CallGuardException {
public:
    ProviderException(ProviderErrorKind kind, const std::string& message)
        : CallGuardException(message)
        , kind_(kind) {}

    ProviderErrorKind kind() const noexcept { return kind_; }
    bool retryable() const noexcept { return kind_ != ProviderErrorKind::Fatal; }

private:
    ProviderErrorKind kind_;
};

// Base for terminal call errors that carry the call's history
class CallFailedException : public CallGuardException {
public:
    CallFailedException(const std::string& message, const CallRecord& record)
        : CallGuardException(message)
        , record_(record) {}

    const CallRecord& record() const noexcept { return record_; }

private:
    CallRecord record_;
};

class ProviderFatalException : public CallFailedException {
public:
    ProviderFatalException(const std::string& cause, const CallRecord& record)
        : CallFailedException(
            "Fatal provider error from " + record.endpoint + " on attempt " +
            std::to_string(record.attempts) + ": " + cause,
            record) {}
};

class CallExhaustedException : public CallFailedException {
public:
    explicit CallExhaustedException(const CallRecord& record)
        : CallFailedException(
            "All " + std::to_string(record.attempts) + " attempts to " +
            record.endpoint + " failed" +
            (record.history.empty() ? std::string()
                                    : ", last error: " + record.history.back().error),
            record) {}
};

class CallCancelledException : public CallFailedException {
public:
    explicit CallCancelledException(const CallRecord& record)
        : CallFailedException("Call to " + record.endpoint + " was cancelled",
                              record) {}
};

class TypeValidationExhaustedException : public CallGuardException {
public:
    TypeValidationExhaustedException(const EndpointId& endpoint,
                                     std::vector<TypedAttempt> attempts)
        : CallGuardException(
            "No valid structured value from " + endpoint + " after " +
            std::to_string(attempts.size()) + " attempts" +
            (attempts.empty() ? std::string()
                              : ", last problem: " + attempts.back().detail))
        , endpoint_(endpoint)
        , attempts_(std::move(attempts)) {}

    const EndpointId& endpoint() const noexcept { return endpoint_; }
    const std::vector<TypedAttempt>& attempts() const noexcept { return attempts_; }

private:
    EndpointId endpoint_;
    std::vector<TypedAttempt> attempts_;
};

} // namespace callguard
