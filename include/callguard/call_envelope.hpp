#pragma once

#include "callguard/types.hpp"
#include "callguard/admission_limiter.hpp"
#include "callguard/budget_ledger.hpp"
#include "callguard/cancellation.hpp"
#include "callguard/monitor.hpp"
#include "callguard/provider.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace callguard {

// Per-call overrides. Unset fields fall back to the endpoint's defaults.
struct CallOptions {
    std::optional<Duration> timeout;
    std::optional<std::uint32_t> max_attempts;

    // Scope charged on success; nullopt means the call is not metered
    std::optional<ScopeId> scope;

    // Limit on the wait for each admission, relative to when it starts
    std::optional<Duration> admission_wait;

    std::optional<CancellationToken> cancel;
};

struct CallResult {
    std::string text;
    TokenUsage usage;
    Dollars cost{0.0};
    std::string model;
    CallRecord record;
};

// Runs one logical call against one endpoint: admission, per-attempt
// timeout, classified retries with backoff, and a single charge on success.
class CallEnvelope {
public:
    CallEnvelope(AdmissionLimiter& limiter,
                 std::shared_ptr<ProviderAdapter> provider,
                 BudgetLedger& ledger,
                 Duration poll_interval = std::chrono::milliseconds(10));

    CallEnvelope(const CallEnvelope&) = delete;
    CallEnvelope& operator=(const CallEnvelope&) = delete;

    // Throws ProviderFatalException, CallExhaustedException,
    // CallCancelledException, AdmissionTimeoutException or
    // BudgetExceededException. Nothing is charged unless an attempt succeeds.
    CallResult execute(const ProviderRequest& request, const CallOptions& options = {});

    // Delay before attempt (failed_attempts + 1), without jitter
    Duration backoff_delay(std::uint32_t failed_attempts) const;

    // backoff_delay() scaled by a uniform random fraction when jitter is on
    Duration next_delay(std::uint32_t failed_attempts) const;

    const EndpointId& endpoint() const noexcept { return limiter_.endpoint(); }
    const EndpointConfig& config() const noexcept { return limiter_.config(); }
    const std::shared_ptr<ProviderAdapter>& provider() const noexcept { return provider_; }

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct AttemptResult;

    AdmissionLimiter& limiter_;
    std::shared_ptr<ProviderAdapter> provider_;
    BudgetLedger& ledger_;
    Duration poll_interval_;

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    // Sends on a detached worker and waits at most timeout for the answer.
    // A response arriving after the wait ends is dropped.
    AttemptResult run_attempt(const ProviderRequest& request, Duration timeout,
                              const CancellationToken* cancel);

    // Returns false if cancel fired before the delay ran out
    bool sleep_for(Duration delay, const CancellationToken* cancel) const;

    [[noreturn]] void fail_cancelled(CallRecord& record);

    void emit_event(EventType type, const std::string& message,
                    std::optional<std::uint32_t> attempt = std::nullopt,
                    std::optional<CallOutcome> outcome = std::nullopt,
                    std::optional<double> duration_us = std::nullopt);
};

} // namespace callguard
