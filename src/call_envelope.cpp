#include "callguard/call_envelope.hpp"
#include "callguard/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <random>
#include <thread>

namespace callguard {

struct CallEnvelope::AttemptResult {
    CallOutcome outcome{CallOutcome::Pending};
    std::optional<ProviderResponse> response;
    std::string error;
};

namespace {

CallOutcome outcome_for(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::Transient:   return CallOutcome::TransientError;
        case ProviderErrorKind::RateLimited: return CallOutcome::RateLimited;
        case ProviderErrorKind::Fatal:       return CallOutcome::FatalError;
    }
    return CallOutcome::TransientError;
}

double to_us(Duration d) {
    return std::chrono::duration<double, std::micro>(d).count();
}

} // anonymous namespace

CallEnvelope::CallEnvelope(AdmissionLimiter& limiter,
                           std::shared_ptr<ProviderAdapter> provider,
                           BudgetLedger& ledger,
                           Duration poll_interval)
    : limiter_(limiter)
    , provider_(std::move(provider))
    , ledger_(ledger)
    , poll_interval_(poll_interval)
{
    if (!provider_) {
        throw std::invalid_argument("CallEnvelope requires a provider");
    }
    if (poll_interval_ <= Duration::zero()) {
        throw InvalidConfigException("poll_interval must be positive");
    }
}

CallResult CallEnvelope::execute(const ProviderRequest& request, const CallOptions& options) {
    const EndpointConfig& cfg = limiter_.config();
    const Duration timeout = options.timeout.value_or(cfg.default_timeout);
    const std::uint32_t max_attempts = options.max_attempts.value_or(cfg.default_max_attempts);
    const std::optional<Duration> admission_wait =
        options.admission_wait.has_value() ? options.admission_wait : cfg.default_admission_wait;
    const CancellationToken* cancel = options.cancel.has_value() ? &options.cancel.value() : nullptr;

    if (timeout <= Duration::zero()) {
        throw InvalidRequestException("Call timeout must be positive");
    }
    if (max_attempts == 0) {
        throw InvalidRequestException("max_attempts must be at least 1");
    }

    CallRecord record;
    record.endpoint = endpoint();
    record.estimated_tokens = provider_->estimate_tokens(request);
    record.started_at = Clock::now();
    if (options.scope.has_value()) {
        record.scope_chain = ledger_.scope_chain(options.scope.value());
    }

    for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1 && !sleep_for(next_delay(attempt - 1), cancel)) {
            fail_cancelled(record);
        }
        if (cancel != nullptr && cancel->cancelled()) {
            fail_cancelled(record);
        }

        // Prevention: never start once a cap in the chain is reached
        if (options.scope.has_value()) {
            try {
                ledger_.ensure_can_start(options.scope.value());
            } catch (BudgetExceededException& e) {
                record.outcome = CallOutcome::BudgetBlocked;
                record.finished_at = Clock::now();
                e.set_record(record);
                throw;
            }
        }

        AttemptRecord attempt_record;
        attempt_record.attempt = attempt;
        attempt_record.started_at = Clock::now();

        std::optional<Timestamp> deadline;
        if (admission_wait.has_value()) {
            deadline = Clock::now() + admission_wait.value();
        }

        Admission admission;
        try {
            admission = limiter_.admit(record.estimated_tokens, deadline, cancel);
        } catch (const CallCancelledException&) {
            fail_cancelled(record);
        } catch (AdmissionTimeoutException& e) {
            record.outcome = CallOutcome::Timeout;
            record.finished_at = Clock::now();
            e.set_record(record);
            throw;
        }
        attempt_record.admission_wait = admission.waited();
        record.attempts = attempt;

        // Other calls may have filled the scope while this one was queued
        if (options.scope.has_value()) {
            try {
                ledger_.ensure_can_start(options.scope.value());
            } catch (BudgetExceededException& e) {
                admission.refund();
                record.outcome = CallOutcome::BudgetBlocked;
                record.finished_at = Clock::now();
                e.set_record(record);
                throw;
            } catch (const ScopeClosedException&) {
                admission.refund();
                throw;
            }
        }

        // Admitted but never sent: give the slot back untouched
        if (cancel != nullptr && cancel->cancelled()) {
            admission.refund();
            attempt_record.outcome = CallOutcome::Cancelled;
            record.history.push_back(attempt_record);
            fail_cancelled(record);
        }

        emit_event(EventType::AttemptStarted,
                   "Attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts),
                   attempt);

        const auto sent_at = Clock::now();
        AttemptResult result = run_attempt(request, timeout, cancel);
        attempt_record.elapsed = Clock::now() - sent_at;
        attempt_record.outcome = result.outcome;
        attempt_record.error = result.error;

        if (result.outcome == CallOutcome::Success) {
            const ProviderResponse& response = result.response.value();
            TokenCount actual = response.usage.total_tokens > 0
                ? response.usage.total_tokens
                : response.usage.prompt_tokens + response.usage.completion_tokens;
            if (actual > 0) {
                admission.reconcile(actual);
            }
            admission.release();

            record.history.push_back(attempt_record);
            record.actual_usage = response.usage;
            record.cost = response.cost;
            record.outcome = CallOutcome::Success;
            record.finished_at = Clock::now();

            emit_event(EventType::AttemptSucceeded, "Response received", attempt,
                       CallOutcome::Success, to_us(attempt_record.elapsed));

            CallResult out;
            out.text = response.text;
            out.usage = response.usage;
            out.cost = response.cost;
            out.model = response.model;
            out.record = record;

            if (options.scope.has_value()) {
                try {
                    ledger_.charge(options.scope.value(), response.cost);
                } catch (BudgetExceededException& e) {
                    e.set_record(record);
                    throw;
                }
            }
            return out;
        }

        // The request reached the provider, so it keeps its place in the window
        admission.release();
        record.history.push_back(attempt_record);

        if (result.outcome == CallOutcome::Cancelled) {
            fail_cancelled(record);
        }

        emit_event(EventType::AttemptFailed, result.error, attempt, result.outcome,
                   to_us(attempt_record.elapsed));

        if (result.outcome == CallOutcome::FatalError) {
            record.outcome = CallOutcome::FatalError;
            record.finished_at = Clock::now();
            emit_event(EventType::CallFatal, result.error, attempt, CallOutcome::FatalError);
            throw ProviderFatalException(result.error, record);
        }
    }

    record.outcome = record.history.empty() ? CallOutcome::TransientError
                                            : record.history.back().outcome;
    record.finished_at = Clock::now();
    emit_event(EventType::CallExhausted,
               "Gave up after " + std::to_string(record.attempts) + " attempts",
               record.attempts, record.outcome);
    throw CallExhaustedException(record);
}

Duration CallEnvelope::backoff_delay(std::uint32_t failed_attempts) const {
    const BackoffConfig& backoff = limiter_.config().backoff;
    if (failed_attempts == 0) return Duration::zero();

    double ticks = static_cast<double>(backoff.base.count()) *
                   std::pow(backoff.multiplier, static_cast<double>(failed_attempts - 1));
    if (ticks >= static_cast<double>(backoff.max.count())) {
        return backoff.max;
    }
    return Duration(static_cast<Duration::rep>(ticks));
}

Duration CallEnvelope::next_delay(std::uint32_t failed_attempts) const {
    Duration delay = backoff_delay(failed_attempts);
    if (!limiter_.config().backoff.jitter || delay <= Duration::zero()) {
        return delay;
    }
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> fraction(0.0, 1.0);
    return std::chrono::duration_cast<Duration>(delay * fraction(rng));
}

void CallEnvelope::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

// ==================== Internal Helpers ====================

CallEnvelope::AttemptResult CallEnvelope::run_attempt(const ProviderRequest& request,
                                                      Duration timeout,
                                                      const CancellationToken* cancel) {
    // The worker owns everything it touches so an abandoned attempt can
    // finish after this envelope is gone
    auto promise = std::make_shared<std::promise<ProviderResponse>>();
    std::future<ProviderResponse> future = promise->get_future();
    std::shared_ptr<ProviderAdapter> provider = provider_;

    std::thread([provider, request, promise]() {
        try {
            promise->set_value(provider->send(request));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    AttemptResult result;
    const Timestamp deadline = Clock::now() + timeout;

    while (true) {
        auto now = Clock::now();
        if (cancel != nullptr && cancel->cancelled()) {
            result.outcome = CallOutcome::Cancelled;
            result.error = "Cancelled while waiting for " + provider_->name();
            return result;
        }
        if (now >= deadline) {
            result.outcome = CallOutcome::Timeout;
            result.error = CallTimeoutException(endpoint(), timeout).what();
            return result;
        }

        Duration slice = deadline - now;
        if (cancel != nullptr) {
            slice = std::min(slice, poll_interval_);
        }
        if (future.wait_for(slice) == std::future_status::ready) {
            break;
        }
    }

    try {
        result.response = future.get();
        result.outcome = CallOutcome::Success;
    } catch (const ProviderException& e) {
        result.outcome = outcome_for(e.kind());
        result.error = e.what();
    } catch (const std::exception& e) {
        // Unclassified adapter failures are retried
        result.outcome = CallOutcome::TransientError;
        result.error = e.what();
    }
    return result;
}

bool CallEnvelope::sleep_for(Duration delay, const CancellationToken* cancel) const {
    const Timestamp until = Clock::now() + delay;
    while (true) {
        if (cancel != nullptr && cancel->cancelled()) return false;
        auto now = Clock::now();
        if (now >= until) return true;
        Duration slice = until - now;
        if (cancel != nullptr) {
            slice = std::min(slice, poll_interval_);
        }
        std::this_thread::sleep_for(slice);
    }
}

void CallEnvelope::fail_cancelled(CallRecord& record) {
    record.outcome = CallOutcome::Cancelled;
    record.finished_at = Clock::now();
    emit_event(EventType::CallCancelled, "Call cancelled by caller",
               record.attempts, CallOutcome::Cancelled);
    throw CallCancelledException(record);
}

void CallEnvelope::emit_event(EventType type, const std::string& message,
                              std::optional<std::uint32_t> attempt,
                              std::optional<CallOutcome> outcome,
                              std::optional<double> duration_us) {
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        mon = monitor_;
    }

    MonitorEvent event{};
    event.type = type;
    event.message = message;
    event.endpoint = endpoint();
    event.attempt = attempt;
    event.outcome = outcome;
    event.duration_us = duration_us;
    emit(mon, std::move(event));
}

} // namespace callguard
