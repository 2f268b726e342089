#pragma once

#include "callguard/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace callguard {

enum class EventType {
    // Budget ledger
    ScopeOpened,
    ScopeClosed,
    ScopeCharged,
    ZeroCharge,
    BudgetExceeded,
    // Admission limiter
    AdmissionQueued,
    AdmissionGranted,
    AdmissionTimedOut,
    AdmissionCancelled,
    TokensReconciled,
    // Call envelope
    AttemptStarted,
    AttemptSucceeded,
    AttemptFailed,
    CallExhausted,
    CallFatal,
    CallCancelled,
    // Typed invocation
    TypedAttemptRejected,
    TypedInvocationSucceeded,
    TypedInvocationExhausted
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<EndpointId> endpoint;
    std::optional<ScopeId> scope_id;
    std::optional<std::uint32_t> attempt;
    std::optional<TokenCount> tokens;
    std::optional<Dollars> amount;
    std::optional<CallOutcome> outcome;

    // How long the operation blocked, in microseconds (admission wait, attempt time)
    std::optional<double> duration_us;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t admissions{0};
        std::uint64_t admission_timeouts{0};
        double average_admission_wait_ms{0.0};
        std::uint64_t attempts{0};
        std::uint64_t successful_calls{0};
        std::uint64_t failed_attempts{0};
        std::uint64_t timed_out_attempts{0};
        std::uint64_t exhausted_calls{0};
        std::uint64_t fatal_calls{0};
        std::uint64_t cancelled_calls{0};
        std::uint64_t budget_breaches{0};
        std::uint64_t validation_failures{0};
        Dollars total_spend{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;

    // Fires once each time total spend crosses the threshold
    void set_spend_alert_threshold(Dollars threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    std::optional<Dollars> spend_threshold_;
    AlertCallback spend_cb_;
    bool spend_alert_fired_{false};

    std::uint64_t admission_wait_samples_{0};
    double admission_wait_sum_ms_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;

private:
    std::mutex monitors_mutex_;
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

// Null-safe emit helper shared by the components
void emit(const std::shared_ptr<Monitor>& monitor, MonitorEvent event);

} // namespace callguard
