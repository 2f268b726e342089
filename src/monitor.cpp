#include "callguard/monitor.hpp"

#include <iomanip>
#include <iostream>

namespace callguard {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::ScopeOpened:              return "ScopeOpened";
        case EventType::ScopeClosed:              return "ScopeClosed";
        case EventType::ScopeCharged:             return "ScopeCharged";
        case EventType::ZeroCharge:               return "ZeroCharge";
        case EventType::BudgetExceeded:           return "BudgetExceeded";
        case EventType::AdmissionQueued:          return "AdmissionQueued";
        case EventType::AdmissionGranted:         return "AdmissionGranted";
        case EventType::AdmissionTimedOut:        return "AdmissionTimedOut";
        case EventType::AdmissionCancelled:       return "AdmissionCancelled";
        case EventType::TokensReconciled:         return "TokensReconciled";
        case EventType::AttemptStarted:           return "AttemptStarted";
        case EventType::AttemptSucceeded:         return "AttemptSucceeded";
        case EventType::AttemptFailed:            return "AttemptFailed";
        case EventType::CallExhausted:            return "CallExhausted";
        case EventType::CallFatal:                return "CallFatal";
        case EventType::CallCancelled:            return "CallCancelled";
        case EventType::TypedAttemptRejected:     return "TypedAttemptRejected";
        case EventType::TypedInvocationSucceeded: return "TypedInvocationSucceeded";
        case EventType::TypedInvocationExhausted: return "TypedInvocationExhausted";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::BudgetExceeded:
        case EventType::ZeroCharge:
        case EventType::AdmissionTimedOut:
        case EventType::AttemptFailed:
        case EventType::CallExhausted:
        case EventType::CallFatal:
        case EventType::CallCancelled:
        case EventType::TypedAttemptRejected:
        case EventType::TypedInvocationExhausted:
            return true;
        default:
            return false;
    }
}

// Chatty per-call events only shown at Debug
bool is_debug_event(EventType t) {
    switch (t) {
        case EventType::AdmissionQueued:
        case EventType::TokensReconciled:
        case EventType::AttemptStarted:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

void emit(const std::shared_ptr<Monitor>& monitor, MonitorEvent event) {
    if (!monitor) return;
    if (event.timestamp == Timestamp{}) {
        event.timestamp = Clock::now();
    }
    monitor->on_event(event);
}

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && is_debug_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[CallGuard] " << to_string(event.type);

    if (event.endpoint.has_value()) {
        std::cout << " endpoint=" << event.endpoint.value();
    }
    if (event.scope_id.has_value()) {
        std::cout << " scope=" << event.scope_id.value();
    }
    if (event.attempt.has_value()) {
        std::cout << " attempt=" << event.attempt.value();
    }
    if (event.tokens.has_value()) {
        std::cout << " tokens=" << event.tokens.value();
    }
    if (event.amount.has_value()) {
        std::cout << " amount=$" << std::fixed << std::setprecision(4)
                  << event.amount.value() << std::defaultfloat;
    }
    if (event.outcome.has_value()) {
        std::cout << " outcome=" << to_string(event.outcome.value());
    }
    if (event.duration_us.has_value()) {
        std::cout << " took=" << std::fixed << std::setprecision(1)
                  << event.duration_us.value() / 1000.0 << "ms" << std::defaultfloat;
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    AlertCallback fire;
    std::string alert;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        switch (event.type) {
            case EventType::AdmissionGranted:
                metrics_.admissions++;
                if (event.duration_us.has_value()) {
                    admission_wait_samples_++;
                    admission_wait_sum_ms_ += event.duration_us.value() / 1000.0;
                    metrics_.average_admission_wait_ms =
                        admission_wait_sum_ms_ / static_cast<double>(admission_wait_samples_);
                }
                break;
            case EventType::AdmissionTimedOut:
                metrics_.admission_timeouts++;
                break;
            case EventType::AttemptStarted:
                metrics_.attempts++;
                break;
            case EventType::AttemptSucceeded:
                metrics_.successful_calls++;
                break;
            case EventType::AttemptFailed:
                metrics_.failed_attempts++;
                if (event.outcome == CallOutcome::Timeout) {
                    metrics_.timed_out_attempts++;
                }
                break;
            case EventType::CallExhausted:
                metrics_.exhausted_calls++;
                break;
            case EventType::CallFatal:
                metrics_.fatal_calls++;
                break;
            case EventType::CallCancelled:
                metrics_.cancelled_calls++;
                break;
            case EventType::BudgetExceeded:
                metrics_.budget_breaches++;
                break;
            case EventType::TypedAttemptRejected:
                metrics_.validation_failures++;
                break;
            case EventType::ScopeCharged:
                // Charges are reported once per call at the innermost scope
                if (event.amount.has_value()) {
                    metrics_.total_spend += event.amount.value();
                }
                break;
            default:
                break;
        }

        if (spend_cb_ && spend_threshold_.has_value() && !spend_alert_fired_ &&
            metrics_.total_spend > spend_threshold_.value()) {
            spend_alert_fired_ = true;
            fire = spend_cb_;
            alert = "Total spend $" + std::to_string(metrics_.total_spend) +
                    " exceeds threshold $" + std::to_string(spend_threshold_.value());
        }
    }

    // Callback runs outside the lock so it may query get_metrics()
    if (fire) {
        fire(alert);
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    admission_wait_samples_ = 0;
    admission_wait_sum_ms_ = 0.0;
    spend_alert_fired_ = false;
}

void MetricsMonitor::set_spend_alert_threshold(Dollars threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    spend_threshold_ = threshold;
    spend_cb_ = std::move(cb);
    spend_alert_fired_ = false;
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitors_mutex_);
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    std::vector<std::shared_ptr<Monitor>> targets;
    {
        std::lock_guard<std::mutex> lock(monitors_mutex_);
        targets = monitors_;
    }
    for (auto& m : targets) {
        m->on_event(event);
    }
}

} // namespace callguard
