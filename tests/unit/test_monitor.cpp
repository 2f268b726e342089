#include <gtest/gtest.h>
#include <callguard/callguard.hpp>

#include <atomic>
#include <iostream>
#include <sstream>

using namespace callguard;

namespace {

MonitorEvent make_event(EventType type, std::optional<Dollars> amount = std::nullopt) {
    MonitorEvent event{};
    event.type = type;
    event.timestamp = Clock::now();
    event.message = to_string(type);
    event.amount = amount;
    return event;
}

class CountingMonitor : public Monitor {
public:
    void on_event(const MonitorEvent&) override { seen.fetch_add(1); }
    std::atomic<int> seen{0};
};

// Redirects std::cout for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* old_;
};

} // namespace

// ===========================================================================
// MetricsMonitor
// ===========================================================================

TEST(MetricsMonitorTest, CountsCallEvents) {
    MetricsMonitor metrics;
    metrics.on_event(make_event(EventType::AttemptStarted));
    metrics.on_event(make_event(EventType::AttemptStarted));
    metrics.on_event(make_event(EventType::AttemptSucceeded));

    MonitorEvent timeout = make_event(EventType::AttemptFailed);
    timeout.outcome = CallOutcome::Timeout;
    metrics.on_event(timeout);

    metrics.on_event(make_event(EventType::CallExhausted));
    metrics.on_event(make_event(EventType::BudgetExceeded));

    auto m = metrics.get_metrics();
    EXPECT_EQ(m.attempts, 2u);
    EXPECT_EQ(m.successful_calls, 1u);
    EXPECT_EQ(m.failed_attempts, 1u);
    EXPECT_EQ(m.timed_out_attempts, 1u);
    EXPECT_EQ(m.exhausted_calls, 1u);
    EXPECT_EQ(m.budget_breaches, 1u);
}

TEST(MetricsMonitorTest, AveragesAdmissionWait) {
    MetricsMonitor metrics;

    MonitorEvent fast = make_event(EventType::AdmissionGranted);
    fast.duration_us = 1000.0;
    MonitorEvent slow = make_event(EventType::AdmissionGranted);
    slow.duration_us = 3000.0;
    metrics.on_event(fast);
    metrics.on_event(slow);

    auto m = metrics.get_metrics();
    EXPECT_EQ(m.admissions, 2u);
    EXPECT_DOUBLE_EQ(m.average_admission_wait_ms, 2.0);
}

TEST(MetricsMonitorTest, SpendAlert_FiresOnce) {
    MetricsMonitor metrics;
    int alerts = 0;
    metrics.set_spend_alert_threshold(1.0, [&](const std::string& msg) {
        ++alerts;
        EXPECT_NE(msg.find("exceeds"), std::string::npos);
    });

    metrics.on_event(make_event(EventType::ScopeCharged, 0.6));
    EXPECT_EQ(alerts, 0);
    metrics.on_event(make_event(EventType::ScopeCharged, 0.6));
    metrics.on_event(make_event(EventType::ScopeCharged, 0.6));
    EXPECT_EQ(alerts, 1);
    EXPECT_NEAR(metrics.get_metrics().total_spend, 1.8, 1e-9);
}

TEST(MetricsMonitorTest, Reset_ClearsCounters) {
    MetricsMonitor metrics;
    metrics.on_event(make_event(EventType::AttemptStarted));
    metrics.reset_metrics();
    EXPECT_EQ(metrics.get_metrics().attempts, 0u);
}

// ===========================================================================
// CompositeMonitor and emit()
// ===========================================================================

TEST(CompositeMonitorTest, FansOutToEveryMonitor) {
    auto a = std::make_shared<CountingMonitor>();
    auto b = std::make_shared<CountingMonitor>();
    CompositeMonitor composite;
    composite.add_monitor(a);
    composite.add_monitor(b);

    composite.on_event(make_event(EventType::ScopeOpened));
    EXPECT_EQ(a->seen.load(), 1);
    EXPECT_EQ(b->seen.load(), 1);
}

TEST(EmitTest, NullMonitor_IsIgnored) {
    std::shared_ptr<Monitor> none;
    EXPECT_NO_THROW(emit(none, make_event(EventType::ScopeOpened)));
}

// ===========================================================================
// ConsoleMonitor
// ===========================================================================

TEST(ConsoleMonitorTest, NormalVerbosity_ShowsOnlyImportantEvents) {
    CoutCapture capture;
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Normal);
    console.on_event(make_event(EventType::AdmissionGranted));
    console.on_event(make_event(EventType::BudgetExceeded));

    std::string out = capture.str();
    EXPECT_EQ(out.find("AdmissionGranted"), std::string::npos);
    EXPECT_NE(out.find("[CallGuard]"), std::string::npos);
    EXPECT_NE(out.find("BudgetExceeded"), std::string::npos);
}

TEST(ConsoleMonitorTest, Quiet_PrintsNothing) {
    CoutCapture capture;
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Quiet);
    console.on_event(make_event(EventType::CallFatal));
    EXPECT_TRUE(capture.str().empty());
}
