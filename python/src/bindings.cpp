#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <callguard/callguard.hpp>

using namespace callguard;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_callguard, m) {
    m.doc() = "CallGuard: rate-limited, budgeted and typed LLM calls";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_monitors(m);
    bind_typed(m);
    bind_core(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<CallOutcome>(m, "CallOutcome")
        .value("Pending",        CallOutcome::Pending)
        .value("Success",        CallOutcome::Success)
        .value("Timeout",        CallOutcome::Timeout)
        .value("RateLimited",    CallOutcome::RateLimited)
        .value("TransientError", CallOutcome::TransientError)
        .value("FatalError",     CallOutcome::FatalError)
        .value("Cancelled",      CallOutcome::Cancelled)
        .value("BudgetBlocked",  CallOutcome::BudgetBlocked)
        .export_values();

    py::enum_<ProviderErrorKind>(m, "ProviderErrorKind")
        .value("Transient",   ProviderErrorKind::Transient)
        .value("RateLimited", ProviderErrorKind::RateLimited)
        .value("Fatal",       ProviderErrorKind::Fatal)
        .export_values();

    py::enum_<ValidationOutcome>(m, "ValidationOutcome")
        .value("Valid",         ValidationOutcome::Valid)
        .value("ParseFailed",   ValidationOutcome::ParseFailed)
        .value("ShapeMismatch", ValidationOutcome::ShapeMismatch)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("ScopeOpened",              EventType::ScopeOpened)
        .value("ScopeClosed",              EventType::ScopeClosed)
        .value("ScopeCharged",             EventType::ScopeCharged)
        .value("ZeroCharge",               EventType::ZeroCharge)
        .value("BudgetExceeded",           EventType::BudgetExceeded)
        .value("AdmissionQueued",          EventType::AdmissionQueued)
        .value("AdmissionGranted",         EventType::AdmissionGranted)
        .value("AdmissionTimedOut",        EventType::AdmissionTimedOut)
        .value("AdmissionCancelled",       EventType::AdmissionCancelled)
        .value("TokensReconciled",         EventType::TokensReconciled)
        .value("AttemptStarted",           EventType::AttemptStarted)
        .value("AttemptSucceeded",         EventType::AttemptSucceeded)
        .value("AttemptFailed",            EventType::AttemptFailed)
        .value("CallExhausted",            EventType::CallExhausted)
        .value("CallFatal",                EventType::CallFatal)
        .value("CallCancelled",            EventType::CallCancelled)
        .value("TypedAttemptRejected",     EventType::TypedAttemptRejected)
        .value("TypedInvocationSucceeded", EventType::TypedInvocationSucceeded)
        .value("TypedInvocationExhausted", EventType::TypedInvocationExhausted)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Structs ----------------------------------------------------------

    py::class_<TokenUsage>(m, "TokenUsage")
        .def(py::init<>())
        .def_readwrite("prompt_tokens",     &TokenUsage::prompt_tokens)
        .def_readwrite("completion_tokens", &TokenUsage::completion_tokens)
        .def_readwrite("total_tokens",      &TokenUsage::total_tokens);

    py::class_<AttemptRecord>(m, "AttemptRecord")
        .def(py::init<>())
        .def_readwrite("attempt",        &AttemptRecord::attempt)
        .def_readwrite("outcome",        &AttemptRecord::outcome)
        .def_readwrite("error",          &AttemptRecord::error)
        .def_readwrite("started_at",     &AttemptRecord::started_at)
        .def_readwrite("elapsed",        &AttemptRecord::elapsed)
        .def_readwrite("admission_wait", &AttemptRecord::admission_wait);

    py::class_<CallRecord>(m, "CallRecord")
        .def(py::init<>())
        .def_readwrite("endpoint",         &CallRecord::endpoint)
        .def_readwrite("estimated_tokens", &CallRecord::estimated_tokens)
        .def_readwrite("actual_usage",     &CallRecord::actual_usage)
        .def_readwrite("cost",             &CallRecord::cost)
        .def_readwrite("outcome",          &CallRecord::outcome)
        .def_readwrite("attempts",         &CallRecord::attempts)
        .def_readwrite("history",          &CallRecord::history)
        .def_readwrite("scope_chain",      &CallRecord::scope_chain)
        .def_readwrite("started_at",       &CallRecord::started_at)
        .def_readwrite("finished_at",      &CallRecord::finished_at)
        .def("finalized", &CallRecord::finalized);

    py::class_<TypedAttempt>(m, "TypedAttempt")
        .def(py::init<>())
        .def_readwrite("attempt",      &TypedAttempt::attempt)
        .def_readwrite("prompt",       &TypedAttempt::prompt)
        .def_readwrite("raw_response", &TypedAttempt::raw_response)
        .def_readwrite("outcome",      &TypedAttempt::outcome)
        .def_readwrite("detail",       &TypedAttempt::detail);

    py::class_<BackoffConfig>(m, "BackoffConfig")
        .def(py::init<>())
        .def_readwrite("base",       &BackoffConfig::base)
        .def_readwrite("multiplier", &BackoffConfig::multiplier)
        .def_readwrite("max",        &BackoffConfig::max)
        .def_readwrite("jitter",     &BackoffConfig::jitter);

    py::class_<EndpointConfig>(m, "EndpointConfig")
        .def(py::init<>())
        .def(py::init([](const std::string& name) {
                 EndpointConfig cfg;
                 cfg.name = name;
                 return cfg;
             }), py::arg("name"))
        .def_readwrite("name",                    &EndpointConfig::name)
        .def_readwrite("max_requests_per_period", &EndpointConfig::max_requests_per_period)
        .def_readwrite("max_tokens_per_period",   &EndpointConfig::max_tokens_per_period)
        .def_readwrite("period",                  &EndpointConfig::period)
        .def_readwrite("max_concurrent",          &EndpointConfig::max_concurrent)
        .def_readwrite("max_queue_size",          &EndpointConfig::max_queue_size)
        .def_readwrite("default_timeout",         &EndpointConfig::default_timeout)
        .def_readwrite("default_max_attempts",    &EndpointConfig::default_max_attempts)
        .def_readwrite("default_typed_attempts",  &EndpointConfig::default_typed_attempts)
        .def_readwrite("default_admission_wait",  &EndpointConfig::default_admission_wait)
        .def_readwrite("backoff",                 &EndpointConfig::backoff);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("poll_interval", &Config::poll_interval)
        .def_readwrite("max_endpoints", &Config::max_endpoints);

    py::class_<ScopeSnapshot>(m, "ScopeSnapshot")
        .def(py::init<>())
        .def_readwrite("id",       &ScopeSnapshot::id)
        .def_readwrite("label",    &ScopeSnapshot::label)
        .def_readwrite("cap",      &ScopeSnapshot::cap)
        .def_readwrite("total",    &ScopeSnapshot::total)
        .def_readwrite("parent",   &ScopeSnapshot::parent)
        .def_readwrite("children", &ScopeSnapshot::children)
        .def_readwrite("open",     &ScopeSnapshot::open);

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",        &MonitorEvent::type)
        .def_readwrite("timestamp",   &MonitorEvent::timestamp)
        .def_readwrite("message",     &MonitorEvent::message)
        .def_readwrite("endpoint",    &MonitorEvent::endpoint)
        .def_readwrite("scope_id",    &MonitorEvent::scope_id)
        .def_readwrite("attempt",     &MonitorEvent::attempt)
        .def_readwrite("tokens",      &MonitorEvent::tokens)
        .def_readwrite("amount",      &MonitorEvent::amount)
        .def_readwrite("outcome",     &MonitorEvent::outcome)
        .def_readwrite("duration_us", &MonitorEvent::duration_us);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("admissions",                &MetricsMonitor::Metrics::admissions)
        .def_readwrite("admission_timeouts",        &MetricsMonitor::Metrics::admission_timeouts)
        .def_readwrite("average_admission_wait_ms", &MetricsMonitor::Metrics::average_admission_wait_ms)
        .def_readwrite("attempts",                  &MetricsMonitor::Metrics::attempts)
        .def_readwrite("successful_calls",          &MetricsMonitor::Metrics::successful_calls)
        .def_readwrite("failed_attempts",           &MetricsMonitor::Metrics::failed_attempts)
        .def_readwrite("timed_out_attempts",        &MetricsMonitor::Metrics::timed_out_attempts)
        .def_readwrite("exhausted_calls",           &MetricsMonitor::Metrics::exhausted_calls)
        .def_readwrite("fatal_calls",               &MetricsMonitor::Metrics::fatal_calls)
        .def_readwrite("cancelled_calls",           &MetricsMonitor::Metrics::cancelled_calls)
        .def_readwrite("budget_breaches",           &MetricsMonitor::Metrics::budget_breaches)
        .def_readwrite("validation_failures",       &MetricsMonitor::Metrics::validation_failures)
        .def_readwrite("total_spend",               &MetricsMonitor::Metrics::total_spend);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_CallGuardError =
        py::register_exception<CallGuardException>(m, "CallGuardError", PyExc_RuntimeError);

    static auto py_InvalidConfigError =
        py::register_exception<InvalidConfigException>(m, "InvalidConfigError", py_CallGuardError.ptr());
    static auto py_InvalidRequestError =
        py::register_exception<InvalidRequestException>(m, "InvalidRequestError", py_CallGuardError.ptr());

    // Derived from InvalidRequestError
    static auto py_EndpointNotFoundError =
        py::register_exception<EndpointNotFoundException>(m, "EndpointNotFoundError", py_InvalidRequestError.ptr());
    static auto py_ScopeClosedError =
        py::register_exception<ScopeClosedException>(m, "ScopeClosedError", py_InvalidRequestError.ptr());

    static auto py_QueueFullError =
        py::register_exception<QueueFullException>(m, "QueueFullError", py_CallGuardError.ptr());
    static auto py_BudgetExceededError =
        py::register_exception<BudgetExceededException>(m, "BudgetExceededError", py_CallGuardError.ptr());
    static auto py_AdmissionTimeoutError =
        py::register_exception<AdmissionTimeoutException>(m, "AdmissionTimeoutError", py_CallGuardError.ptr());
    static auto py_ProviderError =
        py::register_exception<ProviderException>(m, "ProviderError", py_CallGuardError.ptr());

    // Terminal call failures
    static auto py_CallFailedError =
        py::register_exception<CallFailedException>(m, "CallFailedError", py_CallGuardError.ptr());
    static auto py_ProviderFatalError =
        py::register_exception<ProviderFatalException>(m, "ProviderFatalError", py_CallFailedError.ptr());
    static auto py_CallExhaustedError =
        py::register_exception<CallExhaustedException>(m, "CallExhaustedError", py_CallFailedError.ptr());
    static auto py_CallCancelledError =
        py::register_exception<CallCancelledException>(m, "CallCancelledError", py_CallFailedError.ptr());

    static auto py_TypeValidationExhaustedError =
        py::register_exception<TypeValidationExhaustedException>(
            m, "TypeValidationExhaustedError", py_CallGuardError.ptr());
}
