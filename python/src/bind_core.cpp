#include "bind_forward.hpp"
#include <callguard/callguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace callguard;

// ---------------------------------------------------------------------------
// Trampoline class to allow Python subclassing of ProviderAdapter.
// send() runs on a worker thread, so every override takes the GIL. A Python
// exception carrying a `kind` attribute (a ProviderErrorKind) is classified;
// any other exception counts as transient.
// ---------------------------------------------------------------------------
class PyProviderAdapter : public ProviderAdapter {
public:
    using ProviderAdapter::ProviderAdapter;

    ProviderResponse send(const ProviderRequest& request) override {
        py::gil_scoped_acquire acquire;
        try {
            PYBIND11_OVERRIDE_PURE(ProviderResponse, ProviderAdapter, send, request);
        } catch (py::error_already_set& e) {
            py::object value = e.value();
            if (py::hasattr(value, "kind")) {
                ProviderErrorKind kind = value.attr("kind").cast<ProviderErrorKind>();
                throw ProviderException(kind, py::str(value).cast<std::string>());
            }
            throw;
        }
    }

    TokenCount estimate_tokens(const ProviderRequest& request) const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE(TokenCount, ProviderAdapter, estimate_tokens, request);
    }

    std::string name() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, ProviderAdapter, name, );
    }
};

// ---------------------------------------------------------------------------
// Wrapper for std::future<CallResult>
// ---------------------------------------------------------------------------
struct FutureCallResult {
    std::future<CallResult> fut;

    CallResult result() {
        py::gil_scoped_release release;
        return fut.get();
    }

    bool ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

// ---------------------------------------------------------------------------
// bind_core  --  provider types, scopes, call options, Client
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Provider request / response
    // ===================================================================
    py::class_<ProviderRequest>(m, "ProviderRequest")
        .def(py::init<>())
        .def(py::init([](std::string prompt) {
                 ProviderRequest req;
                 req.prompt = std::move(prompt);
                 return req;
             }), py::arg("prompt"))
        .def_readwrite("prompt",            &ProviderRequest::prompt)
        .def_readwrite("system_prompt",     &ProviderRequest::system_prompt)
        .def_readwrite("model",             &ProviderRequest::model)
        .def_readwrite("temperature",       &ProviderRequest::temperature)
        .def_readwrite("max_output_tokens", &ProviderRequest::max_output_tokens);

    py::class_<ProviderResponse>(m, "ProviderResponse")
        .def(py::init<>())
        .def(py::init([](std::string text, Dollars cost) {
                 ProviderResponse resp;
                 resp.text = std::move(text);
                 resp.cost = cost;
                 return resp;
             }), py::arg("text"), py::arg("cost") = 0.0)
        .def_readwrite("text",  &ProviderResponse::text)
        .def_readwrite("usage", &ProviderResponse::usage)
        .def_readwrite("cost",  &ProviderResponse::cost)
        .def_readwrite("model", &ProviderResponse::model);

    py::class_<ProviderAdapter, PyProviderAdapter, std::shared_ptr<ProviderAdapter>>(m, "ProviderAdapter")
        .def(py::init<>())
        .def("send",            &ProviderAdapter::send, py::arg("request"))
        .def("estimate_tokens", &ProviderAdapter::estimate_tokens, py::arg("request"))
        .def("name",            &ProviderAdapter::name);

    // ===================================================================
    // Cancellation and call options
    // ===================================================================
    py::class_<CancellationToken>(m, "CancellationToken")
        .def(py::init<>())
        .def("cancel",    &CancellationToken::cancel)
        .def("cancelled", &CancellationToken::cancelled);

    py::class_<CallOptions>(m, "CallOptions")
        .def(py::init<>())
        .def_readwrite("timeout",        &CallOptions::timeout)
        .def_readwrite("max_attempts",   &CallOptions::max_attempts)
        .def_readwrite("scope",          &CallOptions::scope)
        .def_readwrite("admission_wait", &CallOptions::admission_wait)
        .def_readwrite("cancel",         &CallOptions::cancel);

    py::class_<CallResult>(m, "CallResult")
        .def(py::init<>())
        .def_readwrite("text",   &CallResult::text)
        .def_readwrite("usage",  &CallResult::usage)
        .def_readwrite("cost",   &CallResult::cost)
        .def_readwrite("model",  &CallResult::model)
        .def_readwrite("record", &CallResult::record);

    py::class_<FutureCallResult>(m, "FutureCallResult")
        .def("result", &FutureCallResult::result,
             "Block until the result is available (releases the GIL while waiting).")
        .def("ready",  &FutureCallResult::ready,
             "Return True if the result is available without blocking.");

    // ===================================================================
    // ScopeHandle (usable as a context manager)
    // ===================================================================
    py::class_<ScopeHandle>(m, "ScopeHandle")
        .def("id",            &ScopeHandle::id)
        .def("is_open",       &ScopeHandle::is_open)
        .def("current_usage", &ScopeHandle::current_usage)
        .def("cap",           &ScopeHandle::cap)
        .def("amount_left",   &ScopeHandle::amount_left)
        .def("open_child",    &ScopeHandle::open_child,
             py::arg("cap") = std::nullopt, py::arg("label") = "")
        .def("close",         &ScopeHandle::close)
        .def("__enter__", [](ScopeHandle& self) -> ScopeHandle& { return self; },
             py::return_value_policy::reference)
        .def("__exit__", [](ScopeHandle& self, py::object, py::object, py::object) {
            self.close();
            return false;
        })
        .def("__repr__", [](const ScopeHandle& s) {
            return "<ScopeHandle id=" + std::to_string(s.id())
                 + " usage=" + std::to_string(s.current_usage()) + ">";
        });

    // ===================================================================
    // AdmissionLimiter (read-only queries)
    // ===================================================================
    py::class_<AdmissionLimiter>(m, "AdmissionLimiter")
        .def("requests_in_window", &AdmissionLimiter::requests_in_window)
        .def("tokens_in_window",   &AdmissionLimiter::tokens_in_window)
        .def("available_requests", &AdmissionLimiter::available_requests)
        .def("available_tokens",   &AdmissionLimiter::available_tokens)
        .def("in_flight",          &AdmissionLimiter::in_flight)
        .def("queue_length",       &AdmissionLimiter::queue_length)
        .def("endpoint",           &AdmissionLimiter::endpoint);

    // ===================================================================
    // Client
    // ===================================================================
    py::class_<Client>(m, "Client")
        .def(py::init<Config>(), py::arg("config") = Config{})

        // ------------- Endpoint Registration -------------
        .def("register_endpoint", &Client::register_endpoint,
             py::arg("config"), py::arg("provider"))
        .def("has_endpoint", &Client::has_endpoint, py::arg("endpoint"))
        .def("endpoints",    &Client::endpoints)
        .def("limiter",      &Client::limiter, py::arg("endpoint"),
             py::return_value_policy::reference_internal)

        // ------------- Budget Scopes -------------
        .def("open_scope", &Client::open_scope,
             py::arg("cap") = std::nullopt, py::arg("label") = "")
        .def("current_usage", &Client::current_usage, py::arg("scope"))
        .def("snapshot", [](Client& self, ScopeId scope) {
                 return self.ledger().snapshot(scope);
             }, py::arg("scope"))

        // ------------- Calls -------------
        .def("invoke", &Client::invoke,
             py::arg("endpoint"), py::arg("prompt"),
             py::arg("options") = CallOptions{},
             py::call_guard<py::gil_scoped_release>())
        .def("invoke_detailed", &Client::invoke_detailed,
             py::arg("endpoint"), py::arg("request"),
             py::arg("options") = CallOptions{},
             py::call_guard<py::gil_scoped_release>())
        .def("invoke_async",
             [](Client& self, const EndpointId& endpoint, ProviderRequest request,
                CallOptions options) {
                 return FutureCallResult{
                     self.invoke_async(endpoint, std::move(request), std::move(options))};
             },
             py::arg("endpoint"), py::arg("request"),
             py::arg("options") = CallOptions{})

        // ------------- Typed Calls -------------
        .def("invoke_typed",
             [](Client& self, const EndpointId& endpoint, const std::string& prompt,
                const Shape& shape, std::optional<std::uint32_t> max_attempts,
                const CallOptions& options) {
                 nlohmann::json value;
                 {
                     py::gil_scoped_release release;
                     value = self.invoke_typed(endpoint, prompt, shape, max_attempts, options);
                 }
                 return json_to_python(value);
             },
             py::arg("endpoint"), py::arg("prompt"), py::arg("shape"),
             py::arg("max_attempts") = std::nullopt,
             py::arg("options") = CallOptions{})
        .def("invoke_typed_detailed", &Client::invoke_typed_detailed,
             py::arg("endpoint"), py::arg("request"), py::arg("shape"),
             py::arg("max_attempts") = std::nullopt,
             py::arg("options") = CallOptions{},
             py::call_guard<py::gil_scoped_release>())
        .def("invoke_boolean", &Client::invoke_boolean,
             py::arg("endpoint"), py::arg("prompt"),
             py::arg("true_keyword") = "YES", py::arg("false_keyword") = "NO",
             py::arg("max_attempts") = std::nullopt,
             py::arg("options") = CallOptions{},
             py::call_guard<py::gil_scoped_release>())

        // ------------- Configuration -------------
        .def("set_monitor", &Client::set_monitor, py::arg("monitor"))
        .def("config",      &Client::config);
}
