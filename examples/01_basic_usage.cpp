// 01_basic_usage.cpp
//
// Minimal CallGuard example: one endpoint, one budget scope.
// Demonstrates a plain call, a call that recovers from a transient
// provider failure, and the per-call record the envelope keeps.
//
// Scenario:
//   - A simulated provider answers every prompt, but fails the first
//     time it sees the word "flaky".
//   - Every call runs under a $0.50 scope, so the client tracks spend.
//   - Failed attempts are retried with backoff and never charged.

#include <callguard/callguard.hpp>

#include <atomic>
#include <iostream>
#include <string>

using namespace callguard;
using namespace std::chrono_literals;

// Stand-in for a real HTTP adapter
class SimulatedProvider : public ProviderAdapter {
public:
    ProviderResponse send(const ProviderRequest& request) override {
        if (request.prompt.find("flaky") != std::string::npos && !failed_once_.exchange(true)) {
            throw ProviderException(ProviderErrorKind::Transient, "HTTP 503 Service Unavailable");
        }

        ProviderResponse response;
        response.text = "You said: " + request.prompt;
        response.usage.prompt_tokens = static_cast<TokenCount>(request.prompt.size() / 4 + 1);
        response.usage.completion_tokens = 12;
        response.usage.total_tokens = response.usage.prompt_tokens + 12;
        response.cost = 0.002;
        response.model = "sim-small";
        return response;
    }

    std::string name() const override { return "simulated"; }

private:
    std::atomic<bool> failed_once_{false};
};

int main() {
    std::cout << "=== CallGuard: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the client and attach a console monitor.
    // ----------------------------------------------------------------
    Client client;
    client.set_monitor(
        std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Register an endpoint: 60 requests per minute, 10 s per attempt.
    // ----------------------------------------------------------------
    EndpointConfig endpoint;
    endpoint.name = "sim";
    endpoint.max_requests_per_period = 60;
    endpoint.period = 60s;
    endpoint.default_timeout = 10s;
    endpoint.backoff.base = 100ms;
    client.register_endpoint(endpoint, std::make_shared<SimulatedProvider>());

    // ----------------------------------------------------------------
    // 3. Open a budget scope and make two calls under it.
    // ----------------------------------------------------------------
    auto scope = client.open_scope(0.50, "basic-example");
    CallOptions options;
    options.scope = scope.id();

    std::cout << "\n" << client.invoke("sim", "Hello there", options) << "\n\n";

    ProviderRequest request;
    request.prompt = "A flaky request";
    CallResult result = client.invoke_detailed("sim", request, options);

    std::cout << "\nResult: " << result.text << "\n";
    std::cout << "Attempts: " << result.record.attempts << "\n";
    for (const auto& attempt : result.record.history) {
        std::cout << "  #" << attempt.attempt << " " << to_string(attempt.outcome);
        if (!attempt.error.empty()) std::cout << " (" << attempt.error << ")";
        std::cout << "\n";
    }

    // ----------------------------------------------------------------
    // 4. Spend is charged once per successful call.
    // ----------------------------------------------------------------
    std::cout << "\nScope usage: $" << scope.current_usage()
              << " of $" << scope.cap().value() << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
