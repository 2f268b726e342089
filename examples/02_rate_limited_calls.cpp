// 02_rate_limited_calls.cpp
//
// Several workers share one endpoint limited to 2 requests per second
// and 400 tokens per second. Each worker issues its calls asynchronously;
// the admission limiter releases them in arrival order as the sliding
// window allows.
//
// This example shows how CallGuard keeps a fleet of callers under a
// provider's published limits instead of collecting HTTP 429 responses.

#include <callguard/callguard.hpp>

#include <future>
#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

using namespace callguard;
using namespace std::chrono_literals;

class SlowProvider : public ProviderAdapter {
public:
    ProviderResponse send(const ProviderRequest& request) override {
        std::this_thread::sleep_for(150ms);
        ProviderResponse response;
        response.text = "done: " + request.prompt;
        response.usage.total_tokens = 90;
        response.cost = 0.001;
        return response;
    }

    std::string name() const override { return "slow-sim"; }
};

int main() {
    std::cout << "=== CallGuard: Rate-Limited Calls ===\n\n";

    Client client;
    auto metrics = std::make_shared<MetricsMonitor>();
    client.set_monitor(metrics);

    EndpointConfig endpoint;
    endpoint.name = "shared-api";
    endpoint.max_requests_per_period = 2;
    endpoint.max_tokens_per_period = 400;
    endpoint.period = 1s;
    endpoint.default_timeout = 5s;
    client.register_endpoint(endpoint, std::make_shared<SlowProvider>());

    auto start = Clock::now();
    auto seconds_since_start = [start]() {
        return std::chrono::duration<double>(Clock::now() - start).count();
    };

    // Issue 6 calls at once; the limiter spreads them over ~3 seconds
    std::vector<std::future<CallResult>> pending;
    for (int i = 0; i < 6; ++i) {
        ProviderRequest request;
        request.prompt = "job-" + std::to_string(i + 1);
        request.max_output_tokens = 64;
        pending.push_back(client.invoke_async("shared-api", request));
    }

    std::cout << std::fixed << std::setprecision(2);
    for (auto& f : pending) {
        CallResult result = f.get();
        std::cout << "[" << seconds_since_start() << "s] " << result.text
                  << " (waited "
                  << std::chrono::duration<double>(result.record.history.back().admission_wait).count()
                  << "s for admission)\n";
    }

    auto& limiter = client.limiter("shared-api");
    std::cout << "\nRequests still in window: " << limiter.requests_in_window() << "\n";
    std::cout << "Tokens still in window:   " << limiter.tokens_in_window() << "\n";

    auto m = metrics->get_metrics();
    std::cout << "\n--- Metrics ---\n";
    std::cout << "Admissions:             " << m.admissions << "\n";
    std::cout << "Average admission wait: " << m.average_admission_wait_ms << " ms\n";
    std::cout << "Successful calls:       " << m.successful_calls << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
