// 03_nested_budgets.cpp
//
// A research session with a $0.05 cap runs three tasks, each with its
// own $0.02 sub-budget. Every charge lands on the task scope and on the
// session scope above it, so a task can exhaust its own budget without
// touching its siblings, and the session cap bounds all of them together.
//
// A MetricsMonitor spend alert fires once when total spend passes $0.04.

#include <callguard/callguard.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace callguard;
using namespace std::chrono_literals;

// Charges a flat $0.008 per call
class MeteredProvider : public ProviderAdapter {
public:
    ProviderResponse send(const ProviderRequest& request) override {
        ProviderResponse response;
        response.text = "notes on " + request.prompt;
        response.cost = 0.008;
        return response;
    }

    std::string name() const override { return "metered-sim"; }
};

int main() {
    std::cout << "=== CallGuard: Nested Budgets ===\n\n";

    Client client;
    auto metrics = std::make_shared<MetricsMonitor>();
    metrics->set_spend_alert_threshold(0.04, [](const std::string& msg) {
        std::cout << "  ** ALERT: " << msg << "\n";
    });

    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(metrics);
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    client.set_monitor(composite);

    EndpointConfig endpoint;
    endpoint.name = "research";
    endpoint.max_requests_per_period = 0;
    client.register_endpoint(endpoint, std::make_shared<MeteredProvider>());

    auto session = client.open_scope(0.05, "session");
    const std::vector<std::string> tasks = {"compilers", "databases", "networking"};

    for (const auto& topic : tasks) {
        auto task = session.open_child(0.02, topic);
        CallOptions options;
        options.scope = task.id();

        std::cout << "Task '" << topic << "':\n";
        for (int step = 1; step <= 4; ++step) {
            try {
                client.invoke("research", topic + " step " + std::to_string(step), options);
                std::cout << "  step " << step << " ok, task spend $" << task.current_usage() << "\n";
            } catch (const BudgetExceededException& e) {
                std::cout << "  step " << step << " stopped: " << e.what()
                          << (e.spend_occurred() ? " (after spending)" : " (nothing spent)") << "\n";
                break;
            }
        }
        std::cout << "  session spend so far: $" << session.current_usage() << "\n\n";
    }

    auto snap = client.ledger().snapshot(session.id());
    if (snap.has_value()) {
        std::cout << "Session '" << snap->label << "' total $" << snap->total
                  << " across " << snap->children.size() << " open children\n";
    }
    std::cout << "Metrics total spend: $" << metrics->get_metrics().total_spend << "\n";
    std::cout << "Budget breaches:     " << metrics->get_metrics().budget_breaches << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
