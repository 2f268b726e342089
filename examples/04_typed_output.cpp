// 04_typed_output.cpp
//
// Asks a (simulated) model for a structured forecast. The first reply is
// prose, the second has a probability outside [0, 1], the third is valid.
// The typed invoker appends format instructions, quotes each bad reply
// back with the problem it found, and converts the accepted value into a
// C++ struct through nlohmann::json's from_json.

#include <callguard/callguard.hpp>

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

using namespace callguard;
using json = nlohmann::json;

struct Forecast {
    std::string summary;
    double probability = 0.0;
    std::vector<std::string> drivers;
};

void from_json(const json& j, Forecast& f) {
    j.at("summary").get_to(f.summary);
    j.at("probability").get_to(f.probability);
    if (j.contains("drivers")) j.at("drivers").get_to(f.drivers);
}

// Replays canned replies in order
class ScriptedProvider : public ProviderAdapter {
public:
    explicit ScriptedProvider(std::vector<std::string> replies) : replies_(std::move(replies)) {}

    ProviderResponse send(const ProviderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "----- prompt #" << (next_ + 1) << " -----\n" << request.prompt << "\n\n";

        ProviderResponse response;
        response.text = replies_.at(next_ < replies_.size() ? next_ : replies_.size() - 1);
        response.cost = 0.004;
        ++next_;
        return response;
    }

    std::string name() const override { return "scripted"; }

private:
    std::mutex mutex_;
    std::vector<std::string> replies_;
    std::size_t next_ = 0;
};

int main() {
    std::cout << "=== CallGuard: Typed Output ===\n\n";

    Shape forecast = Shape::object({
        {"summary", Shape::string(), "One sentence outlook", true},
        {"probability", Shape::number(0.0, 1.0), "Chance of rain tomorrow", true},
        {"drivers", Shape::list(Shape::string(), std::nullopt, 3), "Main factors", false},
    });

    auto provider = std::make_shared<ScriptedProvider>(std::vector<std::string>{
        "It will probably rain tomorrow.",
        "{\"summary\": \"Rain likely\", \"probability\": 85}",
        "```json\n{\"summary\": \"Rain likely\", \"probability\": 0.85, "
        "\"drivers\": [\"cold front\", \"humidity\"]}\n```",
    });

    Client client;
    client.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    EndpointConfig endpoint;
    endpoint.name = "forecaster";
    endpoint.default_typed_attempts = 3;
    client.register_endpoint(endpoint, provider);

    auto scope = client.open_scope(0.10, "forecast");
    CallOptions options;
    options.scope = scope.id();

    try {
        Forecast f = client.invoke_typed_as<Forecast>(
            "forecaster", "What is the weather outlook for tomorrow?", forecast,
            std::nullopt, options);

        std::cout << "Summary:     " << f.summary << "\n";
        std::cout << "Probability: " << f.probability << "\n";
        std::cout << "Drivers:    ";
        for (const auto& d : f.drivers) std::cout << " " << d;
        std::cout << "\n";
    } catch (const TypeValidationExhaustedException& e) {
        std::cout << "Gave up: " << e.what() << "\n";
        for (const auto& attempt : e.attempts()) {
            std::cout << "  #" << attempt.attempt << " " << to_string(attempt.outcome)
                      << ": " << attempt.detail << "\n";
        }
        return 1;
    }

    std::cout << "Spent $" << scope.current_usage() << " across all attempts\n";
    std::cout << "\n=== Done ===\n";
    return 0;
}
