#pragma once

#include "callguard/types.hpp"
#include "callguard/admission_limiter.hpp"
#include "callguard/budget_ledger.hpp"
#include "callguard/call_envelope.hpp"
#include "callguard/config.hpp"
#include "callguard/monitor.hpp"
#include "callguard/provider.hpp"
#include "callguard/shape.hpp"
#include "callguard/typed_invocation.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace callguard {

// Entry point tying together one budget ledger and a limiter, envelope
// and typed invoker per registered endpoint. Endpoints cannot be removed.
class Client {
public:
    explicit Client(Config config = Config{});

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // ==================== Endpoint Registration ====================

    void register_endpoint(EndpointConfig config, std::shared_ptr<ProviderAdapter> provider);
    bool has_endpoint(const EndpointId& endpoint) const;
    std::vector<EndpointId> endpoints() const;

    // Throws EndpointNotFoundException
    AdmissionLimiter& limiter(const EndpointId& endpoint) const;

    // ==================== Budget Scopes ====================

    ScopeHandle open_scope(std::optional<Dollars> cap = std::nullopt, std::string label = {});
    Dollars current_usage(ScopeId scope) const;
    BudgetLedger& ledger() noexcept { return ledger_; }
    const BudgetLedger& ledger() const noexcept { return ledger_; }

    // ==================== Calls ====================

    std::string invoke(const EndpointId& endpoint, const std::string& prompt,
                       const CallOptions& options = {});

    CallResult invoke_detailed(const EndpointId& endpoint, const ProviderRequest& request,
                               const CallOptions& options = {});

    std::future<CallResult> invoke_async(const EndpointId& endpoint, ProviderRequest request,
                                         CallOptions options = {});

    // ==================== Typed Calls ====================

    nlohmann::json invoke_typed(const EndpointId& endpoint, const std::string& prompt,
                                const Shape& shape,
                                std::optional<std::uint32_t> max_attempts = std::nullopt,
                                const CallOptions& options = {});

    TypedResult invoke_typed_detailed(const EndpointId& endpoint, const ProviderRequest& request,
                                      const Shape& shape,
                                      std::optional<std::uint32_t> max_attempts = std::nullopt,
                                      const CallOptions& options = {});

    template <typename T>
    T invoke_typed_as(const EndpointId& endpoint, const std::string& prompt, const Shape& shape,
                      std::optional<std::uint32_t> max_attempts = std::nullopt,
                      const CallOptions& options = {}) {
        ProviderRequest request;
        request.prompt = prompt;
        return find_endpoint(endpoint).typed->template invoke_as<T>(
            request, shape, max_attempts, options);
    }

    bool invoke_boolean(const EndpointId& endpoint, const std::string& prompt,
                        const std::string& true_keyword = "YES",
                        const std::string& false_keyword = "NO",
                        std::optional<std::uint32_t> max_attempts = std::nullopt,
                        const CallOptions& options = {});

    // ==================== Configuration ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);
    const Config& config() const noexcept { return config_; }

private:
    struct Endpoint {
        std::unique_ptr<AdmissionLimiter> limiter;
        std::unique_ptr<CallEnvelope> envelope;
        std::unique_ptr<TypedInvoker> typed;
    };

    Config config_;
    BudgetLedger ledger_;

    mutable std::shared_mutex endpoints_mutex_;
    std::unordered_map<EndpointId, Endpoint> endpoints_;
    std::shared_ptr<Monitor> monitor_;

    const Endpoint& find_endpoint(const EndpointId& endpoint) const;
};

} // namespace callguard
