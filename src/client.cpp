#include "callguard/client.hpp"
#include "callguard/exceptions.hpp"

#include <algorithm>
#include <mutex>

namespace callguard {

Client::Client(Config config)
    : config_(std::move(config))
{
    validate(config_);
}

// ==================== Endpoint Registration ====================

void Client::register_endpoint(EndpointConfig config, std::shared_ptr<ProviderAdapter> provider) {
    validate(config);
    if (!provider) {
        throw InvalidRequestException("Endpoint " + config.name + " needs a provider");
    }

    std::unique_lock lock(endpoints_mutex_);
    if (endpoints_.count(config.name) > 0) {
        throw InvalidRequestException("Endpoint already registered: " + config.name);
    }
    if (endpoints_.size() >= config_.max_endpoints) {
        throw InvalidRequestException("Endpoint limit of " +
                                      std::to_string(config_.max_endpoints) + " reached");
    }

    EndpointId name = config.name;
    Endpoint ep;
    ep.limiter = std::make_unique<AdmissionLimiter>(std::move(config), config_.poll_interval);
    ep.envelope = std::make_unique<CallEnvelope>(*ep.limiter, std::move(provider), ledger_,
                                                 config_.poll_interval);
    ep.typed = std::make_unique<TypedInvoker>(*ep.envelope);
    if (monitor_) {
        ep.limiter->set_monitor(monitor_);
        ep.envelope->set_monitor(monitor_);
        ep.typed->set_monitor(monitor_);
    }
    endpoints_.emplace(std::move(name), std::move(ep));
}

bool Client::has_endpoint(const EndpointId& endpoint) const {
    std::shared_lock lock(endpoints_mutex_);
    return endpoints_.count(endpoint) > 0;
}

std::vector<EndpointId> Client::endpoints() const {
    std::shared_lock lock(endpoints_mutex_);
    std::vector<EndpointId> names;
    names.reserve(endpoints_.size());
    for (auto& [name, ep] : endpoints_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

AdmissionLimiter& Client::limiter(const EndpointId& endpoint) const {
    return *find_endpoint(endpoint).limiter;
}

// ==================== Budget Scopes ====================

ScopeHandle Client::open_scope(std::optional<Dollars> cap, std::string label) {
    return ledger_.open_scope(cap, std::nullopt, std::move(label));
}

Dollars Client::current_usage(ScopeId scope) const {
    return ledger_.current_usage(scope);
}

// ==================== Calls ====================

std::string Client::invoke(const EndpointId& endpoint, const std::string& prompt,
                           const CallOptions& options) {
    ProviderRequest request;
    request.prompt = prompt;
    return invoke_detailed(endpoint, request, options).text;
}

CallResult Client::invoke_detailed(const EndpointId& endpoint, const ProviderRequest& request,
                                   const CallOptions& options) {
    return find_endpoint(endpoint).envelope->execute(request, options);
}

std::future<CallResult> Client::invoke_async(const EndpointId& endpoint, ProviderRequest request,
                                             CallOptions options) {
    // Fail fast on an unknown endpoint rather than through the future
    find_endpoint(endpoint);
    return std::async(std::launch::async,
        [this, endpoint, request = std::move(request), options = std::move(options)] {
            return invoke_detailed(endpoint, request, options);
        });
}

// ==================== Typed Calls ====================

nlohmann::json Client::invoke_typed(const EndpointId& endpoint, const std::string& prompt,
                                    const Shape& shape,
                                    std::optional<std::uint32_t> max_attempts,
                                    const CallOptions& options) {
    ProviderRequest request;
    request.prompt = prompt;
    return invoke_typed_detailed(endpoint, request, shape, max_attempts, options).value;
}

TypedResult Client::invoke_typed_detailed(const EndpointId& endpoint,
                                          const ProviderRequest& request,
                                          const Shape& shape,
                                          std::optional<std::uint32_t> max_attempts,
                                          const CallOptions& options) {
    return find_endpoint(endpoint).typed->invoke(request, shape, max_attempts, options);
}

bool Client::invoke_boolean(const EndpointId& endpoint, const std::string& prompt,
                            const std::string& true_keyword,
                            const std::string& false_keyword,
                            std::optional<std::uint32_t> max_attempts,
                            const CallOptions& options) {
    ProviderRequest request;
    request.prompt = prompt;
    return find_endpoint(endpoint).typed->invoke_boolean(request, true_keyword, false_keyword,
                                                         max_attempts, options);
}

// ==================== Configuration ====================

void Client::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::unique_lock lock(endpoints_mutex_);
    monitor_ = monitor;
    ledger_.set_monitor(monitor);
    for (auto& [name, ep] : endpoints_) {
        ep.limiter->set_monitor(monitor);
        ep.envelope->set_monitor(monitor);
        ep.typed->set_monitor(monitor);
    }
}

// ==================== Internal Helpers ====================

const Client::Endpoint& Client::find_endpoint(const EndpointId& endpoint) const {
    std::shared_lock lock(endpoints_mutex_);
    auto it = endpoints_.find(endpoint);
    if (it == endpoints_.end()) {
        throw EndpointNotFoundException(endpoint);
    }
    // Entries are never erased, so the reference outlives the lock
    return it->second;
}

} // namespace callguard
