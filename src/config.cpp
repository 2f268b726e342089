#include "callguard/config.hpp"
#include "callguard/exceptions.hpp"

namespace callguard {

void validate(const EndpointConfig& config) {
    if (config.name.empty()) {
        throw InvalidConfigException("Endpoint name must not be empty");
    }
    if (config.period <= Duration::zero()) {
        throw InvalidConfigException("Endpoint " + config.name + ": period must be positive");
    }
    if (config.max_tokens_per_period < 0) {
        throw InvalidConfigException("Endpoint " + config.name +
                                     ": max_tokens_per_period must be non-negative");
    }
    if (config.max_queue_size == 0) {
        throw InvalidConfigException("Endpoint " + config.name +
                                     ": max_queue_size must be at least 1");
    }
    if (config.default_timeout <= Duration::zero()) {
        throw InvalidConfigException("Endpoint " + config.name +
                                     ": default_timeout must be positive");
    }
    if (config.default_max_attempts == 0) {
        throw InvalidConfigException("Endpoint " + config.name +
                                     ": default_max_attempts must be at least 1");
    }
    if (config.default_typed_attempts == 0) {
        throw InvalidConfigException("Endpoint " + config.name +
                                     ": default_typed_attempts must be at least 1");
    }
    if (config.default_admission_wait.has_value() &&
        config.default_admission_wait.value() < Duration::zero()) {
        throw InvalidConfigException("Endpoint " + config.name +
                                     ": default_admission_wait must be non-negative");
    }

    const BackoffConfig& backoff = config.backoff;
    if (backoff.base < Duration::zero() || backoff.max < Duration::zero()) {
        throw InvalidConfigException("Endpoint " + config.name +
                                     ": backoff delays must be non-negative");
    }
    if (backoff.multiplier < 1.0) {
        throw InvalidConfigException("Endpoint " + config.name +
                                     ": backoff multiplier must be at least 1.0");
    }
    if (backoff.max < backoff.base) {
        throw InvalidConfigException("Endpoint " + config.name +
                                     ": backoff max must not be below backoff base");
    }
}

void validate(const Config& config) {
    if (config.poll_interval <= Duration::zero()) {
        throw InvalidConfigException("poll_interval must be positive");
    }
    if (config.max_endpoints == 0) {
        throw InvalidConfigException("max_endpoints must be at least 1");
    }
}

} // namespace callguard
