#pragma once

#include "callguard/types.hpp"
#include <cstddef>

namespace callguard {

// Delay between failed transport attempts
struct BackoffConfig {
    // Delay before the second attempt; later attempts multiply it
    Duration base = std::chrono::milliseconds(500);
    double multiplier = 2.0;
    Duration max = std::chrono::seconds(60);

    // Full jitter: sleep a uniform random fraction of the computed delay
    bool jitter = false;
};

// Per-endpoint settings, fixed at registration
struct EndpointConfig {
    EndpointId name;

    // Sliding-window ceilings (0 = no ceiling)
    std::size_t max_requests_per_period = 60;
    TokenCount max_tokens_per_period = 0;
    Duration period = std::chrono::seconds(60);

    // Calls allowed in flight at once (0 = unbounded)
    std::size_t max_concurrent = 0;

    // Callers allowed to wait for admission at once
    std::size_t max_queue_size = 10000;

    // Wall-clock limit for one transport attempt
    Duration default_timeout = std::chrono::seconds(90);

    // Transport attempts per logical call
    std::uint32_t default_max_attempts = 3;

    // Semantic attempts per typed invocation
    std::uint32_t default_typed_attempts = 3;

    // How long a caller may wait for admission (nullopt = forever)
    std::optional<Duration> default_admission_wait;

    BackoffConfig backoff;
};

struct Config {
    // Granularity of cancellation checks while blocked
    Duration poll_interval = std::chrono::milliseconds(10);

    // Maximum number of endpoints a Client accepts
    std::size_t max_endpoints = 256;
};

// Throws InvalidConfigException describing the first bad field
void validate(const EndpointConfig& config);
void validate(const Config& config);

} // namespace callguard
