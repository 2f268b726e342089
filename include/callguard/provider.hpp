#pragma once

#include "callguard/types.hpp"

#include <optional>
#include <string>

namespace callguard {

struct ProviderRequest {
    std::string prompt;
    std::string system_prompt;
    std::string model;
    double temperature = 0.7;
    std::optional<TokenCount> max_output_tokens;
};

struct ProviderResponse {
    std::string text;
    TokenUsage usage;
    Dollars cost{0.0};
    std::string model;
};

// Abstract base class for remote model providers.
// send() may be called from several threads at once and reports failures
// by throwing ProviderException.
class ProviderAdapter {
public:
    virtual ~ProviderAdapter() = default;

    virtual ProviderResponse send(const ProviderRequest& request) = 0;

    // Rough prompt-plus-completion estimate used for admission
    virtual TokenCount estimate_tokens(const ProviderRequest& request) const;

    virtual std::string name() const = 0;

    // Fixed per-request overhead added by the default estimate
    static constexpr TokenCount kRequestOverheadTokens = 8;
    static constexpr TokenCount kCharsPerToken = 4;
};

} // namespace callguard
