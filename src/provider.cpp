#include "callguard/provider.hpp"

namespace callguard {

TokenCount ProviderAdapter::estimate_tokens(const ProviderRequest& request) const {
    auto chars = static_cast<TokenCount>(request.prompt.size() + request.system_prompt.size());
    TokenCount prompt_tokens = (chars + kCharsPerToken - 1) / kCharsPerToken;
    TokenCount completion_tokens = request.max_output_tokens.value_or(0);
    return prompt_tokens + completion_tokens + kRequestOverheadTokens;
}

} // namespace callguard
