#include "providers/llm_provider.hpp"

#include "providers/ollama_provider.hpp"

namespace reagent::providers {

std::unique_ptr<LLMProvider> CreateProvider(const reagent::config::Config& config) {
    return std::make_unique<OllamaProvider>(
        config.agent.host,
        config.agent.model,
        config.agent.num_ctx,
        config.agent.request_timeout_s);
}

}  // namespace reagent::providers
