#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace reagent::providers {

// Non-streaming client for the Ollama /api/chat endpoint.
class OllamaProvider : public LLMProvider {
public:
    OllamaProvider(std::string host,
                   std::string default_model,
                   int num_ctx = 32768,
                   int read_timeout_s = 300);

    std::string Chat(
        const std::vector<Message>& messages,
        const std::string& model) override;

    std::string GetDefaultModel() const override { return default_model_; }

    static std::string BuildPayload(
        const std::vector<Message>& messages,
        const std::string& model,
        int num_ctx);
    static std::string ParseReply(const std::string& body);

private:
    std::string host_;
    std::string default_model_;
    int num_ctx_ = 32768;
    int read_timeout_s_ = 300;
};

}  // namespace reagent::providers
