#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace reagent::providers {

struct Message {
    std::string role;
    std::string content;
};

// The model backend could not produce a reply. Nothing in the agent loop
// recovers from this; it reaches the caller of Agent::Task.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    // Sends the full ordered history and returns the new assistant text.
    // Throws TransportError on failure.
    virtual std::string Chat(
        const std::vector<Message>& messages,
        const std::string& model) = 0;
    virtual std::string GetDefaultModel() const = 0;
};

std::unique_ptr<LLMProvider> CreateProvider(const reagent::config::Config& config);

}  // namespace reagent::providers
