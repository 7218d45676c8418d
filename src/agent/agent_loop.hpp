#pragma once

#include <memory>
#include <string>
#include <vector>

#include "agent/tools/tool_registry.hpp"
#include "providers/llm_provider.hpp"

namespace reagent::agent {

inline constexpr int kDefaultMaxSteps = 10;

enum class StepKind {
    kContinue,
    kAnswer,
    kExhausted
};

// kContinue carries the next input for the model, kAnswer the final reply,
// kExhausted the step-limit message.
struct StepOutcome {
    StepKind kind = StepKind::kContinue;
    std::string text;
};

// Reason/act controller. Alternates between the model and the tools until the
// model calls "answer" or the step budget runs out. One instance owns one
// conversation and runs one task at a time.
class AgentLoop {
public:
    AgentLoop(
        reagent::providers::LLMProvider& provider,
        std::string model,
        std::vector<std::unique_ptr<tools::Tool>> tools = {});

    // Returns the answer or the exhaustion message. Only TransportError
    // escapes.
    std::string Task(const std::string& query, int max_steps = kDefaultMaxSteps);

    std::string MessageHistory() const;
    void Reset();

    const std::vector<reagent::providers::Message>& Messages() const { return messages_; }
    const std::string& SystemPrompt() const { return system_prompt_; }
    const tools::ToolRegistry& Tools() const { return tools_; }

    static std::string ExhaustedMessage(int max_steps);

private:
    reagent::providers::LLMProvider& provider_;
    std::string model_;
    tools::ToolRegistry tools_;
    std::string system_prompt_;
    std::vector<reagent::providers::Message> messages_;

    StepOutcome PerformSteps(const std::string& query, int max_steps);
    StepOutcome RunStep(const std::string& step_input);
    std::string Chat(const std::string& message);
};

}  // namespace reagent::agent
