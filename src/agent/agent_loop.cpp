#include "agent/agent_loop.hpp"

#include <utility>

#include "agent/prompt_composer.hpp"
#include "agent/response_parser.hpp"
#include "agent/tools/answer.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace reagent::agent {

AgentLoop::AgentLoop(
    reagent::providers::LLMProvider& provider,
    std::string model,
    std::vector<std::unique_ptr<tools::Tool>> tools)
    : provider_(provider)
    , model_(std::move(model))
    , tools_(std::move(tools))
    , system_prompt_(PromptComposer::BuildSystemPrompt(tools_.GetDefinitions())) {
    if (model_.empty()) {
        model_ = provider_.GetDefaultModel();
    }
    messages_.push_back({"system", system_prompt_});
    utils::LogDebug("agent", "tools=" + utils::Join(tools_.List(), ","));
}

std::string AgentLoop::Task(const std::string& query, int max_steps) {
    return PerformSteps(query, max_steps).text;
}

StepOutcome AgentLoop::PerformSteps(const std::string& query, int max_steps) {
    std::string step_input = query;
    // A discarded runaway exchange still counts as a step.
    for (int step = 1; step <= max_steps; ++step) {
        utils::LogInfo("agent", "step #" + std::to_string(step));
        auto outcome = RunStep(step_input);
        if (outcome.kind == StepKind::kAnswer) {
            return outcome;
        }
        step_input = std::move(outcome.text);
    }
    utils::LogWarn("agent", "no answer after " + std::to_string(max_steps) + " steps");
    return {StepKind::kExhausted, ExhaustedMessage(max_steps)};
}

StepOutcome AgentLoop::RunStep(const std::string& step_input) {
    const auto response = Chat(step_input);
    const auto parsed = ResponseParser::Parse(response);

    switch (parsed.status) {
        case ParseStatus::kRunaway:
            // Forget the exchange and ask again with the same input.
            utils::LogWarn("agent", "runaway response discarded:\n" + utils::Truncate(response, 500));
            messages_.pop_back();
            messages_.pop_back();
            return {StepKind::kContinue, step_input};
        case ParseStatus::kMalformed:
            utils::LogWarn("agent", "malformed response");
            return {StepKind::kContinue, "Observation: Error: Invalid response format"};
        case ParseStatus::kInvalidInput:
            utils::LogWarn("agent", "invalid action input");
            return {StepKind::kContinue, "Observation: Error: Invalid Action Input format"};
        case ParseStatus::kOk:
            break;
    }

    const auto& directive = parsed.directive;
    if (!tools_.Has(directive.action)) {
        utils::LogWarn("agent", "unknown action " + directive.action);
        return {StepKind::kContinue, "Observation: Error: Invalid action (" + directive.action + ")"};
    }

    utils::LogInfo("agent", "using tool '" + directive.action + "'");
    const auto result = tools_.Execute(directive.action, directive.input);
    if (!result.ok) {
        return {StepKind::kContinue, "Observation: Error: " + result.error};
    }
    if (directive.action == tools::kAnswerToolName) {
        return {StepKind::kAnswer, result.output};
    }
    return {StepKind::kContinue, "Observation: " + result.output};
}

std::string AgentLoop::Chat(const std::string& message) {
    messages_.push_back({"user", message});
    std::string reply;
    try {
        reply = provider_.Chat(messages_, model_);
    } catch (const reagent::providers::TransportError&) {
        messages_.pop_back();
        throw;
    }
    messages_.push_back({"assistant", reply});
    return reply;
}

std::string AgentLoop::MessageHistory() const {
    std::vector<std::string> entries;
    for (std::size_t i = 1; i < messages_.size(); ++i) {
        entries.push_back("**" + messages_[i].role + "**:\n" + messages_[i].content + "\n");
    }
    return utils::Join(entries, "\n");
}

void AgentLoop::Reset() {
    messages_.resize(1);
}

std::string AgentLoop::ExhaustedMessage(int max_steps) {
    return "Agent was unable to answer your question in the maximal number of steps (" +
           std::to_string(max_steps) + ")";
}

}  // namespace reagent::agent
