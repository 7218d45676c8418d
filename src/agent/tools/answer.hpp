#pragma once

#include <string>

#include "agent/tools/tool.hpp"

namespace reagent::agent::tools {

inline constexpr const char* kAnswerToolName = "answer";

// Terminal tool: invoking it ends the task with its reply.
class AnswerTool : public Tool {
public:
    std::string Name() const override { return kAnswerToolName; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params) override;
};

}  // namespace reagent::agent::tools
