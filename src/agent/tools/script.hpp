#pragma once

#include <chrono>
#include <string>

#include "agent/tools/tool.hpp"

namespace reagent::agent::tools {

struct ScriptSettings {
    std::string work_dir = "work";
    std::string interpreter = "python3";
    std::chrono::seconds timeout{60};
};

class ScriptTool : public Tool {
public:
    explicit ScriptTool(ScriptSettings settings);

    std::string Name() const override { return "execute_script"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params) override;

private:
    ScriptSettings settings_;
};

}  // namespace reagent::agent::tools
