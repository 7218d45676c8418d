#pragma once

#include <string>

#include "agent/tools/tool.hpp"

namespace reagent::agent::tools {

class DateTool : public Tool {
public:
    std::string Name() const override { return "date"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params) override;
};

}  // namespace reagent::agent::tools
