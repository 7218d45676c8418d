#pragma once

#include <string>

#include "agent/tools/tool.hpp"

namespace reagent::agent::tools {

class CalculatorTool : public Tool {
public:
    std::string Name() const override { return "calculator"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params) override;

    // Evaluates with tinyexpr after rewriting '**' to '^'. Throws
    // std::invalid_argument on syntax errors and non-finite results.
    static double Evaluate(const std::string& expression);
    static std::string FormatNumber(double value);
};

}  // namespace reagent::agent::tools
