#include "agent/tools/calculator.hpp"

#include <tinyexpr.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace reagent::agent::tools {
namespace {

// tinyexpr spells power as '^'; models often write Python's '**'.
std::string NormalizePower(std::string expression) {
    std::size_t pos = 0;
    while ((pos = expression.find("**", pos)) != std::string::npos) {
        expression.replace(pos, 2, "^");
        ++pos;
    }
    return expression;
}

}  // namespace

std::string CalculatorTool::Description() const {
    return "Performs basic mathematical calculations, use also for simple additions\n"
           "\n"
           "Args:\n"
           "    expression (str): The mathematical expression to evaluate (e.g., '2+2', '10*5')\n"
           "\n"
           "Returns:\n"
           "    str: the result of the evaluation or an error message in case of failure";
}

std::string CalculatorTool::ParametersJson() const {
    return R"({"type":"object","properties":{"expression":{"type":"string"}},"required":["expression"]})";
}

ToolResult CalculatorTool::Execute(const nlohmann::json& params) {
    const auto& expression = params.at("expression");
    std::string text = expression.is_string() ? expression.get<std::string>() : expression.dump();
    try {
        return ToolResult::Ok(FormatNumber(Evaluate(text)));
    } catch (const std::invalid_argument&) {
        return ToolResult::Fail("Invalid mathematical expression");
    }
}

double CalculatorTool::Evaluate(const std::string& expression) {
    const auto normalized = NormalizePower(expression);
    int error = 0;
    const double value = te_interp(normalized.c_str(), &error);
    if (error != 0) {
        throw std::invalid_argument("parse error at position " + std::to_string(error));
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument("result is not finite");
    }
    return value;
}

std::string CalculatorTool::FormatNumber(double value) {
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream oss;
    oss.precision(12);
    oss << value;
    return oss.str();
}

}  // namespace reagent::agent::tools
