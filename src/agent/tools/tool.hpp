#pragma once

#include <string>
#include <utility>

#include "nlohmann/json.hpp"

namespace reagent::agent::tools {

// Outcome of one tool invocation. Failed results are reported back to the
// model as "Observation: Error: <error>".
struct ToolResult {
    bool ok = true;
    std::string output;
    std::string error;

    static ToolResult Ok(std::string output) {
        ToolResult result{};
        result.output = std::move(output);
        return result;
    }

    static ToolResult Fail(std::string error) {
        ToolResult result{};
        result.ok = false;
        result.error = std::move(error);
        return result;
    }
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::string parameters_json;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    // Usage documentation, copied verbatim into the system prompt.
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    virtual ToolResult Execute(const nlohmann::json& params) = 0;
};

}  // namespace reagent::agent::tools
