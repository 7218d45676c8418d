#pragma once

#include <string>

#include "agent/tools/tool.hpp"

namespace reagent::agent::tools {

// Web search through the Tavily API. The API key is supplied by the caller;
// the tool never reads it from the environment.
class WebSearchTool : public Tool {
public:
    explicit WebSearchTool(std::string api_key = "",
                           std::string api_base = "https://api.tavily.com");

    std::string Name() const override { return "web_search"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params) override;

private:
    std::string api_key_;
    std::string api_base_;
};

}  // namespace reagent::agent::tools
