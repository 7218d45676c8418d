#include "agent/tools/default_tools.hpp"

#include "agent/tools/calculator.hpp"
#include "agent/tools/date.hpp"
#include "agent/tools/script.hpp"
#include "agent/tools/web.hpp"
#include "utils/logging.hpp"

namespace reagent::agent::tools {

std::vector<std::unique_ptr<Tool>> CreateDefaultTools(const reagent::config::Config& config) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<DateTool>());
    tools.push_back(std::make_unique<CalculatorTool>());

    const auto& search = config.tools.web_search;
    if (search.api_key.empty()) {
        utils::LogDebug("web", "tavily api key is empty");
    } else {
        const auto prefix = search.api_key.size() > 4 ? search.api_key.substr(0, 4) : search.api_key;
        utils::LogDebug("web", "tavily api key=" + prefix + "***");
    }
    tools.push_back(std::make_unique<WebSearchTool>(search.api_key, search.api_base));

    if (config.tools.script.enabled) {
        ScriptSettings settings{};
        settings.work_dir = config.tools.script.work_dir;
        settings.interpreter = config.tools.script.interpreter;
        settings.timeout = std::chrono::seconds(config.tools.script.timeout_s);
        tools.push_back(std::make_unique<ScriptTool>(settings));
    }
    return tools;
}

}  // namespace reagent::agent::tools
