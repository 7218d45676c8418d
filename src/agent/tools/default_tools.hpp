#pragma once

#include <memory>
#include <vector>

#include "agent/tools/tool.hpp"
#include "config/config_schema.hpp"

namespace reagent::agent::tools {

// date, calculator, web_search and (unless disabled) execute_script, each
// configured from config. "answer" is added by the registry itself.
std::vector<std::unique_ptr<Tool>> CreateDefaultTools(const reagent::config::Config& config);

}  // namespace reagent::agent::tools
