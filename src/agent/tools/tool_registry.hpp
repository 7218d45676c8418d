#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "agent/tools/tool.hpp"

namespace reagent::agent::tools {

// Name -> tool mapping. The terminal "answer" tool is registered first by
// every constructor, and the first tool registered under a name wins.
class ToolRegistry {
public:
    ToolRegistry();
    explicit ToolRegistry(std::vector<std::unique_ptr<Tool>> tools);

    bool Register(std::unique_ptr<Tool> tool);
    Tool* Get(const std::string& name);
    bool Has(const std::string& name) const;
    std::vector<ToolDescriptor> GetDefinitions() const;
    ToolResult Execute(const std::string& name, const nlohmann::json& params);

    std::vector<std::string> List() const;

private:
    std::vector<std::unique_ptr<Tool>> tools_;
    std::unordered_map<std::string, Tool*> index_;
};

}  // namespace reagent::agent::tools
