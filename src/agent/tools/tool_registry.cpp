#include "agent/tools/tool_registry.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include "agent/tools/answer.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace reagent::agent::tools {
namespace {

// Checks params against the "required" and "properties" lists of the tool
// schema. Returns an empty string when the call is acceptable.
std::string ValidateParams(const Tool& tool, const nlohmann::json& params) {
    if (!params.is_object()) {
        return "tool input must be a JSON object";
    }
    auto schema = nlohmann::json::parse(tool.ParametersJson(), nullptr, false);
    if (schema.is_discarded() || !schema.is_object()) {
        return {};
    }
    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& item : schema["required"]) {
            if (item.is_string() && !params.contains(item.get<std::string>())) {
                return "missing parameter '" + item.get<std::string>() + "'";
            }
        }
    }
    if (schema.contains("properties") && schema["properties"].is_object()) {
        const auto& properties = schema["properties"];
        for (const auto& item : params.items()) {
            if (!properties.contains(item.key())) {
                return "unexpected parameter '" + item.key() + "'";
            }
        }
    }
    return {};
}

}  // namespace

ToolRegistry::ToolRegistry() {
    Register(std::make_unique<AnswerTool>());
}

ToolRegistry::ToolRegistry(std::vector<std::unique_ptr<Tool>> tools)
    : ToolRegistry() {
    for (auto& tool : tools) {
        Register(std::move(tool));
    }
}

bool ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    if (!tool) {
        return false;
    }
    auto name = tool->Name();
    if (index_.find(name) != index_.end()) {
        utils::LogWarn("tool", "duplicate tool name=" + name + " ignored, keeping first registration");
        return false;
    }
    index_.emplace(name, tool.get());
    tools_.push_back(std::move(tool));
    return true;
}

Tool* ToolRegistry::Get(const std::string& name) {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ToolRegistry::Has(const std::string& name) const {
    return index_.find(name) != index_.end();
}

std::vector<ToolDescriptor> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDescriptor> defs;
    for (const auto& tool : tools_) {
        ToolDescriptor def{};
        def.name = tool->Name();
        def.description = tool->Description();
        def.parameters_json = tool->ParametersJson();
        defs.push_back(def);
    }
    return defs;
}

ToolResult ToolRegistry::Execute(const std::string& name, const nlohmann::json& params) {
    auto tool = Get(name);
    if (!tool) {
        return ToolResult::Fail("Tool '" + name + "' not found");
    }
    std::ostringstream start;
    start << "start name=" << name;
    if (params.is_object() && !params.empty()) {
        start << " params=" << utils::Truncate(params.dump(), 200);
    }
    utils::LogInfo("tool", start.str());

    const auto invalid = ValidateParams(*tool, params);
    if (!invalid.empty()) {
        utils::LogWarn("tool", "rejected name=" + name + ": " + invalid);
        return ToolResult::Fail("There was a problem using the tool ('" + name +
                                "') with the given input: " + invalid);
    }

    ToolResult result{};
    try {
        result = tool->Execute(params);
    } catch (const std::exception& ex) {
        utils::LogWarn("tool", "failed name=" + name + ": " + ex.what());
        return ToolResult::Fail("There was a problem using the tool ('" + name +
                                "') with the given input.");
    } catch (...) {
        utils::LogWarn("tool", "failed name=" + name + ": unknown exception");
        return ToolResult::Fail("There was a problem using the tool ('" + name +
                                "') with the given input.");
    }
    if (result.ok) {
        utils::LogInfo("tool", "end name=" + name + " size=" + std::to_string(result.output.size()));
    } else {
        utils::LogInfo("tool", "end name=" + name + " error=" + result.error);
    }
    return result;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& tool : tools_) {
        names.push_back(tool->Name());
    }
    return names;
}

}  // namespace reagent::agent::tools
