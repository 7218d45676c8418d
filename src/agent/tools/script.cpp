#include "agent/tools/script.hpp"

#include <filesystem>
#include <fstream>
#include <regex>
#include <utility>

#include "sandbox/sandbox_executor.hpp"
#include "utils/logging.hpp"

namespace reagent::agent::tools {
namespace {

constexpr const char* kScriptFilename = "temp_script.py";

}  // namespace

ScriptTool::ScriptTool(ScriptSettings settings)
    : settings_(std::move(settings)) {}

std::string ScriptTool::Description() const {
    return "Execute python code and return the result as a string.\n"
           "You may import any python module, e.g. datetime or pandas\n"
           "If the script produce a figure, write it to a PNG file in the current working directory "
           "and return its name as a string using the format '## Figure: [name] ##' so it is visible to the user.\n"
           "\n"
           "Args:\n"
           "    script (str): The python script to evaluate\n"
           "\n"
           "Returns:\n"
           "    str: the result of running the script or an error message in case of failure";
}

std::string ScriptTool::ParametersJson() const {
    return R"({"type":"object","properties":{"script":{"type":"string"}},"required":["script"]})";
}

ToolResult ScriptTool::Execute(const nlohmann::json& params) {
    const auto script = params.at("script").get<std::string>();
    if (script.empty()) {
        return ToolResult::Fail("missing script");
    }

    std::error_code ec;
    std::filesystem::create_directories(settings_.work_dir, ec);
    if (ec) {
        return ToolResult::Fail("cannot create work directory " + settings_.work_dir + ": " + ec.message());
    }
    const auto script_path = std::filesystem::path(settings_.work_dir) / kScriptFilename;
    {
        std::ofstream output(script_path, std::ios::out | std::ios::trunc);
        if (!output.is_open()) {
            return ToolResult::Fail("cannot write " + script_path.string());
        }
        output << script;
    }

    const auto result = sandbox::SandboxExecutor::Run(
        settings_.interpreter,
        {kScriptFilename},
        settings_.work_dir,
        settings_.timeout);

    if (result.timed_out) {
        return ToolResult::Fail("script timed out");
    }
    if (result.exit_code != 0) {
        utils::LogWarn("script", "exit code " + std::to_string(result.exit_code) + "\n" + result.error);
        return ToolResult::Fail(result.error.empty()
            ? "script failed with exit code " + std::to_string(result.exit_code)
            : result.error);
    }

    static const std::regex kFigure(R"(^## Figure:\s*(\S+))");
    std::smatch match;
    if (std::regex_search(result.output, match, kFigure)) {
        const auto figure = std::filesystem::path(settings_.work_dir) / match[1].str();
        utils::LogInfo("script", "figure written to " + figure.string());
    }
    return ToolResult::Ok(result.output);
}

}  // namespace reagent::agent::tools
