#include "agent/tools/date.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace reagent::agent::tools {

std::string DateTool::Description() const {
    return "Reports the current date and time\n"
           "\n"
           "Args:\n"
           "    None\n"
           "\n"
           "Returns:\n"
           "    str: a string with the date and time in ISO 8601 format";
}

std::string DateTool::ParametersJson() const {
    return R"({"type":"object","properties":{}})";
}

ToolResult DateTool::Execute(const nlohmann::json&) {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M");
    return ToolResult::Ok(oss.str());
}

}  // namespace reagent::agent::tools
