#include "agent/tools/answer.hpp"

namespace reagent::agent::tools {

std::string AnswerTool::Description() const {
    return "Conveys your final reply to the user\n"
           "\n"
           "Args:\n"
           "    reply (str): Your final reply to the user\n"
           "\n"
           "Returns:\n"
           "    str: echoes 'reply'";
}

std::string AnswerTool::ParametersJson() const {
    return R"({"type":"object","properties":{"reply":{"type":"string"}},"required":["reply"]})";
}

ToolResult AnswerTool::Execute(const nlohmann::json& params) {
    const auto& reply = params.at("reply");
    if (reply.is_string()) {
        return ToolResult::Ok(reply.get<std::string>());
    }
    // Models sometimes answer with a bare number or list.
    return ToolResult::Ok(reply.dump());
}

}  // namespace reagent::agent::tools
