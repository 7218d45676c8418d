#pragma once

#include <string>
#include <vector>

#include "agent/tools/tool.hpp"

namespace reagent::agent {

// Builds the system message: preamble, tool documentation and the
// Thought/Action/Action Input output contract.
class PromptComposer {
public:
    static std::string BuildSystemPrompt(const std::vector<tools::ToolDescriptor>& tools);

    static std::string BuildPreamble();
    static std::string BuildToolsSection(const std::vector<tools::ToolDescriptor>& tools);
    static std::string BuildOutputFormat();
};

}  // namespace reagent::agent
