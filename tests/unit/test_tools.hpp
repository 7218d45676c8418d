#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "agent/tools/tool.hpp"

namespace reagent::test {

// Returns a fixed text and counts calls.
class EchoTool : public agent::tools::Tool {
public:
    explicit EchoTool(std::string name, std::string reply = "echo")
        : name_(std::move(name))
        , reply_(std::move(reply)) {}

    std::string Name() const override { return name_; }
    std::string Description() const override { return "Echo tool named " + name_; }
    std::string ParametersJson() const override {
        return R"({"type":"object","properties":{"text":{"type":"string"}}})";
    }
    agent::tools::ToolResult Execute(const nlohmann::json& params) override {
        ++calls;
        last_params = params;
        return agent::tools::ToolResult::Ok(reply_);
    }

    int calls = 0;
    nlohmann::json last_params;

private:
    std::string name_;
    std::string reply_;
};

class ThrowingTool : public agent::tools::Tool {
public:
    std::string Name() const override { return "broken"; }
    std::string Description() const override { return "Always fails."; }
    std::string ParametersJson() const override { return R"({"type":"object","properties":{}})"; }
    agent::tools::ToolResult Execute(const nlohmann::json&) override {
        throw std::runtime_error("internal fault");
    }
};

// Throws a value that does not derive from std::exception.
class RawThrowTool : public agent::tools::Tool {
public:
    std::string Name() const override { return "raw"; }
    std::string Description() const override { return "Throws an int."; }
    std::string ParametersJson() const override { return R"({"type":"object","properties":{}})"; }
    agent::tools::ToolResult Execute(const nlohmann::json&) override {
        throw 42;
    }
};

}  // namespace reagent::test
