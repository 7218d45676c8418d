#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "agent/tools/answer.hpp"
#include "agent/tools/tool_registry.hpp"
#include "test_tools.hpp"

namespace {

using reagent::agent::tools::Tool;
using reagent::agent::tools::ToolRegistry;
using reagent::agent::tools::ToolResult;
using reagent::test::EchoTool;
using reagent::test::RawThrowTool;
using reagent::test::ThrowingTool;

TEST(ToolRegistryTest, AnswerPresentInEmptyRegistry) {
    ToolRegistry registry(std::vector<std::unique_ptr<Tool>>{});
    EXPECT_TRUE(registry.Has("answer"));
    ASSERT_EQ(registry.List().size(), 1u);
    EXPECT_EQ(registry.List()[0], "answer");
}

TEST(ToolRegistryTest, AnswerIsRegisteredFirst) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<EchoTool>("alpha"));
    tools.push_back(std::make_unique<EchoTool>("beta"));
    ToolRegistry registry(std::move(tools));

    const auto names = registry.List();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "answer");
    EXPECT_EQ(names[1], "alpha");
    EXPECT_EQ(names[2], "beta");

    const auto defs = registry.GetDefinitions();
    ASSERT_EQ(defs.size(), 3u);
    EXPECT_EQ(defs[1].description, "Echo tool named alpha");
    EXPECT_FALSE(defs[0].parameters_json.empty());
}

TEST(ToolRegistryTest, FirstRegistrationWins) {
    ToolRegistry registry;
    auto first = std::make_unique<EchoTool>("dup", "first");
    auto* first_ptr = first.get();
    EXPECT_TRUE(registry.Register(std::move(first)));
    EXPECT_FALSE(registry.Register(std::make_unique<EchoTool>("dup", "second")));

    EXPECT_EQ(registry.Get("dup"), first_ptr);
    const auto result = registry.Execute("dup", nlohmann::json::object());
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.output, "first");
    EXPECT_EQ(registry.List().size(), 2u);
}

TEST(ToolRegistryTest, CallerCannotReplaceAnswer) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<EchoTool>("answer", "hijacked"));
    ToolRegistry registry(std::move(tools));

    const auto result = registry.Execute("answer", {{"reply", "4"}});
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.output, "4");
}

TEST(ToolRegistryTest, GetUnknownReturnsNull) {
    ToolRegistry registry;
    EXPECT_EQ(registry.Get("missing"), nullptr);
    EXPECT_FALSE(registry.Has("missing"));
    const auto result = registry.Execute("missing", nlohmann::json::object());
    EXPECT_FALSE(result.ok);
}

TEST(ToolRegistryTest, ExecutePassesParams) {
    ToolRegistry registry;
    auto tool = std::make_unique<EchoTool>("echo");
    auto* echo = tool.get();
    registry.Register(std::move(tool));

    const auto result = registry.Execute("echo", {{"text", "hi"}});
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(echo->calls, 1);
    EXPECT_EQ(echo->last_params["text"], "hi");
}

TEST(ToolRegistryTest, ThrowingToolBecomesError) {
    ToolRegistry registry;
    registry.Register(std::make_unique<ThrowingTool>());

    const auto result = registry.Execute("broken", nlohmann::json::object());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "There was a problem using the tool ('broken') with the given input.");
}

TEST(ToolRegistryTest, NonStandardThrowBecomesError) {
    ToolRegistry registry;
    registry.Register(std::make_unique<RawThrowTool>());

    ToolResult result{};
    EXPECT_NO_THROW(result = registry.Execute("raw", nlohmann::json::object()));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "There was a problem using the tool ('raw') with the given input.");
}

TEST(ToolRegistryTest, MissingRequiredParameterIsRejected) {
    ToolRegistry registry;
    const auto result = registry.Execute("answer", nlohmann::json::object());
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("missing parameter 'reply'"), std::string::npos);
}

TEST(ToolRegistryTest, UnexpectedParameterIsRejected) {
    ToolRegistry registry;
    auto tool = std::make_unique<EchoTool>("echo");
    auto* echo = tool.get();
    registry.Register(std::move(tool));

    const auto result = registry.Execute("echo", {{"txt", "typo"}});
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("unexpected parameter 'txt'"), std::string::npos);
    EXPECT_EQ(echo->calls, 0);
}

TEST(ToolRegistryTest, AnswerSerializesNonStringReply) {
    ToolRegistry registry;
    const auto result = registry.Execute("answer", {{"reply", 4}});
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.output, "4");
}

}  // namespace
