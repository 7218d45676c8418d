#include <gtest/gtest.h>

#include <cstdlib>
#include <mutex>
#include <string>
#include <utility>

#include "agent/tools/web.hpp"
#include "local_server.hpp"
#include "nlohmann/json.hpp"

namespace {

using reagent::agent::tools::WebSearchTool;
using reagent::test::LocalServer;

class WebSearchToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
            unsetenv(name);
        }
        server_.server().Post("/search", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            request_body_ = req.body;
            authorization_ = req.get_header_value("Authorization");
            res.status = status_;
            res.set_content(reply_, "application/json");
        });
        ASSERT_TRUE(server_.Start());
    }

    void Reply(int status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
        reply_ = std::move(body);
    }

    std::string RequestBody() {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_body_;
    }

    std::string Authorization() {
        std::lock_guard<std::mutex> lock(mutex_);
        return authorization_;
    }

    LocalServer server_;

private:
    std::mutex mutex_;
    int status_ = 200;
    std::string reply_;
    std::string request_body_;
    std::string authorization_;
};

TEST_F(WebSearchToolTest, ReturnsTopResultAsUrlAndContent) {
    Reply(200, R"({"query":"capital of Sweden","results":[)"
               R"({"title":"Stockholm","url":"https://example.org/stockholm","content":"Stockholm is the capital.","score":0.98},)"
               R"({"title":"Other","url":"https://example.org/other","content":"Second hit","score":0.5}]})");

    WebSearchTool tool("tvly-test", server_.BaseUrl());
    const auto result = tool.Execute({{"query", "capital of Sweden"}});
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.output,
              R"({"content":"Stockholm is the capital.","url":"https://example.org/stockholm"})");

    const auto sent = nlohmann::json::parse(RequestBody());
    EXPECT_EQ(sent.at("api_key"), "tvly-test");
    EXPECT_EQ(sent.at("query"), "capital of Sweden");
    EXPECT_EQ(sent.at("max_results"), 1);
    EXPECT_EQ(Authorization(), "Bearer tvly-test");
}

TEST_F(WebSearchToolTest, EmptyResultsFail) {
    Reply(200, R"({"query":"nothing","results":[]})");

    WebSearchTool tool("tvly-test", server_.BaseUrl());
    const auto result = tool.Execute({{"query", "nothing"}});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "web_search returned no results");
}

TEST_F(WebSearchToolTest, HttpErrorFails) {
    Reply(401, R"({"detail":{"error":"Unauthorized: missing or invalid API key."}})");

    WebSearchTool tool("bad-key", server_.BaseUrl());
    const auto result = tool.Execute({{"query", "anything"}});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "web_search HTTP 401");
}

TEST(WebSearchToolConfigTest, MissingKeyIsUnavailable) {
    WebSearchTool tool("");
    const auto result = tool.Execute({{"query", "capital of Sweden"}});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "Tool unavailable (API_KEY missing)");
}

TEST(WebSearchToolConfigTest, MalformedEndpointFails) {
    WebSearchTool tool("tvly-test", "http://127.0.0.1:notaport");
    const auto result = tool.Execute({{"query", "anything"}});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.rfind("invalid search endpoint", 0), 0u) << result.error;
}

}  // namespace
