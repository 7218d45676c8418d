#include <gtest/gtest.h>

#include <stdexcept>

#include "utils/url.hpp"

namespace {

using reagent::utils::ParseUrl;
using reagent::utils::Url;

const Url kPlainDefaults{.https = false, .port = 11434};

TEST(UrlTest, SchemeSetsDefaultPort) {
    const auto url = ParseUrl("https://api.tavily.com", kPlainDefaults);
    EXPECT_TRUE(url.https);
    EXPECT_EQ(url.host, "api.tavily.com");
    EXPECT_EQ(url.port, 443);
    EXPECT_EQ(url.base_path, "");
    EXPECT_EQ(url.Origin(), "https://api.tavily.com:443");
}

TEST(UrlTest, BareHostUsesDefaults) {
    const auto url = ParseUrl("localhost", kPlainDefaults);
    EXPECT_FALSE(url.https);
    EXPECT_EQ(url.port, 11434);
    EXPECT_EQ(url.Origin(), "http://localhost:11434");
}

TEST(UrlTest, ExplicitPortAndPath) {
    const auto url = ParseUrl("http://10.0.0.5:8080/ollama/", kPlainDefaults);
    EXPECT_EQ(url.host, "10.0.0.5");
    EXPECT_EQ(url.port, 8080);
    EXPECT_EQ(url.base_path, "/ollama");
}

TEST(UrlTest, RejectsBadPortsAndEmptyHost) {
    EXPECT_THROW(ParseUrl("localhost:abc", kPlainDefaults), std::invalid_argument);
    EXPECT_THROW(ParseUrl("localhost:80x", kPlainDefaults), std::invalid_argument);
    EXPECT_THROW(ParseUrl("localhost:70000", kPlainDefaults), std::invalid_argument);
    EXPECT_THROW(ParseUrl("localhost:", kPlainDefaults), std::invalid_argument);
    EXPECT_THROW(ParseUrl("http://:8080", kPlainDefaults), std::invalid_argument);
}

}  // namespace
