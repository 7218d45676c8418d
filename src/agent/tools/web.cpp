#include "agent/tools/web.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>

#include "httplib.h"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

void ApplyProxy(httplib::Client& client) {
    std::string host;
    int port = 0;
    for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
        if (ParseProxyHostPort(GetEnv(name), host, port)) {
            client.set_proxy(host, port);
            return;
        }
    }
}

}  // namespace

namespace reagent::agent::tools {

WebSearchTool::WebSearchTool(std::string api_key, std::string api_base)
    : api_key_(std::move(api_key))
    , api_base_(std::move(api_base)) {}

std::string WebSearchTool::Description() const {
    return "Performs a web search using the Tavily API.\n"
           "Tavily specializes in providing AI-optimized search results with high accuracy and relevance.\n"
           "\n"
           "Args:\n"
           "    query (str): The search query string to be processed by Tavily's search engine.\n"
           "\n"
           "Returns:\n"
           "    dict: A dictionary containing the top search result. The dictionary contains:\n"
           "        - url: The URL of the webpage\n"
           "        - content: A snippet or content preview";
}

std::string WebSearchTool::ParametersJson() const {
    return R"({"type":"object","properties":{"query":{"type":"string"}},"required":["query"]})";
}

ToolResult WebSearchTool::Execute(const nlohmann::json& params) {
    const auto query = params.at("query").get<std::string>();
    if (query.empty()) {
        return ToolResult::Fail("missing query");
    }
    if (api_key_.empty()) {
        return ToolResult::Fail("Tool unavailable (API_KEY missing)");
    }

    utils::Url parsed{};
    try {
        parsed = utils::ParseUrl(api_base_, utils::Url{.https = true, .port = 443});
    } catch (const std::invalid_argument& ex) {
        return ToolResult::Fail(std::string("invalid search endpoint: ") + ex.what());
    }
    httplib::Client client(parsed.Origin());
    client.set_connection_timeout(15);
    client.set_read_timeout(30);
    ApplyProxy(client);

    nlohmann::json payload = {
        {"api_key", api_key_},
        {"query", query},
        {"max_results", 1}
    };
    httplib::Headers headers{{"Accept", "application/json"},
                             {"Authorization", "Bearer " + api_key_}};
    const auto endpoint = parsed.base_path + "/search";
    auto response = client.Post(endpoint.c_str(), headers, payload.dump(), "application/json");
    if (!response) {
        utils::LogWarn("web", "request failed: " + httplib::to_string(response.error()));
        return ToolResult::Fail("web_search request failed");
    }
    if (response->status >= 400) {
        return ToolResult::Fail("web_search HTTP " + std::to_string(response->status));
    }

    auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return ToolResult::Fail("web_search invalid response");
    }
    if (!json.contains("results") || !json["results"].is_array() || json["results"].empty()) {
        return ToolResult::Fail("web_search returned no results");
    }
    const auto& top = json["results"][0];
    nlohmann::json hit = {
        {"url", top.value("url", "")},
        {"content", top.value("content", "")}
    };
    return ToolResult::Ok(hit.dump());
}

}  // namespace reagent::agent::tools
