#pragma once

#include <string>

namespace reagent::config {

struct AgentConfig {
    std::string host = "http://localhost:11434";
    std::string model = "llama3.1";
    int max_steps = 10;
    int num_ctx = 32768;
    int request_timeout_s = 300;
};

struct WebSearchConfig {
    std::string api_key;
    std::string api_base = "https://api.tavily.com";
};

struct ScriptConfig {
    bool enabled = true;
    std::string work_dir = "work";
    std::string interpreter = "python3";
    int timeout_s = 60;
};

struct ToolsConfig {
    WebSearchConfig web_search;
    ScriptConfig script;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    AgentConfig agent;
    ToolsConfig tools;
    LoggingConfig logging;
};

}  // namespace reagent::config
