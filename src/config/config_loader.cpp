#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "utils/logging.hpp"

namespace reagent::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-integer value '" + value + "'");
        return fallback;
    }
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".reagent" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("agent") && data["agent"].is_object()) {
        const auto& agent = data["agent"];
        ApplyString(config.agent.host, agent, "host");
        ApplyString(config.agent.model, agent, "model");
        ApplyInt(config.agent.max_steps, agent, "maxSteps");
        ApplyInt(config.agent.num_ctx, agent, "numCtx");
        ApplyInt(config.agent.request_timeout_s, agent, "requestTimeoutS");
    }

    if (data.contains("tools") && data["tools"].is_object()) {
        const auto& tools = data["tools"];
        if (tools.contains("webSearch") && tools["webSearch"].is_object()) {
            const auto& search = tools["webSearch"];
            ApplyString(config.tools.web_search.api_key, search, "apiKey");
            ApplyString(config.tools.web_search.api_base, search, "apiBase");
        }
        if (tools.contains("script") && tools["script"].is_object()) {
            const auto& script = tools["script"];
            if (script.contains("enabled") && script["enabled"].is_boolean()) {
                config.tools.script.enabled = script["enabled"].get<bool>();
            }
            ApplyString(config.tools.script.work_dir, script, "workDir");
            ApplyString(config.tools.script.interpreter, script, "interpreter");
            ApplyInt(config.tools.script.timeout_s, script, "timeoutS");
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto host = GetEnvFallback("REAGENT_AGENT__HOST", "OLLAMA_HOST");
    if (!host.empty()) {
        config.agent.host = host;
    }

    const auto model = GetEnv("REAGENT_AGENT__MODEL");
    if (!model.empty()) {
        config.agent.model = model;
    }

    const auto max_steps = GetEnv("REAGENT_AGENT__MAX_STEPS");
    if (!max_steps.empty()) {
        config.agent.max_steps = ParseInt(max_steps, config.agent.max_steps);
    }

    const auto num_ctx = GetEnv("REAGENT_AGENT__NUM_CTX");
    if (!num_ctx.empty()) {
        config.agent.num_ctx = ParseInt(num_ctx, config.agent.num_ctx);
    }

    const auto search_key = GetEnvFallback("REAGENT_TOOLS__WEB_SEARCH__API_KEY", "TAVILY_API_KEY");
    if (!search_key.empty()) {
        config.tools.web_search.api_key = search_key;
    }

    const auto script_enabled = GetEnv("REAGENT_TOOLS__SCRIPT__ENABLED");
    if (!script_enabled.empty()) {
        config.tools.script.enabled = ParseBool(script_enabled);
    }

    const auto work_dir = GetEnv("REAGENT_TOOLS__SCRIPT__WORK_DIR");
    if (!work_dir.empty()) {
        config.tools.script.work_dir = work_dir;
    }

    const auto interpreter = GetEnv("REAGENT_TOOLS__SCRIPT__INTERPRETER");
    if (!interpreter.empty()) {
        config.tools.script.interpreter = interpreter;
    }

    const auto script_timeout = GetEnv("REAGENT_TOOLS__SCRIPT__TIMEOUT_S");
    if (!script_timeout.empty()) {
        config.tools.script.timeout_s = ParseInt(script_timeout, config.tools.script.timeout_s);
    }

    const auto log_level = GetEnv("REAGENT_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::LogWarn("config", "invalid json in " + config_path.string() + ", keeping defaults");
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

}  // namespace reagent::config
