#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace reagent::config {

std::filesystem::path GetConfigPath();

// Defaults, then ~/.reagent/config.json, then REAGENT_* environment variables.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

}  // namespace reagent::config
