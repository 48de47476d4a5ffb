#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace codebox::config {

// Defaults, then the JSON file ($CODEBOX_CONFIG or ~/.codebox/config.json),
// then CODEBOX_* environment overrides.
Config LoadConfig();

// Defaults overlaid with a single JSON file; no environment lookups.
Config LoadConfigFromFile(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

}  // namespace codebox::config
