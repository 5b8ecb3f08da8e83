#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace proverd::config {

// Reads KEY=VALUE lines from `path` into the environment. Variables that are
// already set win. Missing file is not an error.
void LoadDotEnv(const std::filesystem::path& path);

// Defaults, then the JSON file at `config_path` (when non-empty and present),
// then PROVERD_* / PORT / ENV environment variables.
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

}  // namespace proverd::config
