#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace safexec::config {

// Defaults, then ~/.safexec/config.json, then SAFEXEC_* environment.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

std::filesystem::path ExpandHome(const std::string& path);

}  // namespace safexec::config
