#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace verdict::config {

// Defaults, then ~/.verdict/config.json, then VERDICT_* environment variables.
Config LoadConfig();

// Defaults, then the given file, then VERDICT_* environment variables.
Config LoadConfigFromFile(const std::filesystem::path& path);

}  // namespace verdict::config
