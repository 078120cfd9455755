#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace shellbox::config {

std::filesystem::path DefaultConfigPath();

// Reads ~/.shellbox/config.json, then applies SHELLBOX_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

}  // namespace shellbox::config
