// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <health/HealthMonitor.hpp>
#include <mcp/ServerConfig.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief Top-level application configuration.
struct AppConfig
{
    HealthMonitorConfig healthMonitor;

    /// @brief Enabled servers keyed by name; disabled entries are dropped while loading.
    std::map<std::string, ServerConfig> mcpServers;

    /// @brief Workflow definition files, resolved against the config file's directory.
    std::vector<std::string> workflows;
};

/// @brief Returns $XDG_CONFIG_HOME/mcpvisor, falling back to ~/.config/mcpvisor.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Builds an AppConfig from a parsed configuration document.
/// @param root The configuration document.
/// @param baseDir Directory that relative workflow paths are resolved against.
/// @return The configuration or a ConfigError.
[[nodiscard]] auto parseConfig(const nlohmann::json& root, std::string_view baseDir = {}) -> Result<AppConfig>;

/// @brief Loads configuration from a JSON file.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Loads the default config file, or returns defaults if it does not exist.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

} // namespace mcpvisor
