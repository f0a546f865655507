// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpvisor
{

namespace
{

    auto secondsToMillis(double seconds) -> std::chrono::milliseconds
    {
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(seconds * 1000.0));
    }

    auto parseServer(const std::string& name, const nlohmann::json& node) -> Result<ServerConfig>
    {
        if (!node.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' must be an object", name));

        auto server = ServerConfig {};
        server.name = name;
        server.command = json::getStringOr(node, "command", "");
        server.args = json::getStringArray(node, "args");
        server.env = json::getStringMap(node, "env");
        server.timeout = secondsToMillis(json::getDoubleOr(node, "timeout", 30.0));
        server.retryCount = json::getIntOr(node, "retryCount", server.retryCount);
        server.retryBackoff = secondsToMillis(json::getDoubleOr(node, "retryBackoff", 1.0));
        server.healthCheckInterval = std::chrono::seconds(
            json::getIntOr(node, "healthCheckInterval", static_cast<int>(server.healthCheckInterval.count())));
        server.autoRestart = json::getBoolOr(node, "autoRestart", server.autoRestart);
        server.shutdownGrace = secondsToMillis(json::getDoubleOr(node, "shutdownGrace", 5.0));

        if (server.command.empty())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' has no command", name));
        if (server.timeout.count() <= 0)
            return makeError(ErrorCode::ConfigError, std::format("Server '{}': timeout must be positive", name));
        if (server.retryCount < 1)
            return makeError(ErrorCode::ConfigError, std::format("Server '{}': retryCount must be at least 1", name));
        if (server.healthCheckInterval.count() <= 0)
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}': healthCheckInterval must be positive", name));

        return server;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcpvisor";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpvisor";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(const nlohmann::json& root, std::string_view baseDir) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration must be a JSON object");

    auto config = AppConfig {};

    // Health monitor section
    if (root.contains("healthMonitor"))
    {
        auto const& node = root["healthMonitor"];
        auto& monitor = config.healthMonitor;
        monitor.checkInterval = std::chrono::seconds(
            json::getIntOr(node, "checkInterval", static_cast<int>(monitor.checkInterval.count())));
        monitor.failureThreshold = json::getIntOr(node, "failureThreshold", monitor.failureThreshold);
        monitor.restartCooldown = std::chrono::seconds(
            json::getIntOr(node, "restartCooldown", static_cast<int>(monitor.restartCooldown.count())));
        monitor.slowResponseThreshold = std::chrono::milliseconds(
            json::getIntOr(node, "slowResponseMs", static_cast<int>(monitor.slowResponseThreshold.count())));
        monitor.historySize = static_cast<size_t>(
            std::max(1, json::getIntOr(node, "historySize", static_cast<int>(monitor.historySize))));

        if (auto valid = validate(monitor); !valid)
            return makeError(ErrorCode::ConfigError, std::format("healthMonitor: {}", valid.error().message));
    }

    // MCP servers section
    if (root.contains("mcpServers") && root["mcpServers"].is_object())
    {
        for (const auto& [name, node]: root["mcpServers"].items())
        {
            if (json::getBoolOr(node, "disabled", false))
            {
                log::debug("Skipping disabled MCP server '{}'", name);
                continue;
            }

            auto server = parseServer(name, node);
            if (!server)
                return std::unexpected(server.error());
            config.mcpServers[name] = std::move(*server);
        }
    }

    // Workflow files
    for (const auto& path: json::getStringArray(root, "workflows"))
    {
        auto resolved = std::filesystem::path(path);
        if (resolved.is_relative() && !baseDir.empty())
            resolved = std::filesystem::path(baseDir) / resolved;
        config.workflows.push_back(resolved.string());
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    return parseConfig(*parseResult, std::filesystem::path(path).parent_path().string());
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mcpvisor
