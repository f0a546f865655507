// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor::mcp
{

constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };

namespace method
{
    constexpr auto Initialize = std::string_view { "initialize" };
    constexpr auto Initialized = std::string_view { "notifications/initialized" };
    constexpr auto Cancelled = std::string_view { "notifications/cancelled" };
    constexpr auto ToolsList = std::string_view { "tools/list" };
    constexpr auto ToolsCall = std::string_view { "tools/call" };
    constexpr auto Ping = std::string_view { "ping" };
} // namespace method

/// @brief Parameters of the initialize request.
struct InitializeParams
{
    std::string protocolVersion { ProtocolVersion };
    std::string clientName = "mcpvisor";
    std::string clientVersion = "1.0.0";
};

/// @brief Capabilities and identity reported by the server during initialization.
struct InitializeResult
{
    std::string protocolVersion;
    std::string serverName;
    std::string serverVersion;
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
};

/// @brief Parameters of a tools/call request.
struct ToolCallParams
{
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

[[nodiscard]] auto toJson(const InitializeParams& params) -> nlohmann::json;
[[nodiscard]] auto toJson(const ToolCallParams& params) -> nlohmann::json;

/// @brief Validates and decodes the result of an initialize request.
[[nodiscard]] auto parseInitializeResult(const nlohmann::json& result) -> Result<InitializeResult>;

/// @brief Validates and decodes the result of a tools/list request.
///
/// Entries without a string name are rejected rather than silently dropped.
[[nodiscard]] auto parseToolsListResult(const nlohmann::json& result) -> Result<std::vector<ToolDefinition>>;

/// @brief Decodes the result of a tools/call request.
///
/// Text content items are concatenated with newlines; the raw result is kept.
[[nodiscard]] auto parseToolCallResult(const nlohmann::json& result) -> Result<ToolResult>;

} // namespace mcpvisor::mcp
