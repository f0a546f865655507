// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;

/// @brief Liveness classification of an MCP server.
enum class ServerStatus : std::uint8_t
{
    Healthy,
    Degraded,
    Unhealthy,
    Offline,
    Starting,
    Stopping,
};

/// @brief Converts a ServerStatus to its wire/display name.
[[nodiscard]] constexpr auto serverStatusToString(ServerStatus status) -> std::string_view
{
    switch (status)
    {
        case ServerStatus::Healthy: return "healthy";
        case ServerStatus::Degraded: return "degraded";
        case ServerStatus::Unhealthy: return "unhealthy";
        case ServerStatus::Offline: return "offline";
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Stopping: return "stopping";
    }
    return "unknown";
}

/// @brief Returns true if the server answered the liveness check.
[[nodiscard]] constexpr auto isResponsive(ServerStatus status) -> bool
{
    return status == ServerStatus::Healthy || status == ServerStatus::Degraded;
}

/// @brief Point-in-time health view of one server.
struct HealthStatus
{
    ServerStatus status = ServerStatus::Offline;
    double responseTimeMs = 0.0;
    SystemClock::time_point lastCheck {};
    std::optional<std::string> errorMessage;
    double uptimePercentage = 0.0;
};

/// @brief Defines a tool exposed by an MCP server.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
    std::vector<std::string> requiredParameters;
};

/// @brief Result of a successful tools/call round trip.
///
/// isError reflects the tool-level flag of the result; RPC-level failures
/// are reported as ToolError instead.
struct ToolResult
{
    nlohmann::json raw;
    std::string content;
    bool isError = false;
};

/// @brief Serializes a HealthStatus for status output.
[[nodiscard]] auto toJson(const HealthStatus& status) -> nlohmann::json;

/// @brief Formats a system clock time point as ISO-8601 UTC with millisecond precision.
[[nodiscard]] auto formatTimestamp(SystemClock::time_point tp) -> std::string;

/// @brief Generates a random RFC 4122 version 4 identifier.
[[nodiscard]] auto generateId() -> std::string;

} // namespace mcpvisor
