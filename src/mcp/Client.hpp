// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ServerConfig.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief Lifecycle of a client and the server process it owns.
enum class ClientState : std::uint8_t
{
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Terminated,
    Failed,
};

[[nodiscard]] constexpr auto clientStateToString(ClientState state) -> std::string_view
{
    switch (state)
    {
        case ClientState::Uninitialized: return "uninitialized";
        case ClientState::Initializing: return "initializing";
        case ClientState::Ready: return "ready";
        case ClientState::ShuttingDown: return "shutting-down";
        case ClientState::Terminated: return "terminated";
        case ClientState::Failed: return "failed";
    }
    return "unknown";
}

/// @brief Per-call overrides of the server's configured timeout and retry budget.
struct CallOptions
{
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<int> attempts;
};

/// @brief Abstract interface of a client that owns one MCP server end-to-end.
///
/// The registry, the health monitor and the workflow engine only see this
/// interface, so tests can substitute scripted clients.
class Client
{
  public:
    virtual ~Client() = default;

    /// @brief Returns the configuration the client was created with.
    [[nodiscard]] virtual auto config() const -> const ServerConfig& = 0;

    /// @brief Returns the current lifecycle state.
    [[nodiscard]] virtual auto state() const -> ClientState = 0;

    /// @brief Spawns the server and performs the capability handshake.
    [[nodiscard]] virtual auto initialize() -> VoidResult = 0;

    /// @brief Invokes a tool on the server.
    [[nodiscard]] virtual auto callTool(std::string_view name,
                                        const nlohmann::json& arguments,
                                        const CallOptions& options = {}) -> Result<ToolResult> = 0;

    /// @brief Classifies the server's current liveness. Never fails.
    [[nodiscard]] virtual auto healthCheck() -> HealthStatus = 0;

    /// @brief Returns the tools advertised by the server.
    [[nodiscard]] virtual auto listTools() -> Result<std::vector<ToolDefinition>> = 0;

    /// @brief Stops the server. Always leaves the client terminated.
    virtual void shutdown() = 0;

    [[nodiscard]] auto name() const -> const std::string& { return config().name; }
};

} // namespace mcpvisor
