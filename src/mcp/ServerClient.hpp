// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Client.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Protocol.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace mcpvisor
{

/// @brief Creates and starts the transport for a server configuration.
using TransportFactory = std::function<Result<std::unique_ptr<Transport>>(const ServerConfig& config)>;

/// @brief Returns a factory that spawns the configured command over stdio pipes.
[[nodiscard]] auto makeStdioTransportFactory() -> TransportFactory;

/// @brief Client for one MCP server process.
///
/// Handles the lifecycle Uninitialized -> Initializing -> Ready -> ShuttingDown -> Terminated,
/// with Failed reachable from Initializing and Ready. Request/response exchanges are
/// serialized by a per-client mutex and correlated by request id, so the health monitor
/// and workflow steps can share one client safely.
class ServerClient: public Client
{
  public:
    /// @brief Ping round trips slower than this are reported as degraded.
    static constexpr auto SlowResponseThreshold = std::chrono::milliseconds(1000);

    /// @brief Upper bound for a liveness ping.
    static constexpr auto PingTimeout = std::chrono::milliseconds(5000);

    /// @brief Bound on delivering the cancellation notice during shutdown.
    static constexpr auto CancelNotifyTimeout = std::chrono::milliseconds(1000);

    /// @brief Constructs a client; nothing is spawned until initialize().
    /// @param config The server configuration.
    /// @param transportFactory Creates the transport on initialize().
    explicit ServerClient(ServerConfig config, TransportFactory transportFactory = makeStdioTransportFactory());
    ~ServerClient() override;

    ServerClient(const ServerClient&) = delete;
    ServerClient& operator=(const ServerClient&) = delete;

    [[nodiscard]] auto config() const -> const ServerConfig& override;
    [[nodiscard]] auto state() const -> ClientState override;

    /// @brief Spawns the process, performs the initialize handshake and caches the tool list.
    ///
    /// A no-op when the client is already ready with a live process.
    /// @return Success, or a ConnectionError (TimeoutError if the handshake timed out).
    [[nodiscard]] auto initialize() -> VoidResult override;

    /// @brief Calls a tool, retrying timeouts with exponential backoff.
    /// @return The tool result, TimeoutError after the last attempt, ToolError for an
    ///         RPC error response, ConnectionError if the client is not ready.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                const CallOptions& options = {}) -> Result<ToolResult> override;

    [[nodiscard]] auto healthCheck() -> HealthStatus override;
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDefinition>> override;
    void shutdown() override;

    /// @brief Returns the identity reported by the server during the handshake.
    [[nodiscard]] auto serverInfo() const -> mcp::InitializeResult;

  private:
    ServerConfig _config;
    TransportFactory _transportFactory;

    mutable std::mutex _stateMutex;
    ClientState _state = ClientState::Uninitialized;
    std::shared_ptr<Transport> _transport;
    std::vector<ToolDefinition> _tools;
    mcp::InitializeResult _serverInfo;

    std::mutex _lifecycleMutex;
    std::timed_mutex _callMutex;
    std::atomic<int64_t> _nextId = 1;

    [[nodiscard]] auto readyTransport() const -> Result<std::shared_ptr<Transport>>;
    [[nodiscard]] auto failInitialization(Error error) -> VoidResult;

    /// @brief Sends a request and waits for the response with the matching id.
    ///
    /// Requires _callMutex. Messages with other ids (late replies to timed-out
    /// requests, server notifications) are discarded.
    [[nodiscard]] auto exchange(Transport& transport,
                                std::string_view method,
                                nlohmann::json params,
                                std::chrono::milliseconds timeout) -> Result<jsonrpc::Response>;

    [[nodiscard]] auto callToolOnce(Transport& transport,
                                    std::string_view name,
                                    const nlohmann::json& arguments,
                                    std::chrono::milliseconds timeout) -> Result<ToolResult>;
};

} // namespace mcpvisor
