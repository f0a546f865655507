// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Client.hpp>
#include <mcp/ServerConfig.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief Constructs an (uninitialized) client for a server configuration.
using ClientFactory = std::function<std::shared_ptr<Client>(const ServerConfig& config)>;

/// @brief Returns a factory producing ServerClient instances over stdio.
[[nodiscard]] auto makeServerClientFactory() -> ClientFactory;

/// @brief Keyed collection of MCP server clients.
///
/// The map is lock-protected; slow operations (initialize, health checks,
/// shutdown) run outside the lock on shared client handles.
class ClientRegistry
{
  public:
    explicit ClientRegistry(ClientFactory factory = makeServerClientFactory());
    ~ClientRegistry();

    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;

    /// @brief Creates and initializes a client. A duplicate name is a no-op success.
    /// @return Success or the initialization error.
    [[nodiscard]] auto addClient(const ServerConfig& config) -> VoidResult;

    /// @brief Shuts down and evicts a client. Unknown names are ignored.
    /// @return true if a client was removed.
    auto removeClient(std::string_view name) -> bool;

    /// @brief Returns the client registered under @p name, or nullptr.
    [[nodiscard]] auto getClient(std::string_view name) const -> std::shared_ptr<Client>;

    /// @brief Runs healthCheck() on every client concurrently.
    ///
    /// A client whose check throws is reported as UNHEALTHY; the aggregate never fails.
    [[nodiscard]] auto getAllHealthStatus() const -> std::map<std::string, HealthStatus>;

    /// @brief Runs healthCheck() concurrently on the named clients.
    ///
    /// Names without a registered client are reported as OFFLINE.
    [[nodiscard]] auto getHealthStatus(const std::vector<std::string>& names) const
        -> std::map<std::string, HealthStatus>;

    /// @brief Calls a tool on a named server.
    [[nodiscard]] auto callTool(std::string_view server,
                                std::string_view tool,
                                const nlohmann::json& arguments,
                                const CallOptions& options = {}) const -> Result<ToolResult>;

    /// @brief Lists the tools of a named server.
    [[nodiscard]] auto listTools(std::string_view server) const -> Result<std::vector<ToolDefinition>>;

    /// @brief Returns the names of all registered servers in sorted order.
    [[nodiscard]] auto serverNames() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const -> size_t;

    /// @brief Shuts down every client concurrently and clears the registry.
    void shutdownAll();

  private:
    ClientFactory _factory;
    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<Client>, std::less<>> _clients;
};

} // namespace mcpvisor
