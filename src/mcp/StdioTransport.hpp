// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpvisor
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::chrono::milliseconds startupGrace { 100 };
    std::chrono::milliseconds shutdownGrace { std::chrono::seconds(5) };
};

/// @brief Transport that talks to an MCP server over the stdin/stdout pipes of a child process.
///
/// The child inherits the parent's environment with the configured overrides
/// applied, and the parent's stderr. Pipes are created close-on-exec so that
/// sibling servers never hold each other's stdin open. The parent's end of the
/// stdin pipe is non-blocking, so a server that stops reading cannot stall a
/// writer past its deadline.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Spawns the server process.
    /// @return Success, or a ConnectionError if the process cannot be spawned or
    ///         exits within the startup grace period.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the child's process id, if one is running.
    [[nodiscard]] auto pid() const -> std::optional<int>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpvisor
