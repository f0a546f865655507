// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace mcpvisor
{

/// @brief Launch and supervision settings for a single MCP server.
///
/// Immutable once registered; an update replaces the whole value.
struct ServerConfig
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// @brief Per-call response timeout.
    std::chrono::milliseconds timeout { std::chrono::seconds(30) };

    /// @brief Total attempts for a tool call that times out.
    int retryCount = 3;

    /// @brief Delay before the second attempt; doubled for each further attempt.
    std::chrono::milliseconds retryBackoff { std::chrono::seconds(1) };
    std::chrono::milliseconds retryBackoffMax { std::chrono::seconds(10) };

    std::chrono::seconds healthCheckInterval { 60 };
    bool autoRestart = true;

    /// @brief How long the process must stay alive after spawn to count as started.
    std::chrono::milliseconds startupGrace { 100 };

    /// @brief Bounded wait between SIGTERM and SIGKILL on shutdown.
    std::chrono::milliseconds shutdownGrace { std::chrono::seconds(5) };
};

} // namespace mcpvisor
