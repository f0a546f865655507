// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <health/HealthMonitor.hpp>
#include <mcp/ClientRegistry.hpp>
#include <mcpvisor/Config.hpp>
#include <workflow/WorkflowEngine.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief Parses "key=value" pairs into a workflow input object.
///
/// Values that parse as JSON keep their type, anything else is taken as a string.
[[nodiscard]] auto parseInputs(const std::vector<std::string>& pairs) -> Result<nlohmann::json>;

/// @brief Owns the registry, the health monitor and the workflow engine and runs one front-end mode.
class App
{
  public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Registers the configured servers and loads the configured workflows.
    ///
    /// Servers that fail to start stay registered with the monitor.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs one check cycle and prints statuses and metrics as JSON.
    [[nodiscard]] auto printStatus() -> int;

    [[nodiscard]] auto listTools(std::string_view server) -> int;

    /// @param arguments JSON object text.
    [[nodiscard]] auto callTool(std::string_view server, std::string_view tool, std::string_view arguments) -> int;

    /// @brief Runs a workflow to completion and prints the execution as JSON.
    /// @param workflow Name or id of a configured workflow, or a path to a definition file.
    [[nodiscard]] auto runWorkflow(std::string_view workflow, const std::vector<std::string>& inputs) -> int;

    /// @brief Monitors the servers until SIGINT or SIGTERM.
    [[nodiscard]] auto runDaemon() -> int;

    [[nodiscard]] auto registry() -> ClientRegistry&;
    [[nodiscard]] auto monitor() -> HealthMonitor&;
    [[nodiscard]] auto engine() -> WorkflowEngine&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpvisor
