// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ClientRegistry.hpp>
#include <workflow/Workflow.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

/// @brief Stores workflow definitions and runs them against the client registry.
///
/// Every execution runs on its own thread. Sequential workflows run their
/// steps one at a time in dependency order; parallel workflows run every step
/// whose dependencies have finished concurrently, then re-evaluate readiness.
/// Cancellation and the overall workflow timeout are checked before each step
/// (parallel: before each batch of ready steps); a step already running is
/// not interrupted.
class WorkflowEngine
{
  public:
    explicit WorkflowEngine(ClientRegistry& registry);

    /// @brief Cancels all running executions and waits for their threads.
    ~WorkflowEngine();

    WorkflowEngine(const WorkflowEngine&) = delete;
    WorkflowEngine& operator=(const WorkflowEngine&) = delete;

    /// @brief Validates and stores a workflow definition.
    ///
    /// An empty id is replaced by a generated one.
    /// @return The workflow id, a WorkflowValidationError, or InvalidArgument if the id is taken.
    [[nodiscard]] auto createWorkflow(WorkflowDefinition definition) -> Result<std::string>;

    /// @brief Starts an execution of a stored workflow.
    /// @param inputs Initial variables; must be a JSON object.
    /// @return The execution id or NotFound.
    [[nodiscard]] auto executeWorkflow(std::string_view workflowId,
                                       nlohmann::json inputs = nlohmann::json::object()) -> Result<std::string>;

    /// @brief Stores @p definition and starts an execution of it.
    [[nodiscard]] auto execute(WorkflowDefinition definition, nlohmann::json inputs = nlohmann::json::object())
        -> Result<std::string>;

    [[nodiscard]] auto getExecutionStatus(std::string_view executionId) const -> Result<WorkflowExecution>;

    /// @brief Requests cancellation of a pending or running execution.
    ///
    /// The execution keeps its current status until the step in flight returns;
    /// its thread then records that step's result and marks it CANCELLED.
    /// @return false if the execution is unknown, already finished, or already being cancelled.
    auto cancelExecution(std::string_view executionId) -> bool;

    [[nodiscard]] auto listWorkflows() const -> std::vector<WorkflowDefinition>;
    [[nodiscard]] auto getWorkflow(std::string_view workflowId) const -> Result<WorkflowDefinition>;
    [[nodiscard]] auto listExecutions() const -> std::vector<WorkflowExecution>;

    /// @brief Blocks until the execution reaches a terminal state.
    /// @return The final snapshot, NotFound, or TimeoutError if it is still running.
    [[nodiscard]] auto waitForExecution(std::string_view executionId, std::chrono::milliseconds timeout) const
        -> Result<WorkflowExecution>;

    /// @brief Cancels every execution and joins all execution threads.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpvisor
