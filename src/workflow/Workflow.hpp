// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpvisor
{

enum class ExecutionMode : std::uint8_t
{
    Sequential,
    Parallel,
};

/// @brief What the engine does when a step fails.
enum class FailurePolicy : std::uint8_t
{
    Stop,     ///< Abort the execution and mark it failed.
    Continue, ///< Record the failure and keep going; dependents still run.
    Retry,    ///< Re-run the failed step once with its full budget, then behave like Stop.
};

enum class ExecutionStatus : std::uint8_t
{
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
};

[[nodiscard]] constexpr auto failurePolicyToString(FailurePolicy policy) -> std::string_view
{
    switch (policy)
    {
        case FailurePolicy::Stop: return "stop";
        case FailurePolicy::Continue: return "continue";
        case FailurePolicy::Retry: return "retry";
    }
    return "stop";
}

[[nodiscard]] auto failurePolicyFromString(std::string_view name) -> std::optional<FailurePolicy>;

[[nodiscard]] constexpr auto executionStatusToString(ExecutionStatus status) -> std::string_view
{
    switch (status)
    {
        case ExecutionStatus::Pending: return "pending";
        case ExecutionStatus::Running: return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto isTerminal(ExecutionStatus status) -> bool
{
    return status == ExecutionStatus::Completed || status == ExecutionStatus::Failed
           || status == ExecutionStatus::Cancelled;
}

/// @brief Returns true if an execution may move from @p from to @p to.
///
/// Transitions only move forward; terminal states are final.
[[nodiscard]] constexpr auto canTransition(ExecutionStatus from, ExecutionStatus to) -> bool
{
    switch (from)
    {
        case ExecutionStatus::Pending: return to != ExecutionStatus::Pending && to != ExecutionStatus::Completed;
        case ExecutionStatus::Running: return isTerminal(to);
        case ExecutionStatus::Completed:
        case ExecutionStatus::Failed:
        case ExecutionStatus::Cancelled: return false;
    }
    return false;
}

/// @brief One tool invocation within a workflow.
struct WorkflowStep
{
    std::string id;
    std::string name;
    std::string server;
    std::string tool;

    /// @brief Tool arguments; string values may contain ${...} references.
    nlohmann::json arguments = nlohmann::json::object();

    std::vector<std::string> dependsOn;
    std::chrono::seconds timeout { 60 };

    /// @brief Total attempts for connection and timeout failures.
    int retryCount = 1;
};

struct WorkflowDefinition
{
    std::string id;
    std::string name;
    std::string description;
    std::vector<WorkflowStep> steps;
    std::chrono::seconds timeout { 300 };
    ExecutionMode mode = ExecutionMode::Sequential;
    FailurePolicy onFailure = FailurePolicy::Stop;
};

enum class ExecutionEvent : std::uint8_t
{
    Started,
    Completed,
    Failed,
    Retrying,
    Cancelled,
};

[[nodiscard]] constexpr auto executionEventToString(ExecutionEvent event) -> std::string_view
{
    switch (event)
    {
        case ExecutionEvent::Started: return "started";
        case ExecutionEvent::Completed: return "completed";
        case ExecutionEvent::Failed: return "failed";
        case ExecutionEvent::Retrying: return "retrying";
        case ExecutionEvent::Cancelled: return "cancelled";
    }
    return "unknown";
}

struct ExecutionLogEntry
{
    SystemClock::time_point timestamp;
    std::string stepId; ///< Empty for execution-wide events.
    ExecutionEvent event = ExecutionEvent::Started;
    std::string message;
};

/// @brief Snapshot of one run of a workflow.
struct WorkflowExecution
{
    std::string id;
    std::string workflowId;
    ExecutionStatus status = ExecutionStatus::Pending;
    nlohmann::json inputs = nlohmann::json::object();

    /// @brief Step results keyed by step id.
    nlohmann::json outputs = nlohmann::json::object();

    std::optional<std::string> currentStep;
    SystemClock::time_point startedAt {};
    std::optional<SystemClock::time_point> completedAt;
    std::optional<std::string> errorMessage;
    std::optional<std::string> failedStep;
    std::vector<ExecutionLogEntry> log;
};

} // namespace mcpvisor
