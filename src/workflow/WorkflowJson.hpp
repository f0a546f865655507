// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <workflow/Workflow.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace mcpvisor
{

/// @brief Parses a workflow definition document.
///
/// Recognized keys: id, name, description, timeout (seconds), parallel,
/// onFailure ("stop" | "continue" | "retry") and steps[] with id, name,
/// server, tool, arguments, dependsOn, timeout (seconds) and retryCount.
/// Only the document shape is checked here; see compileWorkflow() for semantics.
/// @return The definition or a WorkflowValidationError.
[[nodiscard]] auto parseWorkflowDefinition(const nlohmann::json& document) -> Result<WorkflowDefinition>;

/// @brief Reads and parses a workflow definition file.
[[nodiscard]] auto loadWorkflowFile(const std::filesystem::path& path) -> Result<WorkflowDefinition>;

[[nodiscard]] auto toJson(const WorkflowStep& step) -> nlohmann::json;
[[nodiscard]] auto toJson(const WorkflowDefinition& definition) -> nlohmann::json;
[[nodiscard]] auto toJson(const ExecutionLogEntry& entry) -> nlohmann::json;
[[nodiscard]] auto toJson(const WorkflowExecution& execution) -> nlohmann::json;

} // namespace mcpvisor
