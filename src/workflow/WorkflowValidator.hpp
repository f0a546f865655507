// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <workflow/Workflow.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace mcpvisor
{

/// @brief A step with its dependency edges resolved to plan indices.
struct PlannedStep
{
    WorkflowStep step;
    std::vector<size_t> dependencies;
    std::vector<size_t> dependents;
};

/// @brief Validated, executable form of a workflow definition.
///
/// Steps keep their definition order; @c order is a topological order in
/// which ties are broken by definition order.
struct ExecutionPlan
{
    WorkflowDefinition definition;
    std::vector<PlannedStep> steps;
    std::vector<size_t> order;
};

/// @brief Returns every problem found in a definition, empty if it is valid.
[[nodiscard]] auto collectValidationErrors(const WorkflowDefinition& definition) -> std::vector<std::string>;

/// @brief Validates a definition and compiles it into an execution plan.
/// @return The plan, or a WorkflowValidationError listing all problems.
[[nodiscard]] auto compileWorkflow(const WorkflowDefinition& definition) -> Result<ExecutionPlan>;

} // namespace mcpvisor
