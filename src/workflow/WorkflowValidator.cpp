// SPDX-License-Identifier: Apache-2.0
#include "WorkflowValidator.hpp"

#include <format>
#include <map>
#include <set>
#include <string_view>
#include <utility>

namespace mcpvisor
{

namespace
{

    /// @brief Builds the step arena and a topological order, appending every problem to @p errors.
    auto analyze(const WorkflowDefinition& definition, std::vector<std::string>& errors) -> ExecutionPlan
    {
        auto plan = ExecutionPlan { .definition = definition, .steps = {}, .order = {} };

        if (definition.name.empty())
            errors.emplace_back("Workflow name is required");
        if (definition.steps.empty())
            errors.emplace_back("Workflow must have at least one step");
        if (definition.timeout.count() <= 0)
            errors.emplace_back("Workflow timeout must be positive");

        auto indexById = std::map<std::string, size_t, std::less<>> {};
        plan.steps.reserve(definition.steps.size());

        for (const auto& step: definition.steps)
        {
            auto const index = plan.steps.size();
            plan.steps.push_back(PlannedStep { .step = step, .dependencies = {}, .dependents = {} });

            auto const label = step.id.empty() ? std::format("#{}", index + 1) : step.id;
            if (step.id.empty())
                errors.push_back(std::format("Step {} has no id", label));
            else if (!indexById.try_emplace(step.id, index).second)
                errors.push_back(std::format("Duplicate step id '{}'", step.id));

            if (step.server.empty())
                errors.push_back(std::format("Step {} has no server", label));
            if (step.tool.empty())
                errors.push_back(std::format("Step {} has no tool", label));
            if (step.timeout.count() <= 0)
                errors.push_back(std::format("Step {} timeout must be positive", label));
            if (step.retryCount < 1)
                errors.push_back(std::format("Step {} retry count must be at least 1", label));
            if (!step.arguments.is_object())
                errors.push_back(std::format("Step {} arguments must be an object", label));
        }

        for (auto index = size_t { 0 }; index < plan.steps.size(); ++index)
        {
            auto& planned = plan.steps[index];
            for (const auto& dependency: planned.step.dependsOn)
            {
                auto const it = indexById.find(dependency);
                if (it == indexById.end())
                {
                    errors.push_back(
                        std::format("Step {} depends on non-existent step {}", planned.step.id, dependency));
                    continue;
                }
                planned.dependencies.push_back(it->second);
                plan.steps[it->second].dependents.push_back(index);
            }
        }

        // Kahn's algorithm; the ready set yields the lowest definition index first.
        auto inDegree = std::vector<size_t>(plan.steps.size());
        auto ready = std::set<size_t> {};
        for (auto index = size_t { 0 }; index < plan.steps.size(); ++index)
        {
            inDegree[index] = plan.steps[index].dependencies.size();
            if (inDegree[index] == 0)
                ready.insert(index);
        }

        while (!ready.empty())
        {
            auto const index = *ready.begin();
            ready.erase(ready.begin());
            plan.order.push_back(index);

            for (auto const dependent: plan.steps[index].dependents)
            {
                if (--inDegree[dependent] == 0)
                    ready.insert(dependent);
            }
        }

        if (plan.order.size() != plan.steps.size())
        {
            auto unresolved = std::string {};
            for (auto index = size_t { 0 }; index < plan.steps.size(); ++index)
            {
                if (inDegree[index] == 0)
                    continue;
                if (!unresolved.empty())
                    unresolved += ", ";
                unresolved += plan.steps[index].step.id;
            }
            errors.push_back(std::format("Dependency cycle among steps: {}", unresolved));
        }

        return plan;
    }

} // namespace

auto collectValidationErrors(const WorkflowDefinition& definition) -> std::vector<std::string>
{
    auto errors = std::vector<std::string> {};
    (void) analyze(definition, errors);
    return errors;
}

auto compileWorkflow(const WorkflowDefinition& definition) -> Result<ExecutionPlan>
{
    auto errors = std::vector<std::string> {};
    auto plan = analyze(definition, errors);
    if (errors.empty())
        return plan;

    auto message = std::format("Invalid workflow '{}':", definition.name);
    for (const auto& error: errors)
        message += std::format("\n  - {}", error);
    return makeError(ErrorCode::WorkflowValidationError, std::move(message));
}

} // namespace mcpvisor
