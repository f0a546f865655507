// SPDX-License-Identifier: Apache-2.0
#include "WorkflowJson.hpp"

#include <core/JsonUtils.hpp>

#include <format>
#include <fstream>
#include <sstream>
#include <string>

namespace mcpvisor
{

namespace
{

    auto shapeError(std::string message) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::WorkflowValidationError, std::move(message));
    }

    auto parseStep(const nlohmann::json& node, size_t index) -> Result<WorkflowStep>
    {
        if (!node.is_object())
            return shapeError(std::format("Step #{} must be an object", index + 1));

        auto step = WorkflowStep {};
        step.id = json::getStringOr(node, "id", "");
        step.name = json::getStringOr(node, "name", step.id);
        step.server = json::getStringOr(node, "server", "");
        step.tool = json::getStringOr(node, "tool", "");
        step.timeout = std::chrono::seconds(json::getIntOr(node, "timeout", static_cast<int>(step.timeout.count())));
        step.retryCount = json::getIntOr(node, "retryCount", step.retryCount);

        if (node.contains("arguments"))
        {
            if (!node["arguments"].is_object())
                return shapeError(std::format("Step '{}': arguments must be an object", step.id));
            step.arguments = node["arguments"];
        }

        if (node.contains("dependsOn"))
        {
            if (!node["dependsOn"].is_array())
                return shapeError(std::format("Step '{}': dependsOn must be an array", step.id));
            for (const auto& dependency: node["dependsOn"])
            {
                if (!dependency.is_string())
                    return shapeError(std::format("Step '{}': dependsOn entries must be strings", step.id));
                step.dependsOn.push_back(dependency.get<std::string>());
            }
        }

        return step;
    }

    auto timestampJson(SystemClock::time_point tp) -> nlohmann::json
    {
        return formatTimestamp(tp);
    }

} // namespace

auto parseWorkflowDefinition(const nlohmann::json& document) -> Result<WorkflowDefinition>
{
    if (!document.is_object())
        return shapeError("Workflow definition must be a JSON object");

    auto definition = WorkflowDefinition {};
    definition.id = json::getStringOr(document, "id", "");
    definition.name = json::getStringOr(document, "name", "");
    definition.description = json::getStringOr(document, "description", "");
    definition.timeout =
        std::chrono::seconds(json::getIntOr(document, "timeout", static_cast<int>(definition.timeout.count())));
    definition.mode =
        json::getBoolOr(document, "parallel", false) ? ExecutionMode::Parallel : ExecutionMode::Sequential;

    auto const policyName = json::getStringOr(document, "onFailure", "stop");
    auto const policy = failurePolicyFromString(policyName);
    if (!policy)
        return shapeError(std::format("Unknown failure policy '{}' (expected stop, continue or retry)", policyName));
    definition.onFailure = *policy;

    if (!document.contains("steps") || !document["steps"].is_array())
        return shapeError("Workflow definition requires a steps array");

    auto index = size_t { 0 };
    for (const auto& node: document["steps"])
    {
        auto step = parseStep(node, index++);
        if (!step)
            return std::unexpected(step.error());
        definition.steps.push_back(std::move(*step));
    }

    return definition;
}

auto loadWorkflowFile(const std::filesystem::path& path) -> Result<WorkflowDefinition>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open workflow file: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto document = json::parse(ss.str());
    if (!document)
        return makeError(ErrorCode::WorkflowValidationError,
                         std::format("{}: {}", path.string(), document.error().message));

    return parseWorkflowDefinition(*document);
}

auto toJson(const WorkflowStep& step) -> nlohmann::json
{
    return nlohmann::json {
        { "id", step.id },
        { "name", step.name },
        { "server", step.server },
        { "tool", step.tool },
        { "arguments", step.arguments },
        { "dependsOn", step.dependsOn },
        { "timeout", step.timeout.count() },
        { "retryCount", step.retryCount },
    };
}

auto toJson(const WorkflowDefinition& definition) -> nlohmann::json
{
    auto steps = nlohmann::json::array();
    for (const auto& step: definition.steps)
        steps.push_back(toJson(step));

    return nlohmann::json {
        { "id", definition.id },
        { "name", definition.name },
        { "description", definition.description },
        { "timeout", definition.timeout.count() },
        { "parallel", definition.mode == ExecutionMode::Parallel },
        { "onFailure", failurePolicyToString(definition.onFailure) },
        { "steps", std::move(steps) },
    };
}

auto toJson(const ExecutionLogEntry& entry) -> nlohmann::json
{
    auto out = nlohmann::json {
        { "timestamp", timestampJson(entry.timestamp) },
        { "event", executionEventToString(entry.event) },
        { "message", entry.message },
    };
    if (!entry.stepId.empty())
        out["stepId"] = entry.stepId;
    return out;
}

auto toJson(const WorkflowExecution& execution) -> nlohmann::json
{
    auto entries = nlohmann::json::array();
    for (const auto& entry: execution.log)
        entries.push_back(toJson(entry));

    auto out = nlohmann::json {
        { "id", execution.id },
        { "workflowId", execution.workflowId },
        { "status", executionStatusToString(execution.status) },
        { "inputs", execution.inputs },
        { "outputs", execution.outputs },
        { "startedAt", timestampJson(execution.startedAt) },
        { "executionLog", std::move(entries) },
    };

    out["currentStep"] = execution.currentStep ? nlohmann::json(*execution.currentStep) : nlohmann::json();
    out["completedAt"] = execution.completedAt ? timestampJson(*execution.completedAt) : nlohmann::json();
    out["errorMessage"] = execution.errorMessage ? nlohmann::json(*execution.errorMessage) : nlohmann::json();
    out["failedStep"] = execution.failedStep ? nlohmann::json(*execution.failedStep) : nlohmann::json();
    return out;
}

} // namespace mcpvisor
