// SPDX-License-Identifier: Apache-2.0
#include "WorkflowEngine.hpp"

#include <core/Log.hpp>
#include <core/Types.hpp>
#include <workflow/ExecutionContext.hpp>
#include <workflow/WorkflowValidator.hpp>

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <format>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>

namespace mcpvisor
{

namespace
{

    /// @brief Only the execution thread writes to @c execution; other threads
    ///        read snapshots under the engine mutex and request stops.
    struct ExecutionRecord
    {
        WorkflowExecution execution;
        std::jthread thread;
        bool done = false; ///< Set once the execution thread has written its final state.
    };

    struct RunOutcome
    {
        ExecutionStatus status = ExecutionStatus::Completed;
        std::optional<Error> error;
    };

    enum class StepState : std::uint8_t
    {
        Waiting,
        Succeeded,
        Failed,
    };

    auto toStepResult(const ToolResult& result) -> nlohmann::json
    {
        return nlohmann::json {
            { "status", "completed" },
            { "content", result.content },
            { "isError", result.isError },
            { "result", result.raw },
        };
    }

    auto toFailureRecord(const Error& error) -> nlohmann::json
    {
        return nlohmann::json {
            { "status", "failed" },
            { "error", error.message },
        };
    }

    auto isStepRetryable(const Error& error) -> bool
    {
        return error.code == ErrorCode::TimeoutError || error.code == ErrorCode::ConnectionError;
    }

} // namespace

struct WorkflowEngine::Impl
{
    ClientRegistry& registry;

    mutable std::mutex mutex;
    mutable std::condition_variable finished;
    std::map<std::string, std::shared_ptr<const ExecutionPlan>, std::less<>> workflows;
    std::vector<std::string> workflowOrder;
    std::map<std::string, std::shared_ptr<ExecutionRecord>, std::less<>> executions;
    std::vector<std::string> executionOrder;
    bool shuttingDown = false;

    std::mutex shutdownMutex;

    explicit Impl(ClientRegistry& registry): registry(registry) {}

    /// @brief Applies a status change if it moves forward. Requires mutex.
    static auto transition(ExecutionRecord& record, ExecutionStatus to) -> bool
    {
        auto& execution = record.execution;
        if (!canTransition(execution.status, to))
            return false;

        execution.status = to;
        if (isTerminal(to))
            execution.completedAt = SystemClock::now();
        return true;
    }

    /// @brief Appends to the execution log. Requires mutex.
    static void appendLogLocked(ExecutionRecord& record,
                                std::string stepId,
                                ExecutionEvent event,
                                std::string message)
    {
        record.execution.log.push_back(ExecutionLogEntry {
            .timestamp = SystemClock::now(),
            .stepId = std::move(stepId),
            .event = event,
            .message = std::move(message),
        });
    }

    void appendLog(ExecutionRecord& record, std::string stepId, ExecutionEvent event, std::string message)
    {
        auto lock = std::lock_guard(mutex);
        appendLogLocked(record, std::move(stepId), event, std::move(message));
    }

    void setCurrentStep(ExecutionRecord& record, std::string stepId)
    {
        auto lock = std::lock_guard(mutex);
        record.execution.currentStep = std::move(stepId);
    }

    /// @brief Runs one step with its own attempt budget.
    auto runStep(const std::stop_token& stopToken,
                 const WorkflowStep& step,
                 const nlohmann::json& arguments,
                 ExecutionRecord& record) -> Result<nlohmann::json>
    {
        auto const attempts = std::max(1, step.retryCount);
        auto const options = CallOptions {
            .timeout = std::chrono::duration_cast<std::chrono::milliseconds>(step.timeout),
            .attempts = 1,
        };

        auto lastError = Error {};
        for (auto attempt = 1; attempt <= attempts; ++attempt)
        {
            auto result = registry.callTool(step.server, step.tool, arguments, options);
            if (result)
            {
                if (result->isError)
                    return makeStepError(
                        step.id, std::format("Step '{}': tool reported an error: {}", step.id, result->content));
                return toStepResult(*result);
            }

            lastError = std::move(result.error());
            if (!isStepRetryable(lastError) || attempt == attempts || stopToken.stop_requested())
                break;

            log::warning("Step '{}' attempt {}/{} failed: {}", step.id, attempt, attempts, lastError);
            appendLog(record,
                      step.id,
                      ExecutionEvent::Retrying,
                      std::format("Attempt {}/{} failed: {}", attempt, attempts, lastError.message));
        }

        if (lastError.code == ErrorCode::TimeoutError)
            return makeStepError(step.id, std::format("Step '{}' timed out after {}", step.id, step.timeout));
        return makeStepError(step.id, std::format("Step '{}' failed: {}", step.id, lastError.message));
    }

    /// @brief Runs a step and applies the retry failure policy.
    auto runStepWithPolicy(const std::stop_token& stopToken,
                           FailurePolicy policy,
                           const WorkflowStep& step,
                           const nlohmann::json& arguments,
                           ExecutionRecord& record) -> Result<nlohmann::json>
    {
        auto result = runStep(stopToken, step, arguments, record);
        if (!result && policy == FailurePolicy::Retry && !stopToken.stop_requested())
        {
            appendLog(
                record, step.id, ExecutionEvent::Retrying, std::format("Retrying step: {}", result.error().message));
            result = runStep(stopToken, step, arguments, record);
        }
        return result;
    }

    /// @brief Stores a step's result in the context and the log.
    /// @return An outcome if the failure policy ends the execution.
    auto recordStepResult(ExecutionRecord& record,
                          ExecutionContext& context,
                          FailurePolicy policy,
                          const WorkflowStep& step,
                          const Result<nlohmann::json>& result) -> std::optional<RunOutcome>
    {
        if (result)
        {
            context.setStepResult(step.id, *result);
            appendLog(record, step.id, ExecutionEvent::Completed, std::format("Step '{}' completed", step.id));
            return std::nullopt;
        }

        log::warning("Workflow step '{}' failed: {}", step.id, result.error().message);
        appendLog(record, step.id, ExecutionEvent::Failed, result.error().message);

        if (policy == FailurePolicy::Continue)
        {
            context.setStepResult(step.id, toFailureRecord(result.error()));
            return std::nullopt;
        }

        return RunOutcome { .status = ExecutionStatus::Failed, .error = result.error() };
    }

    /// @brief Checks cancellation and the overall workflow timeout.
    static auto checkInterrupted(const std::stop_token& stopToken,
                                 const ExecutionPlan& plan,
                                 SteadyClock::time_point deadline) -> std::optional<RunOutcome>
    {
        if (stopToken.stop_requested())
            return RunOutcome { .status = ExecutionStatus::Cancelled, .error = std::nullopt };

        if (SteadyClock::now() >= deadline)
            return RunOutcome {
                .status = ExecutionStatus::Failed,
                .error = Error {
                    .code = ErrorCode::WorkflowExecutionError,
                    .message = std::format(
                        "Workflow '{}' timed out after {}", plan.definition.name, plan.definition.timeout),
                },
            };

        return std::nullopt;
    }

    auto resolveArguments(const ExecutionContext& context, const WorkflowStep& step) -> Result<nlohmann::json>
    {
        auto arguments = context.resolve(step.arguments);
        if (!arguments)
            return makeStepError(step.id, std::format("Step '{}': {}", step.id, arguments.error().message));
        return arguments;
    }

    auto runSequential(const std::stop_token& stopToken,
                       const ExecutionPlan& plan,
                       ExecutionRecord& record,
                       ExecutionContext& context,
                       SteadyClock::time_point deadline) -> RunOutcome
    {
        auto const policy = plan.definition.onFailure;

        for (auto const index: plan.order)
        {
            if (auto interrupted = checkInterrupted(stopToken, plan, deadline))
                return *interrupted;

            auto const& step = plan.steps[index].step;
            setCurrentStep(record, step.id);
            appendLog(record,
                      step.id,
                      ExecutionEvent::Started,
                      std::format("Calling {}.{}", step.server, step.tool));

            auto arguments = resolveArguments(context, step);
            auto const result = arguments ? runStepWithPolicy(stopToken, policy, step, *arguments, record)
                                          : Result<nlohmann::json>(std::unexpected(arguments.error()));

            if (auto outcome = recordStepResult(record, context, policy, step, result))
                return *outcome;
        }

        return RunOutcome {};
    }

    auto runParallel(const std::stop_token& stopToken,
                     const ExecutionPlan& plan,
                     ExecutionRecord& record,
                     ExecutionContext& context,
                     SteadyClock::time_point deadline) -> RunOutcome
    {
        auto const policy = plan.definition.onFailure;
        auto states = std::vector<StepState>(plan.steps.size(), StepState::Waiting);

        while (true)
        {
            auto ready = std::vector<size_t> {};
            for (auto const index: plan.order)
            {
                if (states[index] != StepState::Waiting)
                    continue;
                auto const& dependencies = plan.steps[index].dependencies;
                if (std::ranges::all_of(dependencies, [&](size_t d) { return states[d] != StepState::Waiting; }))
                    ready.push_back(index);
            }

            if (ready.empty())
                break;

            if (auto interrupted = checkInterrupted(stopToken, plan, deadline))
                return *interrupted;

            auto batch = std::string {};
            auto results = std::vector<Result<nlohmann::json>>(ready.size());
            auto futures = std::vector<std::future<Result<nlohmann::json>>>(ready.size());

            for (auto i = size_t { 0 }; i < ready.size(); ++i)
            {
                auto const& step = plan.steps[ready[i]].step;
                batch += batch.empty() ? step.id : ", " + step.id;
                appendLog(record,
                          step.id,
                          ExecutionEvent::Started,
                          std::format("Calling {}.{}", step.server, step.tool));

                auto arguments = resolveArguments(context, step);
                if (!arguments)
                {
                    results[i] = std::unexpected(arguments.error());
                    continue;
                }

                futures[i] = std::async(std::launch::async,
                                        [this, stopToken, policy, &step, &record, args = std::move(*arguments)] {
                                            return runStepWithPolicy(stopToken, policy, step, args, record);
                                        });
            }
            setCurrentStep(record, std::move(batch));

            for (auto i = size_t { 0 }; i < futures.size(); ++i)
            {
                if (!futures[i].valid())
                    continue;
                try
                {
                    results[i] = futures[i].get();
                }
                catch (const std::exception& e)
                {
                    auto const& step = plan.steps[ready[i]].step;
                    results[i] = makeStepError(step.id, std::format("Step '{}' failed: {}", step.id, e.what()));
                }
            }

            auto failure = std::optional<RunOutcome> {};
            for (auto i = size_t { 0 }; i < ready.size(); ++i)
            {
                auto const& step = plan.steps[ready[i]].step;
                states[ready[i]] = results[i] ? StepState::Succeeded : StepState::Failed;
                auto outcome = recordStepResult(record, context, policy, step, results[i]);
                if (outcome && !failure)
                    failure = std::move(outcome);
            }

            if (failure)
                return *failure;
        }

        return RunOutcome {};
    }

    /// @brief Writes the final state in one step; the record is never touched afterwards.
    void finish(ExecutionRecord& record, const ExecutionContext& context, const RunOutcome& outcome)
    {
        {
            auto lock = std::lock_guard(mutex);
            auto& execution = record.execution;
            execution.outputs = context.stepResults();
            execution.currentStep.reset();

            if (outcome.status == ExecutionStatus::Failed && outcome.error)
            {
                execution.errorMessage = outcome.error->message;
                if (!outcome.error->stepId.empty())
                    execution.failedStep = outcome.error->stepId;
            }

            if (transition(record, outcome.status) && outcome.status == ExecutionStatus::Cancelled)
                appendLogLocked(record, {}, ExecutionEvent::Cancelled, "Execution cancelled");

            record.done = true;
            log::info("Workflow execution {} finished: {}",
                      execution.id,
                      executionStatusToString(execution.status));
        }
        finished.notify_all();
    }

    void run(const std::stop_token& stopToken, const ExecutionPlan& plan, ExecutionRecord& record)
    {
        auto inputs = nlohmann::json {};
        auto started = false;
        {
            auto lock = std::lock_guard(mutex);
            started = !stopToken.stop_requested() && transition(record, ExecutionStatus::Running);
            inputs = record.execution.inputs;
        }

        auto context = ExecutionContext(std::move(inputs));
        auto outcome = RunOutcome { .status = ExecutionStatus::Cancelled, .error = std::nullopt };

        if (started)
        {
            log::info("Running workflow '{}' ({} steps, {})",
                      plan.definition.name,
                      plan.steps.size(),
                      plan.definition.mode == ExecutionMode::Parallel ? "parallel" : "sequential");

            auto const deadline = SteadyClock::now() + plan.definition.timeout;
            try
            {
                outcome = plan.definition.mode == ExecutionMode::Parallel
                              ? runParallel(stopToken, plan, record, context, deadline)
                              : runSequential(stopToken, plan, record, context, deadline);
            }
            catch (const std::exception& e)
            {
                outcome = RunOutcome {
                    .status = ExecutionStatus::Failed,
                    .error = Error { .code = ErrorCode::WorkflowExecutionError, .message = e.what() },
                };
            }

            // A cancelled run ends CANCELLED even if the step in flight failed or was the last one.
            if (stopToken.stop_requested())
                outcome = RunOutcome { .status = ExecutionStatus::Cancelled, .error = std::nullopt };
        }

        finish(record, context, outcome);
    }

    auto startExecution(std::shared_ptr<const ExecutionPlan> plan, nlohmann::json inputs) -> Result<std::string>
    {
        if (!inputs.is_object())
            return makeError(ErrorCode::InvalidArgument, "Workflow inputs must be a JSON object");

        auto record = std::make_shared<ExecutionRecord>();
        auto& execution = record->execution;
        execution.id = generateId();
        execution.workflowId = plan->definition.id;
        execution.inputs = std::move(inputs);
        execution.startedAt = SystemClock::now();

        auto lock = std::lock_guard(mutex);
        if (shuttingDown)
            return makeError(ErrorCode::WorkflowExecutionError, "Workflow engine is shutting down");

        auto const id = execution.id;
        executions.emplace(id, record);
        executionOrder.push_back(id);

        // The thread blocks on the mutex until the record is fully set up.
        record->thread = std::jthread([this, plan, record](const std::stop_token& token) {
            run(token, *plan, *record);
        });

        log::info("Started execution {} of workflow '{}'", id, plan->definition.name);
        return id;
    }
};

WorkflowEngine::WorkflowEngine(ClientRegistry& registry): _impl(std::make_unique<Impl>(registry))
{
}

WorkflowEngine::~WorkflowEngine()
{
    shutdown();
}

auto WorkflowEngine::createWorkflow(WorkflowDefinition definition) -> Result<std::string>
{
    if (definition.id.empty())
        definition.id = generateId();

    auto plan = compileWorkflow(definition);
    if (!plan)
        return std::unexpected(plan.error());

    auto lock = std::lock_guard(_impl->mutex);
    if (_impl->workflows.contains(definition.id))
        return makeError(ErrorCode::InvalidArgument, std::format("Workflow id already exists: {}", definition.id));

    _impl->workflows.emplace(definition.id, std::make_shared<const ExecutionPlan>(std::move(*plan)));
    _impl->workflowOrder.push_back(definition.id);

    log::info("Created workflow '{}' ({}, {} steps)", definition.name, definition.id, definition.steps.size());
    return definition.id;
}

auto WorkflowEngine::executeWorkflow(std::string_view workflowId, nlohmann::json inputs) -> Result<std::string>
{
    auto plan = std::shared_ptr<const ExecutionPlan> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        auto const it = _impl->workflows.find(workflowId);
        if (it == _impl->workflows.end())
            return makeError(ErrorCode::NotFound, std::format("Workflow not found: {}", workflowId));
        plan = it->second;
    }
    return _impl->startExecution(std::move(plan), std::move(inputs));
}

auto WorkflowEngine::execute(WorkflowDefinition definition, nlohmann::json inputs) -> Result<std::string>
{
    auto workflowId = createWorkflow(std::move(definition));
    if (!workflowId)
        return std::unexpected(workflowId.error());
    return executeWorkflow(*workflowId, std::move(inputs));
}

auto WorkflowEngine::getExecutionStatus(std::string_view executionId) const -> Result<WorkflowExecution>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->executions.find(executionId);
    if (it == _impl->executions.end())
        return makeError(ErrorCode::NotFound, std::format("Execution not found: {}", executionId));
    return it->second->execution;
}

auto WorkflowEngine::cancelExecution(std::string_view executionId) -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->executions.find(executionId);
    if (it == _impl->executions.end())
        return false;

    // The execution thread moves the record to CANCELLED once the step in flight returns.
    auto& record = *it->second;
    if (record.done || !record.thread.request_stop())
        return false;

    log::info("Cancellation requested for workflow execution {}", executionId);
    return true;
}

auto WorkflowEngine::listWorkflows() const -> std::vector<WorkflowDefinition>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto definitions = std::vector<WorkflowDefinition> {};
    definitions.reserve(_impl->workflowOrder.size());
    for (const auto& id: _impl->workflowOrder)
        definitions.push_back(_impl->workflows.at(id)->definition);
    return definitions;
}

auto WorkflowEngine::getWorkflow(std::string_view workflowId) const -> Result<WorkflowDefinition>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->workflows.find(workflowId);
    if (it == _impl->workflows.end())
        return makeError(ErrorCode::NotFound, std::format("Workflow not found: {}", workflowId));
    return it->second->definition;
}

auto WorkflowEngine::listExecutions() const -> std::vector<WorkflowExecution>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto snapshots = std::vector<WorkflowExecution> {};
    snapshots.reserve(_impl->executionOrder.size());
    for (const auto& id: _impl->executionOrder)
        snapshots.push_back(_impl->executions.at(id)->execution);
    return snapshots;
}

auto WorkflowEngine::waitForExecution(std::string_view executionId, std::chrono::milliseconds timeout) const
    -> Result<WorkflowExecution>
{
    auto lock = std::unique_lock(_impl->mutex);
    auto const it = _impl->executions.find(executionId);
    if (it == _impl->executions.end())
        return makeError(ErrorCode::NotFound, std::format("Execution not found: {}", executionId));

    auto record = it->second;
    if (!_impl->finished.wait_for(lock, timeout, [&record] { return record->done; }))
        return makeError(ErrorCode::TimeoutError,
                         std::format("Execution {} still {} after {}",
                                     executionId,
                                     executionStatusToString(record->execution.status),
                                     timeout));
    return record->execution;
}

void WorkflowEngine::shutdown()
{
    auto shutdownLock = std::lock_guard(_impl->shutdownMutex);

    auto records = std::vector<std::shared_ptr<ExecutionRecord>> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->shuttingDown = true;
        for (auto& [id, record]: _impl->executions)
        {
            if (!record->done)
                record->thread.request_stop();
            records.push_back(record);
        }
    }

    for (auto& record: records)
    {
        if (record->thread.joinable())
            record->thread.join();
    }
}

} // namespace mcpvisor
