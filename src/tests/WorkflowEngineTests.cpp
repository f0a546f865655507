// SPDX-License-Identifier: Apache-2.0
#include <workflow/WorkflowEngine.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <thread>

using namespace mcpvisor;
using namespace std::chrono_literals;

namespace
{

/// @brief Blocks tool calls until released, and lets the test wait for callers to arrive.
class Gate
{
  public:
    /// @brief Waits until release() or a safety timeout.
    void enter()
    {
        auto lock = std::unique_lock(_mutex);
        ++_entered;
        _cv.notify_all();
        _cv.wait_for(lock, 5s, [this] { return _open; });
    }

    /// @brief Waits until @p count callers are inside enter().
    [[nodiscard]] auto waitForEntered(int count) -> bool
    {
        auto lock = std::unique_lock(_mutex);
        return _cv.wait_for(lock, 5s, [this, count] { return _entered >= count; });
    }

    void release()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _open = true;
        }
        _cv.notify_all();
    }

  private:
    std::mutex _mutex;
    std::condition_variable _cv;
    int _entered = 0;
    bool _open = false;
};

struct ToolCall
{
    std::string server;
    std::string tool;
    nlohmann::json arguments;
    CallOptions options;
};

/// @brief Tool behaviour shared by every scripted client, keyed by tool name.
struct ToolScript
{
    using Handler = std::function<Result<ToolResult>(const nlohmann::json& arguments)>;

    std::mutex mutex;
    std::map<std::string, Handler> handlers;
    std::vector<ToolCall> calls;

    void on(std::string tool, Handler handler)
    {
        auto lock = std::lock_guard(mutex);
        handlers[std::move(tool)] = std::move(handler);
    }

    auto invoke(const std::string& server,
                std::string_view tool,
                const nlohmann::json& arguments,
                const CallOptions& options) -> Result<ToolResult>
    {
        auto handler = Handler {};
        {
            auto lock = std::lock_guard(mutex);
            calls.push_back(ToolCall {
                .server = server,
                .tool = std::string(tool),
                .arguments = arguments,
                .options = options,
            });
            if (auto const it = handlers.find(std::string(tool)); it != handlers.end())
                handler = it->second;
        }

        if (!handler)
            return ToolResult { .raw = { { "echo", arguments } }, .content = std::string(tool), .isError = false };
        return handler(arguments);
    }

    [[nodiscard]] auto callCount(std::string_view tool) -> int
    {
        auto lock = std::lock_guard(mutex);
        return static_cast<int>(std::ranges::count_if(calls, [tool](const ToolCall& c) { return c.tool == tool; }));
    }

    [[nodiscard]] auto callsTo(std::string_view tool) -> std::vector<ToolCall>
    {
        auto lock = std::lock_guard(mutex);
        auto matching = std::vector<ToolCall> {};
        std::ranges::copy_if(calls, std::back_inserter(matching), [tool](const ToolCall& c) { return c.tool == tool; });
        return matching;
    }
};

class ScriptedClient: public Client
{
  public:
    ScriptedClient(ToolScript& script, ServerConfig config): _script(script), _config(std::move(config)) {}

    auto config() const -> const ServerConfig& override { return _config; }
    auto state() const -> ClientState override { return ClientState::Ready; }
    auto initialize() -> VoidResult override { return {}; }

    auto callTool(std::string_view name, const nlohmann::json& arguments, const CallOptions& options)
        -> Result<ToolResult> override
    {
        return _script.invoke(_config.name, name, arguments, options);
    }

    auto healthCheck() -> HealthStatus override { return HealthStatus { .status = ServerStatus::Healthy }; }
    auto listTools() -> Result<std::vector<ToolDefinition>> override { return std::vector<ToolDefinition> {}; }
    void shutdown() override {}

  private:
    ToolScript& _script;
    ServerConfig _config;
};

auto textResult(std::string text, bool isError = false) -> ToolResult
{
    return ToolResult {
        .raw = { { "content", { { { "type", "text" }, { "text", text } } } }, { "isError", isError } },
        .content = text,
        .isError = isError,
    };
}

auto makeStep(std::string id, std::string tool, std::vector<std::string> dependsOn = {}) -> WorkflowStep
{
    auto step = WorkflowStep {};
    step.id = std::move(id);
    step.server = "git";
    step.tool = std::move(tool);
    step.dependsOn = std::move(dependsOn);
    return step;
}

auto makeWorkflow(std::vector<WorkflowStep> steps, FailurePolicy onFailure = FailurePolicy::Stop) -> WorkflowDefinition
{
    auto definition = WorkflowDefinition {};
    definition.name = "review";
    definition.steps = std::move(steps);
    definition.onFailure = onFailure;
    return definition;
}

struct EngineFixture
{
    ToolScript script;
    ClientRegistry registry { [this](const ServerConfig& config) -> std::shared_ptr<Client> {
        return std::make_shared<ScriptedClient>(script, config);
    } };
    WorkflowEngine engine { registry };

    EngineFixture()
    {
        auto config = ServerConfig {};
        config.name = "git";
        config.command = "fake";
        REQUIRE(registry.addClient(config).has_value());
    }

    /// @brief Runs a definition and waits for the final snapshot.
    auto run(WorkflowDefinition definition, nlohmann::json inputs = nlohmann::json::object()) -> WorkflowExecution
    {
        auto id = engine.execute(std::move(definition), std::move(inputs));
        REQUIRE(id.has_value());
        auto execution = engine.waitForExecution(*id, 10s);
        REQUIRE(execution.has_value());
        return *execution;
    }
};

auto hasLogEvent(const WorkflowExecution& execution, std::string_view stepId, ExecutionEvent event) -> bool
{
    return std::ranges::any_of(execution.log, [&](const ExecutionLogEntry& entry) {
        return entry.stepId == stepId && entry.event == event;
    });
}

} // namespace

TEST_CASE("WorkflowEngine runs steps in dependency order and threads results through", "[workflow]")
{
    auto fixture = EngineFixture {};
    fixture.script.on("git_status",
                      [](const nlohmann::json&) -> Result<ToolResult> { return textResult("M src/a.cpp"); });

    auto diff = makeStep("diff", "git_diff", { "status" });
    diff.arguments = { { "repo_path", "${repo}" }, { "note", "changes: ${steps.status.content}" } };
    auto status = makeStep("status", "git_status");
    status.arguments = { { "repo_path", "${repo}" } };

    auto const execution = fixture.run(makeWorkflow({ diff, status }), { { "repo", "/srv/app" } });

    CHECK(execution.status == ExecutionStatus::Completed);
    CHECK(execution.completedAt.has_value());
    CHECK(!execution.errorMessage.has_value());
    CHECK(!execution.currentStep.has_value());

    auto const diffCalls = fixture.script.callsTo("git_diff");
    REQUIRE(diffCalls.size() == 1);
    CHECK(diffCalls[0].arguments["repo_path"] == "/srv/app");
    CHECK(diffCalls[0].arguments["note"] == "changes: M src/a.cpp");

    REQUIRE(execution.outputs.contains("status"));
    CHECK(execution.outputs["status"]["status"] == "completed");
    CHECK(execution.outputs["status"]["content"] == "M src/a.cpp");
    CHECK(execution.outputs["diff"]["result"]["echo"]["repo_path"] == "/srv/app");

    CHECK(hasLogEvent(execution, "status", ExecutionEvent::Started));
    CHECK(hasLogEvent(execution, "diff", ExecutionEvent::Completed));
}

TEST_CASE("WorkflowEngine calls tools with the step timeout and a single client attempt", "[workflow]")
{
    auto fixture = EngineFixture {};
    auto step = makeStep("status", "git_status");
    step.timeout = 7s;

    auto const execution = fixture.run(makeWorkflow({ step }));
    REQUIRE(execution.status == ExecutionStatus::Completed);

    auto const calls = fixture.script.callsTo("git_status");
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].options.timeout == 7000ms);
    CHECK(calls[0].options.attempts == 1);
}

namespace
{

/// @brief status -> diff -> log, where diff always fails.
auto threeStepsWithFailingMiddle(EngineFixture& fixture, FailurePolicy policy) -> WorkflowDefinition
{
    fixture.script.on("git_diff", [](const nlohmann::json&) -> Result<ToolResult> {
        return makeToolError("git", -32603, "bad revision 'HEAD~'");
    });
    return makeWorkflow(
        {
            makeStep("status", "git_status"),
            makeStep("diff", "git_diff", { "status" }),
            makeStep("log", "git_log", { "diff" }),
        },
        policy);
}

} // namespace

TEST_CASE("WorkflowEngine stop policy halts at the failed step", "[workflow]")
{
    auto fixture = EngineFixture {};
    auto const execution = fixture.run(threeStepsWithFailingMiddle(fixture, FailurePolicy::Stop));

    CHECK(execution.status == ExecutionStatus::Failed);
    CHECK(execution.failedStep == "diff");
    REQUIRE(execution.errorMessage.has_value());
    CHECK(execution.errorMessage->starts_with("Step 'diff' failed:"));
    CHECK(execution.errorMessage->find("bad revision") != std::string::npos);

    CHECK(fixture.script.callCount("git_status") == 1);
    CHECK(fixture.script.callCount("git_log") == 0);
    CHECK(execution.outputs.size() == 1);
    CHECK(execution.outputs["status"]["status"] == "completed");
    CHECK(hasLogEvent(execution, "diff", ExecutionEvent::Failed));
    CHECK(!hasLogEvent(execution, "log", ExecutionEvent::Started));
}

TEST_CASE("WorkflowEngine continue policy records the failure and keeps going", "[workflow]")
{
    auto fixture = EngineFixture {};
    auto const execution = fixture.run(threeStepsWithFailingMiddle(fixture, FailurePolicy::Continue));

    CHECK(execution.status == ExecutionStatus::Completed);
    CHECK(!execution.errorMessage.has_value());
    CHECK(fixture.script.callCount("git_log") == 1);

    CHECK(execution.outputs["status"]["status"] == "completed");
    REQUIRE(execution.outputs.contains("diff"));
    CHECK(execution.outputs["diff"]["status"] == "failed");
    CHECK(execution.outputs["diff"]["error"].get<std::string>().find("bad revision") != std::string::npos);
    CHECK(execution.outputs["log"]["status"] == "completed");
}

TEST_CASE("WorkflowEngine retry policy re-runs a failed step once", "[workflow]")
{
    auto fixture = EngineFixture {};
    auto attempts = std::make_shared<int>(0);

    SECTION("second run succeeds")
    {
        fixture.script.on("git_status", [attempts](const nlohmann::json&) -> Result<ToolResult> {
            if (++*attempts == 1)
                return makeToolError("git", -32603, "index.lock exists");
            return textResult("clean");
        });

        auto const execution = fixture.run(makeWorkflow({ makeStep("a", "git_status") }, FailurePolicy::Retry));
        CHECK(execution.status == ExecutionStatus::Completed);
        CHECK(*attempts == 2);
        CHECK(hasLogEvent(execution, "a", ExecutionEvent::Retrying));
    }

    SECTION("second run fails too")
    {
        fixture.script.on("git_status", [attempts](const nlohmann::json&) -> Result<ToolResult> {
            ++*attempts;
            return makeToolError("git", -32603, "index.lock exists");
        });

        auto const execution = fixture.run(makeWorkflow({ makeStep("a", "git_status") }, FailurePolicy::Retry));
        CHECK(execution.status == ExecutionStatus::Failed);
        CHECK(*attempts == 2);
        CHECK(execution.failedStep == "a");
    }
}

TEST_CASE("WorkflowEngine retries timed-out steps up to their retry count", "[workflow]")
{
    auto fixture = EngineFixture {};
    fixture.script.on("git_log", [](const nlohmann::json&) -> Result<ToolResult> {
        return makeError(ErrorCode::TimeoutError, "Request 'tools/call' timed out");
    });

    auto step = makeStep("history", "git_log");
    step.retryCount = 3;
    step.timeout = 2s;

    auto const execution = fixture.run(makeWorkflow({ step }));
    CHECK(execution.status == ExecutionStatus::Failed);
    CHECK(fixture.script.callCount("git_log") == 3);
    CHECK(execution.errorMessage == "Step 'history' timed out after 2s");
    CHECK(hasLogEvent(execution, "history", ExecutionEvent::Retrying));
}

TEST_CASE("WorkflowEngine treats a tool-level error result as a step failure", "[workflow]")
{
    auto fixture = EngineFixture {};
    fixture.script.on("git_status",
                      [](const nlohmann::json&) -> Result<ToolResult> { return textResult("not a repository", true); });

    auto const execution = fixture.run(makeWorkflow({ makeStep("a", "git_status") }));
    CHECK(execution.status == ExecutionStatus::Failed);
    REQUIRE(execution.errorMessage.has_value());
    CHECK(execution.errorMessage->find("not a repository") != std::string::npos);
}

TEST_CASE("WorkflowEngine fails steps on unknown servers and unresolved references", "[workflow]")
{
    auto fixture = EngineFixture {};

    SECTION("unknown server")
    {
        auto step = makeStep("a", "git_status");
        step.server = "ghost";
        auto const execution = fixture.run(makeWorkflow({ step }));
        CHECK(execution.status == ExecutionStatus::Failed);
        CHECK(execution.errorMessage->find("ghost") != std::string::npos);
    }

    SECTION("unresolved reference")
    {
        auto step = makeStep("a", "git_status");
        step.arguments = { { "repo_path", "${repo}" } };
        auto const execution = fixture.run(makeWorkflow({ step }));
        CHECK(execution.status == ExecutionStatus::Failed);
        CHECK(execution.failedStep == "a");
        CHECK(execution.errorMessage->find("${repo}") != std::string::npos);
        CHECK(fixture.script.callCount("git_status") == 0);
    }
}

TEST_CASE("WorkflowEngine cancellation stops before the next step", "[workflow]")
{
    auto fixture = EngineFixture {};
    auto gate = std::make_shared<Gate>();
    fixture.script.on("git_status", [gate](const nlohmann::json&) -> Result<ToolResult> {
        gate->enter();
        return textResult("clean");
    });

    auto id = fixture.engine.execute(
        makeWorkflow({ makeStep("a", "git_status"), makeStep("b", "git_log", { "a" }) }));
    REQUIRE(id.has_value());
    REQUIRE(gate->waitForEntered(1));

    CHECK(fixture.engine.cancelExecution(*id));
    CHECK(!fixture.engine.cancelExecution(*id));

    // The step in flight is not interrupted; the execution stays running until it returns.
    auto const running = fixture.engine.getExecutionStatus(*id);
    REQUIRE(running.has_value());
    CHECK(running->status == ExecutionStatus::Running);
    CHECK(!running->completedAt.has_value());

    gate->release();
    auto execution = fixture.engine.waitForExecution(*id, 10s);
    REQUIRE(execution.has_value());

    CHECK(execution->status == ExecutionStatus::Cancelled);
    CHECK(execution->completedAt.has_value());
    CHECK(!execution->errorMessage.has_value());
    CHECK(fixture.script.callCount("git_log") == 0);
    CHECK(execution->outputs.size() == 1);
    CHECK(execution->outputs["a"]["status"] == "completed");
    CHECK(hasLogEvent(*execution, "a", ExecutionEvent::Completed));
    CHECK(hasLogEvent(*execution, "", ExecutionEvent::Cancelled));

    // The terminal snapshot never changes afterwards.
    auto const later = fixture.engine.getExecutionStatus(*id);
    REQUIRE(later.has_value());
    CHECK(later->status == execution->status);
    CHECK(later->outputs == execution->outputs);
    CHECK(later->log.size() == execution->log.size());
    CHECK(later->completedAt == execution->completedAt);

    CHECK(!fixture.engine.cancelExecution(*id));
    CHECK(!fixture.engine.cancelExecution("no-such-execution"));
}

TEST_CASE("WorkflowEngine cancellation between steps keeps only the finished results", "[workflow]")
{
    auto fixture = EngineFixture {};
    auto* engine = &fixture.engine;
    fixture.script.on("git_status", [engine](const nlohmann::json&) -> Result<ToolResult> {
        // Step 1 is the last thing to run before the cancellation lands.
        auto const executions = engine->listExecutions();
        if (executions.size() == 1)
            engine->cancelExecution(executions.front().id);
        return textResult("clean");
    });

    auto const execution = fixture.run(makeWorkflow({
        makeStep("status", "git_status"),
        makeStep("diff", "git_diff", { "status" }),
        makeStep("log", "git_log", { "diff" }),
    }));

    CHECK(execution.status == ExecutionStatus::Cancelled);
    CHECK(execution.outputs.size() == 1);
    CHECK(execution.outputs["status"]["content"] == "clean");
    CHECK(fixture.script.callCount("git_diff") == 0);
    CHECK(fixture.script.callCount("git_log") == 0);
}

TEST_CASE("WorkflowEngine cancellation wins over a failing step in flight", "[workflow]")
{
    auto fixture = EngineFixture {};
    auto gate = std::make_shared<Gate>();
    fixture.script.on("git_status", [gate](const nlohmann::json&) -> Result<ToolResult> {
        gate->enter();
        return makeToolError("git", -32603, "repository not found");
    });

    auto id = fixture.engine.execute(makeWorkflow({ makeStep("a", "git_status") }));
    REQUIRE(id.has_value());
    REQUIRE(gate->waitForEntered(1));
    REQUIRE(fixture.engine.cancelExecution(*id));
    gate->release();

    auto const execution = fixture.engine.waitForExecution(*id, 10s);
    REQUIRE(execution.has_value());
    CHECK(execution->status == ExecutionStatus::Cancelled);
    CHECK(!execution->errorMessage.has_value());
    CHECK(!execution->failedStep.has_value());
    CHECK(hasLogEvent(*execution, "a", ExecutionEvent::Failed));
}

TEST_CASE("WorkflowEngine parallel mode runs independent steps concurrently", "[workflow]")
{
    auto fixture = EngineFixture {};
    auto gate = std::make_shared<Gate>();
    auto blockUntilBoth = [gate](const nlohmann::json&) -> Result<ToolResult> {
        gate->enter();
        return textResult("done");
    };
    fixture.script.on("git_status", blockUntilBoth);
    fixture.script.on("git_log", blockUntilBoth);

    auto definition = makeWorkflow({
        makeStep("status", "git_status"),
        makeStep("log", "git_log"),
        makeStep("report", "git_show", { "status", "log" }),
    });
    definition.mode = ExecutionMode::Parallel;

    auto id = fixture.engine.execute(std::move(definition));
    REQUIRE(id.has_value());

    // Both independent steps must be inside their tool call at the same time.
    auto const bothEntered = gate->waitForEntered(2);
    gate->release();
    CHECK(bothEntered);

    auto execution = fixture.engine.waitForExecution(*id, 10s);
    REQUIRE(execution.has_value());
    CHECK(execution->status == ExecutionStatus::Completed);
    CHECK(fixture.script.callCount("git_show") == 1);
    CHECK(execution->outputs.size() == 3);
}

TEST_CASE("WorkflowEngine parallel mode stops after a failed batch", "[workflow]")
{
    auto fixture = EngineFixture {};
    fixture.script.on("git_status", [](const nlohmann::json&) -> Result<ToolResult> {
        return makeToolError("git", -32603, "boom");
    });

    auto definition = makeWorkflow({
        makeStep("status", "git_status"),
        makeStep("log", "git_log"),
        makeStep("report", "git_show", { "status", "log" }),
    });
    definition.mode = ExecutionMode::Parallel;

    auto const execution = fixture.run(std::move(definition));
    CHECK(execution.status == ExecutionStatus::Failed);
    CHECK(execution.failedStep == "status");
    CHECK(fixture.script.callCount("git_log") == 1);
    CHECK(fixture.script.callCount("git_show") == 0);
}

TEST_CASE("WorkflowEngine enforces the overall workflow timeout", "[workflow]")
{
    auto fixture = EngineFixture {};
    fixture.script.on("git_status", [](const nlohmann::json&) -> Result<ToolResult> {
        std::this_thread::sleep_for(1100ms);
        return textResult("slow");
    });

    auto definition = makeWorkflow({ makeStep("a", "git_status"), makeStep("b", "git_log", { "a" }) });
    definition.timeout = 1s;

    auto const execution = fixture.run(std::move(definition));
    CHECK(execution.status == ExecutionStatus::Failed);
    CHECK(execution.errorMessage == "Workflow 'review' timed out after 1s");
    CHECK(fixture.script.callCount("git_log") == 0);
}

TEST_CASE("WorkflowEngine manages workflow definitions", "[workflow]")
{
    auto fixture = EngineFixture {};

    SECTION("ids are generated when missing")
    {
        auto id = fixture.engine.createWorkflow(makeWorkflow({ makeStep("a", "git_status") }));
        REQUIRE(id.has_value());
        CHECK(!id->empty());
        REQUIRE(fixture.engine.getWorkflow(*id).has_value());
        CHECK(fixture.engine.getWorkflow(*id)->name == "review");
    }

    SECTION("duplicate ids are rejected")
    {
        auto definition = makeWorkflow({ makeStep("a", "git_status") });
        definition.id = "review";
        REQUIRE(fixture.engine.createWorkflow(definition).has_value());

        auto again = fixture.engine.createWorkflow(definition);
        REQUIRE(!again.has_value());
        CHECK(again.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("invalid definitions are rejected")
    {
        auto result = fixture.engine.createWorkflow(makeWorkflow({ makeStep("a", "git_status", { "a" }) }));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::WorkflowValidationError);
        CHECK(fixture.engine.listWorkflows().empty());
    }

    SECTION("workflows are listed in creation order")
    {
        auto first = makeWorkflow({ makeStep("a", "git_status") });
        first.id = "z-first";
        auto second = makeWorkflow({ makeStep("a", "git_status") });
        second.id = "a-second";
        REQUIRE(fixture.engine.createWorkflow(first).has_value());
        REQUIRE(fixture.engine.createWorkflow(second).has_value());

        auto const workflows = fixture.engine.listWorkflows();
        REQUIRE(workflows.size() == 2);
        CHECK(workflows[0].id == "z-first");
        CHECK(workflows[1].id == "a-second");
    }
}

TEST_CASE("WorkflowEngine validates execution requests", "[workflow]")
{
    auto fixture = EngineFixture {};

    auto unknown = fixture.engine.executeWorkflow("missing");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::NotFound);

    auto definition = makeWorkflow({ makeStep("a", "git_status") });
    definition.id = "review";
    REQUIRE(fixture.engine.createWorkflow(definition).has_value());

    auto badInputs = fixture.engine.executeWorkflow("review", nlohmann::json::array());
    REQUIRE(!badInputs.has_value());
    CHECK(badInputs.error().code == ErrorCode::InvalidArgument);

    CHECK(fixture.engine.getExecutionStatus("missing").error().code == ErrorCode::NotFound);
    CHECK(fixture.engine.waitForExecution("missing", 10ms).error().code == ErrorCode::NotFound);
}

TEST_CASE("WorkflowEngine waitForExecution times out on a running execution", "[workflow]")
{
    auto fixture = EngineFixture {};
    auto gate = std::make_shared<Gate>();
    fixture.script.on("git_status", [gate](const nlohmann::json&) -> Result<ToolResult> {
        gate->enter();
        return textResult("clean");
    });

    auto id = fixture.engine.execute(makeWorkflow({ makeStep("a", "git_status") }));
    REQUIRE(id.has_value());
    REQUIRE(gate->waitForEntered(1));

    auto pending = fixture.engine.waitForExecution(*id, 20ms);
    REQUIRE(!pending.has_value());
    CHECK(pending.error().code == ErrorCode::TimeoutError);
    CHECK(fixture.engine.getExecutionStatus(*id)->status == ExecutionStatus::Running);
    CHECK(fixture.engine.getExecutionStatus(*id)->currentStep == "a");

    gate->release();
    auto finished = fixture.engine.waitForExecution(*id, 10s);
    REQUIRE(finished.has_value());
    CHECK(finished->status == ExecutionStatus::Completed);

    auto const executions = fixture.engine.listExecutions();
    REQUIRE(executions.size() == 1);
    CHECK(executions[0].id == *id);
}
