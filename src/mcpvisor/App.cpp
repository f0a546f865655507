// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <workflow/WorkflowJson.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <thread>
#include <utility>

namespace mcpvisor
{

namespace
{

    constexpr auto SignalPollInterval = std::chrono::milliseconds(200);

    /// @brief Extra time granted on top of a workflow's own timeout before giving up on it.
    constexpr auto WorkflowWaitSlack = std::chrono::seconds(5);

    std::atomic<bool> gStopRequested = false; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void stopSignalHandler(int /*sig*/)
    {
        gStopRequested = true;
    }

    /// @brief Installs SIGINT/SIGTERM handlers for its lifetime.
    class StopSignalScope
    {
      public:
        StopSignalScope()
        {
            gStopRequested = false;
            struct sigaction sa {};
            sa.sa_handler = stopSignalHandler;
            sigemptyset(&sa.sa_mask);
            sigaction(SIGINT, &sa, &_previousInt);
            sigaction(SIGTERM, &sa, &_previousTerm);
        }

        ~StopSignalScope()
        {
            sigaction(SIGINT, &_previousInt, nullptr);
            sigaction(SIGTERM, &_previousTerm, nullptr);
        }

        StopSignalScope(const StopSignalScope&) = delete;
        StopSignalScope& operator=(const StopSignalScope&) = delete;

      private:
        struct sigaction _previousInt {};
        struct sigaction _previousTerm {};
    };

    auto toJson(const ToolDefinition& tool) -> nlohmann::json
    {
        return nlohmann::json {
            { "name", tool.name },
            { "description", tool.description },
            { "inputSchema", tool.inputSchema },
            { "required", tool.requiredParameters },
        };
    }

} // namespace

auto parseInputs(const std::vector<std::string>& pairs) -> Result<nlohmann::json>
{
    auto inputs = nlohmann::json::object();
    for (const auto& pair: pairs)
    {
        auto const eq = pair.find('=');
        if (eq == std::string::npos || eq == 0)
            return makeError(ErrorCode::InvalidArgument, std::format("Expected key=value, got '{}'", pair));

        auto const key = pair.substr(0, eq);
        auto const text = pair.substr(eq + 1);
        auto value = nlohmann::json::parse(text, nullptr, false);
        inputs[key] = value.is_discarded() ? nlohmann::json(text) : std::move(value);
    }
    return inputs;
}

struct App::Impl
{
    AppConfig config;
    ClientRegistry registry;
    HealthMonitor monitor;
    WorkflowEngine engine;
    AlertCallbackId alertSubscription = 0;

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)), registry(), monitor(registry, config.healthMonitor), engine(registry)
    {
    }

    /// @brief Finds a loaded workflow by id or name.
    [[nodiscard]] auto findWorkflow(std::string_view key) const -> std::optional<std::string>
    {
        for (const auto& definition: engine.listWorkflows())
        {
            if (definition.id == key || definition.name == key)
                return definition.id;
        }
        return std::nullopt;
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    _impl->monitor.removeAlertCallback(_impl->alertSubscription);
    _impl->engine.shutdown();
    _impl->monitor.stop();
    _impl->registry.shutdownAll();
}

auto App::initialize() -> VoidResult
{
    _impl->alertSubscription = _impl->monitor.addAlertCallback([](const Alert& alert) {
        log::warning("Health alert ({}): {}", alertKindToString(alert.kind), alert.message);
    });

    for (const auto& [name, serverConfig]: _impl->config.mcpServers)
    {
        if (auto added = _impl->monitor.registerServer(serverConfig); !added)
            log::warning("Failed to start MCP server '{}': {}", name, added.error().message);
    }

    for (const auto& path: _impl->config.workflows)
    {
        auto definition = loadWorkflowFile(path);
        if (!definition)
        {
            log::warning("Skipping workflow {}: {}", path, definition.error().message);
            continue;
        }

        if (auto created = _impl->engine.createWorkflow(std::move(*definition)); !created)
            log::warning("Skipping workflow {}: {}", path, created.error().message);
    }

    log::info("Supervising {} MCP server(s), {} workflow(s) loaded",
              _impl->config.mcpServers.size(),
              _impl->engine.listWorkflows().size());
    return {};
}

auto App::printStatus() -> int
{
    _impl->monitor.checkAllServers();

    auto const statuses = _impl->monitor.getAllStatuses();
    auto const metrics = _impl->monitor.getAllMetrics();

    auto servers = nlohmann::json::object();
    for (const auto& [name, status]: statuses)
    {
        auto entry = toJson(status);
        if (auto const it = metrics.find(name); it != metrics.end())
            entry["metrics"] = it->second.toJson();
        servers[name] = std::move(entry);
    }

    std::println("{}", nlohmann::json { { "servers", std::move(servers) } }.dump(2));
    return 0;
}

auto App::listTools(std::string_view server) -> int
{
    auto tools = _impl->registry.listTools(server);
    if (!tools)
    {
        log::error("Cannot list tools of '{}': {}", server, tools.error());
        return 1;
    }

    auto out = nlohmann::json::array();
    for (const auto& tool: *tools)
        out.push_back(toJson(tool));

    std::println("{}", out.dump(2));
    return 0;
}

auto App::callTool(std::string_view server, std::string_view tool, std::string_view arguments) -> int
{
    auto parsed = json::parse(arguments.empty() ? std::string_view("{}") : arguments);
    if (!parsed || !parsed->is_object())
    {
        log::error("Tool arguments must be a JSON object");
        return 1;
    }

    auto result = _impl->registry.callTool(server, tool, *parsed);
    if (!result)
    {
        log::error("Tool call {}.{} failed: {}", server, tool, result.error());
        return 1;
    }

    std::println("{}", result->raw.dump(2));
    return result->isError ? 1 : 0;
}

auto App::runWorkflow(std::string_view workflow, const std::vector<std::string>& inputs) -> int
{
    auto inputObject = parseInputs(inputs);
    if (!inputObject)
    {
        log::error("{}", inputObject.error().message);
        return 1;
    }

    auto executionId = Result<std::string> {};
    if (auto const known = _impl->findWorkflow(workflow))
    {
        executionId = _impl->engine.executeWorkflow(*known, std::move(*inputObject));
    }
    else
    {
        auto definition = loadWorkflowFile(std::filesystem::path(workflow));
        if (!definition)
        {
            log::error("Cannot load workflow: {}", definition.error().message);
            return 1;
        }
        executionId = _impl->engine.execute(std::move(*definition), std::move(*inputObject));
    }

    if (!executionId)
    {
        log::error("Cannot start workflow: {}", executionId.error().message);
        return 1;
    }

    auto workflowTimeout = WorkflowDefinition {}.timeout;
    if (auto const snapshot = _impl->engine.getExecutionStatus(*executionId))
    {
        if (auto const definition = _impl->engine.getWorkflow(snapshot->workflowId))
            workflowTimeout = definition->timeout;
    }
    auto const waitTimeout = std::chrono::duration_cast<std::chrono::milliseconds>(workflowTimeout + WorkflowWaitSlack);

    auto execution = _impl->engine.waitForExecution(*executionId, waitTimeout);
    if (!execution)
    {
        log::error("Workflow did not finish: {}", execution.error().message);
        _impl->engine.cancelExecution(*executionId);
        execution = _impl->engine.waitForExecution(*executionId, waitTimeout);
        if (!execution)
            return 1;
    }

    std::println("{}", toJson(*execution).dump(2));
    return execution->status == ExecutionStatus::Completed ? 0 : 1;
}

auto App::runDaemon() -> int
{
    auto const signals = StopSignalScope {};

    _impl->monitor.start();
    log::info("Monitoring started; press Ctrl+C to stop");

    while (!gStopRequested)
        std::this_thread::sleep_for(SignalPollInterval);

    log::info("Shutting down");
    _impl->monitor.stop();
    return 0;
}

auto App::registry() -> ClientRegistry&
{
    return _impl->registry;
}

auto App::monitor() -> HealthMonitor&
{
    return _impl->monitor;
}

auto App::engine() -> WorkflowEngine&
{
    return _impl->engine;
}

} // namespace mcpvisor
