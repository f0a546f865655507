// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcpvisor/App.hpp>
#include <mcpvisor/Config.hpp>

#include <CLI/CLI.hpp>

#include <string>
#include <vector>

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpvisor - MCP server supervisor and workflow runner" };

    auto configPath = std::string {};
    auto verbose = false;
    auto trace = false;
    auto logLevel = std::string {};
    auto status = false;
    auto listToolsServer = std::string {};
    auto callTarget = std::vector<std::string> {};
    auto callArguments = std::string { "{}" };
    auto workflow = std::string {};
    auto inputs = std::vector<std::string> {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--trace", trace, "Log JSON-RPC wire traffic");
    app.add_option("--log-level", logLevel, "Log level: error, warning, info, debug or trace")
        ->check(CLI::IsMember({ "error", "warning", "warn", "info", "debug", "trace" }));

    auto* statusFlag = app.add_flag("--status", status, "Check every server once and print the result as JSON");
    auto* listOption = app.add_option("--list-tools", listToolsServer, "List the tools of a server");
    auto* callOption = app.add_option("--call", callTarget, "Call a tool: --call <server> <tool>")->expected(2);
    app.add_option("--args", callArguments, "Tool arguments as a JSON object (with --call)");
    auto* runOption =
        app.add_option("--run", workflow, "Run a workflow (file path, name or id) and print the execution");
    app.add_option("--input", inputs, "Workflow input as key=value (repeatable, with --run)");

    statusFlag->excludes(listOption)->excludes(callOption)->excludes(runOption);
    listOption->excludes(callOption)->excludes(runOption);
    callOption->excludes(runOption);

    CLI11_PARSE(app, argc, argv);

    if (auto const level = mcpvisor::log::levelFromString(logLevel))
        mcpvisor::log::setLevel(*level);
    else if (trace)
        mcpvisor::log::setLevel(mcpvisor::log::Level::Trace);
    else if (verbose)
        mcpvisor::log::setLevel(mcpvisor::log::Level::Debug);

    auto configResult = configPath.empty() ? mcpvisor::loadConfig() : mcpvisor::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mcpvisor::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto application = mcpvisor::App(std::move(*configResult));
    auto initResult = application.initialize();
    if (!initResult)
    {
        mcpvisor::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (status)
        return application.printStatus();
    if (!listToolsServer.empty())
        return application.listTools(listToolsServer);
    if (callTarget.size() == 2)
        return application.callTool(callTarget[0], callTarget[1], callArguments);
    if (!workflow.empty())
        return application.runWorkflow(workflow, inputs);

    return application.runDaemon();
}
