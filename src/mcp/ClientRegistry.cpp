// SPDX-License-Identifier: Apache-2.0
#include "ClientRegistry.hpp"

#include <core/Log.hpp>
#include <mcp/ServerClient.hpp>

#include <exception>
#include <format>
#include <future>
#include <utility>

namespace mcpvisor
{

auto makeServerClientFactory() -> ClientFactory
{
    return [](const ServerConfig& config) -> std::shared_ptr<Client> {
        return std::make_shared<ServerClient>(config);
    };
}

ClientRegistry::ClientRegistry(ClientFactory factory): _factory(std::move(factory))
{
}

ClientRegistry::~ClientRegistry()
{
    shutdownAll();
}

auto ClientRegistry::addClient(const ServerConfig& config) -> VoidResult
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_clients.contains(config.name))
        {
            log::debug("MCP client '{}' already registered", config.name);
            return {};
        }
    }

    auto client = _factory(config);
    if (!client)
        return makeError(ErrorCode::ConnectionError, std::format("No client could be created for '{}'", config.name));

    if (auto initialized = client->initialize(); !initialized)
    {
        client->shutdown();
        return std::unexpected(initialized.error());
    }

    auto lock = std::unique_lock(_mutex);
    auto const inserted = _clients.try_emplace(config.name, client).second;
    lock.unlock();

    if (!inserted)
    {
        // Lost a race against a concurrent addClient for the same name.
        client->shutdown();
        return {};
    }

    log::info("Added MCP client '{}'", config.name);
    return {};
}

auto ClientRegistry::removeClient(std::string_view name) -> bool
{
    auto client = std::shared_ptr<Client> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _clients.find(name);
        if (it == _clients.end())
            return false;
        client = std::move(it->second);
        _clients.erase(it);
    }

    client->shutdown();
    log::info("Removed MCP client '{}'", name);
    return true;
}

auto ClientRegistry::getClient(std::string_view name) const -> std::shared_ptr<Client>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _clients.find(name);
    return it != _clients.end() ? it->second : nullptr;
}

auto ClientRegistry::getAllHealthStatus() const -> std::map<std::string, HealthStatus>
{
    return getHealthStatus(serverNames());
}

auto ClientRegistry::getHealthStatus(const std::vector<std::string>& names) const
    -> std::map<std::string, HealthStatus>
{
    auto statuses = std::map<std::string, HealthStatus> {};
    auto pending = std::vector<std::pair<std::string, std::future<HealthStatus>>> {};
    pending.reserve(names.size());

    for (const auto& name: names)
    {
        auto client = getClient(name);
        if (!client)
        {
            statuses[name] = HealthStatus {
                .status = ServerStatus::Offline,
                .responseTimeMs = 0.0,
                .lastCheck = SystemClock::now(),
                .errorMessage = std::string("Client not found"),
                .uptimePercentage = 0.0,
            };
            continue;
        }
        pending.emplace_back(name, std::async(std::launch::async, [client] { return client->healthCheck(); }));
    }

    for (auto& [name, future]: pending)
    {
        try
        {
            statuses[name] = future.get();
        }
        catch (const std::exception& e)
        {
            log::error("Health check failed for '{}': {}", name, e.what());
            statuses[name] = HealthStatus {
                .status = ServerStatus::Unhealthy,
                .responseTimeMs = 0.0,
                .lastCheck = SystemClock::now(),
                .errorMessage = std::string(e.what()),
                .uptimePercentage = 0.0,
            };
        }
    }

    return statuses;
}

auto ClientRegistry::callTool(std::string_view server,
                              std::string_view tool,
                              const nlohmann::json& arguments,
                              const CallOptions& options) const -> Result<ToolResult>
{
    auto client = getClient(server);
    if (!client)
        return makeError(ErrorCode::NotFound, std::format("MCP client not found: {}", server));
    return client->callTool(tool, arguments, options);
}

auto ClientRegistry::listTools(std::string_view server) const -> Result<std::vector<ToolDefinition>>
{
    auto client = getClient(server);
    if (!client)
        return makeError(ErrorCode::NotFound, std::format("MCP client not found: {}", server));
    return client->listTools();
}

auto ClientRegistry::serverNames() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto names = std::vector<std::string> {};
    names.reserve(_clients.size());
    for (const auto& [name, client]: _clients)
        names.push_back(name);
    return names;
}

auto ClientRegistry::size() const -> size_t
{
    auto lock = std::lock_guard(_mutex);
    return _clients.size();
}

void ClientRegistry::shutdownAll()
{
    auto clients = decltype(_clients) {};
    {
        auto lock = std::lock_guard(_mutex);
        clients.swap(_clients);
    }

    if (clients.empty())
        return;

    auto pending = std::vector<std::future<void>> {};
    pending.reserve(clients.size());
    for (auto& [name, client]: clients)
        pending.push_back(std::async(std::launch::async, [client] { client->shutdown(); }));

    for (auto& future: pending)
    {
        try
        {
            future.get();
        }
        catch (const std::exception& e)
        {
            log::error("Error while shutting down an MCP client: {}", e.what());
        }
    }

    log::info("All MCP clients shut down");
}

} // namespace mcpvisor
