// SPDX-License-Identifier: Apache-2.0
#include "ServerClient.hpp"

#include <core/Log.hpp>
#include <mcp/StdioTransport.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace mcpvisor
{

namespace
{
    auto elapsedMs(SteadyClock::time_point since) -> double
    {
        return std::chrono::duration<double, std::milli>(SteadyClock::now() - since).count();
    }
} // namespace

auto makeStdioTransportFactory() -> TransportFactory
{
    return [](const ServerConfig& config) -> Result<std::unique_ptr<Transport>> {
        auto transport = std::make_unique<StdioTransport>();
        auto started = transport->start(StdioTransportConfig {
            .command = config.command,
            .args = config.args,
            .env = config.env,
            .startupGrace = config.startupGrace,
            .shutdownGrace = config.shutdownGrace,
        });
        if (!started)
            return std::unexpected(started.error());
        return std::unique_ptr<Transport>(std::move(transport));
    };
}

ServerClient::ServerClient(ServerConfig config, TransportFactory transportFactory):
    _config(std::move(config)), _transportFactory(std::move(transportFactory))
{
}

ServerClient::~ServerClient()
{
    shutdown();
}

auto ServerClient::config() const -> const ServerConfig&
{
    return _config;
}

auto ServerClient::state() const -> ClientState
{
    auto lock = std::lock_guard(_stateMutex);
    return _state;
}

auto ServerClient::serverInfo() const -> mcp::InitializeResult
{
    auto lock = std::lock_guard(_stateMutex);
    return _serverInfo;
}

auto ServerClient::initialize() -> VoidResult
{
    auto lifecycle = std::lock_guard(_lifecycleMutex);

    {
        auto lock = std::lock_guard(_stateMutex);
        switch (_state)
        {
            case ClientState::Ready:
                if (_transport && _transport->isConnected())
                    return {};
                _state = ClientState::Failed;
                _transport.reset();
                return makeError(ErrorCode::ConnectionError,
                                 std::format("MCP server '{}' process is no longer running", _config.name));
            case ClientState::Uninitialized: _state = ClientState::Initializing; break;
            default:
                return makeError(ErrorCode::ConnectionError,
                                 std::format("MCP server '{}' cannot be initialized from state {}",
                                             _config.name,
                                             clientStateToString(_state)));
        }
    }

    log::info("Initializing MCP server '{}'", _config.name);

    auto transportResult = _transportFactory(_config);
    if (!transportResult)
        return failInitialization(std::move(transportResult.error()));

    auto transport = std::shared_ptr<Transport>(std::move(*transportResult));
    auto callLock = std::unique_lock(_callMutex);

    auto initResult =
        exchange(*transport, mcp::method::Initialize, mcp::toJson(mcp::InitializeParams {}), _config.timeout)
            .and_then([this](const jsonrpc::Response& response) -> Result<mcp::InitializeResult> {
                if (response.error)
                {
                    return makeError(ErrorCode::ConnectionError,
                                     std::format("MCP server '{}' rejected initialize: {} ({})",
                                                 _config.name,
                                                 response.error->message,
                                                 response.error->code));
                }
                return mcp::parseInitializeResult(*response.result);
            });

    if (!initResult)
    {
        transport->close();
        return failInitialization(std::move(initResult.error()));
    }

    if (auto sent = transport->send(jsonrpc::makeNotification(mcp::method::Initialized), _config.timeout); !sent)
    {
        transport->close();
        return failInitialization(std::move(sent.error()));
    }

    auto tools = exchange(*transport, mcp::method::ToolsList, nlohmann::json::object(), _config.timeout)
                     .and_then([](const jsonrpc::Response& response) -> Result<std::vector<ToolDefinition>> {
                         if (response.error)
                             return makeError(ErrorCode::ProtocolError, response.error->message);
                         return mcp::parseToolsListResult(*response.result);
                     });
    callLock.unlock();

    if (!tools)
        log::warning("Failed to list tools for MCP server '{}': {}", _config.name, tools.error().message);

    {
        auto lock = std::lock_guard(_stateMutex);
        _transport = std::move(transport);
        _serverInfo = std::move(*initResult);
        _tools = tools ? std::move(*tools) : std::vector<ToolDefinition> {};
        _state = ClientState::Ready;

        log::info("MCP server '{}' ready: {} v{} with {} tools",
                  _config.name,
                  _serverInfo.serverName,
                  _serverInfo.serverVersion,
                  _tools.size());
    }

    return {};
}

auto ServerClient::failInitialization(Error error) -> VoidResult
{
    log::error("Failed to initialize MCP server '{}': {}", _config.name, error.message);

    auto lock = std::lock_guard(_stateMutex);
    _state = ClientState::Failed;
    _transport.reset();
    _tools.clear();

    error.serverName = _config.name;
    return std::unexpected(std::move(error));
}

auto ServerClient::callTool(std::string_view name, const nlohmann::json& arguments, const CallOptions& options)
    -> Result<ToolResult>
{
    auto transport = readyTransport();
    if (!transport)
        return std::unexpected(transport.error());

    auto const attempts = std::max(1, options.attempts.value_or(_config.retryCount));
    auto const timeout = options.timeout.value_or(_config.timeout);
    auto delay = _config.retryBackoff;

    log::debug("Calling tool '{}' on '{}'", name, _config.name);

    for (auto attempt = 1;; ++attempt)
    {
        auto result = callToolOnce(**transport, name, arguments, timeout);
        if (result || !isRetryable(result.error()))
            return result;

        if (attempt >= attempts)
        {
            log::warning("Tool '{}' on '{}' timed out after {} attempts", name, _config.name, attempts);
            return result;
        }

        log::warning("Tool '{}' on '{}' timed out (attempt {}/{}), retrying in {}",
                     name,
                     _config.name,
                     attempt,
                     attempts,
                     delay);
        std::this_thread::sleep_for(delay);
        delay = std::min(delay * 2, _config.retryBackoffMax);
    }
}

auto ServerClient::callToolOnce(Transport& transport,
                                std::string_view name,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<ToolResult>
{
    auto callLock = std::unique_lock(_callMutex, std::defer_lock);
    if (!callLock.try_lock_for(timeout))
        return makeError(ErrorCode::TimeoutError,
                         std::format("MCP server '{}' stayed busy for {}", _config.name, timeout));

    auto params = mcp::toJson(mcp::ToolCallParams { .name = std::string(name), .arguments = arguments });

    return exchange(transport, mcp::method::ToolsCall, std::move(params), timeout)
        .and_then([this, name](const jsonrpc::Response& response) -> Result<ToolResult> {
            if (response.error)
            {
                return makeToolError(
                    _config.name,
                    response.error->code,
                    std::format("Tool '{}' failed on '{}': {}", name, _config.name, response.error->message));
            }

            auto toolResult = mcp::parseToolCallResult(*response.result);
            if (toolResult)
                log::debug("Tool '{}' returned {} bytes (isError: {})",
                           name,
                           toolResult->content.size(),
                           toolResult->isError);
            return toolResult;
        });
}

auto ServerClient::healthCheck() -> HealthStatus
{
    auto const now = SystemClock::now();
    auto transport = std::shared_ptr<Transport> {};
    auto state = ClientState::Uninitialized;
    {
        auto lock = std::lock_guard(_stateMutex);
        transport = _transport;
        state = _state;
    }

    if (state != ClientState::Ready || !transport || !transport->isConnected())
    {
        return HealthStatus {
            .status = ServerStatus::Offline,
            .responseTimeMs = 0.0,
            .lastCheck = now,
            .errorMessage = state == ClientState::Ready
                                ? std::string("Process not running")
                                : std::format("Client is {}", clientStateToString(state)),
            .uptimePercentage = 0.0,
        };
    }

    auto const timeout = std::min(_config.timeout, std::chrono::milliseconds(PingTimeout));

    auto callLock = std::unique_lock(_callMutex, std::defer_lock);
    if (!callLock.try_lock_for(timeout))
    {
        return HealthStatus {
            .status = ServerStatus::Degraded,
            .responseTimeMs = static_cast<double>(timeout.count()),
            .lastCheck = now,
            .errorMessage = "Server busy with an in-flight request",
            .uptimePercentage = 100.0,
        };
    }

    auto const start = SteadyClock::now();
    auto response = exchange(*transport, mcp::method::Ping, nlohmann::json::object(), timeout);
    auto const responseTime = elapsedMs(start);

    if (!response)
    {
        return HealthStatus {
            .status = ServerStatus::Unhealthy,
            .responseTimeMs = responseTime,
            .lastCheck = now,
            .errorMessage = response.error().message,
            .uptimePercentage = 0.0,
        };
    }

    if (response->error)
    {
        return HealthStatus {
            .status = ServerStatus::Degraded,
            .responseTimeMs = responseTime,
            .lastCheck = now,
            .errorMessage = std::format("Ping error {}: {}", response->error->code, response->error->message),
            .uptimePercentage = 100.0,
        };
    }

    auto const slow = responseTime > static_cast<double>(SlowResponseThreshold.count());
    return HealthStatus {
        .status = slow ? ServerStatus::Degraded : ServerStatus::Healthy,
        .responseTimeMs = responseTime,
        .lastCheck = now,
        .errorMessage = slow ? std::optional(std::format("Slow response: {:.0f} ms", responseTime)) : std::nullopt,
        .uptimePercentage = 100.0,
    };
}

auto ServerClient::listTools() -> Result<std::vector<ToolDefinition>>
{
    if (state() == ClientState::Uninitialized)
    {
        if (auto initialized = initialize(); !initialized)
            return std::unexpected(initialized.error());
    }

    auto lock = std::lock_guard(_stateMutex);
    return _tools;
}

void ServerClient::shutdown()
{
    auto lifecycle = std::lock_guard(_lifecycleMutex);

    auto transport = std::shared_ptr<Transport> {};
    auto wasReady = false;
    {
        auto lock = std::lock_guard(_stateMutex);
        if (_state == ClientState::Terminated)
            return;
        if (_state == ClientState::Uninitialized)
        {
            _state = ClientState::Terminated;
            return;
        }
        wasReady = _state == ClientState::Ready;
        _state = ClientState::ShuttingDown;
        transport = std::move(_transport);
    }

    log::info("Shutting down MCP server '{}'", _config.name);

    if (transport)
    {
        if (wasReady)
        {
            auto notification =
                jsonrpc::makeNotification(mcp::method::Cancelled, nlohmann::json { { "reason", "client shutdown" } });
            if (auto sent = transport->send(notification, CancelNotifyTimeout); !sent)
                log::debug("Could not notify '{}' of shutdown: {}", _config.name, sent.error().message);
        }

        // Closing without the call mutex makes an in-flight exchange fail with ConnectionError.
        transport->close();
    }

    auto lock = std::lock_guard(_stateMutex);
    _tools.clear();
    _serverInfo = {};
    _state = ClientState::Terminated;
}

auto ServerClient::readyTransport() const -> Result<std::shared_ptr<Transport>>
{
    auto lock = std::lock_guard(_stateMutex);
    if (_state != ClientState::Ready || !_transport)
    {
        return std::unexpected(Error {
            .code = ErrorCode::ConnectionError,
            .message = std::format("MCP server '{}' is not ready ({})", _config.name, clientStateToString(_state)),
            .serverName = _config.name,
        });
    }
    return _transport;
}

auto ServerClient::exchange(Transport& transport,
                            std::string_view method,
                            nlohmann::json params,
                            std::chrono::milliseconds timeout) -> Result<jsonrpc::Response>
{
    auto const id = _nextId++;
    auto const deadline = SteadyClock::now() + timeout;
    if (auto sent = transport.send(jsonrpc::makeRequest(id, method, std::move(params)), timeout); !sent)
    {
        auto error = std::move(sent.error());
        if (error.code == ErrorCode::TimeoutError)
            error.message = std::format("Request '{}' timed out on '{}' after {}", method, _config.name, timeout);
        error.serverName = _config.name;
        return std::unexpected(std::move(error));
    }

    while (true)
    {
        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
        if (remaining <= std::chrono::milliseconds::zero())
            return makeError(ErrorCode::TimeoutError,
                             std::format("Request '{}' timed out on '{}' after {}", method, _config.name, timeout));

        auto message = transport.receive(remaining);
        if (!message)
        {
            auto error = std::move(message.error());
            if (error.code == ErrorCode::TimeoutError)
                error.message =
                    std::format("Request '{}' timed out on '{}' after {}", method, _config.name, timeout);
            error.serverName = _config.name;
            return std::unexpected(std::move(error));
        }

        if (!jsonrpc::isResponseTo(*message, id))
        {
            log::debug("Discarding message from '{}' not matching request {}", _config.name, id);
            continue;
        }

        return jsonrpc::parseResponse(*message);
    }
}

} // namespace mcpvisor
