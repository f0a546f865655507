// SPDX-License-Identifier: Apache-2.0
#include "HealthMonitor.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <format>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace mcpvisor
{

namespace
{

    /// @brief Tolerance for loop ticks that land just short of a server's check interval.
    constexpr auto ScheduleSlack = std::chrono::seconds(1);

    struct ServerEntry
    {
        ServerConfig config;
        HealthMetrics metrics;
        HealthStatus status;
        std::optional<SteadyClock::time_point> lastChecked;
    };

    auto makeStatus(ServerStatus status, double uptime, std::optional<std::string> errorMessage = std::nullopt)
        -> HealthStatus
    {
        return HealthStatus {
            .status = status,
            .responseTimeMs = 0.0,
            .lastCheck = SystemClock::now(),
            .errorMessage = std::move(errorMessage),
            .uptimePercentage = uptime,
        };
    }

} // namespace

auto validate(const HealthMonitorConfig& config) -> VoidResult
{
    if (config.checkInterval < HealthMonitorConfig::MinCheckInterval)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Check interval must be at least {}", HealthMonitorConfig::MinCheckInterval));
    if (config.failureThreshold < 1)
        return makeError(ErrorCode::InvalidArgument, "Failure threshold must be at least 1");
    if (config.restartCooldown < HealthMonitorConfig::MinRestartCooldown)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Restart cooldown must be at least {}", HealthMonitorConfig::MinRestartCooldown));
    if (config.historySize == 0)
        return makeError(ErrorCode::InvalidArgument, "History size must be at least 1");
    return {};
}

struct HealthMonitor::Impl
{
    ClientRegistry& registry;

    // Guards config, timeSource and servers.
    mutable std::mutex mutex;
    HealthMonitorConfig config;
    TimeSource timeSource = [] { return SteadyClock::now(); };
    std::map<std::string, ServerEntry, std::less<>> servers;

    // Serializes client replacement (register, unregister, restart).
    std::mutex restartMutex;

    std::mutex alertMutex;
    std::map<AlertCallbackId, AlertCallback> alertCallbacks;
    AlertCallbackId nextAlertId = 1;

    std::mutex controlMutex;
    std::mutex loopMutex;
    std::condition_variable_any cv;
    bool wakeRequested = false;
    std::jthread worker;
    std::atomic<bool> monitoring = false;

    Impl(ClientRegistry& registry, HealthMonitorConfig config): registry(registry), config(config) {}

    [[nodiscard]] auto shouldRestart(const ServerEntry& entry, SteadyClock::time_point now) const -> bool
    {
        if (!entry.config.autoRestart)
            return false;
        if (entry.metrics.consecutiveFailures() < config.failureThreshold)
            return false;
        auto const lastRestart = entry.metrics.lastRestart();
        return !lastRestart || now - *lastRestart > config.restartCooldown;
    }

    void dispatch(const Alert& alert)
    {
        auto callbacks = std::vector<AlertCallback> {};
        {
            auto lock = std::lock_guard(alertMutex);
            callbacks.reserve(alertCallbacks.size());
            for (const auto& [id, callback]: alertCallbacks)
                callbacks.push_back(callback);
        }

        log::debug("Alert ({}) for '{}': {}", alertKindToString(alert.kind), alert.serverName, alert.message);

        for (const auto& callback: callbacks)
        {
            try
            {
                callback(alert);
            }
            catch (const std::exception& e)
            {
                log::error("Alert callback failed: {}", e.what());
            }
        }
    }

    void checkServers(const std::vector<std::string>& names)
    {
        if (names.empty())
            return;

        auto results = registry.getHealthStatus(names);

        auto alerts = std::vector<Alert> {};
        auto restartCandidates = std::vector<std::string> {};
        {
            auto lock = std::lock_guard(mutex);
            auto const now = timeSource();
            auto const slowThresholdMs = static_cast<double>(config.slowResponseThreshold.count());

            for (auto& [name, status]: results)
            {
                auto const it = servers.find(name);
                if (it == servers.end())
                    continue; // unregistered while the check was running

                auto& entry = it->second;
                auto const previous = entry.status.status;

                entry.metrics.addCheckResult(isResponsive(status.status), status.responseTimeMs, status.lastCheck);
                status.uptimePercentage = entry.metrics.uptimePercentage();
                entry.status = status;
                entry.lastChecked = now;

                log::debug("Health of '{}': {} ({:.1f} ms, {} consecutive failures)",
                           name,
                           serverStatusToString(status.status),
                           status.responseTimeMs,
                           entry.metrics.consecutiveFailures());

                if (status.status == ServerStatus::Offline && previous != ServerStatus::Offline)
                    alerts.push_back(Alert {
                        .kind = AlertKind::ServerOffline,
                        .serverName = name,
                        .status = status,
                        .message = std::format("Server '{}' is offline: {}",
                                               name,
                                               status.errorMessage.value_or("no response")),
                    });

                if (status.responseTimeMs > slowThresholdMs)
                    alerts.push_back(Alert {
                        .kind = AlertKind::SlowResponse,
                        .serverName = name,
                        .status = status,
                        .message = std::format("Server '{}' responded in {:.0f} ms (threshold {} ms)",
                                               name,
                                               status.responseTimeMs,
                                               config.slowResponseThreshold.count()),
                    });

                if (shouldRestart(entry, now))
                    restartCandidates.push_back(name);
            }
        }

        for (const auto& alert: alerts)
            dispatch(alert);

        for (const auto& name: restartCandidates)
        {
            if (auto restarted = restartServer(name, false); !restarted)
                log::error("Automatic restart of '{}' failed: {}", name, restarted.error());
        }
    }

    /// @brief Replaces the server's client with a fresh one.
    /// @param force Skip the threshold and cooldown check.
    auto restartServer(std::string_view name, bool force) -> VoidResult
    {
        auto restartLock = std::lock_guard(restartMutex);

        auto serverConfig = ServerConfig {};
        {
            auto lock = std::lock_guard(mutex);
            auto const it = servers.find(name);
            if (it == servers.end())
                return makeError(ErrorCode::NotFound, std::format("Server not registered: {}", name));

            // Re-evaluated here: a concurrent restart may already have reset the failure streak.
            if (!force && !shouldRestart(it->second, timeSource()))
                return {};

            serverConfig = it->second.config;
            it->second.status = makeStatus(ServerStatus::Stopping, it->second.metrics.uptimePercentage());
        }

        log::warning("Restarting MCP server '{}'{}", serverConfig.name, force ? " (forced)" : "");

        registry.removeClient(serverConfig.name);
        auto result = registry.addClient(serverConfig);

        auto lock = std::lock_guard(mutex);
        auto const it = servers.find(name);
        if (it == servers.end())
            return result;

        auto& entry = it->second;
        entry.metrics.recordRestart(timeSource());
        if (result)
            entry.status = makeStatus(ServerStatus::Starting, entry.metrics.uptimePercentage());
        else
            entry.status = makeStatus(ServerStatus::Offline, entry.metrics.uptimePercentage(), result.error().message);

        return result;
    }

    [[nodiscard]] auto dueServers() const -> std::vector<std::string>
    {
        auto lock = std::lock_guard(mutex);
        auto const now = timeSource();
        auto names = std::vector<std::string> {};
        for (const auto& [name, entry]: servers)
        {
            if (!entry.lastChecked || *entry.lastChecked + entry.config.healthCheckInterval <= now + ScheduleSlack)
                names.push_back(name);
        }
        return names;
    }

    [[nodiscard]] auto allServers() const -> std::vector<std::string>
    {
        auto lock = std::lock_guard(mutex);
        auto names = std::vector<std::string> {};
        names.reserve(servers.size());
        for (const auto& [name, entry]: servers)
            names.push_back(name);
        return names;
    }

    void wake()
    {
        {
            auto lock = std::lock_guard(loopMutex);
            wakeRequested = true;
        }
        cv.notify_all();
    }

    void run(const std::stop_token& stopToken)
    {
        log::info("Health monitor started");

        while (!stopToken.stop_requested())
        {
            checkServers(dueServers());

            auto interval = std::chrono::seconds {};
            {
                auto lock = std::lock_guard(mutex);
                interval = config.checkInterval;
            }

            auto lock = std::unique_lock(loopMutex);
            cv.wait_for(lock, stopToken, interval, [this] { return wakeRequested; });
            wakeRequested = false;
        }

        log::info("Health monitor stopped");
    }
};

HealthMonitor::HealthMonitor(ClientRegistry& registry, HealthMonitorConfig config):
    _impl(std::make_unique<Impl>(registry, config))
{
    if (auto valid = validate(config); !valid)
    {
        log::warning("Invalid health monitor configuration, clamping to limits: {}", valid.error());
        auto& c = _impl->config;
        c.checkInterval = std::max(c.checkInterval, HealthMonitorConfig::MinCheckInterval);
        c.failureThreshold = std::max(c.failureThreshold, 1);
        c.restartCooldown = std::max(c.restartCooldown, HealthMonitorConfig::MinRestartCooldown);
        c.historySize = std::max<size_t>(c.historySize, 1);
    }
}

HealthMonitor::~HealthMonitor()
{
    stop();
}

auto HealthMonitor::registerServer(const ServerConfig& config) -> VoidResult
{
    if (config.name.empty())
        return makeError(ErrorCode::InvalidArgument, "Server name must not be empty");

    auto restartLock = std::lock_guard(_impl->restartMutex);

    auto replaced = false;
    {
        auto lock = std::lock_guard(_impl->mutex);
        auto const it = _impl->servers.find(config.name);
        if (it != _impl->servers.end())
        {
            it->second.config = config;
            it->second.status = makeStatus(ServerStatus::Starting, it->second.metrics.uptimePercentage());
            replaced = true;
        }
        else
        {
            _impl->servers.try_emplace(config.name,
                                       ServerEntry {
                                           .config = config,
                                           .metrics = HealthMetrics(config.name, _impl->config.historySize),
                                           .status = makeStatus(ServerStatus::Starting, 100.0),
                                           .lastChecked = std::nullopt,
                                       });
        }
    }

    if (replaced)
        _impl->registry.removeClient(config.name);

    auto result = _impl->registry.addClient(config);
    if (!result)
    {
        log::warning("MCP server '{}' registered but not started: {}", config.name, result.error());
        auto lock = std::lock_guard(_impl->mutex);
        if (auto const it = _impl->servers.find(config.name); it != _impl->servers.end())
            it->second.status =
                makeStatus(ServerStatus::Offline, it->second.metrics.uptimePercentage(), result.error().message);
        return result;
    }

    log::info("Monitoring MCP server '{}'", config.name);
    return {};
}

auto HealthMonitor::unregisterServer(std::string_view name) -> bool
{
    auto restartLock = std::lock_guard(_impl->restartMutex);
    {
        auto lock = std::lock_guard(_impl->mutex);
        auto const it = _impl->servers.find(name);
        if (it == _impl->servers.end())
            return false;
        _impl->servers.erase(it);
    }

    _impl->registry.removeClient(name);
    log::info("Stopped monitoring MCP server '{}'", name);
    return true;
}

auto HealthMonitor::getServerStatus(std::string_view name) const -> HealthStatus
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->servers.find(name);
    if (it == _impl->servers.end())
        return makeStatus(ServerStatus::Offline, 0.0, "Server not registered");
    return it->second.status;
}

auto HealthMonitor::getAllStatuses() const -> std::map<std::string, HealthStatus>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto statuses = std::map<std::string, HealthStatus> {};
    for (const auto& [name, entry]: _impl->servers)
        statuses.emplace(name, entry.status);
    return statuses;
}

auto HealthMonitor::forceRestartServer(std::string_view name) -> VoidResult
{
    return _impl->restartServer(name, true);
}

auto HealthMonitor::getServerMetrics(std::string_view name) const -> std::optional<HealthMetrics>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->servers.find(name);
    if (it == _impl->servers.end())
        return std::nullopt;
    return it->second.metrics;
}

auto HealthMonitor::getAllMetrics() const -> std::map<std::string, HealthMetrics>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto metrics = std::map<std::string, HealthMetrics> {};
    for (const auto& [name, entry]: _impl->servers)
        metrics.emplace(name, entry.metrics);
    return metrics;
}

auto HealthMonitor::addAlertCallback(AlertCallback callback) -> AlertCallbackId
{
    auto lock = std::lock_guard(_impl->alertMutex);
    auto const id = _impl->nextAlertId++;
    _impl->alertCallbacks.emplace(id, std::move(callback));
    return id;
}

auto HealthMonitor::removeAlertCallback(AlertCallbackId id) -> bool
{
    auto lock = std::lock_guard(_impl->alertMutex);
    return _impl->alertCallbacks.erase(id) > 0;
}

void HealthMonitor::checkAllServers()
{
    _impl->checkServers(_impl->allServers());
}

void HealthMonitor::start()
{
    auto lock = std::lock_guard(_impl->controlMutex);
    if (_impl->worker.joinable())
        return;

    _impl->monitoring = true;
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

void HealthMonitor::stop()
{
    auto lock = std::lock_guard(_impl->controlMutex);
    if (!_impl->worker.joinable())
        return;

    _impl->worker.request_stop();
    _impl->worker.join();
    _impl->worker = std::jthread {};
    _impl->monitoring = false;
}

auto HealthMonitor::isMonitoring() const -> bool
{
    return _impl->monitoring;
}

auto HealthMonitor::config() const -> HealthMonitorConfig
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->config;
}

auto HealthMonitor::setCheckInterval(std::chrono::seconds interval) -> VoidResult
{
    if (interval < HealthMonitorConfig::MinCheckInterval)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Check interval must be at least {}", HealthMonitorConfig::MinCheckInterval));
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->config.checkInterval = interval;
    }
    _impl->wake();
    return {};
}

auto HealthMonitor::setFailureThreshold(int threshold) -> VoidResult
{
    if (threshold < 1)
        return makeError(ErrorCode::InvalidArgument, "Failure threshold must be at least 1");
    auto lock = std::lock_guard(_impl->mutex);
    _impl->config.failureThreshold = threshold;
    return {};
}

auto HealthMonitor::setRestartCooldown(std::chrono::seconds cooldown) -> VoidResult
{
    if (cooldown < HealthMonitorConfig::MinRestartCooldown)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Restart cooldown must be at least {}", HealthMonitorConfig::MinRestartCooldown));
    auto lock = std::lock_guard(_impl->mutex);
    _impl->config.restartCooldown = cooldown;
    return {};
}

void HealthMonitor::setTimeSource(TimeSource timeSource)
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->timeSource = std::move(timeSource);
}

} // namespace mcpvisor
