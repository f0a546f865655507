// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <health/HealthMetrics.hpp>
#include <mcp/ClientRegistry.hpp>
#include <mcp/ServerConfig.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpvisor
{

/// @brief Tunables of the health monitor.
struct HealthMonitorConfig
{
    static constexpr auto MinCheckInterval = std::chrono::seconds(5);
    static constexpr auto MinRestartCooldown = std::chrono::seconds(60);

    /// @brief Wake-up period of the monitoring loop.
    std::chrono::seconds checkInterval { 30 };

    /// @brief Consecutive failed checks that make a server eligible for restart.
    int failureThreshold = 3;

    /// @brief Minimum time between two automatic restarts of the same server.
    std::chrono::seconds restartCooldown { 300 };

    /// @brief Response times above this raise a slow-response alert.
    std::chrono::milliseconds slowResponseThreshold { 5000 };

    size_t historySize = HealthMetrics::DefaultHistorySize;
};

/// @brief Checks the tunables against their lower bounds.
/// @return Success or InvalidArgument naming the first offending field.
[[nodiscard]] auto validate(const HealthMonitorConfig& config) -> VoidResult;

enum class AlertKind : std::uint8_t
{
    ServerOffline,
    SlowResponse,
};

[[nodiscard]] constexpr auto alertKindToString(AlertKind kind) -> std::string_view
{
    switch (kind)
    {
        case AlertKind::ServerOffline: return "server-offline";
        case AlertKind::SlowResponse: return "slow-response";
    }
    return "unknown";
}

/// @brief Notification raised by a health check cycle.
struct Alert
{
    AlertKind kind = AlertKind::ServerOffline;
    std::string serverName;
    HealthStatus status;
    std::string message;
};

using AlertCallback = std::function<void(const Alert& alert)>;
using AlertCallbackId = std::uint64_t;

/// @brief Periodically checks registered servers, keeps their metrics and restarts failing ones.
///
/// Servers are registered here and added to the client registry on the caller's
/// behalf. Restart policy: a server is restarted when auto-restart is enabled,
/// its consecutive failures reached the failure threshold, and the previous
/// restart (if any) lies longer ago than the restart cooldown.
class HealthMonitor
{
  public:
    using TimeSource = std::function<SteadyClock::time_point()>;

    explicit HealthMonitor(ClientRegistry& registry, HealthMonitorConfig config = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// @brief Starts monitoring a server and adds its client to the registry.
    ///
    /// The server stays registered even if the client cannot be started, so
    /// the restart policy can bring it up later. Registering an existing name
    /// replaces its configuration and restarts its client.
    /// @return Success, or the error of the initial client start.
    [[nodiscard]] auto registerServer(const ServerConfig& config) -> VoidResult;

    /// @brief Stops monitoring a server and removes its client.
    auto unregisterServer(std::string_view name) -> bool;

    /// @brief Returns the last recorded status, OFFLINE for unknown servers.
    [[nodiscard]] auto getServerStatus(std::string_view name) const -> HealthStatus;

    [[nodiscard]] auto getAllStatuses() const -> std::map<std::string, HealthStatus>;

    /// @brief Restarts a server regardless of failure threshold and cooldown.
    /// @return NotFound for unregistered servers, otherwise the result of re-adding the client.
    [[nodiscard]] auto forceRestartServer(std::string_view name) -> VoidResult;

    [[nodiscard]] auto getServerMetrics(std::string_view name) const -> std::optional<HealthMetrics>;
    [[nodiscard]] auto getAllMetrics() const -> std::map<std::string, HealthMetrics>;

    /// @brief Subscribes to alerts. Callbacks run on the thread performing the check.
    /// @return An id for removeAlertCallback().
    auto addAlertCallback(AlertCallback callback) -> AlertCallbackId;
    auto removeAlertCallback(AlertCallbackId id) -> bool;

    /// @brief Performs one check cycle over every registered server.
    void checkAllServers();

    /// @brief Starts the background loop. Does nothing if already running.
    void start();

    /// @brief Stops the background loop and waits for the current cycle to finish.
    void stop();

    [[nodiscard]] auto isMonitoring() const -> bool;

    [[nodiscard]] auto config() const -> HealthMonitorConfig;

    [[nodiscard]] auto setCheckInterval(std::chrono::seconds interval) -> VoidResult;
    [[nodiscard]] auto setFailureThreshold(int threshold) -> VoidResult;
    [[nodiscard]] auto setRestartCooldown(std::chrono::seconds cooldown) -> VoidResult;

    /// @brief Replaces the clock used for restart cooldowns and check scheduling.
    void setTimeSource(TimeSource timeSource);

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpvisor
