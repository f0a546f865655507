// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace mcpvisor
{

/// @brief Rolling health statistics for one server.
///
/// Keeps a bounded window of check outcomes and response-time samples plus
/// lifetime counters. Only the health monitor mutates it.
class HealthMetrics
{
  public:
    static constexpr auto DefaultHistorySize = size_t { 100 };

    explicit HealthMetrics(std::string serverName, size_t historySize = DefaultHistorySize);

    /// @brief Records one liveness check.
    /// @param success Whether the server answered.
    /// @param responseTimeMs Round-trip time; only sampled for successful checks.
    void addCheckResult(bool success, double responseTimeMs = 0.0, SystemClock::time_point at = SystemClock::now());

    /// @brief Records a restart: bumps the restart count and clears the failure streak.
    void recordRestart(SteadyClock::time_point at);

    /// @brief Successful checks over all checks in the window, in percent (100 with no checks).
    [[nodiscard]] auto uptimePercentage() const -> double;

    /// @brief Mean of the response-time window, 0 with no samples.
    [[nodiscard]] auto averageResponseTime() const -> double;

    /// @brief 95th percentile of the response-time window, 0 with no samples.
    [[nodiscard]] auto p95ResponseTime() const -> double;

    [[nodiscard]] auto serverName() const -> const std::string& { return _serverName; }
    [[nodiscard]] auto totalChecks() const -> size_t { return _totalChecks; }
    [[nodiscard]] auto totalFailures() const -> size_t { return _totalFailures; }
    [[nodiscard]] auto consecutiveFailures() const -> int { return _consecutiveFailures; }
    [[nodiscard]] auto restartCount() const -> int { return _restartCount; }
    [[nodiscard]] auto lastSuccessfulCheck() const -> std::optional<SystemClock::time_point> { return _lastSuccess; }
    [[nodiscard]] auto lastFailedCheck() const -> std::optional<SystemClock::time_point> { return _lastFailure; }
    [[nodiscard]] auto lastRestart() const -> std::optional<SteadyClock::time_point> { return _lastRestart; }
    [[nodiscard]] auto responseTimes() const -> const std::deque<double>& { return _responseTimes; }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

  private:
    std::string _serverName;
    size_t _historySize;
    std::deque<double> _responseTimes;
    std::deque<bool> _checks;
    size_t _totalChecks = 0;
    size_t _totalFailures = 0;
    int _consecutiveFailures = 0;
    int _restartCount = 0;
    std::optional<SystemClock::time_point> _lastSuccess;
    std::optional<SystemClock::time_point> _lastFailure;
    std::optional<SteadyClock::time_point> _lastRestart;
};

} // namespace mcpvisor
