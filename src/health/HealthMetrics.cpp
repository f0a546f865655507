// SPDX-License-Identifier: Apache-2.0
#include "HealthMetrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace mcpvisor
{

HealthMetrics::HealthMetrics(std::string serverName, size_t historySize):
    _serverName(std::move(serverName)), _historySize(std::max<size_t>(historySize, 1))
{
}

void HealthMetrics::addCheckResult(bool success, double responseTimeMs, SystemClock::time_point at)
{
    ++_totalChecks;
    _checks.push_back(success);
    if (_checks.size() > _historySize)
        _checks.pop_front();

    if (success)
    {
        _consecutiveFailures = 0;
        _lastSuccess = at;
        _responseTimes.push_back(responseTimeMs);
        if (_responseTimes.size() > _historySize)
            _responseTimes.pop_front();
    }
    else
    {
        ++_totalFailures;
        ++_consecutiveFailures;
        _lastFailure = at;
    }
}

void HealthMetrics::recordRestart(SteadyClock::time_point at)
{
    ++_restartCount;
    _consecutiveFailures = 0;
    _lastRestart = at;
}

auto HealthMetrics::uptimePercentage() const -> double
{
    if (_checks.empty())
        return 100.0;

    auto const successes = std::ranges::count(_checks, true);
    return static_cast<double>(successes) / static_cast<double>(_checks.size()) * 100.0;
}

auto HealthMetrics::averageResponseTime() const -> double
{
    if (_responseTimes.empty())
        return 0.0;

    auto const sum = std::accumulate(_responseTimes.begin(), _responseTimes.end(), 0.0);
    return sum / static_cast<double>(_responseTimes.size());
}

auto HealthMetrics::p95ResponseTime() const -> double
{
    if (_responseTimes.empty())
        return 0.0;

    auto sorted = std::vector<double>(_responseTimes.begin(), _responseTimes.end());
    std::ranges::sort(sorted);

    auto const index = static_cast<size_t>(std::floor(0.95 * static_cast<double>(sorted.size() - 1)));
    return sorted[index];
}

auto HealthMetrics::toJson() const -> nlohmann::json
{
    auto out = nlohmann::json {
        { "serverName", _serverName },
        { "totalChecks", _totalChecks },
        { "totalFailures", _totalFailures },
        { "consecutiveFailures", _consecutiveFailures },
        { "restartCount", _restartCount },
        { "uptimePercentage", uptimePercentage() },
        { "averageResponseTimeMs", averageResponseTime() },
        { "p95ResponseTimeMs", p95ResponseTime() },
    };

    out["lastSuccessfulCheck"] = _lastSuccess ? nlohmann::json(formatTimestamp(*_lastSuccess)) : nlohmann::json();
    out["lastFailedCheck"] = _lastFailure ? nlohmann::json(formatTimestamp(*_lastFailure)) : nlohmann::json();
    return out;
}

} // namespace mcpvisor
