// SPDX-License-Identifier: Apache-2.0
#include "Types.hpp"

#include <format>
#include <mutex>
#include <random>

namespace mcpvisor
{

auto toJson(const HealthStatus& status) -> nlohmann::json
{
    auto out = nlohmann::json {
        { "status", serverStatusToString(status.status) },
        { "responseTimeMs", status.responseTimeMs },
        { "lastCheck", formatTimestamp(status.lastCheck) },
        { "uptimePercentage", status.uptimePercentage },
    };

    if (status.errorMessage)
        out["errorMessage"] = *status.errorMessage;

    return out;
}

auto formatTimestamp(SystemClock::time_point tp) -> std::string
{
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(tp));
}

auto generateId() -> std::string
{
    static auto mutex = std::mutex {};
    static auto engine = std::mt19937_64 { std::random_device {}() };

    auto lock = std::lock_guard(mutex);
    auto const high = engine();
    auto const low = engine();

    // Version 4, variant 10xx.
    auto const timeHigh = ((high >> 0) & 0x0fffu) | 0x4000u;
    auto const clockSeq = ((low >> 48) & 0x3fffu) | 0x8000u;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<std::uint32_t>(high >> 32),
                       static_cast<std::uint32_t>((high >> 16) & 0xffffu),
                       static_cast<std::uint32_t>(timeHigh),
                       static_cast<std::uint32_t>(clockSeq),
                       low & 0xffffffffffffull);
}

} // namespace mcpvisor
