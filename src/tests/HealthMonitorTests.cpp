// SPDX-License-Identifier: Apache-2.0
#include <health/HealthMonitor.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <map>
#include <mutex>
#include <set>
#include <stdexcept>

using namespace mcpvisor;
using namespace std::chrono_literals;

namespace
{

/// @brief Health outcomes shared by every client the fleet creates, keyed by server name.
struct FakeFleet
{
    struct Behaviour
    {
        ServerStatus status = ServerStatus::Healthy;
        double responseTimeMs = 10.0;
    };

    mutable std::mutex mutex;
    std::map<std::string, Behaviour> behaviour;
    std::map<std::string, int> created;
    std::set<std::string> failingStarts;

    void set(const std::string& name, ServerStatus status, double responseTimeMs = 10.0)
    {
        auto lock = std::lock_guard(mutex);
        behaviour[name] = Behaviour { .status = status, .responseTimeMs = responseTimeMs };
    }

    [[nodiscard]] auto lookup(const std::string& name) const -> Behaviour
    {
        auto lock = std::lock_guard(mutex);
        auto const it = behaviour.find(name);
        return it != behaviour.end() ? it->second : Behaviour {};
    }

    [[nodiscard]] auto createdCount(const std::string& name) const -> int
    {
        auto lock = std::lock_guard(mutex);
        auto const it = created.find(name);
        return it != created.end() ? it->second : 0;
    }

    auto factory() -> ClientFactory;
};

class FleetClient: public Client
{
  public:
    FleetClient(FakeFleet& fleet, ServerConfig config): _fleet(fleet), _config(std::move(config)) {}

    auto config() const -> const ServerConfig& override { return _config; }
    auto state() const -> ClientState override { return ClientState::Ready; }

    auto initialize() -> VoidResult override
    {
        auto lock = std::lock_guard(_fleet.mutex);
        if (_fleet.failingStarts.contains(_config.name))
            return makeError(ErrorCode::ConnectionError, "spawn failed");
        return {};
    }

    auto callTool(std::string_view, const nlohmann::json&, const CallOptions&) -> Result<ToolResult> override
    {
        return ToolResult {};
    }

    auto healthCheck() -> HealthStatus override
    {
        auto const behaviour = _fleet.lookup(_config.name);
        return HealthStatus {
            .status = behaviour.status,
            .responseTimeMs = behaviour.responseTimeMs,
            .lastCheck = SystemClock::now(),
            .errorMessage = isResponsive(behaviour.status) ? std::nullopt : std::optional<std::string>("down"),
            .uptimePercentage = 0.0,
        };
    }

    auto listTools() -> Result<std::vector<ToolDefinition>> override { return std::vector<ToolDefinition> {}; }

    void shutdown() override {}

  private:
    FakeFleet& _fleet;
    ServerConfig _config;
};

auto FakeFleet::factory() -> ClientFactory
{
    return [this](const ServerConfig& config) -> std::shared_ptr<Client> {
        {
            auto lock = std::lock_guard(mutex);
            ++created[config.name];
        }
        return std::make_shared<FleetClient>(*this, config);
    };
}

auto serverConfig(std::string name, bool autoRestart = true) -> ServerConfig
{
    auto config = ServerConfig {};
    config.name = std::move(name);
    config.command = "fake";
    config.autoRestart = autoRestart;
    return config;
}

/// @brief Registry, monitor and a manually advanced clock.
struct MonitorFixture
{
    SteadyClock::time_point now = SteadyClock::now();
    FakeFleet fleet;
    ClientRegistry registry { fleet.factory() };
    HealthMonitor monitor { registry };

    MonitorFixture()
    {
        monitor.setTimeSource([this] { return now; });
    }

    void checkTimes(int count)
    {
        for (auto i = 0; i < count; ++i)
            monitor.checkAllServers();
    }
};

} // namespace

TEST_CASE("HealthMonitor reports unknown servers as offline", "[health]")
{
    auto fixture = MonitorFixture {};

    auto const status = fixture.monitor.getServerStatus("ghost");
    CHECK(status.status == ServerStatus::Offline);
    CHECK(status.errorMessage == "Server not registered");
    CHECK(!fixture.monitor.getServerMetrics("ghost").has_value());
}

TEST_CASE("HealthMonitor registers servers with the registry", "[health]")
{
    auto fixture = MonitorFixture {};

    REQUIRE(fixture.monitor.registerServer(serverConfig("git")).has_value());
    CHECK(fixture.registry.getClient("git") != nullptr);
    CHECK(fixture.monitor.getServerStatus("git").status == ServerStatus::Starting);

    SECTION("empty names are rejected")
    {
        auto result = fixture.monitor.registerServer(serverConfig(""));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("unregister removes the client")
    {
        CHECK(fixture.monitor.unregisterServer("git"));
        CHECK(fixture.registry.getClient("git") == nullptr);
        CHECK(fixture.monitor.getAllStatuses().empty());
        CHECK(!fixture.monitor.unregisterServer("git"));
    }
}

TEST_CASE("HealthMonitor keeps a server that failed to start", "[health]")
{
    auto fixture = MonitorFixture {};
    fixture.fleet.failingStarts.insert("broken");

    auto result = fixture.monitor.registerServer(serverConfig("broken"));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionError);

    auto const statuses = fixture.monitor.getAllStatuses();
    REQUIRE(statuses.contains("broken"));
    CHECK(statuses.at("broken").status == ServerStatus::Offline);
    CHECK(fixture.registry.getClient("broken") == nullptr);
}

TEST_CASE("HealthMonitor records check results in the metrics", "[health]")
{
    auto fixture = MonitorFixture {};
    REQUIRE(fixture.monitor.registerServer(serverConfig("git")).has_value());

    fixture.fleet.set("git", ServerStatus::Healthy, 20.0);
    fixture.checkTimes(3);
    fixture.fleet.set("git", ServerStatus::Unhealthy, 0.0);
    fixture.checkTimes(1);

    auto const metrics = fixture.monitor.getServerMetrics("git");
    REQUIRE(metrics.has_value());
    CHECK(metrics->totalChecks() == 4);
    CHECK(metrics->consecutiveFailures() == 1);
    CHECK(metrics->averageResponseTime() == Catch::Approx(20.0));

    auto const status = fixture.monitor.getServerStatus("git");
    CHECK(status.status == ServerStatus::Unhealthy);
    CHECK(status.uptimePercentage == Catch::Approx(75.0));

    auto const all = fixture.monitor.getAllMetrics();
    REQUIRE(all.size() == 1);
    CHECK(all.at("git").totalFailures() == 1);
}

TEST_CASE("HealthMonitor restarts a server once the failure threshold is reached", "[health]")
{
    auto fixture = MonitorFixture {};
    REQUIRE(fixture.monitor.registerServer(serverConfig("git")).has_value());
    REQUIRE(fixture.fleet.createdCount("git") == 1);

    fixture.fleet.set("git", ServerStatus::Unhealthy);
    fixture.checkTimes(2);
    CHECK(fixture.fleet.createdCount("git") == 1);
    CHECK(fixture.monitor.getServerMetrics("git")->consecutiveFailures() == 2);

    fixture.checkTimes(1);
    CHECK(fixture.fleet.createdCount("git") == 2);

    auto const metrics = fixture.monitor.getServerMetrics("git");
    REQUIRE(metrics.has_value());
    CHECK(metrics->restartCount() == 1);
    CHECK(metrics->consecutiveFailures() == 0);
    CHECK(fixture.monitor.getServerStatus("git").status == ServerStatus::Starting);
}

TEST_CASE("HealthMonitor honours the restart cooldown", "[health]")
{
    auto fixture = MonitorFixture {};
    REQUIRE(fixture.monitor.registerServer(serverConfig("git")).has_value());

    fixture.fleet.set("git", ServerStatus::Offline);
    fixture.checkTimes(3);
    REQUIRE(fixture.monitor.getServerMetrics("git")->restartCount() == 1);

    // Still failing, but the last restart is too recent.
    fixture.checkTimes(5);
    CHECK(fixture.monitor.getServerMetrics("git")->restartCount() == 1);
    CHECK(fixture.monitor.getServerMetrics("git")->consecutiveFailures() == 5);

    fixture.now += 299s;
    fixture.checkTimes(1);
    CHECK(fixture.monitor.getServerMetrics("git")->restartCount() == 1);

    fixture.now += 2s;
    fixture.checkTimes(1);
    CHECK(fixture.monitor.getServerMetrics("git")->restartCount() == 2);
    CHECK(fixture.fleet.createdCount("git") == 3);
}

TEST_CASE("HealthMonitor never restarts servers without auto-restart", "[health]")
{
    auto fixture = MonitorFixture {};
    REQUIRE(fixture.monitor.registerServer(serverConfig("git", false)).has_value());

    fixture.fleet.set("git", ServerStatus::Unhealthy);
    fixture.checkTimes(10);

    auto const metrics = fixture.monitor.getServerMetrics("git");
    REQUIRE(metrics.has_value());
    CHECK(metrics->restartCount() == 0);
    CHECK(metrics->consecutiveFailures() == 10);
    CHECK(fixture.fleet.createdCount("git") == 1);
}

TEST_CASE("HealthMonitor retries servers that failed to start", "[health]")
{
    auto fixture = MonitorFixture {};
    fixture.fleet.failingStarts.insert("git");
    REQUIRE(!fixture.monitor.registerServer(serverConfig("git")).has_value());

    fixture.fleet.failingStarts.clear();
    fixture.checkTimes(3);

    CHECK(fixture.registry.getClient("git") != nullptr);
    CHECK(fixture.monitor.getServerMetrics("git")->restartCount() == 1);
    CHECK(fixture.monitor.getServerStatus("git").status == ServerStatus::Starting);
}

TEST_CASE("HealthMonitor forceRestartServer ignores threshold and cooldown", "[health]")
{
    auto fixture = MonitorFixture {};
    REQUIRE(fixture.monitor.registerServer(serverConfig("git")).has_value());

    REQUIRE(fixture.monitor.forceRestartServer("git").has_value());
    REQUIRE(fixture.monitor.forceRestartServer("git").has_value());
    CHECK(fixture.monitor.getServerMetrics("git")->restartCount() == 2);
    CHECK(fixture.fleet.createdCount("git") == 3);

    auto missing = fixture.monitor.forceRestartServer("ghost");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("HealthMonitor raises alerts", "[health]")
{
    auto fixture = MonitorFixture {};
    REQUIRE(fixture.monitor.registerServer(serverConfig("git", false)).has_value());

    auto alerts = std::vector<Alert> {};
    auto const id = fixture.monitor.addAlertCallback([&alerts](const Alert& alert) { alerts.push_back(alert); });

    SECTION("once when a server goes offline")
    {
        fixture.checkTimes(1);
        CHECK(alerts.empty());

        fixture.fleet.set("git", ServerStatus::Offline);
        fixture.checkTimes(3);
        REQUIRE(alerts.size() == 1);
        CHECK(alerts[0].kind == AlertKind::ServerOffline);
        CHECK(alerts[0].serverName == "git");
        CHECK(alerts[0].status.status == ServerStatus::Offline);
    }

    SECTION("for every slow response")
    {
        fixture.fleet.set("git", ServerStatus::Degraded, 6000.0);
        fixture.checkTimes(2);
        REQUIRE(alerts.size() == 2);
        CHECK(alerts[0].kind == AlertKind::SlowResponse);
        CHECK(alerts[0].status.responseTimeMs == 6000.0);
    }

    SECTION("not after the callback is removed")
    {
        CHECK(fixture.monitor.removeAlertCallback(id));
        CHECK(!fixture.monitor.removeAlertCallback(id));

        fixture.fleet.set("git", ServerStatus::Offline);
        fixture.checkTimes(1);
        CHECK(alerts.empty());
    }
}

TEST_CASE("HealthMonitor survives a throwing alert callback", "[health]")
{
    auto fixture = MonitorFixture {};
    REQUIRE(fixture.monitor.registerServer(serverConfig("git", false)).has_value());

    auto delivered = 0;
    fixture.monitor.addAlertCallback([](const Alert&) { throw std::runtime_error("subscriber bug"); });
    fixture.monitor.addAlertCallback([&delivered](const Alert&) { ++delivered; });

    fixture.fleet.set("git", ServerStatus::Offline);
    fixture.checkTimes(1);
    CHECK(delivered == 1);
}

TEST_CASE("HealthMonitor validates its tunables", "[health]")
{
    auto fixture = MonitorFixture {};

    CHECK(fixture.monitor.setCheckInterval(4s).error().code == ErrorCode::InvalidArgument);
    CHECK(fixture.monitor.setFailureThreshold(0).error().code == ErrorCode::InvalidArgument);
    CHECK(fixture.monitor.setRestartCooldown(59s).error().code == ErrorCode::InvalidArgument);

    REQUIRE(fixture.monitor.setCheckInterval(5s).has_value());
    REQUIRE(fixture.monitor.setFailureThreshold(1).has_value());
    REQUIRE(fixture.monitor.setRestartCooldown(60s).has_value());

    auto const config = fixture.monitor.config();
    CHECK(config.checkInterval == 5s);
    CHECK(config.failureThreshold == 1);
    CHECK(config.restartCooldown == 60s);
}

TEST_CASE("HealthMonitor clamps an invalid initial configuration", "[health]")
{
    auto fleet = FakeFleet {};
    auto registry = ClientRegistry(fleet.factory());
    auto monitor = HealthMonitor(registry, HealthMonitorConfig { .checkInterval = 1s, .failureThreshold = 0 });

    auto const config = monitor.config();
    CHECK(config.checkInterval == HealthMonitorConfig::MinCheckInterval);
    CHECK(config.failureThreshold == 1);
    CHECK(config.restartCooldown == 300s);
}

TEST_CASE("HealthMonitor start and stop control the background loop", "[health]")
{
    auto fixture = MonitorFixture {};
    REQUIRE(fixture.monitor.registerServer(serverConfig("git")).has_value());

    CHECK(!fixture.monitor.isMonitoring());
    fixture.monitor.start();
    CHECK(fixture.monitor.isMonitoring());
    fixture.monitor.start();
    CHECK(fixture.monitor.isMonitoring());

    fixture.monitor.stop();
    CHECK(!fixture.monitor.isMonitoring());
    fixture.monitor.stop();
    CHECK(!fixture.monitor.isMonitoring());
}
