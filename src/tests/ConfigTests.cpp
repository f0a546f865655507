// SPDX-License-Identifier: Apache-2.0
#include <mcpvisor/App.hpp>
#include <mcpvisor/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace mcpvisor;
using namespace std::chrono_literals;

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("mcpvisor/config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.healthMonitor.checkInterval == 30s);
    CHECK(config.healthMonitor.failureThreshold == 3);
    CHECK(config.healthMonitor.restartCooldown == 300s);
    CHECK(config.mcpServers.empty());
    CHECK(config.workflows.empty());

    auto const server = ServerConfig {};
    CHECK(server.timeout == 30s);
    CHECK(server.retryCount == 3);
    CHECK(server.healthCheckInterval == 60s);
    CHECK(server.autoRestart);
}

TEST_CASE("parseConfig reads servers and monitor settings", "[config]")
{
    auto const root = nlohmann::json::parse(R"({
        "healthMonitor": {
            "checkInterval": 15,
            "failureThreshold": 5,
            "restartCooldown": 120,
            "slowResponseMs": 2500
        },
        "mcpServers": {
            "git": {
                "command": "uvx",
                "args": ["mcp-server-git", "--repository", "."],
                "env": {"GIT_PAGER": "cat"},
                "timeout": 2.5,
                "retryCount": 2,
                "healthCheckInterval": 20,
                "autoRestart": false
            },
            "legacy": {
                "command": "old-server",
                "disabled": true
            }
        },
        "workflows": ["workflows/review.json", "/etc/mcpvisor/release.json"]
    })");

    auto result = parseConfig(root, "/home/dev/.config/mcpvisor");
    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("health monitor")
    {
        CHECK(config.healthMonitor.checkInterval == 15s);
        CHECK(config.healthMonitor.failureThreshold == 5);
        CHECK(config.healthMonitor.restartCooldown == 120s);
        CHECK(config.healthMonitor.slowResponseThreshold == 2500ms);
    }

    SECTION("servers")
    {
        CHECK(config.mcpServers.size() == 1);
        CHECK(!config.mcpServers.contains("legacy"));

        REQUIRE(config.mcpServers.contains("git"));
        auto const& server = config.mcpServers.at("git");
        CHECK(server.name == "git");
        CHECK(server.command == "uvx");
        CHECK(server.args == std::vector<std::string> { "mcp-server-git", "--repository", "." });
        CHECK(server.env.at("GIT_PAGER") == "cat");
        CHECK(server.timeout == 2500ms);
        CHECK(server.retryCount == 2);
        CHECK(server.healthCheckInterval == 20s);
        CHECK(!server.autoRestart);
    }

    SECTION("workflow paths")
    {
        REQUIRE(config.workflows.size() == 2);
        CHECK(config.workflows[0] == "/home/dev/.config/mcpvisor/workflows/review.json");
        CHECK(config.workflows[1] == "/etc/mcpvisor/release.json");
    }
}

TEST_CASE("parseConfig rejects invalid settings", "[config]")
{
    SECTION("server without command")
    {
        auto result = parseConfig(nlohmann::json::parse(R"({"mcpServers": {"git": {"args": []}}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("retry count below one")
    {
        auto result =
            parseConfig(nlohmann::json::parse(R"({"mcpServers": {"git": {"command": "uvx", "retryCount": 0}}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("check interval below the minimum")
    {
        auto result = parseConfig(nlohmann::json::parse(R"({"healthMonitor": {"checkInterval": 1}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("restart cooldown below the minimum")
    {
        auto result = parseConfig(nlohmann::json::parse(R"({"healthMonitor": {"restartCooldown": 10}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("non-object document")
    {
        auto result = parseConfig(nlohmann::json::array());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("parseConfig treats integers beyond int range as absent", "[config]")
{
    auto result = parseConfig(nlohmann::json::parse(R"({
        "healthMonitor": {"failureThreshold": 10000000000, "slowResponseMs": -10000000000},
        "mcpServers": {"git": {"command": "uvx", "retryCount": 18446744073709551615}}
    })"));
    REQUIRE(result.has_value());
    CHECK(result->healthMonitor.failureThreshold == 3);
    CHECK(result->healthMonitor.slowResponseThreshold == HealthMonitorConfig {}.slowResponseThreshold);
    CHECK(result->mcpServers.at("git").retryCount == 3);
}

TEST_CASE("loadConfigFromFile resolves workflows next to the config file", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "mcpvisor_test_config";
    std::filesystem::create_directories(dir);
    auto const path = dir / "config.json";
    {
        auto file = std::ofstream(path);
        file << R"({
            "mcpServers": {"fs": {"command": "npx", "args": ["-y", "@modelcontextprotocol/server-filesystem"]}},
            "workflows": ["review.json"]
        })";
    }

    auto result = loadConfigFromFile(path.string());
    REQUIRE(result.has_value());
    CHECK(result->mcpServers.contains("fs"));
    REQUIRE(result->workflows.size() == 1);
    CHECK(result->workflows[0] == (dir / "review.json").string());

    std::filesystem::remove_all(dir);
}

TEST_CASE("loadConfigFromFile reports missing and malformed files", "[config]")
{
    SECTION("missing file")
    {
        auto result = loadConfigFromFile("/nonexistent/mcpvisor/config.json");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("malformed JSON")
    {
        auto const path = std::filesystem::temp_directory_path() / "mcpvisor_test_malformed.json";
        {
            auto file = std::ofstream(path);
            file << R"({"mcpServers": {)";
        }

        auto result = loadConfigFromFile(path.string());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);

        std::filesystem::remove(path);
    }
}

TEST_CASE("parseInputs turns key=value pairs into a JSON object", "[config]")
{
    auto inputs = parseInputs({ "repo=/srv/app", "limit=5", "verbose=true", "tags=[\"a\",\"b\"]", "empty=" });
    REQUIRE(inputs.has_value());
    CHECK((*inputs)["repo"] == "/srv/app");
    CHECK((*inputs)["limit"] == 5);
    CHECK((*inputs)["verbose"] == true);
    CHECK((*inputs)["tags"].size() == 2);
    CHECK((*inputs)["empty"] == "");

    auto invalid = parseInputs({ "no-equals-sign" });
    REQUIRE(!invalid.has_value());
    CHECK(invalid.error().code == ErrorCode::InvalidArgument);

    auto missingKey = parseInputs({ "=value" });
    REQUIRE(!missingKey.has_value());
}
