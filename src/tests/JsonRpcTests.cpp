// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpvisor;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "tools/call", params);

    CHECK(request["id"] == 42);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification omits the id", "[jsonrpc]")
{
    auto notification = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notification["jsonrpc"] == "2.0");
    CHECK(!notification.contains("id"));
    CHECK(notification["method"] == "notifications/initialized");
}

TEST_CASE("encodeLine produces exactly one newline-terminated line", "[jsonrpc]")
{
    auto message = jsonrpc::makeRequest(7, "tools/call", { { "text", "line one\nline two" } });
    auto const line = jsonrpc::encodeLine(message);

    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
    CHECK(line.find('\n') == line.size() - 1);

    auto decoded = jsonrpc::decodeLine(line);
    REQUIRE(decoded.has_value());
    CHECK((*decoded)["params"]["text"] == "line one\nline two");
}

TEST_CASE("decodeLine strips CR/LF terminators", "[jsonrpc]")
{
    auto decoded = jsonrpc::decodeLine("{\"jsonrpc\":\"2.0\",\"id\":3,\"result\":{}}\r\n");
    REQUIRE(decoded.has_value());
    CHECK((*decoded)["id"] == 3);
}

TEST_CASE("decodeLine reports malformed input as ProtocolError", "[jsonrpc]")
{
    SECTION("truncated JSON")
    {
        auto decoded = jsonrpc::decodeLine("{\"jsonrpc\":\"2.0\",\"id\":");
        REQUIRE(!decoded.has_value());
        CHECK(decoded.error().code == ErrorCode::ProtocolError);
    }

    SECTION("empty line")
    {
        auto decoded = jsonrpc::decodeLine("\n");
        REQUIRE(!decoded.has_value());
        CHECK(decoded.error().code == ErrorCode::ProtocolError);
    }

    SECTION("non-object value")
    {
        auto decoded = jsonrpc::decodeLine("[1,2,3]");
        REQUIRE(!decoded.has_value());
        CHECK(decoded.error().code == ErrorCode::ProtocolError);
    }
}

TEST_CASE("isResponseTo matches only the outstanding request id", "[jsonrpc]")
{
    auto const response = nlohmann::json { { "jsonrpc", "2.0" }, { "id", 5 }, { "result", nlohmann::json::object() } };
    auto const stringId =
        nlohmann::json { { "jsonrpc", "2.0" }, { "id", "5" }, { "result", nlohmann::json::object() } };
    auto const notification = jsonrpc::makeNotification("notifications/progress");
    auto const serverRequest = jsonrpc::makeRequest(5, "roots/list");

    CHECK(jsonrpc::isResponseTo(response, 5));
    CHECK(!jsonrpc::isResponseTo(response, 4));
    CHECK(jsonrpc::isResponseTo(stringId, 5));
    CHECK(!jsonrpc::isResponseTo(notification, 5));
    CHECK(!jsonrpc::isResponseTo(serverRequest, 5));
    CHECK(jsonrpc::isPeerMessage(serverRequest));
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32601 },
              { "message", "Method not found" },
              { "data", { { "method", "nope" } } },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32601);
    CHECK(result->error->message == "Method not found");
    CHECK(result->error->data["method"] == "nope");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "jsonrpc", "1.0" }, { "id", 1 }, { "result", 1 } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse handles response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}
