// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcpvisor::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto encodeLine(const nlohmann::json& message) -> std::string
{
    // dump() without indentation never emits a raw newline.
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

auto decodeLine(std::string_view line) -> Result<nlohmann::json>
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (line.empty())
        return makeError(ErrorCode::ProtocolError, "Empty JSON-RPC line");

    return json::parse(line).and_then([](nlohmann::json message) -> Result<nlohmann::json> {
        if (!message.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC message is not an object");
        return message;
    });
}

auto isPeerMessage(const nlohmann::json& message) -> bool
{
    return message.is_object() && message.contains("method");
}

auto isResponseTo(const nlohmann::json& message, int64_t id) -> bool
{
    if (!message.is_object() || isPeerMessage(message) || !message.contains("id"))
        return false;

    auto const& echoed = message["id"];
    if (echoed.is_number_integer())
        return echoed.get<int64_t>() == id;

    // Some servers echo ids as strings.
    if (echoed.is_string())
        return echoed.get<std::string>() == std::to_string(id);

    return false;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = json::getIntOr(err, "code", 0),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response has neither result nor error");
    }

    return response;
}

} // namespace mcpvisor::jsonrpc
