// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpvisor::jsonrpc
{

/// @brief Represents a JSON-RPC 2.0 error object.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Serializes a message as a single newline-terminated line.
[[nodiscard]] auto encodeLine(const nlohmann::json& message) -> std::string;

/// @brief Decodes one line received from a server.
/// @return The JSON value, or ProtocolError for malformed input.
[[nodiscard]] auto decodeLine(std::string_view line) -> Result<nlohmann::json>;

/// @brief Returns true if the message is a request or notification sent by the peer.
[[nodiscard]] auto isPeerMessage(const nlohmann::json& message) -> bool;

/// @brief Returns true if the message is a response carrying the given request id.
[[nodiscard]] auto isResponseTo(const nlohmann::json& message, int64_t id) -> bool;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or a ProtocolError.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

} // namespace mcpvisor::jsonrpc
