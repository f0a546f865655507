// SPDX-License-Identifier: Apache-2.0
#include "Protocol.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcpvisor::mcp
{

auto toJson(const InitializeParams& params) -> nlohmann::json
{
    return nlohmann::json {
        { "protocolVersion", params.protocolVersion },
        { "capabilities",
          nlohmann::json {
              { "roots", { { "listChanged", true } } },
              { "sampling", nlohmann::json::object() },
          } },
        { "clientInfo",
          nlohmann::json {
              { "name", params.clientName },
              { "version", params.clientVersion },
          } },
    };
}

auto toJson(const ToolCallParams& params) -> nlohmann::json
{
    return nlohmann::json {
        { "name", params.name },
        { "arguments", params.arguments.is_null() ? nlohmann::json::object() : params.arguments },
    };
}

auto parseInitializeResult(const nlohmann::json& result) -> Result<InitializeResult>
{
    if (!result.is_object())
        return makeError(ErrorCode::ProtocolError, "initialize result is not an object");

    auto const serverInfo = result.value("serverInfo", nlohmann::json::object());
    auto out = InitializeResult {
        .protocolVersion = json::getStringOr(result, "protocolVersion", ProtocolVersion),
        .serverName = json::getStringOr(serverInfo, "name", "unknown"),
        .serverVersion = json::getStringOr(serverInfo, "version", "unknown"),
    };

    if (result.contains("capabilities") && result["capabilities"].is_object())
    {
        auto const& caps = result["capabilities"];
        out.hasTools = caps.contains("tools");
        out.hasResources = caps.contains("resources");
        out.hasPrompts = caps.contains("prompts");
    }

    return out;
}

auto parseToolsListResult(const nlohmann::json& result) -> Result<std::vector<ToolDefinition>>
{
    auto tools = std::vector<ToolDefinition> {};

    if (!result.is_object() || !result.contains("tools"))
        return tools;

    if (!result["tools"].is_array())
        return makeError(ErrorCode::ProtocolError, "tools/list result 'tools' is not an array");

    for (const auto& toolJson: result["tools"])
    {
        auto name = json::getString(toolJson, "name");
        if (!name)
            return makeError(ErrorCode::ProtocolError, "tools/list entry without a name");

        auto schema = toolJson.value("inputSchema", nlohmann::json::object());
        auto required = json::getStringArray(schema, "required");

        tools.push_back(ToolDefinition {
            .name = std::move(*name),
            .description = json::getStringOr(toolJson, "description", ""),
            .inputSchema = std::move(schema),
            .requiredParameters = std::move(required),
        });
    }

    return tools;
}

auto parseToolCallResult(const nlohmann::json& result) -> Result<ToolResult>
{
    auto toolResult = ToolResult {
        .raw = result,
        .content = {},
        .isError = json::getBoolOr(result, "isError", false),
    };

    if (result.is_object() && result.contains("content") && result["content"].is_array())
    {
        for (const auto& item: result["content"])
        {
            if (json::getStringOr(item, "type", "") != "text")
                continue;
            if (!toolResult.content.empty())
                toolResult.content += "\n";
            toolResult.content += json::getStringOr(item, "text", "");
        }
    }

    return toolResult;
}

} // namespace mcpvisor::mcp
