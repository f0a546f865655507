// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace mcpvisor
{

/// @brief Error codes for categorizing failures across the supervisor.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    NotFound,
    IoError,
    ConfigError,
    ConnectionError,
    TimeoutError,
    ProtocolError,
    ToolError,
    WorkflowError,
    WorkflowValidationError,
    WorkflowExecutionError,
};

/// @brief Returns a stable display name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ConnectionError: return "ConnectionError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::ToolError: return "ToolError";
        case ErrorCode::WorkflowError: return "WorkflowError";
        case ErrorCode::WorkflowValidationError: return "WorkflowValidationError";
        case ErrorCode::WorkflowExecutionError: return "WorkflowExecutionError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
///
/// Tool errors carry the JSON-RPC error code reported by the server,
/// workflow errors carry the id of the step that failed.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::optional<int> rpcCode;
    std::string stepId;
    std::string serverName;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message) });
}

/// @brief Creates an unexpected ToolError carrying the server's RPC error code.
[[nodiscard]] inline auto makeToolError(std::string serverName, int rpcCode, std::string message)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error {
        .code = ErrorCode::ToolError,
        .message = std::move(message),
        .rpcCode = rpcCode,
        .serverName = std::move(serverName),
    });
}

/// @brief Creates an unexpected WorkflowError scoped to a single step.
[[nodiscard]] inline auto makeStepError(std::string stepId, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error {
        .code = ErrorCode::WorkflowError,
        .message = std::move(message),
        .stepId = std::move(stepId),
    });
}

/// @brief Returns true if a client may transparently retry the failed call.
[[nodiscard]] constexpr auto isRetryable(const Error& error) -> bool
{
    return error.code == ErrorCode::TimeoutError;
}

} // namespace mcpvisor

template <>
struct std::formatter<mcpvisor::Error>: std::formatter<std::string>
{
    auto format(const mcpvisor::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcpvisor::errorCodeName(error.code), error.message), ctx);
    }
};
