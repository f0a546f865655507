// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace mcpvisor
{

/// @brief Abstract interface for line-delimited JSON-RPC traffic with one server process.
///
/// send() and receive() may be called from different threads; close() may be
/// called while another thread is blocked in send() or receive() and makes it
/// return a ConnectionError.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends one JSON message as a single line, waiting at most @p timeout
    ///        for the peer to drain its input.
    /// @return Success, TimeoutError when the deadline passes, or a ConnectionError.
    [[nodiscard]] virtual auto send(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> VoidResult = 0;

    /// @brief Receives the next JSON message, waiting at most @p timeout.
    /// @return The message, TimeoutError when the deadline passes, ConnectionError
    ///         when the peer is gone, or ProtocolError for a malformed line.
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> = 0;

    /// @brief Terminates the peer and closes the connection.
    virtual void close() = 0;

    /// @brief Returns true while the peer process is running and the pipes are open.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace mcpvisor
