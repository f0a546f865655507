// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <climits>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcpvisor
{

using namespace std::chrono_literals;

namespace
{
    void ignoreSigpipe()
    {
        // A write to a server that just died must fail with EPIPE instead of killing us.
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto merged = std::map<std::string, std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view(*e);
                auto const eq = entry.find('=');
                if (eq == std::string_view::npos)
                    continue;
                merged.insert_or_assign(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
            }
        }
        for (const auto& [key, value]: overrides)
            merged.insert_or_assign(key, value);

        auto envStrings = std::vector<std::string> {};
        envStrings.reserve(merged.size());
        for (const auto& [key, value]: merged)
            envStrings.push_back(std::format("{}={}", key, value));
        return envStrings;
    }

    auto describeExit(int status) -> std::string
    {
        if (WIFEXITED(status))
            return std::format("exit code {}", WEXITSTATUS(status));
        if (WIFSIGNALED(status))
            return std::format("signal {}", WTERMSIG(status));
        return "unknown status";
    }
} // namespace

struct StdioTransport::Impl
{
    std::string command;
    std::chrono::milliseconds shutdownGrace { 5s };

    std::mutex processMutex;
    pid_t childPid = -1;
    std::string exitDescription;

    std::mutex writeMutex;
    int stdinWrite = -1;

    std::mutex readMutex;
    int stdoutRead = -1;
    std::string readBuffer;

    std::atomic<bool> connected { false };

    /// @brief Reaps the child if it has exited. Requires processMutex.
    /// @return true while the child is still running.
    auto reapLocked() -> bool
    {
        if (childPid <= 0)
            return false;

        auto status = 0;
        auto const rc = ::waitpid(childPid, &status, WNOHANG);
        if (rc == 0)
            return true;

        exitDescription = rc == childPid ? describeExit(status) : "already reaped";
        childPid = -1;
        return false;
    }

    /// @brief SIGTERM, bounded wait, then SIGKILL. Requires processMutex.
    void terminateLocked()
    {
        if (!reapLocked())
            return;

        ::kill(childPid, SIGTERM);

        auto const deadline = std::chrono::steady_clock::now() + shutdownGrace;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (!reapLocked())
                return;
            std::this_thread::sleep_for(10ms);
        }

        log::warning("MCP server '{}' did not exit within {}, sending SIGKILL", command, shutdownGrace);
        ::kill(childPid, SIGKILL);

        auto status = 0;
        ::waitpid(childPid, &status, 0);
        exitDescription = describeExit(status);
        childPid = -1;
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();

    auto lock = std::lock_guard(_impl->readMutex);
    closeFd(_impl->stdoutRead);
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::ConnectionError, "Transport already connected");

    ignoreSigpipe();

    int stdinPipe[2];
    int stdoutPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::ConnectionError,
                         std::format("Failed to create stdin pipe: {}", std::strerror(errno)));
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::ConnectionError,
                         std::format("Failed to create stdout pipe: {}", std::strerror(errno)));
    }

    // dup2 clears close-on-exec on the child's 0 and 1; every other pipe end closes on exec.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);

    auto argStrings = std::vector<std::string> {};
    argStrings.push_back(config.command);
    argStrings.insert(argStrings.end(), config.args.begin(), config.args.end());

    auto argv = std::vector<char*> {};
    for (auto& arg: argStrings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(config.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status =
        ::posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::ConnectionError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->command = config.command;
    _impl->shutdownGrace = config.shutdownGrace;
    {
        auto lock = std::lock_guard(_impl->processMutex);
        _impl->childPid = pid;
        _impl->exitDescription.clear();
    }
    if (::fcntl(stdinPipe[1], F_SETFL, ::fcntl(stdinPipe[1], F_GETFL) | O_NONBLOCK) != 0)
        log::warning("Could not make stdin of '{}' non-blocking: {}", config.command, std::strerror(errno));
    {
        auto lock = std::lock_guard(_impl->writeMutex);
        _impl->stdinWrite = stdinPipe[1];
    }
    {
        auto lock = std::lock_guard(_impl->readMutex);
        _impl->stdoutRead = stdoutPipe[0];
        _impl->readBuffer.clear();
    }

    if (config.startupGrace > 0ms)
        std::this_thread::sleep_for(config.startupGrace);

    auto exitDescription = std::string {};
    {
        auto lock = std::lock_guard(_impl->processMutex);
        if (!_impl->reapLocked())
            exitDescription = _impl->exitDescription;
    }

    if (!exitDescription.empty())
    {
        {
            auto lock = std::lock_guard(_impl->writeMutex);
            closeFd(_impl->stdinWrite);
        }
        {
            auto lock = std::lock_guard(_impl->readMutex);
            closeFd(_impl->stdoutRead);
        }
        return makeError(ErrorCode::ConnectionError,
                         std::format("Process '{}' exited immediately ({})", config.command, exitDescription));
    }

    _impl->connected = true;
    log::debug("MCP server process started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message, std::chrono::milliseconds timeout) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto const data = jsonrpc::encodeLine(message);
    log::trace("-> {}: {}", _impl->command, std::string_view(data).substr(0, data.size() - 1));

    auto const deadline = std::chrono::steady_clock::now() + timeout;

    auto lock = std::lock_guard(_impl->writeMutex);
    if (_impl->stdinWrite < 0)
        return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written >= 0)
        {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK)
        {
            _impl->connected = false;
            return makeError(ErrorCode::ConnectionError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        }

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining <= 0ms)
        {
            // Half a line on the wire breaks framing for every later message.
            if (offset > 0)
                _impl->connected = false;
            return makeError(ErrorCode::TimeoutError,
                             std::format("'{}' did not read its input within {}", _impl->command, timeout));
        }

        auto pfd = pollfd { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 };
        auto const waitMs = static_cast<int>(std::min<std::chrono::milliseconds::rep>(remaining.count(), INT_MAX));
        if (::poll(&pfd, 1, waitMs) < 0 && errno != EINTR)
        {
            _impl->connected = false;
            return makeError(ErrorCode::ConnectionError, std::format("poll failed: {}", std::strerror(errno)));
        }
    }

    return {};
}

auto StdioTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto lock = std::lock_guard(_impl->readMutex);
    if (_impl->stdoutRead < 0)
        return makeError(ErrorCode::ConnectionError, "Transport not connected");

    auto const deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (line.empty() || line == "\r")
                continue;

            log::trace("<- {}: {}", _impl->command, line);
            return jsonrpc::decodeLine(line);
        }

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining <= 0ms)
            return makeError(ErrorCode::TimeoutError,
                             std::format("No response from '{}' within {}", _impl->command, timeout));

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const waitMs = static_cast<int>(std::min<std::chrono::milliseconds::rep>(remaining.count(), INT_MAX));
        auto const ready = ::poll(&pfd, 1, waitMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::ConnectionError, std::format("poll failed: {}", std::strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && (errno == EINTR || errno == EAGAIN))
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::ConnectionError, std::format("Process '{}' closed stdout", _impl->command));
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    auto const wasConnected = _impl->connected.exchange(false);

    // Closing stdin first lets a well-behaved server exit on EOF. A writer
    // waiting on a full pipe keeps the lock; terminating the child makes its
    // next write fail with EPIPE.
    {
        auto lock = std::unique_lock(_impl->writeMutex, std::try_to_lock);
        if (lock.owns_lock())
            closeFd(_impl->stdinWrite);
    }
    {
        auto lock = std::lock_guard(_impl->processMutex);
        _impl->terminateLocked();
    }
    {
        auto lock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    // A reader blocked in receive() owns the read end; it sees EOF now that the
    // child is gone and the destructor closes the descriptor.
    auto readLock = std::unique_lock(_impl->readMutex, std::try_to_lock);
    if (readLock.owns_lock())
    {
        closeFd(_impl->stdoutRead);
        _impl->readBuffer.clear();
    }

    if (wasConnected)
        log::debug("MCP transport closed: {}", _impl->command);
}

auto StdioTransport::isConnected() const -> bool
{
    if (!_impl->connected)
        return false;

    auto lock = std::lock_guard(_impl->processMutex);
    return _impl->reapLocked();
}

auto StdioTransport::pid() const -> std::optional<int>
{
    auto lock = std::lock_guard(_impl->processMutex);
    if (_impl->childPid > 0)
        return _impl->childPid;
    return std::nullopt;
}

} // namespace mcpvisor
