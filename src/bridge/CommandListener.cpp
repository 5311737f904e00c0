// SPDX-License-Identifier: Apache-2.0
#include "CommandListener.hpp"

#include <bridge/Protocol.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <list>
#include <mutex>
#include <thread>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace voicebridge
{

namespace
{

    constexpr auto ReadChunkSize = std::size_t { 4096 };

    auto errnoMessage() -> std::string
    {
        return std::strerror(errno);
    }

} // namespace

struct CommandListener::Impl
{
    /// @brief A single producer connection and the thread serving it.
    struct Connection
    {
        int fd = -1;
        std::atomic<bool> finished = false;
        std::thread thread;
    };

    CommandListenerConfig config;
    CommandHandler handler;

    int listenFd = -1;
    std::atomic<bool> listening = false;
    std::jthread acceptThread;

    mutable std::mutex connectionsMutex;
    std::list<Connection> connections;

    void acceptLoop(const std::stop_token& stopToken)
    {
        log::setThreadName("listener");
        while (!stopToken.stop_requested())
        {
            auto const fd = ::accept4(listenFd, nullptr, nullptr, SOCK_CLOEXEC);
            if (fd < 0)
            {
                if (stopToken.stop_requested() || errno == EBADF || errno == EINVAL)
                    break;
                if (errno != EINTR)
                    log::warning("Socket accept error: {}", errnoMessage());
                continue;
            }

            auto lock = std::lock_guard(connectionsMutex);
            reapFinishedLocked();

            auto& connection = connections.emplace_back();
            connection.fd = fd;
            connection.thread = std::thread([this, &connection, fd] { serve(connection, fd); });
            log::debug("Producer connected (fd={}, active={})", fd, connections.size());
        }
    }

    void serve(Connection& connection, int fd)
    {
        log::setThreadName(std::format("conn {}", fd));
        auto splitter = LineSplitter {};
        auto buffer = std::array<char, ReadChunkSize> {};

        while (true)
        {
            auto const bytesRead = ::read(fd, buffer.data(), buffer.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break;

            for (auto const& line: splitter.feed(std::string_view(buffer.data(), static_cast<std::size_t>(bytesRead))))
            {
                auto command = parseCommand(line);
                if (!command)
                {
                    log::trace("Dropping malformed command line: {}", line);
                    continue;
                }
                handler(std::move(*command));
            }
        }

        if (splitter.pendingBytes() > 0)
            log::trace("Producer closed mid-line, discarding {} bytes", splitter.pendingBytes());
        log::debug("Producer disconnected (fd={})", fd);

        // The descriptor is released here; the reaper only has to join the thread.
        auto lock = std::lock_guard(connectionsMutex);
        ::close(fd);
        connection.fd = -1;
        connection.finished = true;
    }

    /// @brief Joins connections whose threads are done. Requires connectionsMutex.
    void reapFinishedLocked()
    {
        for (auto it = connections.begin(); it != connections.end();)
        {
            if (!it->finished)
            {
                ++it;
                continue;
            }
            it->thread.join();
            it = connections.erase(it);
        }
    }
};

CommandListener::CommandListener(): _impl(std::make_unique<Impl>())
{
}

CommandListener::~CommandListener()
{
    stop();
}

auto CommandListener::start(const CommandListenerConfig& config, CommandHandler handler) -> VoidResult
{
    if (_impl->listening)
        return makeError(ErrorCode::TransportError, "Command listener already running");

    auto const& path = config.socketPath;
    auto address = sockaddr_un {};
    address.sun_family = AF_UNIX;
    if (path.native().size() >= sizeof(address.sun_path))
        return makeError(ErrorCode::InvalidArgument, std::format("Socket path too long: {}", path.string()));
    std::memcpy(address.sun_path, path.c_str(), path.native().size() + 1);

    auto ec = std::error_code {};
    std::filesystem::remove(path, ec);
    if (ec)
        return makeError(ErrorCode::TransportError,
                         std::format("Cannot remove stale socket {}: {}", path.string(), ec.message()));

    auto const fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return makeError(ErrorCode::TransportError, std::format("socket() failed: {}", errnoMessage()));

    // The socket must never exist with permissions wider than owner-only.
    auto const oldMask = ::umask(0077);
    auto const bindResult = ::bind(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address));
    auto const bindErrno = errno;
    ::umask(oldMask);

    if (bindResult != 0)
    {
        ::close(fd);
        return makeError(ErrorCode::TransportError,
                         std::format("Cannot bind {}: {}", path.string(), std::strerror(bindErrno)));
    }

    if (::chmod(path.c_str(), 0600) != 0 || ::listen(fd, config.backlog) != 0)
    {
        auto const message = errnoMessage();
        ::close(fd);
        std::filesystem::remove(path, ec);
        return makeError(ErrorCode::TransportError, std::format("Cannot listen on {}: {}", path.string(), message));
    }

    _impl->config = config;
    _impl->handler = std::move(handler);
    _impl->listenFd = fd;
    _impl->listening = true;
    _impl->acceptThread = std::jthread([this](const std::stop_token& token) { _impl->acceptLoop(token); });

    log::info("Command socket listening: {}", path.string());
    return {};
}

void CommandListener::stop()
{
    if (!_impl->listening.exchange(false))
        return;

    // Wakes the blocked accept() with EINVAL.
    _impl->acceptThread.request_stop();
    ::shutdown(_impl->listenFd, SHUT_RDWR);
    if (_impl->acceptThread.joinable())
        _impl->acceptThread.join();

    // Connection threads take the mutex on exit, so they are joined outside of it.
    auto remaining = std::list<Impl::Connection> {};
    {
        auto lock = std::lock_guard(_impl->connectionsMutex);
        for (auto const& connection: _impl->connections)
            if (connection.fd >= 0)
                ::shutdown(connection.fd, SHUT_RDWR);
        remaining.splice(remaining.end(), _impl->connections);
    }
    for (auto& connection: remaining)
        connection.thread.join();

    ::close(_impl->listenFd);
    _impl->listenFd = -1;

    auto ec = std::error_code {};
    std::filesystem::remove(_impl->config.socketPath, ec);
    log::debug("Command socket closed: {}", _impl->config.socketPath.string());
}

auto CommandListener::isListening() const -> bool
{
    return _impl->listening;
}

auto CommandListener::connectionCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->connectionsMutex);
    _impl->reapFinishedLocked();
    return _impl->connections.size();
}

} // namespace voicebridge
