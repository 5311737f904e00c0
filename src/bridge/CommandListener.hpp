// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/Command.hpp>
#include <core/Error.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>

namespace voicebridge
{

/// @brief Receives each parsed command, on the thread of the connection it arrived on.
using CommandHandler = std::function<void(Command command)>;

/// @brief Configuration for the command channel listener.
struct CommandListenerConfig
{
    std::filesystem::path socketPath;
    int backlog = 8;
};

/// @brief Accepts producer connections on a Unix stream socket and forwards the
///        commands they send.
///
/// Each connection is served by its own thread that reads newline-terminated
/// protocol lines. Commands of one connection reach the handler in the order they
/// were sent; malformed lines are dropped without any reply. A connection closing
/// mid-line discards the incomplete line.
class CommandListener
{
  public:
    CommandListener();
    ~CommandListener();

    CommandListener(const CommandListener&) = delete;
    CommandListener& operator=(const CommandListener&) = delete;

    /// @brief Binds the socket (owner-only permissions) and starts accepting.
    ///
    /// A stale socket file at the path is removed first.
    /// @return Success or a TransportError when the endpoint cannot be bound.
    [[nodiscard]] auto start(const CommandListenerConfig& config, CommandHandler handler) -> VoidResult;

    /// @brief Closes all connections, joins their threads and removes the socket file.
    void stop();

    [[nodiscard]] auto isListening() const -> bool;

    /// @brief Number of connections currently being served.
    [[nodiscard]] auto connectionCount() const -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicebridge
