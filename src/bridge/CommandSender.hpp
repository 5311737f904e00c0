// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/Command.hpp>
#include <core/Error.hpp>

#include <filesystem>

namespace voicebridge
{

/// @brief Producer-side connection to the bridge's command socket.
///
/// Fire-and-forget: the bridge never replies. A failed write closes the connection;
/// the caller decides whether to connect() again.
class CommandSender
{
  public:
    CommandSender() = default;
    ~CommandSender();

    CommandSender(const CommandSender&) = delete;
    CommandSender& operator=(const CommandSender&) = delete;

    [[nodiscard]] auto connect(const std::filesystem::path& socketPath) -> VoidResult;

    /// @brief Writes one command line.
    [[nodiscard]] auto send(const Command& command) -> VoidResult;

    void close();

    [[nodiscard]] auto isConnected() const noexcept -> bool { return _fd >= 0; }

  private:
    int _fd = -1;
};

} // namespace voicebridge
