// SPDX-License-Identifier: Apache-2.0
#include "CommandSender.hpp"

#include <bridge/Protocol.hpp>
#include <core/Log.hpp>

#include <cerrno>
#include <cstring>
#include <format>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace voicebridge
{

CommandSender::~CommandSender()
{
    close();
}

auto CommandSender::connect(const std::filesystem::path& socketPath) -> VoidResult
{
    close();

    auto address = sockaddr_un {};
    address.sun_family = AF_UNIX;
    if (socketPath.native().size() >= sizeof(address.sun_path))
        return makeError(ErrorCode::InvalidArgument, std::format("Socket path too long: {}", socketPath.string()));
    std::memcpy(address.sun_path, socketPath.c_str(), socketPath.native().size() + 1);

    auto const fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return makeError(ErrorCode::TransportError, std::format("socket() failed: {}", std::strerror(errno)));

    if (::connect(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0)
    {
        auto const message = std::string(std::strerror(errno));
        ::close(fd);
        return makeError(ErrorCode::TransportError,
                         std::format("Cannot connect to {}: {}", socketPath.string(), message));
    }

    _fd = fd;
    log::debug("Connected to bridge socket {}", socketPath.string());
    return {};
}

auto CommandSender::send(const Command& command) -> VoidResult
{
    if (_fd < 0)
        return makeError(ErrorCode::TransportError, "Not connected to the bridge");

    auto const line = formatCommand(command);
    auto data = std::string_view { line };
    while (!data.empty())
    {
        auto const written = ::send(_fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (written < 0 && errno == EINTR)
            continue;
        if (written <= 0)
        {
            auto const message = std::string(std::strerror(errno));
            close();
            return makeError(ErrorCode::TransportError, std::format("Write to bridge failed: {}", message));
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
    return {};
}

void CommandSender::close()
{
    if (_fd < 0)
        return;
    ::close(_fd);
    _fd = -1;
}

} // namespace voicebridge
