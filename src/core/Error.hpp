// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace voicebridge
{

/// @brief Failure categories of the bridge and the transcriber.
///
/// Only startup failures travel as errors up to main(); failures of a single
/// connection or command are logged and dropped where they happen.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ModelLoadError,
    TranscriptionError,
    TransportError,
    ProtocolError,
    HostServiceError,
};

[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::IoError: return "I/O";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::ModelLoadError: return "model load";
        case ErrorCode::TranscriptionError: return "transcription";
        case ErrorCode::TransportError: return "transport";
        case ErrorCode::ProtocolError: return "protocol";
        case ErrorCode::HostServiceError: return "host service";
    }
    return "unknown";
}

struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

/// @brief Builds the unexpected value returned by Result-returning functions.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace voicebridge

/// Formats as "<category> error: <message>".
template <>
struct std::formatter<voicebridge::Error>: std::formatter<std::string_view>
{
    auto format(const voicebridge::Error& error, auto& ctx) const
    {
        auto const text = std::format("{} error: {}", voicebridge::errorCodeName(error.code), error.message);
        return std::formatter<std::string_view>::format(text, ctx);
    }
};
