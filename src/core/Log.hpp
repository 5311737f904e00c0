// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace voicebridge::log
{

enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every message that passes the level filter.
/// @param level The level the message was logged at.
/// @param message The formatted text, already tagged with the thread name if one is set.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes messages to callback instead of stderr; an empty callback restores stderr.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

[[nodiscard]] auto isEnabled(Level level) -> bool;

/// @brief Parses a level name ("error", "warning", "info", "debug", "trace").
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Tags all further messages from the calling thread, e.g. "conn 3" or "decoder".
///
/// The bridge serves every producer on its own thread; the tag tells their lines apart.
void setThreadName(std::string name);

/// @brief Writes a message at the given level.
///
/// Safe to call from any thread; lines of concurrent writers never interleave.
void write(Level level, std::string_view message);

/// @brief Formats and writes a message, skipping the formatting when level is filtered out.
template <typename... Args>
void print(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (isEnabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace voicebridge::log
