// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <mutex>
#include <print>

namespace voicebridge::log
{

namespace
{
    // Written by connection threads, the decode worker and the GLib main loop alike.
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto sinkMutex = std::mutex {};

    thread_local auto threadName = std::string {};
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(sinkMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto isEnabled(Level level) -> bool
{
    return level <= getLevel();
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    for (auto const level: { Level::Error, Level::Warning, Level::Info, Level::Debug, Level::Trace })
        if (name == levelName(level))
            return level;
    if (name == "warn")
        return Level::Warning;
    return std::nullopt;
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "unknown";
}

void setThreadName(std::string name)
{
    threadName = std::move(name);
}

void write(Level level, std::string_view message)
{
    if (!isEnabled(level))
        return;

    auto const tagged = threadName.empty() ? std::string(message) : std::format("[{}] {}", threadName, message);

    auto lock = std::lock_guard(sinkMutex);
    if (globalCallback)
    {
        globalCallback(level, tagged);
        return;
    }

    std::println(stderr, "[{}] {}", levelName(level), tagged);
}

} // namespace voicebridge::log
