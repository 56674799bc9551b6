// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <core/TextUtils.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <print>
#include <string>

namespace agentstream::log
{

namespace
{
    // The decode thread logs concurrently with the main thread.
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalMutex = std::mutex {};
    auto globalCallback = LogCallback {};
    auto globalStream = static_cast<std::FILE*>(nullptr);
    auto globalTag = std::string { "agentstream" };

    constexpr auto levelPrefix(Level l) -> std::string_view
    {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setStream(std::FILE* stream)
{
    auto const lock = std::lock_guard(globalMutex);
    globalStream = stream;
}

void setTag(std::string_view tag)
{
    auto const lock = std::lock_guard(globalMutex);
    globalTag = std::string(tag);
}

void setLevel(Level level)
{
    globalLevel.store(level);
}

auto getLevel() -> Level
{
    return globalLevel.load();
}

auto enabled(Level level) -> bool
{
    return level <= globalLevel.load();
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto callback = LogCallback {};
    {
        auto const lock = std::lock_guard(globalMutex);
        callback = globalCallback;
    }
    // Called unlocked; the callback may log itself.
    if (callback)
    {
        callback(level, message);
        return;
    }

    auto const lock = std::lock_guard(globalMutex);
    auto* const stream = globalStream ? globalStream : stderr;
    auto const clock = text::clockTime(std::chrono::system_clock::now());
    std::println(stream, "{} [{}] {} {}", clock, globalTag, levelPrefix(level), message);
}

} // namespace agentstream::log
