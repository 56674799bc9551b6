// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdio>
#include <format>
#include <functional>
#include <string_view>

namespace agentstream::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Callback type that receives all log messages.
/// @param level The log level of the message.
/// @param message The formatted log message text (without prefix).
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Sets a callback that receives all log messages.
///
/// When set, log messages are routed to the callback instead of the output stream.
/// Pass an empty callback to revert to stream output.
void setCallback(LogCallback callback);

/// @brief Sets the C stream used when no callback is installed (stderr by default).
void setStream(std::FILE* stream);

/// @brief Sets the tag printed in front of every stream message, e.g. "stream-debug".
void setTag(std::string_view tag);

/// @brief Sets the global log verbosity level.
void setLevel(Level level);

/// @brief Returns the current global log verbosity level.
[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns true if messages at the given level are emitted.
[[nodiscard]] auto enabled(Level level) -> bool;

/// @brief Writes a log message at the given level.
///
/// Stream output has the form `HH:MM:SS [tag] LEVEL message`.
void write(Level level, std::string_view message);

/// @brief Logs an error message.
template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a warning message.
template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs an info message.
template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a debug message.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a trace message.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Trace))
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace agentstream::log
