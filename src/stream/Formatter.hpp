// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/Event.hpp>
#include <tui/TerminalOutput.hpp>
#include <tui/Theme.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>

namespace agentstream
{

/// @brief Controls what the Formatter renders and how.
struct FormatterConfig
{
    std::string agentName;           ///< Display name, e.g. "claude".
    bool showText = true;            ///< Render assistant text; false shows tools only.
    bool showProgress = false;       ///< Render Progress and Unknown events.
    bool useColor = false;           ///< Emit ANSI styling.
    bool useEmoji = true;            ///< Pictographic markers instead of ASCII ones.
    bool verbose = false;            ///< Show empty successful results and per-tool durations.
    bool showTimestamp = false;      ///< Prefix lines with [HH:MM:SS].
    std::size_t maxOutputLines = 3;  ///< Tool output lines shown; 0 selects the default.
    std::size_t maxOutputChars = 120; ///< Characters per tool output line; 0 selects the default.
};

/// @brief Returns the default configuration, with color detected from stdout.
[[nodiscard]] auto defaultFormatterConfig(std::string_view agentName) -> FormatterConfig;

/// @brief Renders events as an incremental terminal transcript.
///
/// Correlates each ToolEnd with the ToolStart of the same id, so results show which tool
/// produced them, and keeps run statistics for the completion summary. formatEvent() is
/// safe to call from several threads; each call renders one event under a lock and writes
/// it to the stream in one piece.
class Formatter
{
  public:
    using Clock = std::chrono::steady_clock;

    Formatter(std::ostream& out, FormatterConfig config);

    Formatter(Formatter const&) = delete;
    Formatter& operator=(Formatter const&) = delete;

    /// @brief Renders one event and updates correlation state and statistics.
    void formatEvent(Event const& event);

    [[nodiscard]] auto config() const noexcept -> FormatterConfig const& { return _config; }

    /// @brief Number of tool calls started and not yet ended.
    [[nodiscard]] auto pendingCount() const -> std::size_t;

    /// @brief Returns true if a ToolStart with @p toolId awaits its ToolEnd.
    [[nodiscard]] auto hasPending(std::string_view toolId) const -> bool;

    /// @brief Number of ToolStart events seen.
    [[nodiscard]] auto toolCount() const -> std::size_t;

    /// @brief Number of failed ToolEnd events seen.
    [[nodiscard]] auto errorCount() const -> std::size_t;

  private:
    struct PendingTool
    {
        Event start;
        Clock::time_point startedAt;
    };

    void displayToolStart(Event const& event);
    void displayToolResult(PendingTool const* pending, Event const& event, Clock::duration duration);
    void displayText(std::string_view text);
    void displayCompletion(Event const& event);
    void displayTodo(Event const& event);
    void displayProgress(std::string_view text);
    void appendTruncatedOutput(std::string_view output, bool isError);
    void appendTimestamp();

    mutable std::mutex _mutex;
    FormatterConfig _config;
    tui::TerminalOutput _out;
    tui::Theme _theme;

    std::unordered_map<std::string, PendingTool> _pendingTools;

    Clock::time_point _startTime;
    std::size_t _toolCount = 0;
    std::size_t _errorCount = 0;
};

/// @brief Formats a token count with K or M suffix: 999, 2K, 1.2M.
[[nodiscard]] auto formatTokenCount(std::int64_t count) -> std::string;

/// @brief Formats an elapsed time rounded to seconds: 45s, 2m, 6m7s.
[[nodiscard]] auto formatDuration(std::chrono::milliseconds elapsed) -> std::string;

} // namespace agentstream
