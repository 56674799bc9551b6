// SPDX-License-Identifier: Apache-2.0
#include "Formatter.hpp"

#include <core/TextUtils.hpp>

#include <cstdio>
#include <format>
#include <vector>

namespace agentstream
{

namespace
{
    // Markers, pictographic and ASCII
    constexpr auto IconToolStart = std::string_view { "⏺ " };
    constexpr auto IconSuccess = std::string_view { "✅ " };
    constexpr auto IconError = std::string_view { "❌ " };
    constexpr auto IconContinue = std::string_view { "⎿  " };
    constexpr auto IconTodoDone = std::string_view { "✅ " };
    constexpr auto IconTodoRunning = std::string_view { "🔄 " };
    constexpr auto IconTodoPending = std::string_view { "⏸️ " };
    constexpr auto IconTodoList = std::string_view { "📋 " };
    constexpr auto IconProgress = std::string_view { "📊 " };

    constexpr auto AsciiToolStart = std::string_view { "> " };
    constexpr auto AsciiSuccess = std::string_view { "[OK] " };
    constexpr auto AsciiError = std::string_view { "[ERR] " };
    constexpr auto AsciiContinue = std::string_view { "|  " };

    constexpr auto ToolInputWidth = std::size_t { 80 };
    constexpr auto TodoContentWidth = std::size_t { 70 };

    constexpr auto DefaultMaxOutputLines = std::size_t { 3 };
    constexpr auto DefaultMaxOutputChars = std::size_t { 120 };

    auto applyDefaults(FormatterConfig config) -> FormatterConfig
    {
        if (config.maxOutputLines == 0)
            config.maxOutputLines = DefaultMaxOutputLines;
        if (config.maxOutputChars == 0)
            config.maxOutputChars = DefaultMaxOutputChars;
        return config;
    }
} // namespace

auto defaultFormatterConfig(std::string_view agentName) -> FormatterConfig
{
    return FormatterConfig {
        .agentName = std::string(agentName),
        .showText = true,
        .showProgress = false,
        .useColor = tui::detectColorSupport(fileno(stdout)),
        .useEmoji = true,
        .verbose = false,
        .showTimestamp = false,
        .maxOutputLines = DefaultMaxOutputLines,
        .maxOutputChars = DefaultMaxOutputChars,
    };
}

Formatter::Formatter(std::ostream& out, FormatterConfig config):
    _config(applyDefaults(std::move(config))),
    _out(out, _config.useColor),
    _theme(tui::ansiTheme()),
    _startTime(Clock::now())
{
}

void Formatter::formatEvent(Event const& event)
{
    auto const lock = std::scoped_lock(_mutex);

    switch (event.type)
    {
        case EventType::ToolStart:
            ++_toolCount;
            if (!event.toolId.empty())
                _pendingTools.insert_or_assign(event.toolId,
                                               PendingTool { .start = event, .startedAt = Clock::now() });
            displayToolStart(event);
            break;

        case EventType::ToolEnd: {
            if (event.isError())
                ++_errorCount;

            auto const it = event.toolId.empty() ? _pendingTools.end() : _pendingTools.find(event.toolId);
            if (it == _pendingTools.end())
            {
                displayToolResult(nullptr, event, Clock::duration::zero());
                break;
            }
            auto const pending = std::move(it->second);
            _pendingTools.erase(it);
            displayToolResult(&pending, event, Clock::now() - pending.startedAt);
            break;
        }

        case EventType::Text:
            if (_config.showText && !event.text.empty())
                displayText(event.text);
            break;

        case EventType::Result: displayCompletion(event); break;

        case EventType::Todo: displayTodo(event); break;

        case EventType::Progress:
        case EventType::Unknown:
            if (_config.showProgress)
                displayProgress(event.text);
            break;
    }

    _out.flush();
}

auto Formatter::pendingCount() const -> std::size_t
{
    auto const lock = std::scoped_lock(_mutex);
    return _pendingTools.size();
}

auto Formatter::hasPending(std::string_view toolId) const -> bool
{
    auto const lock = std::scoped_lock(_mutex);
    return _pendingTools.contains(std::string(toolId));
}

auto Formatter::toolCount() const -> std::size_t
{
    auto const lock = std::scoped_lock(_mutex);
    return _toolCount;
}

auto Formatter::errorCount() const -> std::size_t
{
    auto const lock = std::scoped_lock(_mutex);
    return _errorCount;
}

void Formatter::appendTimestamp()
{
    if (_config.showTimestamp)
        _out.write(std::format("[{}] ", text::clockTime(std::chrono::system_clock::now())), _theme.muted);
}

void Formatter::displayToolStart(Event const& event)
{
    appendTimestamp();
    _out.write(_config.useEmoji ? IconToolStart : AsciiToolStart, _theme.accent);
    _out.write(event.toolName, _theme.toolName);
    if (!event.toolInput.empty())
    {
        _out.write("(", _theme.muted);
        _out.write(text::truncateFirstLine(event.toolInput, ToolInputWidth), _theme.toolInput);
        _out.write(")", _theme.muted);
    }
    _out.writeRaw("\n");
}

void Formatter::displayToolResult(PendingTool const* pending, Event const& event, Clock::duration duration)
{
    auto const isError = event.isError();
    auto const& output = isError ? event.toolError : event.toolOutput;

    if (!isError && output.empty() && !_config.verbose)
        return;

    appendTimestamp();

    auto const& style = isError ? _theme.error : _theme.success;
    if (_config.useEmoji)
        _out.write(isError ? IconError : IconSuccess, style);
    else
        _out.write(isError ? AsciiError : AsciiSuccess, style);
    _out.write(isError ? "Error" : "Result", style);

    if (pending && !pending->start.toolName.empty())
        _out.write(std::format(" ← {}", pending->start.toolName), _theme.muted);

    if (!output.empty())
    {
        auto const stats = text::countLinesChars(output);
        _out.write(std::format(" ({} lines, {} chars)", stats.lines, stats.chars), _theme.muted);
    }

    if (_config.verbose && duration > Clock::duration::zero())
    {
        auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
        _out.write(std::format(" [{}]", ms), _theme.muted);
    }
    _out.writeRaw("\n");

    if (!output.empty())
        appendTruncatedOutput(output, isError);
}

void Formatter::appendTruncatedOutput(std::string_view output, bool isError)
{
    auto const lines = text::splitLines(output);
    auto const maxLines = _config.maxOutputLines;
    auto const maxChars = _config.maxOutputChars;
    auto const continuation = _config.useEmoji ? IconContinue : AsciiContinue;

    if (!lines.front().empty())
    {
        _out.writeRaw("  ");
        _out.write(continuation, _theme.muted);
        _out.write(text::truncate(lines.front(), maxChars), isError ? _theme.error : _theme.muted);
        _out.writeRaw("\n");
    }

    auto shown = std::size_t { 1 };
    for (auto i = std::size_t { 1 }; i < lines.size() && shown < maxLines; ++i)
    {
        if (lines[i].empty())
            continue;
        _out.writeRaw("      ");
        _out.write(text::truncate(lines[i], maxChars), _theme.muted);
        _out.writeRaw("\n");
        ++shown;
    }

    if (lines.size() > maxLines)
    {
        _out.writeRaw("  ");
        _out.write(continuation, _theme.muted);
        _out.write(std::format("... {} more lines", lines.size() - maxLines), _theme.muted);
        _out.writeRaw("\n");
    }
}

void Formatter::displayText(std::string_view text)
{
    for (auto const line: text::splitLines(text))
    {
        appendTimestamp();
        _out.write(line, _theme.text);
        _out.writeRaw("\n");
    }
}

void Formatter::displayCompletion(Event const& event)
{
    auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - _startTime);

    appendTimestamp();
    _out.write(_config.useEmoji ? IconSuccess : AsciiSuccess, _theme.success);
    _out.write("Complete", _theme.success);

    auto stats = std::vector<std::string> {};
    if (event.cost > 0)
        stats.push_back(std::format("cost: ${:.2f}", event.cost));

    if (event.inputTokens > 0 || event.outputTokens > 0)
    {
        auto tokens = std::format("tokens: {} in", formatTokenCount(event.inputTokens));
        if (event.cacheReadTokens > 0)
            tokens += std::format(" ({} cached)", formatTokenCount(event.cacheReadTokens));
        tokens += std::format(" / {} out", formatTokenCount(event.outputTokens));
        stats.push_back(std::move(tokens));
    }

    stats.push_back(std::format("tools: {}", _toolCount));
    stats.push_back(std::format("errors: {}", _errorCount));
    stats.push_back(std::format("time: {}", formatDuration(elapsed)));

    auto joined = std::string {};
    for (auto const& item: stats)
    {
        if (!joined.empty())
            joined += ", ";
        joined += item;
    }
    _out.write(std::format(" ({})", joined), _theme.muted);
    _out.writeRaw("\n");

    // Failed runs (e.g. Amp's error_during_execution) carry their reason in toolError.
    if (event.isError())
    {
        _out.writeRaw("  ");
        _out.write(_config.useEmoji ? IconContinue : AsciiContinue, _theme.muted);
        _out.write(text::truncateFirstLine(event.toolError, _config.maxOutputChars), _theme.error);
        _out.writeRaw("\n");
    }
}

void Formatter::displayTodo(Event const& event)
{
    auto const& items = event.todoItems;
    if (items.empty())
        return;

    if (_config.useEmoji)
        _out.write(IconTodoList, _theme.accent);
    _out.write("Todo List", _theme.accent);
    _out.writeRaw("\n");

    auto completed = std::size_t { 0 };
    auto inProgress = std::size_t { 0 };
    auto pending = std::size_t { 0 };

    for (auto const& item: items)
    {
        auto icon = IconTodoPending;
        auto marker = std::string_view { "[ ] " };
        auto const* style = &_theme.muted;
        switch (item.status)
        {
            case TodoStatus::Completed:
                icon = IconTodoDone;
                marker = "[x] ";
                style = &_theme.success;
                ++completed;
                break;
            case TodoStatus::InProgress:
                icon = IconTodoRunning;
                marker = "[>] ";
                style = &_theme.toolName;
                ++inProgress;
                break;
            case TodoStatus::Pending: ++pending; break;
        }

        _out.writeRaw("  ");
        _out.writeRaw(_config.useEmoji ? icon : marker);
        _out.write(text::truncateFirstLine(item.content, TodoContentWidth), *style);

        if (!item.priority.empty() && item.priority != "medium")
            _out.write(std::format(" [{}]", item.priority), _theme.muted);

        if (item.status == TodoStatus::InProgress)
            _out.write(" ← ACTIVE", _theme.toolName);
        _out.writeRaw("\n");
    }

    auto const total = items.size();
    auto const percent = static_cast<double>(completed) / static_cast<double>(total) * 100.0;
    _out.write(std::format("\n  {}Progress: {}/{} ({:.0f}%) | {} active, {} pending",
                           _config.useEmoji ? IconProgress : std::string_view {},
                           completed,
                           total,
                           percent,
                           inProgress,
                           pending),
               _theme.muted);
    _out.writeRaw("\n");
}

void Formatter::displayProgress(std::string_view text)
{
    appendTimestamp();
    _out.write(text, _theme.muted);
    _out.writeRaw("\n");
}

auto formatTokenCount(std::int64_t count) -> std::string
{
    if (count >= 1'000'000)
        return std::format("{:.1f}M", static_cast<double>(count) / 1'000'000.0);
    if (count >= 1'000)
        return std::format("{:.0f}K", static_cast<double>(count) / 1'000.0);
    return std::format("{}", count);
}

auto formatDuration(std::chrono::milliseconds elapsed) -> std::string
{
    auto const seconds = (elapsed.count() + 500) / 1000;
    if (seconds < 60)
        return std::format("{}s", seconds);

    auto const minutes = seconds / 60;
    auto const rest = seconds % 60;
    if (rest == 0)
        return std::format("{}m", minutes);
    return std::format("{}m{}s", minutes, rest);
}

} // namespace agentstream
