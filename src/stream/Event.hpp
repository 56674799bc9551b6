// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace agentstream
{

/// @brief Categorizes a normalized agent output event.
enum class EventType : std::uint8_t
{
    ToolStart, ///< Tool invocation began.
    ToolEnd,   ///< Tool completed (success or error).
    Text,      ///< Assistant text output.
    Result,    ///< Final result of a turn or session.
    Progress,  ///< Session or status information.
    Todo,      ///< Task list update.
    Unknown,   ///< Unrecognized message, kept for diagnostics.
};

/// @brief Returns the display name of an event type.
[[nodiscard]] constexpr auto eventTypeName(EventType type) -> std::string_view
{
    switch (type)
    {
        case EventType::ToolStart: return "ToolStart";
        case EventType::ToolEnd: return "ToolEnd";
        case EventType::Text: return "Text";
        case EventType::Result: return "Result";
        case EventType::Progress: return "Progress";
        case EventType::Todo: return "Todo";
        case EventType::Unknown: return "Unknown";
    }
    return "Unknown";
}

/// @brief Status of a task list item.
enum class TodoStatus : std::uint8_t
{
    Pending,
    InProgress,
    Completed,
};

/// @brief Parses a wire status ("pending", "in_progress", "completed"); anything else is Pending.
[[nodiscard]] constexpr auto todoStatusFromString(std::string_view str) -> TodoStatus
{
    if (str == "completed")
        return TodoStatus::Completed;
    if (str == "in_progress")
        return TodoStatus::InProgress;
    return TodoStatus::Pending;
}

/// @brief A task in an agent's todo list.
struct TodoItem
{
    std::string id;
    std::string content;
    TodoStatus status = TodoStatus::Pending;
    std::string priority; ///< "high", "medium", "low", or empty when not given.
};

/// @brief A parsed, agent-agnostic output event.
///
/// Only the fields relevant to the event's type are populated.
struct Event
{
    EventType type = EventType::Unknown;
    std::chrono::system_clock::time_point timestamp; ///< When the event was decoded.

    // Tool events
    std::string toolName;   ///< e.g. "Read", "Edit", "Bash".
    std::string toolId;     ///< Correlation id for start/end matching.
    std::string toolInput;  ///< Summary of the input (file path, command, ...).
    std::string toolOutput; ///< Output of a successful tool call.
    std::string toolError;  ///< Error message if the tool failed.

    // Text, Progress and Unknown events
    std::string text;

    // Result events
    std::string result;
    bool isComplete = false;

    // Cost and usage
    double cost = 0.0;      ///< Cumulative session cost in USD.
    double costDelta = 0.0; ///< Cost added since the previous result.
    std::int64_t inputTokens = 0;
    std::int64_t outputTokens = 0;
    std::int64_t cacheReadTokens = 0;
    std::int64_t cacheWriteTokens = 0;

    // Todo events
    std::vector<TodoItem> todoItems;

    /// @brief Returns true if this event represents a failure.
    [[nodiscard]] auto isError() const noexcept -> bool { return !toolError.empty(); }
};

} // namespace agentstream
