// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <stream/Event.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Decoding helpers shared by dialects built on the Anthropic content-block model
// ({"type":"assistant"|"user","message":{"content":[...]}}), i.e. Claude and Amp.
namespace agentstream::blocks
{

using Clock = std::chrono::system_clock;

/// @brief Summarizes a tool_use input object into a short display string.
using InputSummarizer = std::function<std::string(std::string_view toolName, nlohmann::json const& input)>;

/// @brief Options that differ between content-block dialects.
struct DialectOptions
{
    InputSummarizer summarizeInput;
    std::size_t maxToolOutputChars = 0; ///< 0 keeps tool_result output untruncated.
};

/// @brief Creates an event of the given type stamped with @p now.
[[nodiscard]] auto makeEvent(EventType type, Clock::time_point now) -> Event;

/// @brief Returns `message.content` of a message, or nullptr when either level is absent.
[[nodiscard]] auto messageContent(nlohmann::json const& root) -> Result<nlohmann::json const*>;

/// @brief Decodes the text and tool_use blocks of an assistant message.
[[nodiscard]] auto parseAssistant(nlohmann::json const& root, Clock::time_point now, DialectOptions const& options)
    -> Result<std::vector<Event>>;

/// @brief Decodes the tool_result blocks of a user message into ToolEnd events.
[[nodiscard]] auto parseToolResults(nlohmann::json const& root,
                                    Clock::time_point now,
                                    DialectOptions const& options) -> Result<std::vector<Event>>;

/// @brief Returns the text of a tool_result's `content`, which is a string or a list of text blocks.
[[nodiscard]] auto toolResultText(nlohmann::json const& block) -> std::string;

/// @brief Copies token counts from a `usage` object of @p root into @p event.
void readUsage(nlohmann::json const& root, Event& event);

/// @brief Returns the todo list of a TodoWrite input, or nullptr if the input carries none.
[[nodiscard]] auto todoList(nlohmann::json const& input) -> nlohmann::json const*;

/// @brief Converts a todos array into items; text is read from `content`, falling back to `subject`.
[[nodiscard]] auto parseTodoItems(nlohmann::json const& todos) -> std::vector<TodoItem>;

/// @brief Returns the first of @p keys holding a non-empty string in @p input, truncated to @p maxChars.
///
/// @p maxChars of 0 disables truncation. Non-object inputs yield an empty string.
[[nodiscard]] auto firstStringOf(nlohmann::json const& input,
                                 std::span<std::string_view const> keys,
                                 std::size_t maxChars = 0) -> std::string;

/// @brief Convenience overload for a braced list of keys.
[[nodiscard]] auto firstStringOf(nlohmann::json const& input,
                                 std::initializer_list<std::string_view> keys,
                                 std::size_t maxChars = 0) -> std::string;

} // namespace agentstream::blocks
