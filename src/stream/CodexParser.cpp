// SPDX-License-Identifier: Apache-2.0
#include "CodexParser.hpp"

#include <core/JsonUtils.hpp>
#include <stream/ContentBlocks.hpp>

#include <format>

namespace agentstream
{

namespace
{
    using blocks::Clock;
    using blocks::makeEvent;

    constexpr auto CommandToolName = std::string_view { "Bash" };

    auto itemStarted(nlohmann::json const& item, Clock::time_point now) -> std::vector<Event>
    {
        if (json::getStringOr(item, "type") != "command_execution")
            return {};

        auto event = makeEvent(EventType::ToolStart, now);
        event.toolName = CommandToolName;
        event.toolId = json::getStringOr(item, "id");
        event.toolInput = json::getStringOr(item, "command");
        return { std::move(event) };
    }

    auto itemCompleted(nlohmann::json const& item, Clock::time_point now) -> std::vector<Event>
    {
        auto const itemType = json::getStringOr(item, "type");

        if (itemType == "command_execution")
        {
            auto event = makeEvent(EventType::ToolEnd, now);
            event.toolId = json::getStringOr(item, "id");

            // exit_code is null while running; a completed item without one counts as success.
            auto const exitCode = json::getInt64Or(item, "exit_code", 0);
            auto output = json::getStringOr(item, "aggregated_output");
            if (exitCode != 0)
                event.toolError = std::format("exit code {}: {}", exitCode, output);
            else
                event.toolOutput = std::move(output);
            return { std::move(event) };
        }

        if (itemType == "reasoning" || itemType == "agent_message")
        {
            auto text = json::getStringOr(item, "text");
            if (text.empty())
                return {};
            auto event = makeEvent(EventType::Text, now);
            event.text = std::move(text);
            return { std::move(event) };
        }

        auto event = makeEvent(EventType::Unknown, now);
        event.text = std::format("unknown item type: {}", itemType);
        return { std::move(event) };
    }

    auto turnCompleted(nlohmann::json const& root, Clock::time_point now) -> Result<std::vector<Event>>
    {
        auto event = makeEvent(EventType::Result, now);
        event.isComplete = true;

        auto usage = json::getObject(root, "usage");
        if (!usage)
            return std::unexpected(usage.error());
        if (auto const* u = *usage)
        {
            event.inputTokens = json::getInt64Or(*u, "input_tokens", 0);
            event.outputTokens = json::getInt64Or(*u, "output_tokens", 0);
            event.cacheReadTokens = json::getInt64Or(*u, "cached_input_tokens", 0);
        }
        return std::vector { std::move(event) };
    }
} // namespace

auto CodexParser::parse(std::string_view line) -> Result<std::vector<Event>>
{
    auto doc = json::parse(line);
    if (!doc)
        return std::unexpected(doc.error());

    auto const& root = *doc;
    if (!root.is_object())
        return makeError(ErrorCode::DecodeError, "Codex message is not a JSON object");

    auto const now = Clock::now();
    auto const type = json::getStringOr(root, "type");

    if (type == "thread.started")
    {
        auto event = makeEvent(EventType::Progress, now);
        event.text = std::format("thread: {}", json::getStringOr(root, "thread_id"));
        return std::vector { std::move(event) };
    }

    if (type == "turn.started")
        return std::vector<Event> {};

    if (type == "item.started" || type == "item.completed")
    {
        auto item = json::getObject(root, "item");
        if (!item)
            return std::unexpected(item.error());
        if (!*item)
            return std::vector<Event> {};
        return type == "item.started" ? itemStarted(**item, now) : itemCompleted(**item, now);
    }

    if (type == "turn.completed")
        return turnCompleted(root, now);

    auto event = makeEvent(EventType::Unknown, now);
    event.text = std::format("unknown message type: {}", type);
    return std::vector { std::move(event) };
}

auto CodexParser::name() const -> std::string_view
{
    return "codex";
}

} // namespace agentstream
