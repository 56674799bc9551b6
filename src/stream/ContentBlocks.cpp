// SPDX-License-Identifier: Apache-2.0
#include "ContentBlocks.hpp"

#include <core/JsonUtils.hpp>
#include <core/TextUtils.hpp>

namespace agentstream::blocks
{

namespace
{
    auto isTodoTool(std::string_view name) -> bool
    {
        return name == "TodoWrite" || name == "todo_write";
    }
} // namespace

auto makeEvent(EventType type, Clock::time_point now) -> Event
{
    auto event = Event {};
    event.type = type;
    event.timestamp = now;
    return event;
}

auto messageContent(nlohmann::json const& root) -> Result<nlohmann::json const*>
{
    auto message = json::getObject(root, "message");
    if (!message)
        return std::unexpected(message.error());
    if (!*message)
        return nullptr;
    return json::getArray(**message, "content");
}

auto parseAssistant(nlohmann::json const& root, Clock::time_point now, DialectOptions const& options)
    -> Result<std::vector<Event>>
{
    auto content = messageContent(root);
    if (!content)
        return std::unexpected(content.error());

    auto events = std::vector<Event> {};
    if (!*content)
        return events;

    for (auto const& block: **content)
    {
        auto const blockType = json::getStringOr(block, "type");
        if (blockType == "text")
        {
            auto text = json::getStringOr(block, "text");
            if (text.empty())
                continue;
            auto event = makeEvent(EventType::Text, now);
            event.text = std::move(text);
            events.push_back(std::move(event));
        }
        else if (blockType == "tool_use")
        {
            auto const name = json::getStringOr(block, "name");
            auto const input = block.is_object() && block.contains("input") ? block["input"] : nlohmann::json {};

            if (isTodoTool(name))
            {
                if (auto const* todos = todoList(input))
                {
                    auto items = parseTodoItems(*todos);
                    if (!items.empty())
                    {
                        auto event = makeEvent(EventType::Todo, now);
                        event.toolName = name;
                        event.toolId = json::getStringOr(block, "id");
                        event.todoItems = std::move(items);
                        events.push_back(std::move(event));
                    }
                    continue;
                }
            }

            auto event = makeEvent(EventType::ToolStart, now);
            event.toolName = name;
            event.toolId = json::getStringOr(block, "id");
            if (options.summarizeInput)
                event.toolInput = options.summarizeInput(name, input);
            events.push_back(std::move(event));
        }
    }
    return events;
}

auto parseToolResults(nlohmann::json const& root, Clock::time_point now, DialectOptions const& options)
    -> Result<std::vector<Event>>
{
    auto content = messageContent(root);
    if (!content)
        return std::unexpected(content.error());

    auto events = std::vector<Event> {};
    if (!*content)
        return events;

    for (auto const& block: **content)
    {
        if (json::getStringOr(block, "type") != "tool_result")
            continue;

        auto event = makeEvent(EventType::ToolEnd, now);
        event.toolId = json::getStringOr(block, "tool_use_id");

        auto output = toolResultText(block);
        if (json::getBoolOr(block, "is_error", false))
        {
            event.toolError = json::getStringOr(block, "error");
            if (event.toolError.empty())
                event.toolError = std::move(output);
        }
        else if (options.maxToolOutputChars > 0)
        {
            event.toolOutput = text::truncate(output, options.maxToolOutputChars);
        }
        else
        {
            event.toolOutput = std::move(output);
        }
        events.push_back(std::move(event));
    }
    return events;
}

auto toolResultText(nlohmann::json const& block) -> std::string
{
    if (!block.is_object())
        return {};

    auto const it = block.find("content");
    if (it == block.end())
        return {};
    if (it->is_string())
        return it->get<std::string>();
    if (!it->is_array())
        return {};

    auto text = std::string {};
    for (auto const& part: *it)
    {
        if (json::getStringOr(part, "type") != "text")
            continue;
        if (!text.empty())
            text += '\n';
        text += json::getStringOr(part, "text");
    }
    return text;
}

void readUsage(nlohmann::json const& root, Event& event)
{
    auto const it = root.find("usage");
    if (it == root.end() || !it->is_object())
        return;

    auto const& usage = *it;
    event.inputTokens = json::getInt64Or(usage, "input_tokens", 0);
    event.outputTokens = json::getInt64Or(usage, "output_tokens", 0);
    event.cacheReadTokens = json::getInt64Or(usage, "cache_read_input_tokens", 0);
    event.cacheWriteTokens = json::getInt64Or(usage, "cache_creation_input_tokens", 0);
}

auto todoList(nlohmann::json const& input) -> nlohmann::json const*
{
    if (!input.is_object())
        return nullptr;
    auto const it = input.find("todos");
    if (it == input.end() || !it->is_array())
        return nullptr;
    return &*it;
}

auto parseTodoItems(nlohmann::json const& todos) -> std::vector<TodoItem>
{
    auto items = std::vector<TodoItem> {};
    for (auto const& todo: todos)
    {
        if (!todo.is_object())
            continue;

        auto item = TodoItem {};
        item.id = json::getStringOr(todo, "id");
        item.content = json::getStringOr(todo, "content");
        if (item.content.empty())
            item.content = json::getStringOr(todo, "subject");
        item.status = todoStatusFromString(json::getStringOr(todo, "status"));
        item.priority = json::getStringOr(todo, "priority");
        items.push_back(std::move(item));
    }
    return items;
}

auto firstStringOf(nlohmann::json const& input, std::span<std::string_view const> keys, std::size_t maxChars)
    -> std::string
{
    if (!input.is_object())
        return {};

    for (auto const key: keys)
    {
        auto value = json::getStringOr(input, key);
        if (value.empty())
            continue;
        if (maxChars == 0)
            return value;
        return text::truncate(value, maxChars);
    }
    return {};
}

auto firstStringOf(nlohmann::json const& input, std::initializer_list<std::string_view> keys, std::size_t maxChars)
    -> std::string
{
    return firstStringOf(input, std::span<std::string_view const>(keys.begin(), keys.size()), maxChars);
}

} // namespace agentstream::blocks
