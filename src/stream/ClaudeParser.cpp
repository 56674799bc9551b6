// SPDX-License-Identifier: Apache-2.0
#include "ClaudeParser.hpp"

#include <core/JsonUtils.hpp>
#include <stream/ContentBlocks.hpp>

#include <format>

namespace agentstream
{

namespace
{
    constexpr auto MaxToolOutputChars = std::size_t { 100 };

    auto dialect() -> blocks::DialectOptions const&
    {
        static auto const options = blocks::DialectOptions {
            .summarizeInput = &ClaudeParser::summarizeInput,
            .maxToolOutputChars = MaxToolOutputChars,
        };
        return options;
    }
} // namespace

auto ClaudeParser::parse(std::string_view line) -> Result<std::vector<Event>>
{
    auto doc = json::parse(line);
    if (!doc)
        return std::unexpected(doc.error());

    auto const& root = *doc;
    if (!root.is_object())
        return makeError(ErrorCode::DecodeError, "Claude message is not a JSON object");

    auto const now = blocks::Clock::now();
    auto const type = json::getStringOr(root, "type");

    if (type == "assistant")
        return blocks::parseAssistant(root, now, dialect());

    if (type == "user")
        return blocks::parseToolResults(root, now, dialect());

    if (type == "result")
    {
        auto event = blocks::makeEvent(EventType::Result, now);
        event.result = json::getStringOr(root, "result");
        // A result without a cost field leaves the running total unchanged.
        event.cost = json::getDoubleOr(root, "total_cost_usd", _cumulativeCost);
        event.costDelta = event.cost - _cumulativeCost;
        event.isComplete = true;
        blocks::readUsage(root, event);
        _cumulativeCost = event.cost;
        return std::vector { std::move(event) };
    }

    if (type == "system")
    {
        auto event = blocks::makeEvent(EventType::Progress, now);
        event.text = std::format("session: {}", json::getStringOr(root, "session_id"));
        return std::vector { std::move(event) };
    }

    auto event = blocks::makeEvent(EventType::Unknown, now);
    event.text = std::format("unknown message type: {}", type);
    return std::vector { std::move(event) };
}

auto ClaudeParser::name() const -> std::string_view
{
    return "claude";
}

auto ClaudeParser::summarizeInput(std::string_view toolName, nlohmann::json const& input) -> std::string
{
    if (toolName == "Read" || toolName == "Write" || toolName == "Edit")
        return blocks::firstStringOf(input, { "file_path" });
    if (toolName == "Bash")
        return blocks::firstStringOf(input, { "command", "description" }, 60);
    if (toolName == "Glob" || toolName == "Grep")
        return blocks::firstStringOf(input, { "pattern" }, 40);
    if (toolName == "Task")
        return blocks::firstStringOf(input, { "description" }, 40);
    if (toolName == "WebFetch" || toolName == "WebSearch")
        return blocks::firstStringOf(input, { "url", "query" }, 50);
    return {};
}

} // namespace agentstream
