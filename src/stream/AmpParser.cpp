// SPDX-License-Identifier: Apache-2.0
#include "AmpParser.hpp"

#include <core/JsonUtils.hpp>
#include <core/TextUtils.hpp>
#include <stream/ContentBlocks.hpp>

#include <algorithm>
#include <format>
#include <vector>

namespace agentstream
{

namespace
{
    /// @brief Which input keys summarize a family of tools, and how long the summary may be.
    struct SummaryRule
    {
        std::vector<std::string_view> toolNames; ///< Lower-case.
        std::vector<std::string_view> inputKeys;
        std::size_t maxChars = 0;
    };

    auto summaryRules() -> std::vector<SummaryRule> const&
    {
        static auto const rules = std::vector<SummaryRule> {
            {
                .toolNames = { "read", "read_file", "write", "write_file", "create_file", "edit", "edit_file",
                               "list_directory" },
                .inputKeys = { "path", "file_path" },
            },
            { .toolNames = { "bash", "shell" }, .inputKeys = { "command" }, .maxChars = 60 },
            { .toolNames = { "grep", "glob" }, .inputKeys = { "pattern" }, .maxChars = 40 },
            {
                .toolNames = { "search", "web_search", "websearch", "webfetch", "read_web_page" },
                .inputKeys = { "query", "url" },
                .maxChars = 50,
            },
            { .toolNames = { "task" }, .inputKeys = { "description" }, .maxChars = 40 },
        };
        return rules;
    }

    auto dialect() -> blocks::DialectOptions const&
    {
        static auto const options = blocks::DialectOptions {
            .summarizeInput = &AmpParser::summarizeInput,
            .maxToolOutputChars = 0,
        };
        return options;
    }

    auto parseResult(nlohmann::json const& root, blocks::Clock::time_point now) -> Event
    {
        auto event = blocks::makeEvent(EventType::Result, now);
        event.isComplete = true;
        blocks::readUsage(root, event);

        auto const subtype = json::getStringOr(root, "subtype");
        auto const failed = json::getBoolOr(root, "is_error", false) || (!subtype.empty() && subtype != "success");
        if (!failed)
        {
            event.result = json::getStringOr(root, "result");
            return event;
        }

        auto message = json::getStringOr(root, "error");
        if (message.empty())
            message = json::getStringOr(root, "result");
        if (message.empty())
            message = subtype.empty() ? std::string("error") : subtype;
        event.result = message;
        event.toolError = std::move(message);
        return event;
    }
} // namespace

auto AmpParser::parse(std::string_view line) -> Result<std::vector<Event>>
{
    auto doc = json::parse(line);
    if (!doc)
        return std::unexpected(doc.error());

    auto const& root = *doc;
    if (!root.is_object())
        return makeError(ErrorCode::DecodeError, "Amp message is not a JSON object");

    auto const now = blocks::Clock::now();
    auto const type = json::getStringOr(root, "type");

    if (type == "assistant")
        return blocks::parseAssistant(root, now, dialect());

    if (type == "user")
        return blocks::parseToolResults(root, now, dialect());

    if (type == "result")
        return std::vector { parseResult(root, now) };

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

auto AmpParser::name() const -> std::string_view
{
    return "amp";
}

auto AmpParser::summarizeInput(std::string_view toolName, nlohmann::json const& input) -> std::string
{
    auto const lowered = text::toLower(toolName);
    for (auto const& rule: summaryRules())
    {
        if (std::ranges::find(rule.toolNames, lowered) != rule.toolNames.end())
            return blocks::firstStringOf(input, rule.inputKeys, rule.maxChars);
    }
    return {};
}

} // namespace agentstream
