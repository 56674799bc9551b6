// SPDX-License-Identifier: Apache-2.0
#include <stream/Formatter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace agentstream;
using namespace std::chrono_literals;

namespace
{
auto plainConfig() -> FormatterConfig
{
    return FormatterConfig {
        .agentName = "claude",
        .showText = true,
        .showProgress = false,
        .useColor = false,
        .useEmoji = false,
        .verbose = false,
        .showTimestamp = false,
        .maxOutputLines = 3,
        .maxOutputChars = 120,
    };
}

auto toolStart(std::string id, std::string name, std::string input = {}) -> Event
{
    auto event = Event {};
    event.type = EventType::ToolStart;
    event.toolId = std::move(id);
    event.toolName = std::move(name);
    event.toolInput = std::move(input);
    return event;
}

auto toolEnd(std::string id, std::string output, std::string error = {}) -> Event
{
    auto event = Event {};
    event.type = EventType::ToolEnd;
    event.toolId = std::move(id);
    event.toolOutput = std::move(output);
    event.toolError = std::move(error);
    return event;
}

auto textEvent(EventType type, std::string text) -> Event
{
    auto event = Event {};
    event.type = type;
    event.text = std::move(text);
    return event;
}
} // namespace

TEST_CASE("Formatter renders a tool start with its input", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    formatter.formatEvent(toolStart("t1", "Read", "/test.go"));
    CHECK(out.str() == "> Read(/test.go)\n");
    CHECK(formatter.toolCount() == 1);
}

TEST_CASE("Formatter uses pictographic markers with emoji enabled", "[formatter]")
{
    auto config = plainConfig();
    config.useEmoji = true;
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, config);

    formatter.formatEvent(toolStart("t1", "Bash", "ls"));
    formatter.formatEvent(toolEnd("t1", "file.txt"));
    CHECK(out.str() == "⏺ Bash(ls)\n✅ Result ← Bash (1 lines, 8 chars)\n  ⎿  file.txt\n");
}

TEST_CASE("Formatter correlates tool end with its start", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    formatter.formatEvent(toolStart("t1", "Read", "/test.go"));
    CHECK(formatter.hasPending("t1"));
    CHECK(formatter.pendingCount() == 1);

    formatter.formatEvent(toolEnd("t1", "package main"));
    CHECK_FALSE(formatter.hasPending("t1"));
    CHECK(formatter.pendingCount() == 0);
    CHECK(out.str().find("[OK] Result ← Read (1 lines, 12 chars)\n  |  package main\n") != std::string::npos);
}

TEST_CASE("Formatter renders an unmatched tool end without correlation", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    formatter.formatEvent(toolEnd("ghost", "orphan output"));
    CHECK(out.str() == "[OK] Result (1 lines, 13 chars)\n  |  orphan output\n");
    CHECK(formatter.pendingCount() == 0);
}

TEST_CASE("Formatter correlates each id only once", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    formatter.formatEvent(toolStart("t1", "Read"));
    formatter.formatEvent(toolEnd("t1", "first"));
    formatter.formatEvent(toolEnd("t1", "second"));

    auto const text = out.str();
    CHECK(text.find("Result ← Read (1 lines, 5 chars)") != std::string::npos);
    CHECK(text.find("Result (1 lines, 6 chars)") != std::string::npos);
}

TEST_CASE("Formatter ignores tool starts without id for correlation", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    formatter.formatEvent(toolStart("", "Read"));
    CHECK(formatter.pendingCount() == 0);
    CHECK(formatter.toolCount() == 1);
}

TEST_CASE("Formatter renders and counts tool errors", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    formatter.formatEvent(toolStart("c1", "Bash", "cat x"));
    formatter.formatEvent(toolEnd("c1", {}, "exit code 1: No such file"));

    CHECK(out.str().find("[ERR] Error ← Bash (1 lines, 25 chars)\n  |  exit code 1: No such file\n")
          != std::string::npos);
    CHECK(formatter.errorCount() == 1);
}

TEST_CASE("Formatter skips empty successful results unless verbose", "[formatter]")
{
    SECTION("quiet")
    {
        auto out = std::ostringstream {};
        auto formatter = Formatter(out, plainConfig());
        formatter.formatEvent(toolStart("w1", "Write", "a.txt"));
        formatter.formatEvent(toolEnd("w1", ""));
        CHECK(out.str() == "> Write(a.txt)\n");
        CHECK(formatter.pendingCount() == 0);
    }

    SECTION("verbose")
    {
        auto config = plainConfig();
        config.verbose = true;
        auto out = std::ostringstream {};
        auto formatter = Formatter(out, config);
        formatter.formatEvent(toolStart("w1", "Write", "a.txt"));
        formatter.formatEvent(toolEnd("w1", ""));
        CHECK(out.str().find("[OK] Result ← Write") != std::string::npos);
    }
}

TEST_CASE("Formatter truncates multi-line tool output", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    formatter.formatEvent(toolEnd("x", "line1\nline2\n\nline3\nline4"));

    auto const expected = std::string("[OK] Result (5 lines, 24 chars)\n"
                                      "  |  line1\n"
                                      "      line2\n"
                                      "      line3\n"
                                      "  |  ... 2 more lines\n");
    CHECK(out.str() == expected);
}

TEST_CASE("Formatter truncates long output lines", "[formatter]")
{
    auto config = plainConfig();
    config.maxOutputChars = 10;
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, config);

    formatter.formatEvent(toolEnd("x", "abcdefghijklmnopqrstuvwxyz"));
    CHECK(out.str().find("  |  abcdefg...\n") != std::string::npos);
}

TEST_CASE("Formatter applies defaults for zero limits", "[formatter]")
{
    auto config = plainConfig();
    config.maxOutputLines = 0;
    config.maxOutputChars = 0;
    auto out = std::ostringstream {};
    auto const formatter = Formatter(out, config);
    CHECK(formatter.config().maxOutputLines == 3);
    CHECK(formatter.config().maxOutputChars == 120);
}

TEST_CASE("Formatter renders text line by line", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    formatter.formatEvent(textEvent(EventType::Text, "Hello\nWorld"));
    CHECK(out.str() == "Hello\nWorld\n");
}

TEST_CASE("Formatter hides text when showText is off", "[formatter]")
{
    auto config = plainConfig();
    config.showText = false;
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, config);

    formatter.formatEvent(textEvent(EventType::Text, "Hello"));
    CHECK(out.str().empty());
}

TEST_CASE("Formatter shows progress and unknown events only when enabled", "[formatter]")
{
    SECTION("hidden by default")
    {
        auto out = std::ostringstream {};
        auto formatter = Formatter(out, plainConfig());
        formatter.formatEvent(textEvent(EventType::Progress, "session: abc"));
        formatter.formatEvent(textEvent(EventType::Unknown, "unknown message type: x"));
        CHECK(out.str().empty());
    }

    SECTION("shown with showProgress")
    {
        auto config = plainConfig();
        config.showProgress = true;
        auto out = std::ostringstream {};
        auto formatter = Formatter(out, config);
        formatter.formatEvent(textEvent(EventType::Progress, "session: abc"));
        formatter.formatEvent(textEvent(EventType::Unknown, "unknown message type: x"));
        CHECK(out.str() == "session: abc\nunknown message type: x\n");
    }
}

TEST_CASE("Formatter renders the completion summary", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    formatter.formatEvent(toolStart("t1", "Read"));
    formatter.formatEvent(toolEnd("t1", {}, "boom"));

    auto result = Event {};
    result.type = EventType::Result;
    result.isComplete = true;
    result.cost = 0.0123;
    result.inputTokens = 2000;
    result.cacheReadTokens = 1000;
    result.outputTokens = 500;
    formatter.formatEvent(result);

    auto const text = out.str();
    CHECK(text.find("[OK] Complete (cost: $0.01, tokens: 2K in (1K cached) / 500 out, tools: 1, errors: 1, time: ")
          != std::string::npos);
}

TEST_CASE("Formatter omits zero cost and tokens from the summary", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    auto result = Event {};
    result.type = EventType::Result;
    formatter.formatEvent(result);

    CHECK(out.str().starts_with("[OK] Complete (tools: 0, errors: 0, time: "));
}

TEST_CASE("Formatter shows the reason of a failed run", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    auto result = Event {};
    result.type = EventType::Result;
    result.toolError = "error_max_turns";
    formatter.formatEvent(result);

    CHECK(out.str().find("  |  error_max_turns\n") != std::string::npos);
    CHECK(formatter.errorCount() == 0);
}

TEST_CASE("Formatter renders a todo list with progress", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    auto todo = Event {};
    todo.type = EventType::Todo;
    todo.todoItems = {
        TodoItem { .id = "1", .content = "Design", .status = TodoStatus::Completed, .priority = "high" },
        TodoItem { .id = "2", .content = "Build", .status = TodoStatus::InProgress, .priority = "medium" },
        TodoItem { .id = "3", .content = "Test", .status = TodoStatus::Pending, .priority = "" },
    };
    formatter.formatEvent(todo);

    auto const expected = std::string("Todo List\n"
                                      "  [x] Design [high]\n"
                                      "  [>] Build ← ACTIVE\n"
                                      "  [ ] Test\n"
                                      "\n"
                                      "  Progress: 1/3 (33%) | 1 active, 1 pending\n");
    CHECK(out.str() == expected);
}

TEST_CASE("Formatter ignores an empty todo list", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    auto todo = Event {};
    todo.type = EventType::Todo;
    formatter.formatEvent(todo);
    CHECK(out.str().empty());
}

TEST_CASE("Formatter emits ANSI styling only with color enabled", "[formatter]")
{
    auto config = plainConfig();
    config.useColor = true;
    auto colored = std::ostringstream {};
    auto formatter = Formatter(colored, config);
    formatter.formatEvent(toolStart("t1", "Read", "a.txt"));
    CHECK(colored.str().find("\033[") != std::string::npos);
    CHECK(colored.str().find("Read") != std::string::npos);

    auto plain = std::ostringstream {};
    auto plainFormatter = Formatter(plain, plainConfig());
    plainFormatter.formatEvent(toolStart("t1", "Read", "a.txt"));
    CHECK(plain.str().find('\033') == std::string::npos);
}

TEST_CASE("Formatter prefixes lines with timestamps", "[formatter]")
{
    auto config = plainConfig();
    config.showTimestamp = true;
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, config);

    formatter.formatEvent(toolStart("t1", "Read"));
    auto const text = out.str();
    REQUIRE(text.size() > 11);
    CHECK(text[0] == '[');
    CHECK(text[3] == ':');
    CHECK(text[6] == ':');
    CHECK(text.substr(9, 2) == "] ");
}

TEST_CASE("Formatter serializes concurrent callers", "[formatter]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    constexpr auto ThreadCount = 4;
    constexpr auto PerThread = 50;
    auto threads = std::vector<std::thread> {};
    for (auto t = 0; t < ThreadCount; ++t)
    {
        threads.emplace_back([&formatter, t] {
            for (auto i = 0; i < PerThread; ++i)
            {
                auto const id = std::to_string(t) + "-" + std::to_string(i);
                formatter.formatEvent(toolStart(id, "Bash", "echo"));
                formatter.formatEvent(toolEnd(id, "ok"));
            }
        });
    }
    for (auto& thread: threads)
        thread.join();

    CHECK(formatter.toolCount() == ThreadCount * PerThread);
    CHECK(formatter.pendingCount() == 0);

    auto lines = std::istringstream(out.str());
    auto line = std::string {};
    auto resultLines = 0;
    while (std::getline(lines, line))
    {
        if (line == "[OK] Result ← Bash (1 lines, 2 chars)")
            ++resultLines;
    }
    CHECK(resultLines == ThreadCount * PerThread);
}

TEST_CASE("formatTokenCount uses K and M suffixes", "[formatter]")
{
    CHECK(formatTokenCount(0) == "0");
    CHECK(formatTokenCount(999) == "999");
    CHECK(formatTokenCount(1000) == "1K");
    CHECK(formatTokenCount(1500) == "2K");
    CHECK(formatTokenCount(999999) == "1000K");
    CHECK(formatTokenCount(1000000) == "1.0M");
    CHECK(formatTokenCount(1234567) == "1.2M");
}

TEST_CASE("formatDuration rounds to seconds", "[formatter]")
{
    CHECK(formatDuration(0ms) == "0s");
    CHECK(formatDuration(400ms) == "0s");
    CHECK(formatDuration(59s) == "59s");
    CHECK(formatDuration(60s) == "1m");
    CHECK(formatDuration(61s) == "1m1s");
    CHECK(formatDuration(367s) == "6m7s");
    CHECK(formatDuration(59'600ms) == "1m");
}

TEST_CASE("Event kinds have stable display names", "[formatter]")
{
    CHECK(eventTypeName(EventType::ToolStart) == "ToolStart");
    CHECK(eventTypeName(EventType::ToolEnd) == "ToolEnd");
    CHECK(eventTypeName(EventType::Text) == "Text");
    CHECK(eventTypeName(EventType::Result) == "Result");
    CHECK(eventTypeName(EventType::Progress) == "Progress");
    CHECK(eventTypeName(EventType::Todo) == "Todo");
    CHECK(eventTypeName(EventType::Unknown) == "Unknown");

    auto event = Event {};
    CHECK_FALSE(event.isError());
    event.toolError = "boom";
    CHECK(event.isError());
}
