// SPDX-License-Identifier: Apache-2.0
#include <stream/ClaudeParser.hpp>
#include <stream/Processor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace agentstream;

namespace
{
auto plainConfig() -> FormatterConfig
{
    auto config = FormatterConfig {};
    config.agentName = "test";
    config.showText = true;
    config.useColor = false;
    config.useEmoji = false;
    return config;
}

auto makeProcessor(std::string_view agent, Formatter& formatter, ProcessorOptions options = {})
    -> std::unique_ptr<Processor>
{
    auto result = Processor::create(agent, formatter, options);
    REQUIRE(result.has_value());
    REQUIRE(*result != nullptr);
    return std::move(*result);
}

/// Accepts every line without producing events.
class SilentParser final: public Parser
{
  public:
    auto parse(std::string_view line) -> Result<std::vector<Event>> override
    {
        longestLine = std::max(longestLine, line.size());
        return std::vector<Event> {};
    }

    [[nodiscard]] auto name() const -> std::string_view override { return "silent"; }

    std::size_t longestLine = 0;
};
} // namespace

TEST_CASE("Processor is not created for agents without a dialect", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    auto result = Processor::create("aider", formatter);
    REQUIRE(result.has_value());
    CHECK(*result == nullptr);
}

TEST_CASE("Processor resolves the parser from the command path", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    auto processor = makeProcessor("/usr/local/bin/Codex.exe", formatter);
    CHECK(processor->parserName() == "codex");
}

TEST_CASE("Processor rejects a missing parser", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());

    auto result = Processor::create(std::unique_ptr<Parser> {}, formatter);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Processor renders a Claude session end to end", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("claude", formatter);

    auto const input = std::string(
        R"({"type":"assistant","message":{"content":[{"type":"tool_use","id":"t1","name":"Read","input":{"file_path":"/test.go"}}]}})"
        "\n"
        R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"t1","content":"package main"}]}})"
        "\n"
        R"({"type":"result","subtype":"success","result":"done","total_cost_usd":0.01})"
        "\n");
    REQUIRE(processor->write(input).has_value());
    REQUIRE(processor->close().has_value());

    auto const text = out.str();
    CHECK(text.find("Read") != std::string::npos);
    CHECK(text.find("/test.go") != std::string::npos);
    CHECK(text.find("Complete") != std::string::npos);

    // Rendered in arrival order
    CHECK(text.find("/test.go") < text.find("package main"));
    CHECK(text.find("package main") < text.find("Complete"));

    auto const stats = processor->stats();
    CHECK(stats.events == 3);
    CHECK(stats.errors == 0);
    CHECK(formatter.pendingCount() == 0);
}

TEST_CASE("Processor counts invalid lines without stopping", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("claude", formatter);

    auto const input = std::string(R"({"type":"system","session_id":"s"})"
                                   "\n"
                                   "this is not json\n"
                                   R"({"type":"assistant","message":{"content":[{"type":"text","text":"hi"},{"type":"text","text":"there"}]}})"
                                   "\n"
                                   "{\"truncated\": \n"
                                   R"({"type":"assistant","message":{"content":"not an array"}})"
                                   "\n"
                                   R"({"type":"mystery"})"
                                   "\n");
    REQUIRE(processor->write(input).has_value());
    REQUIRE(processor->close().has_value());

    auto const stats = processor->stats();
    // system (1) + two text blocks (2) + unknown type (1)
    CHECK(stats.events == 4);
    // two syntax errors and one decode error
    CHECK(stats.errors == 3);
    CHECK(out.str() == "hi\nthere\n");
}

TEST_CASE("Processor reassembles lines split across writes", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("codex", formatter);

    auto const line =
        std::string(R"({"type":"item.completed","item":{"id":"m","type":"agent_message","text":"split message"}})");
    for (auto const c: line)
        REQUIRE(processor->write(std::string_view(&c, 1)).has_value());
    REQUIRE(processor->write("\n").has_value());
    REQUIRE(processor->close().has_value());

    CHECK(out.str() == "split message\n");
    CHECK(processor->stats().events == 1);
}

TEST_CASE("Processor decodes a final line without newline", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("codex", formatter);

    REQUIRE(processor->write(R"({"type":"item.completed","item":{"type":"agent_message","text":"tail"}})").has_value());
    REQUIRE(processor->close().has_value());

    CHECK(out.str() == "tail\n");
}

TEST_CASE("Processor handles lines larger than the pipe buffer", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("codex", formatter);

    auto const payload = std::string(1024 * 1024, 'z');
    auto const line =
        std::string(R"({"type":"item.completed","item":{"type":"agent_message","text":")") + payload + "\"}}\n";
    REQUIRE(processor->write(line).has_value());
    REQUIRE(processor->close().has_value());

    CHECK(processor->stats().events == 1);
    CHECK(processor->stats().errors == 0);
    CHECK(out.str() == payload + "\n");
}

TEST_CASE("Processor decodes a very long line fed in small writes in linear time", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto parser = std::make_unique<SilentParser>();
    auto const& silent = *parser;
    auto result = Processor::create(std::move(parser), formatter);
    REQUIRE(result.has_value());
    auto& processor = **result;

    constexpr auto PayloadSize = std::size_t { 32 } * 1024 * 1024;
    constexpr auto WriteSize = std::size_t { 1024 };
    auto const line = std::string(R"({"type":"padding","text":")") + std::string(PayloadSize, 'x') + "\"}\n";

    auto const started = std::chrono::steady_clock::now();
    for (auto offset = std::size_t { 0 }; offset < line.size(); offset += WriteSize)
        REQUIRE(processor.write(std::string_view(line).substr(offset, WriteSize)).has_value());
    REQUIRE(processor.close().has_value());
    auto const elapsed = std::chrono::steady_clock::now() - started;

    CHECK(processor.stats().errors == 0);
    CHECK(silent.longestLine == line.size() - 1);
    CHECK(elapsed < std::chrono::seconds(10));
}

TEST_CASE("Processor skips blank lines and trims whitespace", "[processor]")
{
    auto out = std::ostringstream {};
    auto rawLog = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("codex", formatter, ProcessorOptions { .rawLog = &rawLog });

    REQUIRE(processor->write("\n   \n\t{\"type\":\"turn.started\"}  \r\n\n").has_value());
    REQUIRE(processor->close().has_value());

    CHECK(processor->stats().events == 0);
    CHECK(processor->stats().errors == 0);
    CHECK(rawLog.str() == "{\"type\":\"turn.started\"}\n");
}

TEST_CASE("Processor mirrors every decoded line to the raw log", "[processor]")
{
    auto out = std::ostringstream {};
    auto rawLog = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("claude", formatter, ProcessorOptions { .rawLog = &rawLog });

    REQUIRE(processor->write("{\"type\":\"system\"}\nnot json\n").has_value());
    REQUIRE(processor->close().has_value());

    CHECK(rawLog.str() == "{\"type\":\"system\"}\nnot json\n");
    CHECK(processor->stats().errors == 1);
}

TEST_CASE("Processor counts raw log failures and keeps decoding", "[processor]")
{
    auto out = std::ostringstream {};
    auto brokenLog = std::ostream(nullptr);
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("codex", formatter, ProcessorOptions { .rawLog = &brokenLog });

    REQUIRE(processor->write(R"({"type":"item.completed","item":{"type":"agent_message","text":"a"}})"
                             "\n"
                             R"({"type":"item.completed","item":{"type":"agent_message","text":"b"}})"
                             "\n")
                .has_value());
    REQUIRE(processor->close().has_value());

    CHECK(processor->stats().events == 2);
    CHECK(processor->stats().errors == 2);
    CHECK(out.str() == "a\nb\n");
}

TEST_CASE("Processor tracks last activity", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("claude", formatter);

    CHECK(processor->lastActivity() == std::chrono::system_clock::time_point {});

    auto const before = std::chrono::system_clock::now();
    REQUIRE(processor->write("garbage\n").has_value());
    REQUIRE(processor->close().has_value());

    CHECK(processor->lastActivity() >= before);
    CHECK(processor->lastActivity() <= std::chrono::system_clock::now());
}

TEST_CASE("Processor close is idempotent and rejects later writes", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("amp", formatter);

    CHECK(processor->close().has_value());
    CHECK(processor->close().has_value());

    auto const result = processor->write("{}\n");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);
}

TEST_CASE("Processor drives an Amp session", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("amp", formatter);

    REQUIRE(processor
                ->write(
                    R"({"type":"assistant","message":{"content":[{"type":"tool_use","id":"a1","name":"edit_file","input":{"path":"main.cpp"}}]}})"
                    "\n"
                    R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"a1","is_error":true,"content":"conflict"}]}})"
                    "\n"
                    R"({"type":"result","subtype":"success","result":"ok","usage":{"input_tokens":1500,"output_tokens":10}})"
                    "\n")
                .has_value());
    REQUIRE(processor->close().has_value());

    auto const text = out.str();
    CHECK(text.find("> edit_file(main.cpp)") != std::string::npos);
    CHECK(text.find("[ERR] Error ← edit_file") != std::string::npos);
    CHECK(text.find("tokens: 2K in / 10 out, tools: 1, errors: 1") != std::string::npos);
    CHECK(formatter.errorCount() == 1);
}

TEST_CASE("Processor drives a Codex session", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto processor = makeProcessor("/usr/local/bin/codex", formatter);

    REQUIRE(processor
                ->write(
                    R"({"type":"thread.started","thread_id":"t-1"})"
                    "\n"
                    R"({"type":"turn.started"})"
                    "\n"
                    R"({"type":"item.started","item":{"id":"c1","type":"command_execution","command":"ls missing"}})"
                    "\n"
                    R"({"type":"item.completed","item":{"id":"c1","type":"command_execution","exit_code":1,"aggregated_output":"No such file"}})"
                    "\n"
                    R"({"type":"item.completed","item":{"id":"m1","type":"agent_message","text":"The directory is missing."}})"
                    "\n"
                    R"({"type":"turn.completed","usage":{"input_tokens":12000,"cached_input_tokens":3000,"output_tokens":400}})"
                    "\n")
                .has_value());
    REQUIRE(processor->close().has_value());

    auto const text = out.str();
    CHECK(text.find("> Bash(ls missing)") != std::string::npos);
    CHECK(text.find("[ERR] Error ← Bash") != std::string::npos);
    CHECK(text.find("exit code 1: No such file") != std::string::npos);
    CHECK(text.find("The directory is missing.") != std::string::npos);
    CHECK(text.find("tokens: 12K in (3K cached) / 400 out") != std::string::npos);
    CHECK(text.find("thread: t-1") == std::string::npos);
    CHECK(processor->stats().events == 5);
    CHECK(processor->stats().errors == 0);
}

TEST_CASE("Processor accepts an explicit parser", "[processor]")
{
    auto out = std::ostringstream {};
    auto formatter = Formatter(out, plainConfig());
    auto result = Processor::create(std::make_unique<ClaudeParser>(), formatter);
    REQUIRE(result.has_value());
    REQUIRE(*result != nullptr);

    auto& processor = **result;
    REQUIRE(processor.write(R"({"type":"result","total_cost_usd":0.5})"
                            "\n")
                .has_value());
    REQUIRE(processor.close().has_value());
    CHECK(out.str().find("cost: $0.50") != std::string::npos);
}
