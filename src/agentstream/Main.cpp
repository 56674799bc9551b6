// SPDX-License-Identifier: Apache-2.0
#include <agentstream/App.hpp>
#include <agentstream/Config.hpp>
#include <core/Log.hpp>
#include <stream/ParserRegistry.hpp>

#include <CLI/CLI.hpp>

#include <cstddef>
#include <iostream>
#include <print>
#include <string>
#include <vector>

#ifndef _WIN32
    #include <csignal>
#endif

namespace
{

void printFlags(std::vector<std::string> const& flags)
{
    auto line = std::string {};
    for (auto const& flag: flags)
    {
        if (!line.empty())
            line += ' ';
        line += flag;
    }
    std::println("{}", line);
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "agentstream - live transcript of a coding agent's NDJSON output" };

    auto configPath = std::string {};
    auto inputPath = std::string {};
    auto agent = std::string {};
    auto rawLogPath = std::string {};
    auto noRawLog = false;
    auto noColor = false;
    auto noEmoji = false;
    auto timestamps = false;
    auto showProgress = false;
    auto hideText = false;
    auto verboseOutput = false;
    auto maxLines = std::size_t { 0 };
    auto maxChars = std::size_t { 0 };
    auto verbose = false;
    auto printOutputFlags = false;
    auto printTextFlags = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-i,--input", inputPath, "Read NDJSON from a file instead of stdin");
    app.add_option("-a,--agent", agent, "Agent command that produced the stream (claude|codex|amp)");
    app.add_option("--raw-log", rawLogPath, "Append every decoded line to this file");
    app.add_flag("--no-raw-log", noRawLog, "Do not write the raw log");
    app.add_flag("--no-color", noColor, "Disable ANSI colors");
    app.add_flag("--no-emoji", noEmoji, "Use ASCII markers");
    app.add_flag("--timestamps", timestamps, "Prefix lines with the time of day");
    app.add_flag("--show-progress", showProgress, "Show session and unrecognized messages");
    app.add_flag("--hide-text", hideText, "Show tool activity only");
    app.add_flag("--verbose-output", verboseOutput, "Show empty tool results and tool durations");
    app.add_option("--max-lines", maxLines, "Tool output lines to show");
    app.add_option("--max-chars", maxChars, "Characters per tool output line");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging and print statistics");
    app.add_flag("--print-flags", printOutputFlags, "Print the agent's structured-output flags and exit");
    app.add_flag("--print-text-flags", printTextFlags, "Print the agent's text-mode flags and exit");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        agentstream::log::setLevel(agentstream::log::Level::Debug);

    // Load config
    auto configResult =
        configPath.empty() ? agentstream::loadConfig() : agentstream::loadConfigFromFile(configPath);

    if (!configResult)
    {
        agentstream::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!agent.empty())
        config.agent.command = agent;
    if (!inputPath.empty())
        config.inputPath = inputPath;
    if (!rawLogPath.empty())
    {
        config.rawLog.path = rawLogPath;
        config.rawLog.enabled = true;
    }
    if (noRawLog)
        config.rawLog.enabled = false;
    if (noColor)
        config.formatter.useColor = false;
    if (noEmoji)
        config.formatter.useEmoji = false;
    if (timestamps)
        config.formatter.showTimestamp = true;
    if (showProgress)
        config.formatter.showProgress = true;
    if (hideText)
        config.formatter.showText = false;
    if (verboseOutput)
        config.formatter.verbose = true;
    if (maxLines > 0)
        config.formatter.maxOutputLines = maxLines;
    if (maxChars > 0)
        config.formatter.maxOutputChars = maxChars;
    config.verbose = verbose;

    if (printOutputFlags || printTextFlags)
    {
        auto const flags = printOutputFlags ? agentstream::outputFlags(config.agent.command)
                                            : agentstream::textModeFlags(config.agent.command);
        printFlags(flags);
        return 0;
    }

#ifndef _WIN32
    // A closed stdout must surface as a write error, not terminate the process.
    std::signal(SIGPIPE, SIG_IGN);
#endif

    auto application = agentstream::App(std::move(config), std::cout);
    auto initResult = application.initialize();
    if (!initResult)
    {
        agentstream::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
