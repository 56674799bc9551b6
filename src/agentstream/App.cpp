// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <stream/Formatter.hpp>
#include <stream/ParserRegistry.hpp>
#include <stream/Processor.hpp>

#include <array>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>

namespace agentstream
{

namespace
{
    constexpr auto InputChunkSize = std::size_t { 64 * 1024 };
} // namespace

struct App::Impl
{
    AppConfig config;
    std::ostream& out;

    std::ifstream inputFile;
    std::ofstream rawLogFile;

    std::optional<Formatter> formatter;
    std::unique_ptr<Processor> processor;

    Impl(AppConfig c, std::ostream& o): config(std::move(c)), out(o) {}

    auto openRawLog() -> VoidResult
    {
        auto const path = std::filesystem::path(config.rawLog.path);
        auto const dir = path.parent_path();
        if (!dir.empty())
        {
            auto ec = std::error_code {};
            std::filesystem::create_directories(dir, ec);
            if (ec)
                return makeError(
                    ErrorCode::IoError,
                    std::format("Failed to create raw log directory '{}': {}", dir.string(), ec.message()));
        }

        rawLogFile.open(path, std::ios::out | std::ios::app | std::ios::binary);
        if (!rawLogFile.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open raw log: {}", path.string()));
        log::debug("Raw stream log: {}", path.string());
        return {};
    }

    /// Copies input to the output unchanged, for agents without a structured dialect.
    auto passthrough(std::istream& input) -> int
    {
        auto buffer = std::array<char, InputChunkSize> {};
        while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0)
        {
            out.write(buffer.data(), input.gcount());
            if (!out)
            {
                log::error("Failed to write output");
                return 1;
            }
        }
        out.flush();
        if (input.bad())
        {
            log::error("Failed to read input");
            return 1;
        }
        return 0;
    }

    auto decode(std::istream& input) -> int
    {
        auto exitCode = 0;
        auto buffer = std::array<char, InputChunkSize> {};
        while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0)
        {
            auto const chunk = std::string_view(buffer.data(), static_cast<std::size_t>(input.gcount()));
            if (auto result = processor->write(chunk); !result)
            {
                log::error("Failed to feed decoder: {}", result.error());
                exitCode = 1;
                break;
            }
        }
        if (input.bad())
        {
            log::error("Failed to read input");
            exitCode = 1;
        }

        if (auto result = processor->close(); !result)
        {
            log::error("Decoder stopped early: {}", result.error());
            exitCode = 1;
        }

        if (config.verbose)
        {
            auto const stats = processor->stats();
            log::info("{} events, {} errors, {} tools, {} failed, {} unmatched",
                      stats.events,
                      stats.errors,
                      formatter->toolCount(),
                      formatter->errorCount(),
                      formatter->pendingCount());
        }
        return exitCode;
    }
};

App::App(AppConfig config, std::ostream& out): _impl(std::make_unique<Impl>(std::move(config), out))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto& config = _impl->config;

    if (!config.inputPath.empty())
    {
        _impl->inputFile.open(config.inputPath, std::ios::in | std::ios::binary);
        if (!_impl->inputFile.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open input file: {}", config.inputPath));
    }

    auto const agentName = normalizeName(config.agent.command);
    _impl->formatter.emplace(_impl->out, toFormatterConfig(config.formatter, agentName));

    auto options = ProcessorOptions {};
    if (config.rawLog.enabled)
    {
        if (auto result = _impl->openRawLog(); !result)
            return result;
        options.rawLog = &_impl->rawLogFile;
    }

    auto processor = Processor::create(config.agent.command, *_impl->formatter, options);
    if (!processor)
        return std::unexpected(processor.error());

    _impl->processor = std::move(*processor);
    if (!_impl->processor)
        log::warning("No stream parser for agent '{}', passing output through", agentName);

    return {};
}

auto App::run() -> int
{
    if (_impl->inputFile.is_open())
        return run(_impl->inputFile);
    return run(std::cin);
}

auto App::run(std::istream& input) -> int
{
    if (!_impl->formatter)
    {
        log::error("App::run() called before initialize()");
        return 1;
    }

    if (!_impl->processor)
        return _impl->passthrough(input);
    return _impl->decode(input);
}

} // namespace agentstream
