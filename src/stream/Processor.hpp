// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <stream/Formatter.hpp>
#include <stream/Parser.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string_view>

namespace agentstream
{

/// @brief Optional collaborators of a Processor.
struct ProcessorOptions
{
    /// Receives every decoded non-empty line followed by '\n'; not owned, may be null.
    /// Must outlive the Processor.
    std::ostream* rawLog = nullptr;
};

/// @brief Monotonic counters of a Processor.
struct ProcessorStats
{
    std::int64_t events = 0; ///< Events forwarded to the formatter.
    std::int64_t errors = 0; ///< Invalid lines, parse failures, raw log and read failures.
};

/// @brief Decodes an agent's NDJSON output on a background thread and renders it.
///
/// Bytes passed to write() go through an OS pipe to a single decode thread, which splits
/// them into lines of any length, validates and parses each line and forwards the
/// resulting events to the Formatter in arrival order. The pipe's buffer bounds the
/// amount of undecoded data: write() blocks while the decoder is behind.
///
/// Malformed lines never stop decoding; they only increment the error counter.
class Processor
{
  public:
    /// @brief Creates a processor for the given agent command.
    ///
    /// @return nullptr when the agent has no structured-output flags or no registered parser,
    ///         in which case the caller should pass output through unchanged; an IoError if
    ///         the pipe or the decode thread could not be created.
    [[nodiscard]] static auto create(std::string_view agentCommand,
                                     Formatter& formatter,
                                     ProcessorOptions options = {}) -> Result<std::unique_ptr<Processor>>;

    /// @brief Creates a processor around an explicit parser.
    [[nodiscard]] static auto create(std::unique_ptr<Parser> parser,
                                     Formatter& formatter,
                                     ProcessorOptions options = {}) -> Result<std::unique_ptr<Processor>>;

    /// @brief Closes the processor, waiting for the decoder to drain.
    ~Processor();

    Processor(Processor const&) = delete;
    Processor& operator=(Processor const&) = delete;

    /// @brief Feeds bytes to the decoder. Lines may be split across calls arbitrarily.
    /// @return IoError if the processor is closed, the decoder stopped after a read error,
    ///         or the pipe write failed.
    [[nodiscard]] auto write(std::string_view data) -> VoidResult;

    /// @brief Signals end of input and blocks until every byte written before has been rendered.
    ///
    /// Safe to call more than once; later calls return the first call's result.
    /// @return The last non-EOF read error of the decoder, if any.
    auto close() -> VoidResult;

    /// @brief Returns the event and error counters.
    [[nodiscard]] auto stats() const noexcept -> ProcessorStats;

    /// @brief Time the most recent non-empty line was processed; the epoch if none was yet.
    [[nodiscard]] auto lastActivity() const noexcept -> std::chrono::system_clock::time_point;

    /// @brief Returns the name of the parser in use, e.g. "codex".
    [[nodiscard]] auto parserName() const -> std::string_view;

  private:
    struct Impl;

    /// Restricts construction to create().
    struct Token
    {
        explicit Token() = default;
    };

  public:
    Processor(Token, std::unique_ptr<Impl> impl);

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace agentstream
