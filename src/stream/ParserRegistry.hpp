// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/Parser.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentstream
{

/// @brief Names of the supported agent CLIs.
namespace agents
{
    constexpr auto Claude = std::string_view { "claude" };
    constexpr auto Codex = std::string_view { "codex" };
    constexpr auto Amp = std::string_view { "amp" };
} // namespace agents

/// @brief Where an agent writes its final answer when it does not print it to stdout.
struct OutputCapture
{
    std::filesystem::path file;
};

/// @brief Reduces an agent command to its lower-cased executable name.
///
/// "/usr/local/bin/Claude" and "C:\\Tools\\codex.exe" become "claude" and "codex".
[[nodiscard]] auto normalizeName(std::string_view agentCommand) -> std::string;

/// @brief Creates a fresh parser for the given agent command.
/// @return The parser, or nullptr if the agent has no structured-output dialect.
[[nodiscard]] auto parserFor(std::string_view agentCommand) -> std::unique_ptr<Parser>;

/// @brief Returns the flags that make the agent emit NDJSON, or an empty list if it cannot.
[[nodiscard]] auto outputFlags(std::string_view agentCommand) -> std::vector<std::string>;

/// @brief Returns the flags for plain text output, used for one-shot requests.
[[nodiscard]] auto textModeFlags(std::string_view agentCommand) -> std::vector<std::string>;

/// @brief Returns the output capture file of agents that write their answer to disk.
[[nodiscard]] auto outputCaptureFor(std::string_view agentCommand, std::filesystem::path const& baseDir)
    -> std::optional<OutputCapture>;

} // namespace agentstream
