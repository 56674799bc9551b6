// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/Parser.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace agentstream
{

/// @brief Decodes Claude Code's `--output-format stream-json` dialect.
///
/// Message kinds are assistant (text and tool_use blocks), user (tool_result blocks),
/// result (final text, cumulative cost and usage) and system (session init).
class ClaudeParser: public Parser
{
  public:
    [[nodiscard]] auto parse(std::string_view line) -> Result<std::vector<Event>> override;
    [[nodiscard]] auto name() const -> std::string_view override;

    /// @brief Summarizes the input of a Claude tool call for display.
    /// @param toolName The tool name, e.g. "Read" or "Bash".
    /// @param input The tool_use input object.
    /// @return The primary argument, truncated per tool, or an empty string for unknown tools.
    [[nodiscard]] static auto summarizeInput(std::string_view toolName, nlohmann::json const& input)
        -> std::string;

  private:
    double _cumulativeCost = 0.0;
};

} // namespace agentstream
