// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/Parser.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace agentstream
{

/// @brief Decodes Sourcegraph Amp's `--stream-json` dialect.
///
/// Shares Claude's content-block layout; result messages select success or failure via
/// their subtype and report cache reads and writes separately.
class AmpParser: public Parser
{
  public:
    [[nodiscard]] auto parse(std::string_view line) -> Result<std::vector<Event>> override;
    [[nodiscard]] auto name() const -> std::string_view override;

    /// @brief Summarizes the input of an Amp tool call for display.
    ///
    /// Tool names are matched case-insensitively, so both "read_file" and "Read" resolve.
    [[nodiscard]] static auto summarizeInput(std::string_view toolName, nlohmann::json const& input)
        -> std::string;
};

} // namespace agentstream
