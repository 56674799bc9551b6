// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/Parser.hpp>

namespace agentstream
{

/// @brief Decodes OpenAI Codex CLI's `--json` event stream.
///
/// Codex reports work as items (command_execution, reasoning, agent_message) that are
/// started and completed inside turns; token usage arrives with turn.completed.
class CodexParser: public Parser
{
  public:
    [[nodiscard]] auto parse(std::string_view line) -> Result<std::vector<Event>> override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

} // namespace agentstream
