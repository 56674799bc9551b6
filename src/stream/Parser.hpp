// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <stream/Event.hpp>

#include <string_view>
#include <vector>

namespace agentstream
{

/// @brief Abstract decoder for one agent's NDJSON dialect.
///
/// Implementations keep any cross-line state (such as cumulative cost) per instance,
/// so one parser must only ever see the output of a single agent invocation.
class Parser
{
  public:
    virtual ~Parser() = default;

    /// @brief Decodes one complete JSON line into zero or more events.
    ///
    /// Unrecognized message types yield a single EventType::Unknown event rather than an error.
    /// @param line One NDJSON line without its terminating newline.
    /// @return The decoded events, a ProtocolError for malformed JSON, or a DecodeError
    ///         when a known message has an unusable shape.
    [[nodiscard]] virtual auto parse(std::string_view line) -> Result<std::vector<Event>> = 0;

    /// @brief Returns the stable agent id, e.g. "claude".
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

} // namespace agentstream
