// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

namespace agentstream::tui
{

/// @brief Named styles used when rendering an agent transcript.
struct Theme
{
    Style accent;    ///< Tool markers and headings.
    Style toolName;  ///< Tool names and the active todo item.
    Style toolInput; ///< Tool argument summaries.
    Style text;      ///< Assistant text.
    Style success;   ///< Success markers and completed items.
    Style error;     ///< Error markers and error output.
    Style muted;     ///< Secondary details, statistics, progress messages.
};

/// @brief Returns the default theme built from the basic ANSI palette.
///
/// Palette colors follow the user's terminal scheme, so one theme fits dark and light backgrounds.
[[nodiscard]] auto ansiTheme() -> Theme;

} // namespace agentstream::tui
