// SPDX-License-Identifier: Apache-2.0
#include <tui/Theme.hpp>

namespace agentstream::tui
{

namespace
{
    // Basic ANSI palette indexes
    constexpr std::uint8_t Red = 1;
    constexpr std::uint8_t Green = 2;
    constexpr std::uint8_t Yellow = 3;
    constexpr std::uint8_t Cyan = 6;
    constexpr std::uint8_t White = 7;
} // namespace

auto ansiTheme() -> Theme
{
    auto theme = Theme {};

    theme.accent.fg = Cyan;
    theme.toolName.fg = Yellow;
    theme.toolInput.fg = White;
    theme.text.fg = White;
    theme.success.fg = Green;
    theme.error.fg = Red;
    theme.error.bold = true;
    theme.muted.dim = true;

    return theme;
}

} // namespace agentstream::tui
