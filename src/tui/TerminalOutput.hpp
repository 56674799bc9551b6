// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace agentstream::tui
{

/// @brief RGB color representation.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

/// @brief Color representation: default, palette index, or true color (RGB).
///
/// Indexes 0-7 map to the basic ANSI colors, so they follow the user's terminal palette.
using Color = std::variant<std::monostate, std::uint8_t, RgbColor>;

/// @brief Text styling attributes for terminal output.
struct Style
{
    Color fg;                   ///< Foreground color.
    bool bold = false;          ///< Bold text.
    bool dim = false;           ///< Dim/faint text.
    bool italic = false;        ///< Italic text.
    bool underline = false;     ///< Underlined text.
};

/// @brief Buffered, optionally styled line writer on top of an output stream.
///
/// Text accumulates in an internal buffer until flush(), so one logical record reaches
/// the stream in a single write. With color disabled, styles are dropped and only the
/// plain text is emitted.
class TerminalOutput
{
  public:
    /// @param out Destination stream, typically std::cout.
    /// @param colorEnabled Whether SGR sequences are emitted.
    TerminalOutput(std::ostream& out, bool colorEnabled);

    /// @brief Writes text wrapped in the SGR sequences of @p style.
    void write(std::string_view text, Style const& style = {});

    /// @brief Writes raw text without styling.
    void writeRaw(std::string_view text);

    /// @brief Writes the buffer to the stream and flushes the stream.
    void flush();

  private:
    std::ostream& _out;
    bool _colorEnabled;
    std::string _buffer; ///< Output buffer for batching writes.

    /// @brief Appends SGR (Select Graphic Rendition) sequences for the given style.
    /// @return false if the style carries no attributes and nothing was appended.
    auto appendSgr(Style const& style) -> bool;
};

/// @brief Returns true when colored output should be used for the given file descriptor.
///
/// Colors are off when the descriptor is not a terminal, when NO_COLOR is set to any
/// value, or when TERM is "dumb".
[[nodiscard]] auto detectColorSupport(int fd) -> bool;

} // namespace agentstream::tui
