// SPDX-License-Identifier: Apache-2.0
#include <cstdlib>
#include <format>
#include <string_view>

#ifdef _WIN32
    #include <io.h>
#else
    #include <unistd.h>
#endif

#include <tui/TerminalOutput.hpp>

namespace agentstream::tui
{

TerminalOutput::TerminalOutput(std::ostream& out, bool colorEnabled): _out(out), _colorEnabled(colorEnabled)
{
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    if (text.empty())
        return;

    auto const styled = _colorEnabled && appendSgr(style);
    _buffer.append(text);
    if (styled)
        _buffer += "\033[0m";
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::flush()
{
    if (!_buffer.empty())
    {
        _out.write(_buffer.data(), static_cast<std::streamsize>(_buffer.size()));
        _buffer.clear();
    }
    _out.flush();
}

auto TerminalOutput::appendSgr(Style const& style) -> bool
{
    auto const isDefaultFg = std::holds_alternative<std::monostate>(style.fg);
    if (isDefaultFg && !style.bold && !style.dim && !style.italic && !style.underline)
        return false;

    _buffer += "\033[";
    auto needSemicolon = false;
    auto const appendSep = [&]() {
        if (needSemicolon)
            _buffer += ';';
        needSemicolon = true;
    };

    if (style.bold)
    {
        appendSep();
        _buffer += '1';
    }
    if (style.dim)
    {
        appendSep();
        _buffer += '2';
    }
    if (style.italic)
    {
        appendSep();
        _buffer += '3';
    }
    if (style.underline)
    {
        appendSep();
        _buffer += '4';
    }

    if (auto const* idx = std::get_if<std::uint8_t>(&style.fg))
    {
        appendSep();
        if (*idx < 8)
            _buffer += std::format("{}", 30 + *idx);
        else
            _buffer += std::format("38;5;{}", *idx);
    }
    else if (auto const* rgb = std::get_if<RgbColor>(&style.fg))
    {
        appendSep();
        _buffer += std::format("38;2;{};{};{}", rgb->r, rgb->g, rgb->b);
    }

    _buffer += 'm';
    return true;
}

auto detectColorSupport(int fd) -> bool
{
    if (std::getenv("NO_COLOR") != nullptr)
        return false;

    if (auto const* term = std::getenv("TERM"); term && std::string_view(term) == "dumb")
        return false;

#ifdef _WIN32
    return _isatty(fd) != 0;
#else
    return ::isatty(fd) != 0;
#endif
}

} // namespace agentstream::tui
