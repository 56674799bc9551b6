// SPDX-License-Identifier: Apache-2.0
#include "TextUtils.hpp"

#include <libunicode/utf8_grapheme_segmenter.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <format>

namespace agentstream::text
{

namespace
{
    constexpr auto Ellipsis = std::string_view { "..." };

    auto isSpace(char c) -> bool
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
    }

    // Pure ASCII has one cluster per byte, except CR LF.
    auto isSimpleAscii(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](char c) { return static_cast<unsigned char>(c) < 0x80; })
               && text.find("\r\n") == std::string_view::npos;
    }

    /// Byte offset of the cluster at index @p count, or text.size() if there are fewer clusters.
    auto clusterOffset(std::string_view text, std::size_t count) -> std::size_t
    {
        if (count == 0)
            return 0;
        if (isSimpleAscii(text))
            return std::min(count, text.size());

        auto segmenter = unicode::utf8_grapheme_segmenter(text);
        auto index = std::size_t { 0 };
        for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        {
            if (index == count)
                return static_cast<std::size_t>(it._clusterStart - text.data());
            ++index;
        }
        return text.size();
    }
} // namespace

auto graphemeCount(std::string_view text) -> std::size_t
{
    if (text.empty())
        return 0;

    if (isSimpleAscii(text))
        return text.size();

    auto segmenter = unicode::utf8_grapheme_segmenter(text);
    auto count = std::size_t { 0 };
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        ++count;
    return count;
}

auto graphemePrefix(std::string_view text, std::size_t count) -> std::string_view
{
    return text.substr(0, clusterOffset(text, count));
}

auto truncate(std::string_view text, std::size_t maxChars) -> std::string
{
    if (graphemeCount(text) <= maxChars)
        return std::string(text);

    if (maxChars <= Ellipsis.size())
        return std::string(graphemePrefix(text, maxChars));

    auto result = std::string(graphemePrefix(text, maxChars - Ellipsis.size()));
    result += Ellipsis;
    return result;
}

auto truncateFirstLine(std::string_view text, std::size_t maxChars) -> std::string
{
    auto const newline = text.find('\n');
    if (newline != std::string_view::npos)
        text = text.substr(0, newline);
    return truncate(text, maxChars);
}

auto countLinesChars(std::string_view text) -> LineStats
{
    if (text.empty())
        return {};

    return LineStats {
        .lines = static_cast<std::size_t>(std::ranges::count(text, '\n')) + 1,
        .chars = graphemeCount(text),
    };
}

auto trim(std::string_view text) -> std::string_view
{
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

auto splitLines(std::string_view text) -> std::vector<std::string_view>
{
    auto lines = std::vector<std::string_view> {};
    auto start = std::size_t { 0 };
    while (true)
    {
        auto const pos = text.find('\n', start);
        if (pos == std::string_view::npos)
        {
            lines.push_back(text.substr(start));
            return lines;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

auto toLower(std::string_view text) -> std::string
{
    auto result = std::string(text);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto clockTime(std::chrono::system_clock::time_point when) -> std::string
{
    auto const t = std::chrono::system_clock::to_time_t(when);
    auto tm = std::tm {};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return std::format("{:02}:{:02}:{:02}", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

} // namespace agentstream::text
