// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace agentstream::text
{

/// @brief Line and character totals of a block of text.
struct LineStats
{
    std::size_t lines = 0;
    std::size_t chars = 0; ///< Grapheme clusters, not bytes.
};

/// @brief Returns the number of grapheme clusters in a UTF-8 string.
[[nodiscard]] auto graphemeCount(std::string_view text) -> std::size_t;

/// @brief Returns the longest prefix of @p text holding at most @p count grapheme clusters.
[[nodiscard]] auto graphemePrefix(std::string_view text, std::size_t count) -> std::string_view;

/// @brief Shortens text to at most @p maxChars grapheme clusters, ending in "..." when cut.
///
/// Never splits a UTF-8 sequence or a combined character.
[[nodiscard]] auto truncate(std::string_view text, std::size_t maxChars) -> std::string;

/// @brief Like truncate(), but only considers the first line of @p text.
[[nodiscard]] auto truncateFirstLine(std::string_view text, std::size_t maxChars) -> std::string;

/// @brief Counts lines (newline count + 1) and characters; both zero for empty text.
[[nodiscard]] auto countLinesChars(std::string_view text) -> LineStats;

/// @brief Strips leading and trailing ASCII whitespace.
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

/// @brief Splits text on '\n'. An empty input yields one empty element.
[[nodiscard]] auto splitLines(std::string_view text) -> std::vector<std::string_view>;

/// @brief ASCII lower-casing.
[[nodiscard]] auto toLower(std::string_view text) -> std::string;

/// @brief Formats a wall-clock time point as local HH:MM:SS.
[[nodiscard]] auto clockTime(std::chrono::system_clock::time_point when) -> std::string;

} // namespace agentstream::text
