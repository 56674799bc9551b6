// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <stream/Formatter.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace agentstream
{

/// @brief Agent section.
struct AgentConfig
{
    /// Agent executable whose output is decoded; a path or a bare name.
    std::string command = "claude";
};

/// @brief Rendering section, mirroring FormatterConfig.
struct FormatterSettings
{
    bool showText = true;
    bool showProgress = false;
    std::optional<bool> useColor; ///< Unset means detect from the terminal ("auto").
    bool useEmoji = true;
    bool verbose = false;
    bool showTimestamp = false;
    std::size_t maxOutputLines = 3;
    std::size_t maxOutputChars = 120;
};

/// @brief Raw NDJSON log section.
struct RawLogConfig
{
    bool enabled = false;
    std::string path = ".ralph/stream-json.log";
};

/// @brief Top-level application configuration.
struct AppConfig
{
    AgentConfig agent;
    FormatterSettings formatter;
    RawLogConfig rawLog;

    /// @brief File to read NDJSON from; empty reads stdin (set via --input).
    std::string inputPath;

    /// @brief Debug logging and a statistics line at exit (set via --verbose).
    bool verbose = false;
};

/// @brief Builds the formatter configuration for @p agentName from the settings.
[[nodiscard]] auto toFormatterConfig(FormatterSettings const& settings, std::string_view agentName)
    -> FormatterConfig;

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @return The configuration, or a ConfigError if the file cannot be read or has invalid values.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration, creating the parent directory if needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, AppConfig const& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
///
/// $XDG_CONFIG_HOME/agentstream or ~/.config/agentstream on Linux,
/// ~/Library/Application Support/agentstream on macOS, %APPDATA%\agentstream on Windows.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace agentstream
