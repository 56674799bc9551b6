// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace agentstream
{

namespace
{
    auto readUseColor(nlohmann::json const& formatter) -> Result<std::optional<bool>>
    {
        auto const it = formatter.find("useColor");
        if (it == formatter.end() || it->is_null())
            return std::nullopt;
        if (it->is_boolean())
            return it->get<bool>();
        if (it->is_string() && it->get<std::string>() == "auto")
            return std::nullopt;
        return makeError(ErrorCode::ConfigError,
                         std::format("formatter.useColor must be \"auto\" or a boolean, got {}", it->dump()));
    }

    auto readSize(nlohmann::json const& obj, std::string_view key, std::size_t defaultValue)
        -> Result<std::size_t>
    {
        auto const value = json::getInt64Or(obj, key, static_cast<std::int64_t>(defaultValue));
        if (value < 0)
            return makeError(ErrorCode::ConfigError, std::format("formatter.{} must not be negative", key));
        return static_cast<std::size_t>(value);
    }
} // namespace

auto toFormatterConfig(FormatterSettings const& settings, std::string_view agentName) -> FormatterConfig
{
    auto config = defaultFormatterConfig(agentName);
    config.showText = settings.showText;
    config.showProgress = settings.showProgress;
    if (settings.useColor)
        config.useColor = *settings.useColor;
    config.useEmoji = settings.useEmoji;
    config.verbose = settings.verbose;
    config.showTimestamp = settings.showTimestamp;
    config.maxOutputLines = settings.maxOutputLines;
    config.maxOutputChars = settings.maxOutputChars;
    return config;
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\agentstream";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/agentstream";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/agentstream";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/agentstream";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid config file {}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto config = AppConfig {};

    // Agent section
    if (auto const it = root.find("agent"); it != root.end() && it->is_object())
        config.agent.command = json::getStringOr(*it, "command", config.agent.command);

    // Formatter section
    if (auto const it = root.find("formatter"); it != root.end() && it->is_object())
    {
        auto const& formatter = *it;
        auto& settings = config.formatter;
        settings.showText = json::getBoolOr(formatter, "showText", settings.showText);
        settings.showProgress = json::getBoolOr(formatter, "showProgress", settings.showProgress);
        settings.useEmoji = json::getBoolOr(formatter, "useEmoji", settings.useEmoji);
        settings.verbose = json::getBoolOr(formatter, "verbose", settings.verbose);
        settings.showTimestamp = json::getBoolOr(formatter, "showTimestamp", settings.showTimestamp);

        auto useColor = readUseColor(formatter);
        if (!useColor)
            return std::unexpected(useColor.error());
        settings.useColor = *useColor;

        auto maxLines = readSize(formatter, "maxOutputLines", settings.maxOutputLines);
        if (!maxLines)
            return std::unexpected(maxLines.error());
        settings.maxOutputLines = *maxLines;

        auto maxChars = readSize(formatter, "maxOutputChars", settings.maxOutputChars);
        if (!maxChars)
            return std::unexpected(maxChars.error());
        settings.maxOutputChars = *maxChars;
    }

    // Raw log section
    if (auto const it = root.find("rawLog"); it != root.end() && it->is_object())
    {
        config.rawLog.enabled = json::getBoolOr(*it, "enabled", config.rawLog.enabled);
        config.rawLog.path = json::getStringOr(*it, "path", config.rawLog.path);
    }

    return config;
}

auto saveConfigToFile(std::string_view path, AppConfig const& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["agent"] = { { "command", config.agent.command } };

    auto formatter = nlohmann::json::object();
    auto const& settings = config.formatter;
    formatter["showText"] = settings.showText;
    formatter["showProgress"] = settings.showProgress;
    if (settings.useColor)
        formatter["useColor"] = *settings.useColor;
    else
        formatter["useColor"] = "auto";
    formatter["useEmoji"] = settings.useEmoji;
    formatter["verbose"] = settings.verbose;
    formatter["showTimestamp"] = settings.showTimestamp;
    formatter["maxOutputLines"] = settings.maxOutputLines;
    formatter["maxOutputChars"] = settings.maxOutputChars;
    root["formatter"] = std::move(formatter);

    root["rawLog"] = { { "enabled", config.rawLog.enabled }, { "path", config.rawLog.path } };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::ConfigError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace agentstream
