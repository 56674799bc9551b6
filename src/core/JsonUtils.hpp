// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace agentstream::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Checks JSON syntax without building a document.
[[nodiscard]] inline auto isValid(std::string_view input) -> bool
{
    return nlohmann::json::accept(input);
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing or not a string.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue = {}) -> std::string
{
    if (!obj.is_object())
        return std::string(defaultValue);
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
[[nodiscard]] inline auto getInt64Or(const nlohmann::json& obj, std::string_view key, std::int64_t defaultValue)
    -> std::int64_t
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_number_integer())
        return it->get<std::int64_t>();
    return defaultValue;
}

/// @brief Extracts an optional floating point field from a JSON object.
[[nodiscard]] inline auto getDoubleOr(const nlohmann::json& obj, std::string_view key, double defaultValue)
    -> double
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_number())
        return it->get<double>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

/// @brief Returns a pointer to an object-valued field, or nullptr when missing or null.
///
/// A field that is present but holds a non-object value is reported as a DecodeError.
[[nodiscard]] inline auto getObject(const nlohmann::json& obj, std::string_view key)
    -> Result<const nlohmann::json*>
{
    auto const it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;
    if (!it->is_object())
        return makeError(ErrorCode::DecodeError, std::format("Field '{}' is not an object", key));
    return &*it;
}

/// @brief Returns a pointer to an array-valued field, or nullptr when missing or null.
///
/// A field that is present but holds a non-array value is reported as a DecodeError.
[[nodiscard]] inline auto getArray(const nlohmann::json& obj, std::string_view key)
    -> Result<const nlohmann::json*>
{
    auto const it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;
    if (!it->is_array())
        return makeError(ErrorCode::DecodeError, std::format("Field '{}' is not an array", key));
    return &*it;
}

} // namespace agentstream::json
