// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcprt::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a SerializationError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::SerializationError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it == obj.end() || !it->is_string())
        return makeError(ErrorCode::ValidationError, std::format("Missing or invalid string field: {}", key));
    return it->get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

/// @brief Extracts an optional non-negative integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The value, or std::nullopt if missing or not a non-negative number.
[[nodiscard]] inline auto getUInt(const nlohmann::json& obj, std::string_view key) -> std::optional<uint64_t>
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it == obj.end())
        return std::nullopt;
    if (it->is_number_unsigned())
        return it->get<uint64_t>();
    if (it->is_number_integer() && it->get<int64_t>() >= 0)
        return static_cast<uint64_t>(it->get<int64_t>());
    if (it->is_number_float() && it->get<double>() >= 0.0)
        return static_cast<uint64_t>(it->get<double>());
    return std::nullopt;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

/// @brief Extracts the string elements of an optional array field. Non-string elements are skipped.
[[nodiscard]] inline auto getStringList(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it == obj.end() || !it->is_array())
        return result;

    for (const auto& element: *it)
    {
        if (element.is_string())
            result.push_back(element.get<std::string>());
    }
    return result;
}

/// @brief Extracts the string members of an optional object field. Non-string values are skipped.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
    auto const it = obj.is_object() ? obj.find(std::string(key)) : obj.end();
    if (it == obj.end() || !it->is_object())
        return result;

    for (const auto& [name, value]: it->items())
    {
        if (value.is_string())
            result[name] = value.get<std::string>();
    }
    return result;
}

} // namespace mcprt::json
