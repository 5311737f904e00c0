// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <format>
#include <string>
#include <string_view>
#include <type_traits>

#include "Error.hpp"

namespace voicebridge::json
{

/// @brief Parses JSON text into a document.
/// @param input The JSON text.
/// @param source Names the input (usually a file path) in the error message.
/// @return The document, or a ConfigError describing where parsing failed.
[[nodiscard]] inline auto parse(std::string_view input, std::string_view source) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", source, e.what()));
    }
}

/// @brief Returns the object stored under key, or nullptr when it is absent or not an object.
[[nodiscard]] inline auto section(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_object())
        return nullptr;
    return &*it;
}

/// @brief Reads an optional scalar field.
///
/// A missing field, or one whose JSON type does not match T, yields fallback.
/// Integers are accepted where a floating-point value is expected.
template <typename T>
[[nodiscard]] auto valueOr(const nlohmann::json& obj, std::string_view key, T fallback) -> T
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end())
        return fallback;

    if constexpr (std::is_same_v<T, bool>)
        return it->is_boolean() ? it->template get<bool>() : fallback;
    else if constexpr (std::is_integral_v<T>)
        return it->is_number_integer() ? it->template get<T>() : fallback;
    else if constexpr (std::is_floating_point_v<T>)
        return it->is_number() ? it->template get<T>() : fallback;
    else
        return it->is_string() ? it->template get<std::string>() : fallback;
}

} // namespace voicebridge::json
