#pragma once

/**
 * @file common.hpp
 * @brief Common types: error information and Result aliases
 */

#include <expected>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace jsondelta {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/**
 * @brief Parsed JSON document
 *
 * Keys keep their source order; canonicalization sorts them.
 */
using JsonValue = nlohmann::ordered_json;

}  // namespace jsondelta
