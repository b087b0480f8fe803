#pragma once

/**
 * @file input.hpp
 * @brief Parsing JSON documents from text and from files
 */

#include "jsondelta/common.hpp"

#include <filesystem>
#include <string_view>

namespace jsondelta::input {

/**
 * Parse JSON text (UTF-8)
 * @return Document; EmptyInput for blank text; ParseError with the parser's
 *         position detail for malformed text or invalid UTF-8
 */
[[nodiscard]] jsondelta::Result<JsonValue> parse_json_text(std::string_view text);

/**
 * Read and parse a JSON file
 * @return Document; IOError when the file cannot be read; otherwise the
 *         errors of parse_json_text, prefixed with the path
 */
[[nodiscard]] jsondelta::Result<JsonValue> read_json_file(const std::filesystem::path& path);

}  // namespace jsondelta::input
