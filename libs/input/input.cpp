/**
 * @file input.cpp
 * @brief Parsing JSON documents from text and from files
 */

#include "jsondelta/input.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <string>

namespace jsondelta::input {

namespace {

[[nodiscard]] bool is_blank(std::string_view text)
{
    return std::ranges::all_of(text, [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    });
}

}  // namespace

jsondelta::Result<JsonValue> parse_json_text(std::string_view text)
{
    if (is_blank(text)) {
        return std::unexpected(Error::make("EmptyInput", "No JSON content provided"));
    }
    try {
        return JsonValue::parse(text);
    } catch (const JsonValue::parse_error& ex) {
        return std::unexpected(Error::make(
            "ParseError",
            std::format("Invalid JSON format: {} (byte {})", ex.what(), ex.byte)));
    }
}

jsondelta::Result<JsonValue> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return std::unexpected(
            Error::make("IOError", "Failed to read JSON file: " + path.string()));
    }

    auto parsed = parse_json_text(content);
    if (!parsed) {
        return std::unexpected(
            Error::make(parsed.error().code, path.string() + ": " + parsed.error().message));
    }
    return parsed;
}

}  // namespace jsondelta::input
