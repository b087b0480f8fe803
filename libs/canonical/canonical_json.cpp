/**
 * @file canonical_json.cpp
 * @brief Canonical line rendering of JSON values
 *
 * C++23 modernization:
 * - Using std::ranges::sort with a projection for key ordering
 * - Using std::views::enumerate for indexed iteration
 * - Using std::expected for encoding failures
 */

#include "jsondelta/canonical_json.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <ranges>
#include <string_view>

namespace jsondelta::canonical {

namespace {

[[nodiscard]] jsondelta::Error encoding_error(std::string_view path, std::string_view reason)
{
    return Error::make("EncodingError",
                       std::format("Cannot canonicalize value at {}: {}", path, reason));
}

[[nodiscard]] std::string indent(std::size_t depth)
{
    return std::string(depth * kIndentWidth, ' ');
}

/**
 * @brief Quote a string as an ASCII-only JSON literal
 *
 * Invalid UTF-8 is rejected (strict error handler), never replaced.
 */
[[nodiscard]] jsondelta::Result<std::string> quote_string(const std::string& s,
                                                          std::string_view path)
{
    try {
        return JsonValue(s).dump(-1, ' ', true, JsonValue::error_handler_t::strict);
    } catch (const JsonValue::type_error& ex) {
        return std::unexpected(encoding_error(path, ex.what()));
    }
}

class LineRenderer
{
public:
    [[nodiscard]] jsondelta::VoidResult render(const JsonValue& j,
                                               std::size_t depth,
                                               std::string head,
                                               std::string_view tail,
                                               const std::string& path);

    [[nodiscard]] CanonicalText take() && { return std::move(m_lines); }

private:
    CanonicalText m_lines;

    void emit(std::string head, std::string_view token, std::string_view tail)
    {
        head.append(token);
        head.append(tail);
        m_lines.push_back(std::move(head));
    }

    [[nodiscard]] jsondelta::VoidResult render_object(const JsonValue& j,
                                                      std::size_t depth,
                                                      std::string head,
                                                      std::string_view tail,
                                                      const std::string& path);

    [[nodiscard]] jsondelta::VoidResult render_array(const JsonValue& j,
                                                     std::size_t depth,
                                                     std::string head,
                                                     std::string_view tail,
                                                     const std::string& path);
};

// Every value_t alternative is handled explicitly; no default branch.
jsondelta::VoidResult LineRenderer::render(const JsonValue& j,
                                           std::size_t depth,
                                           std::string head,
                                           std::string_view tail,
                                           const std::string& path)
{
    switch (j.type()) {
        case JsonValue::value_t::object:
            return render_object(j, depth, std::move(head), tail, path);
        case JsonValue::value_t::array:
            return render_array(j, depth, std::move(head), tail, path);
        case JsonValue::value_t::null:
            emit(std::move(head), "null", tail);
            return {};
        case JsonValue::value_t::boolean:
            emit(std::move(head), j.get<bool>() ? "true" : "false", tail);
            return {};
        case JsonValue::value_t::number_integer:
        case JsonValue::value_t::number_unsigned:
            emit(std::move(head), j.dump(), tail);
            return {};
        case JsonValue::value_t::number_float: {
            if (!std::isfinite(j.get<double>())) {
                return std::unexpected(encoding_error(path, "non-finite number"));
            }
            emit(std::move(head), j.dump(), tail);
            return {};
        }
        case JsonValue::value_t::string: {
            auto quoted = quote_string(j.get_ref<const std::string&>(), path);
            if (!quoted) {
                return std::unexpected(quoted.error());
            }
            emit(std::move(head), *quoted, tail);
            return {};
        }
        case JsonValue::value_t::binary:
            return std::unexpected(encoding_error(path, "binary value has no JSON text form"));
        case JsonValue::value_t::discarded:
            return std::unexpected(encoding_error(path, "discarded value"));
    }
    return std::unexpected(encoding_error(path, "unknown value type"));
}

jsondelta::VoidResult LineRenderer::render_object(const JsonValue& j,
                                                  std::size_t depth,
                                                  std::string head,
                                                  std::string_view tail,
                                                  const std::string& path)
{
    if (depth >= kMaxNestingDepth) {
        return std::unexpected(encoding_error(
            path, std::format("nesting deeper than {} levels", kMaxNestingDepth)));
    }
    const auto& members = j.get_ref<const JsonValue::object_t&>();

    std::vector<const JsonValue::object_t::value_type*> sorted;
    sorted.reserve(members.size());
    for (const auto& member : members) {
        sorted.push_back(&member);
    }
    std::ranges::sort(sorted, {}, [](const auto* member) -> const std::string& {
        return member->first;
    });

    emit(std::move(head), "{", "");
    const std::string child_indent = indent(depth + 1);
    for (auto [i, member] : std::views::enumerate(sorted)) {
        auto key = quote_string(member->first, path);
        if (!key) {
            return std::unexpected(key.error());
        }
        const bool last = static_cast<std::size_t>(i) + 1 == sorted.size();
        if (auto result = render(member->second,
                                 depth + 1,
                                 child_indent + *key + ": ",
                                 last ? "" : ",",
                                 path + "." + member->first);
            !result) {
            return result;
        }
    }
    emit(indent(depth), "}", tail);
    return {};
}

jsondelta::VoidResult LineRenderer::render_array(const JsonValue& j,
                                                 std::size_t depth,
                                                 std::string head,
                                                 std::string_view tail,
                                                 const std::string& path)
{
    if (depth >= kMaxNestingDepth) {
        return std::unexpected(encoding_error(
            path, std::format("nesting deeper than {} levels", kMaxNestingDepth)));
    }
    const auto& elements = j.get_ref<const JsonValue::array_t&>();

    emit(std::move(head), "[", "");
    const std::string child_indent = indent(depth + 1);
    for (auto [i, elem] : std::views::enumerate(elements)) {
        const bool last = static_cast<std::size_t>(i) + 1 == elements.size();
        if (auto result = render(elem,
                                 depth + 1,
                                 child_indent,
                                 last ? "" : ",",
                                 std::format("{}[{}]", path, i));
            !result) {
            return result;
        }
    }
    emit(indent(depth), "]", tail);
    return {};
}

}  // namespace

jsondelta::Result<CanonicalText> canonicalize(const JsonValue& j)
{
    LineRenderer renderer;
    if (auto result = renderer.render(j, 0, std::string{}, "", "$"); !result) {
        return std::unexpected(result.error());
    }
    return std::move(renderer).take();
}

std::string join_lines(const CanonicalText& text)
{
    std::size_t total = 0;
    for (const auto& line : text) {
        total += line.size() + 1;
    }

    std::string joined;
    joined.reserve(total);
    for (const auto& [i, line] : std::views::enumerate(text)) {
        if (i != 0) {
            joined.push_back('\n');
        }
        joined.append(line);
    }
    return joined;
}

}  // namespace jsondelta::canonical
