#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical line rendering of JSON values for line-level comparison
 *
 * Rules:
 * - Object keys in ascending byte order, regardless of source order
 * - Array elements in source order
 * - Two spaces of indentation per nesting level
 * - Every container multi-line: the opening bracket ends the line that holds
 *   the key, one member per line, the closing bracket on its own line
 *   (empty containers included)
 * - Members separated by a trailing ',', key separator ": "
 * - Strings escaped to ASCII (\uXXXX, lowercase hex, surrogate pairs above
 *   U+FFFF); floats in shortest round-trip form
 */

#include "jsondelta/common.hpp"

#include <string>
#include <vector>

namespace jsondelta::canonical {

/// Spaces added per nesting level.
constexpr std::size_t kIndentWidth = 2;

/// Deepest container nesting accepted; the top-level value is level 1.
constexpr std::size_t kMaxNestingDepth = 1000;

/// Rendered lines, without line terminators.
using CanonicalText = std::vector<std::string>;

/**
 * Render a JSON value into canonical lines
 * @param j JSON value
 * @return Canonical lines, or EncodingError naming the offending JSON path
 *         (non-finite number, binary value, invalid UTF-8 string, containers
 *         nested deeper than kMaxNestingDepth)
 */
[[nodiscard]] jsondelta::Result<CanonicalText> canonicalize(const JsonValue& j);

/**
 * Join canonical lines with '\n' (no trailing newline)
 */
[[nodiscard]] std::string join_lines(const CanonicalText& text);

}  // namespace jsondelta::canonical
