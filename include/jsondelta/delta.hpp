#pragma once

/**
 * @file delta.hpp
 * @brief Delta summary and the top-level JSON comparison
 *
 * Change counts are line-level: a value changed deep inside a document
 * counts as every canonical line its rendering touches, not as one change.
 */

#include "jsondelta/common.hpp"
#include "jsondelta/line_diff.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace jsondelta::delta {

struct DeltaSummary
{
    std::vector<std::string> added;    ///< Inserted lines, in target order
    std::vector<std::string> removed;  ///< Deleted lines, in source order
    std::size_t total_changes = 0;     ///< added.size() + removed.size()

    [[nodiscard]] bool operator==(const DeltaSummary&) const = default;
};

/**
 * Partition an edit script into added and removed lines
 */
[[nodiscard]] DeltaSummary summarize(const diff::EditScript& script);

/**
 * Compare two JSON documents line by line on their canonical renderings
 *
 * Pure: no I/O, no shared state; safe to call concurrently.
 * @return Summary, or EncodingError when either document cannot be
 *         canonicalized (no partial summary is produced)
 */
[[nodiscard]] jsondelta::Result<DeltaSummary> compare(const JsonValue& json1,
                                                      const JsonValue& json2);

}  // namespace jsondelta::delta
