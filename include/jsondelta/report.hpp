#pragma once

/**
 * @file report.hpp
 * @brief Comparison report: JSON form, file export and text view
 *
 * Report format (schemas/report.v1.schema.json):
 *   {
 *     "added_to_json2": [ <line>, ... ],
 *     "removed_from_json1": [ <line>, ... ],
 *     "total_changes": <integer>
 *   }
 */

#include "jsondelta/common.hpp"
#include "jsondelta/delta.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsondelta::report {

constexpr std::string_view kAddedField = "added_to_json2";
constexpr std::string_view kRemovedField = "removed_from_json1";
constexpr std::string_view kTotalField = "total_changes";

/// Schema file name under the schema directory.
constexpr std::string_view kReportSchemaFile = "report.v1.schema.json";

[[nodiscard]] nlohmann::json to_json(const delta::DeltaSummary& summary);

/**
 * Rebuild a summary from its report form
 * @return Summary, or InvalidReport for missing/mistyped fields or an
 *         inconsistent total
 */
[[nodiscard]] jsondelta::Result<delta::DeltaSummary> from_json(const nlohmann::json& report);

/**
 * Serialize a report as canonical JSON text, newline terminated
 */
[[nodiscard]] jsondelta::Result<std::string> serialize_report(const delta::DeltaSummary& summary);

[[nodiscard]] jsondelta::VoidResult write_report(const std::filesystem::path& path,
                                                 const delta::DeltaSummary& summary);

[[nodiscard]] jsondelta::Result<delta::DeltaSummary>
read_report(const std::filesystem::path& path);

/**
 * Human-readable differences view, one entry per output line
 */
[[nodiscard]] std::vector<std::string> render_text(const delta::DeltaSummary& summary);

}  // namespace jsondelta::report
