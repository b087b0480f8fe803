/**
 * @file report.cpp
 * @brief Comparison report: JSON form, file export and text view
 */

#include "jsondelta/report.hpp"

#include "jsondelta/canonical_json.hpp"
#include "jsondelta/input.hpp"

#include <cstdint>
#include <format>
#include <fstream>

namespace jsondelta::report {

namespace {

[[nodiscard]] jsondelta::Error invalid_report(std::string message)
{
    return Error::make("InvalidReport", std::move(message));
}

[[nodiscard]] jsondelta::Result<std::vector<std::string>> read_lines(const nlohmann::json& report,
                                                                     std::string_view field)
{
    const std::string key(field);
    if (!report.contains(key) || !report.at(key).is_array()) {
        return std::unexpected(
            invalid_report(std::format("Report field '{}' must be an array of strings", key)));
    }

    std::vector<std::string> lines;
    lines.reserve(report.at(key).size());
    for (const auto& item : report.at(key)) {
        if (!item.is_string()) {
            return std::unexpected(
                invalid_report(std::format("Report field '{}' contains a non-string entry", key)));
        }
        lines.push_back(item.get<std::string>());
    }
    return lines;
}

}  // namespace

nlohmann::json to_json(const delta::DeltaSummary& summary)
{
    return nlohmann::json{
        {  std::string(kAddedField),         summary.added},
        {std::string(kRemovedField),       summary.removed},
        {  std::string(kTotalField), summary.total_changes}
    };
}

jsondelta::Result<delta::DeltaSummary> from_json(const nlohmann::json& report)
{
    if (!report.is_object()) {
        return std::unexpected(invalid_report("Report must be a JSON object"));
    }

    auto added = read_lines(report, kAddedField);
    if (!added) {
        return std::unexpected(added.error());
    }
    auto removed = read_lines(report, kRemovedField);
    if (!removed) {
        return std::unexpected(removed.error());
    }

    const std::string total_key(kTotalField);
    if (!report.contains(total_key) || !report.at(total_key).is_number_integer()
        || report.at(total_key).get<std::int64_t>() < 0) {
        return std::unexpected(invalid_report(
            std::format("Report field '{}' must be a non-negative integer", total_key)));
    }
    const auto total = report.at(total_key).get<std::size_t>();
    if (total != added->size() + removed->size()) {
        return std::unexpected(invalid_report(
            std::format("Report total {} does not match {} added and {} removed lines",
                        total,
                        added->size(),
                        removed->size())));
    }

    return delta::DeltaSummary{.added = std::move(*added),
                               .removed = std::move(*removed),
                               .total_changes = total};
}

jsondelta::Result<std::string> serialize_report(const delta::DeltaSummary& summary)
{
    auto lines = canonical::canonicalize(JsonValue(to_json(summary)));
    if (!lines) {
        return std::unexpected(lines.error());
    }
    return canonical::join_lines(*lines) + "\n";
}

jsondelta::VoidResult write_report(const std::filesystem::path& path,
                                   const delta::DeltaSummary& summary)
{
    auto text = serialize_report(summary);
    if (!text) {
        return std::unexpected(text.error());
    }

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << *text;
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

jsondelta::Result<delta::DeltaSummary> read_report(const std::filesystem::path& path)
{
    auto document = input::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    return from_json(nlohmann::json(*document));
}

std::vector<std::string> render_text(const delta::DeltaSummary& summary)
{
    std::vector<std::string> out;
    out.reserve(summary.total_changes + 6);

    out.push_back(std::format("Total Changes: {}", summary.total_changes));
    out.emplace_back();
    out.emplace_back("Additions to JSON 2:");
    if (summary.added.empty()) {
        out.emplace_back("No additions found.");
    }
    for (const auto& line : summary.added) {
        out.push_back("+ " + line);
    }
    out.emplace_back();
    out.emplace_back("Removals from JSON 1:");
    if (summary.removed.empty()) {
        out.emplace_back("No removals found.");
    }
    for (const auto& line : summary.removed) {
        out.push_back("- " + line);
    }
    return out;
}

}  // namespace jsondelta::report
