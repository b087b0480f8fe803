/**
 * @file delta.cpp
 * @brief Delta summary and the top-level JSON comparison
 */

#include "jsondelta/delta.hpp"

#include "jsondelta/canonical_json.hpp"

namespace jsondelta::delta {

DeltaSummary summarize(const diff::EditScript& script)
{
    DeltaSummary summary;
    for (const auto& op : script) {
        switch (op.kind) {
            case diff::EditKind::kInsert:
                summary.added.push_back(op.line);
                break;
            case diff::EditKind::kDelete:
                summary.removed.push_back(op.line);
                break;
            case diff::EditKind::kKeep:
                break;
        }
    }
    summary.total_changes = summary.added.size() + summary.removed.size();
    return summary;
}

jsondelta::Result<DeltaSummary> compare(const JsonValue& json1, const JsonValue& json2)
{
    auto left = canonical::canonicalize(json1);
    if (!left) {
        return std::unexpected(
            Error::make(left.error().code, "First document: " + left.error().message));
    }
    auto right = canonical::canonicalize(json2);
    if (!right) {
        return std::unexpected(
            Error::make(right.error().code, "Second document: " + right.error().message));
    }
    return summarize(diff::diff(*left, *right));
}

}  // namespace jsondelta::delta
