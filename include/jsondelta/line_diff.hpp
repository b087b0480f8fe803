#pragma once

/**
 * @file line_diff.hpp
 * @brief Minimal line-level edit scripts between two canonical texts
 *
 * Lines are compared as atoms. The script is a shortest edit script
 * (Myers' O(ND) algorithm, linear-space variant). Among the shortest
 * scripts, one with the fewest hunks is chosen, with hunks placed as late
 * as possible on ties. Within each hunk every Delete precedes every Insert.
 *
 * Hunk minimization is exact while the diagonal band of the shortest
 * scripts stays within a fixed cell budget (2^24 cells). Beyond it, hunk
 * boundaries are shifted the way GNU diff does.
 */

#include "jsondelta/canonical_json.hpp"
#include "jsondelta/common.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace jsondelta::diff {

enum class EditKind {
    kKeep,    ///< Line present in both texts
    kInsert,  ///< Line only in the target text
    kDelete   ///< Line only in the source text
};

struct EditOp
{
    EditKind kind;
    std::string line;

    [[nodiscard]] bool operator==(const EditOp&) const = default;
};

using EditScript = std::vector<EditOp>;

/**
 * Compute the edit script transforming @p a into @p b
 */
[[nodiscard]] EditScript diff(const canonical::CanonicalText& a,
                              const canonical::CanonicalText& b);

/**
 * Replay a script against its source text
 *
 * Keep and Delete lines must match @p a in order, and the script must
 * consume all of @p a.
 * @return Target text (Keep and Insert lines in order), or ScriptMismatch
 */
[[nodiscard]] jsondelta::Result<canonical::CanonicalText>
apply_script(const canonical::CanonicalText& a, const EditScript& script);

/**
 * Number of maximal runs of Insert/Delete operations
 */
[[nodiscard]] std::size_t count_hunks(const EditScript& script);

}  // namespace jsondelta::diff
