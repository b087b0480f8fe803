/**
 * @file line_diff.cpp
 * @brief Line-level shortest edit script (Myers O(ND), linear space)
 *
 * The search follows "An O(ND) Difference Algorithm and its Variations",
 * E. Myers, Algorithmica 1(2), 1986, section 4.2: forward and backward
 * searches meet at the middle snake, and the problem is split there.
 * The search always runs to a minimal result; no cost heuristics.
 * Lines that occur only on one side are marked up front and excluded
 * from the search, as GNU diff does.
 *
 * The search fixes the edit distance D. Among all alignments with D edits,
 * a DP over the diagonal band they share then picks one with the fewest
 * hunks (HunkMinimizer). When that band is too large, hunk boundaries are
 * normalized the way GNU diff does it (shift_boundaries) instead.
 */

#include "jsondelta/line_diff.hpp"

#include <algorithm>
#include <array>
#include <compare>
#include <cstdint>
#include <format>
#include <limits>
#include <ranges>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace jsondelta::diff {

namespace {

using canonical::CanonicalText;

using LineId = std::ptrdiff_t;

constexpr LineId kMaxLine = std::numeric_limits<LineId>::max();

/// Both texts with every distinct line replaced by a dense integer id.
struct InternedTexts
{
    std::vector<LineId> left;
    std::vector<LineId> right;
    std::size_t distinct = 0;
};

[[nodiscard]] InternedTexts intern_lines(const CanonicalText& a, const CanonicalText& b)
{
    std::unordered_map<std::string_view, LineId> ids;
    ids.reserve(a.size() + b.size());
    const auto id_of = [&ids](std::string_view line) {
        return ids.try_emplace(line, static_cast<LineId>(ids.size())).first->second;
    };

    InternedTexts texts;
    texts.left.reserve(a.size());
    for (const auto& line : a) {
        texts.left.push_back(id_of(line));
    }
    texts.right.reserve(b.size());
    for (const auto& line : b) {
        texts.right.push_back(id_of(line));
    }
    texts.distinct = ids.size();
    return texts;
}

[[nodiscard]] std::vector<std::size_t> count_ids(const std::vector<LineId>& ids,
                                                 std::size_t distinct)
{
    std::vector<std::size_t> counts(distinct, 0);
    for (const LineId id : ids) {
        ++counts[static_cast<std::size_t>(id)];
    }
    return counts;
}

/// Per-line change flags, with an unchanged sentinel at index -1 and size().
class ChangeMarks
{
public:
    explicit ChangeMarks(std::size_t size)
        : m_flags(size + 2, 0)
    {}

    char& operator[](LineId i) { return m_flags[static_cast<std::size_t>(i + 1)]; }
    char operator[](LineId i) const { return m_flags[static_cast<std::size_t>(i + 1)]; }

private:
    std::vector<char> m_flags;
};

/// Lines that take part in the search, with their positions in the full text.
struct SearchLines
{
    std::vector<LineId> ids;
    std::vector<LineId> positions;
};

// A line with no equal line in the other text is never kept: mark it changed
// now and leave it out of the search.
[[nodiscard]] SearchLines discard_unmatched(const std::vector<LineId>& ids,
                                            const std::vector<std::size_t>& other_counts,
                                            ChangeMarks& changed)
{
    SearchLines search;
    search.ids.reserve(ids.size());
    search.positions.reserve(ids.size());
    for (const auto& [i, id] : std::views::enumerate(ids)) {
        if (other_counts[static_cast<std::size_t>(id)] == 0) {
            changed[static_cast<LineId>(i)] = 1;
            continue;
        }
        search.ids.push_back(id);
        search.positions.push_back(static_cast<LineId>(i));
    }
    return search;
}

struct Midpoint
{
    LineId x;
    LineId y;
};

class MyersDiff
{
public:
    MyersDiff(const SearchLines& x,
              const SearchLines& y,
              ChangeMarks& x_changed,
              ChangeMarks& y_changed)
        : m_x(x)
        , m_y(y)
        , m_x_changed(x_changed)
        , m_y_changed(y_changed)
        , m_offset(static_cast<LineId>(y.ids.size()) + 1)
        , m_fdiag(x.ids.size() + y.ids.size() + 3)
        , m_bdiag(x.ids.size() + y.ids.size() + 3)
    {}

    /**
     * @brief Mark the changed lines of x[xoff, xlim) against y[yoff, ylim)
     *
     * Offsets index the search lines, not the full texts.
     */
    void compare_range(LineId xoff, LineId xlim, LineId yoff, LineId ylim);

private:
    const SearchLines& m_x;
    const SearchLines& m_y;
    ChangeMarks& m_x_changed;
    ChangeMarks& m_y_changed;
    LineId m_offset;              ///< Diagonal -(|y| + 1) maps to slot 0.
    std::vector<LineId> m_fdiag;  ///< Furthest x reached per diagonal, forward.
    std::vector<LineId> m_bdiag;  ///< Smallest x reached per diagonal, backward.

    LineId& fd(LineId d) { return m_fdiag[static_cast<std::size_t>(d + m_offset)]; }
    LineId& bd(LineId d) { return m_bdiag[static_cast<std::size_t>(d + m_offset)]; }

    [[nodiscard]] bool same(LineId x, LineId y) const
    {
        return m_x.ids[static_cast<std::size_t>(x)] == m_y.ids[static_cast<std::size_t>(y)];
    }

    void mark(const SearchLines& lines, ChangeMarks& changed, LineId index)
    {
        changed[lines.positions[static_cast<std::size_t>(index)]] = 1;
    }

    [[nodiscard]] Midpoint find_midpoint(LineId xoff, LineId xlim, LineId yoff, LineId ylim);
};

// Requires x[xoff] != y[yoff] and x[xlim - 1] != y[ylim - 1], both ranges non-empty.
Midpoint MyersDiff::find_midpoint(LineId xoff, LineId xlim, LineId yoff, LineId ylim)
{
    const LineId dmin = xoff - ylim;
    const LineId dmax = xlim - yoff;
    const LineId fmid = xoff - yoff;
    const LineId bmid = xlim - ylim;
    LineId fmin = fmid;
    LineId fmax = fmid;
    LineId bmin = bmid;
    LineId bmax = bmid;
    const bool odd = ((fmid - bmid) & 1) != 0;

    fd(fmid) = xoff;
    bd(bmid) = xlim;

    while (true) {
        // Extend the forward search by one edit on every active diagonal.
        if (fmin > dmin) {
            fd(--fmin - 1) = -1;
        } else {
            ++fmin;
        }
        if (fmax < dmax) {
            fd(++fmax + 1) = -1;
        } else {
            --fmax;
        }
        for (LineId d = fmax; d >= fmin; d -= 2) {
            const LineId tlo = fd(d - 1);
            const LineId thi = fd(d + 1);
            LineId x = tlo >= thi ? tlo + 1 : thi;
            LineId y = x - d;
            while (x < xlim && y < ylim && same(x, y)) {
                ++x;
                ++y;
            }
            fd(d) = x;
            if (odd && bmin <= d && d <= bmax && bd(d) <= x) {
                return Midpoint{.x = x, .y = y};
            }
        }

        // Same for the backward search.
        if (bmin > dmin) {
            bd(--bmin - 1) = kMaxLine;
        } else {
            ++bmin;
        }
        if (bmax < dmax) {
            bd(++bmax + 1) = kMaxLine;
        } else {
            --bmax;
        }
        for (LineId d = bmax; d >= bmin; d -= 2) {
            const LineId tlo = bd(d - 1);
            const LineId thi = bd(d + 1);
            LineId x = tlo < thi ? tlo : thi - 1;
            LineId y = x - d;
            while (x > xoff && y > yoff && same(x - 1, y - 1)) {
                --x;
                --y;
            }
            bd(d) = x;
            if (!odd && fmin <= d && d <= fmax && x <= fd(d)) {
                return Midpoint{.x = x, .y = y};
            }
        }
    }
}

void MyersDiff::compare_range(LineId xoff, LineId xlim, LineId yoff, LineId ylim)
{
    while (xoff < xlim && yoff < ylim && same(xoff, yoff)) {
        ++xoff;
        ++yoff;
    }
    while (xlim > xoff && ylim > yoff && same(xlim - 1, ylim - 1)) {
        --xlim;
        --ylim;
    }

    if (xoff == xlim) {
        while (yoff < ylim) {
            mark(m_y, m_y_changed, yoff++);
        }
    } else if (yoff == ylim) {
        while (xoff < xlim) {
            mark(m_x, m_x_changed, xoff++);
        }
    } else {
        const Midpoint mid = find_midpoint(xoff, xlim, yoff, ylim);
        compare_range(xoff, mid.x, yoff, mid.y);
        compare_range(mid.x, xlim, mid.y, ylim);
    }
}

/**
 * @brief Slide runs of changed lines to canonical positions
 *
 * A run can move by one line whenever the line it uncovers equals the line
 * it covers, which keeps the script equally short. Runs are first slid back
 * to merge with preceding runs, then forward to merge with following ones
 * (and as far forward as possible otherwise), and finally back again to
 * line up with a run in the other text when one is adjacent.
 */
void shift_boundaries(const std::vector<LineId>& equivs,
                      ChangeMarks& changed,
                      const ChangeMarks& other_changed)
{
    const auto eq = [&equivs](LineId i) { return equivs[static_cast<std::size_t>(i)]; };
    const LineId i_end = static_cast<LineId>(equivs.size());
    LineId i = 0;
    LineId j = 0;

    while (true) {
        // Find the next run, tracking the corresponding point in the other text.
        while (i < i_end && changed[i] == 0) {
            while (other_changed[j++] != 0) {}
            ++i;
        }
        if (i == i_end) {
            break;
        }

        LineId start = i;
        while (changed[++i] != 0) {}
        while (other_changed[j] != 0) {
            ++j;
        }

        LineId runlength = 0;
        LineId corresponding = i_end;
        do {
            runlength = i - start;

            while (start != 0 && eq(start - 1) == eq(i - 1)) {
                changed[--start] = 1;
                changed[--i] = 0;
                while (changed[start - 1] != 0) {
                    --start;
                }
                while (other_changed[--j] != 0) {}
            }

            // End of the run at the last point aligned with a run in the other text.
            corresponding = other_changed[j - 1] != 0 ? i : i_end;

            while (i != i_end && eq(start) == eq(i)) {
                changed[start++] = 0;
                changed[i++] = 1;
                while (changed[i] != 0) {
                    ++i;
                }
                while (other_changed[++j] != 0) {
                    corresponding = i;
                }
            }
        } while (runlength != i - start);

        while (corresponding < i) {
            changed[--start] = 1;
            changed[--i] = 0;
            while (other_changed[--j] != 0) {}
        }
    }
}

/// Alignment cost, compared edits first and hunks second.
struct AlignCost
{
    LineId edits = 0;
    LineId hunks = 0;

    auto operator<=>(const AlignCost&) const = default;
};

constexpr AlignCost kUnreachable{.edits = kMaxLine, .hunks = kMaxLine};

[[nodiscard]] AlignCost extend(AlignCost base, LineId edits, LineId hunks)
{
    if (base == kUnreachable) {
        return base;
    }
    return AlignCost{.edits = base.edits + edits, .hunks = base.hunks + hunks};
}

// Largest band (in cells) the hunk minimizer takes on; one byte per cell.
constexpr std::size_t kMaxMinimizerCells = std::size_t{1} << 24;

enum class Step : std::uint8_t { kMatch, kDelete, kInsert };

/**
 * @brief Among the shortest alignments of the search lines, find one with
 *        the fewest hunks
 *
 * Every shortest alignment with D edits stays between diagonals -inserts
 * and +deletes, so a suffix DP over that band is exact. The DP tracks
 * whether the previous step kept a line (state 0) or is inside a hunk
 * (state 1). Keeping a line straight after another kept line opens a hunk
 * when discarded lines sit between them in the full texts.
 *
 * Ties prefer keeping, then deleting, so hunks sit as late as possible.
 */
class HunkMinimizer
{
public:
    HunkMinimizer(const SearchLines& x,
                  const SearchLines& y,
                  LineId x_total,
                  LineId y_total,
                  LineId edits)
        : m_x(x)
        , m_y(y)
        , m_n(static_cast<LineId>(x.ids.size()))
        , m_m(static_cast<LineId>(y.ids.size()))
        , m_x_total(x_total)
        , m_y_total(y_total)
        , m_deletes((edits + m_n - m_m) / 2)
        , m_inserts((edits - m_n + m_m) / 2)
    {}

    /**
     * @brief Replace the marks of the search lines with a fewest-hunk alignment
     * @return false (marks untouched) when the band exceeds the cell budget
     */
    [[nodiscard]] bool apply(ChangeMarks& x_changed, ChangeMarks& y_changed);

private:
    const SearchLines& m_x;
    const SearchLines& m_y;
    LineId m_n;
    LineId m_m;
    LineId m_x_total;
    LineId m_y_total;
    LineId m_deletes;
    LineId m_inserts;
    std::vector<std::size_t> m_row_base;
    std::vector<std::uint8_t> m_steps;  ///< Step for state 0 in bits 0-1, state 1 in bits 2-3.

    [[nodiscard]] LineId lo(LineId i) const { return std::max<LineId>(0, i - m_deletes); }
    [[nodiscard]] LineId hi(LineId i) const { return std::min<LineId>(m_m, i + m_inserts); }

    [[nodiscard]] bool in_band(LineId i, LineId j) const
    {
        return i <= m_n && j <= m_m && lo(i) <= j && j <= hi(i);
    }

    [[nodiscard]] std::size_t cell(LineId i, LineId j) const
    {
        return m_row_base[static_cast<std::size_t>(i)] + static_cast<std::size_t>(j - lo(i));
    }

    [[nodiscard]] LineId x_pos(LineId i) const
    {
        return i < 0 ? -1 : m_x.positions[static_cast<std::size_t>(i)];
    }
    [[nodiscard]] LineId y_pos(LineId j) const
    {
        return j < 0 ? -1 : m_y.positions[static_cast<std::size_t>(j)];
    }

    // Keeping (i, j) right after keeping (i - 1, j - 1) skips discarded lines.
    [[nodiscard]] bool keep_opens_hunk(LineId i, LineId j) const
    {
        return x_pos(i) - x_pos(i - 1) > 1 || y_pos(j) - y_pos(j - 1) > 1;
    }

    [[nodiscard]] bool tail_has_discards() const
    {
        return m_x_total - 1 - x_pos(m_n - 1) > 0 || m_y_total - 1 - y_pos(m_m - 1) > 0;
    }

    [[nodiscard]] bool same(LineId i, LineId j) const
    {
        return m_x.ids[static_cast<std::size_t>(i)] == m_y.ids[static_cast<std::size_t>(j)];
    }
};

bool HunkMinimizer::apply(ChangeMarks& x_changed, ChangeMarks& y_changed)
{
    m_row_base.assign(static_cast<std::size_t>(m_n) + 1, 0);
    std::size_t cells = 0;
    for (LineId i = 0; i <= m_n; ++i) {
        m_row_base[static_cast<std::size_t>(i)] = cells;
        cells += static_cast<std::size_t>(hi(i) - lo(i) + 1);
        if (cells > kMaxMinimizerCells) {
            return false;
        }
    }
    m_steps.assign(cells, 0);

    const auto width = static_cast<std::size_t>(m_m) + 1;
    std::array<std::vector<AlignCost>, 2> next{std::vector<AlignCost>(width, kUnreachable),
                                               std::vector<AlignCost>(width, kUnreachable)};
    std::array<std::vector<AlignCost>, 2> cur = next;

    for (LineId i = m_n; i >= 0; --i) {
        for (LineId j = hi(i); j >= lo(i); --j) {
            const auto uj = static_cast<std::size_t>(j);
            std::uint8_t packed = 0;
            for (std::size_t state = 0; state < 2; ++state) {
                const LineId opens = state == 0 ? 1 : 0;
                if (i == m_n && j == m_m) {
                    cur[state][uj] =
                        AlignCost{.edits = 0, .hunks = state == 0 && tail_has_discards() ? 1 : 0};
                    continue;
                }

                AlignCost best = kUnreachable;
                Step step = Step::kMatch;
                if (i < m_n && j < m_m && same(i, j) && in_band(i + 1, j + 1)) {
                    best = extend(next[0][uj + 1], 0, state == 0 && keep_opens_hunk(i, j) ? 1 : 0);
                }
                if (i < m_n && in_band(i + 1, j)) {
                    const AlignCost cost = extend(next[1][uj], 1, opens);
                    if (cost < best) {
                        best = cost;
                        step = Step::kDelete;
                    }
                }
                if (j < m_m && in_band(i, j + 1)) {
                    const AlignCost cost = extend(cur[1][uj + 1], 1, opens);
                    if (cost < best) {
                        best = cost;
                        step = Step::kInsert;
                    }
                }
                cur[state][uj] = best;
                packed = static_cast<std::uint8_t>(packed
                                                   | (static_cast<unsigned>(step) << (2 * state)));
            }
            m_steps[cell(i, j)] = packed;
        }
        std::swap(cur, next);
    }

    if (next[0][0] == kUnreachable) {
        return false;
    }

    for (const LineId pos : m_x.positions) {
        x_changed[pos] = 1;
    }
    for (const LineId pos : m_y.positions) {
        y_changed[pos] = 1;
    }

    LineId i = 0;
    LineId j = 0;
    unsigned state = 0;
    while (i < m_n || j < m_m) {
        const auto step = static_cast<Step>((m_steps[cell(i, j)] >> (2 * state)) & 3U);
        switch (step) {
            case Step::kMatch:
                x_changed[x_pos(i++)] = 0;
                y_changed[y_pos(j++)] = 0;
                state = 0;
                break;
            case Step::kDelete:
                ++i;
                state = 1;
                break;
            case Step::kInsert:
                ++j;
                state = 1;
                break;
        }
    }
    return true;
}

[[nodiscard]] LineId count_marked(const SearchLines& lines, const ChangeMarks& changed)
{
    LineId marked = 0;
    for (const LineId pos : lines.positions) {
        marked += changed[pos] != 0 ? 1 : 0;
    }
    return marked;
}

[[nodiscard]] EditScript build_script(const CanonicalText& a,
                                      const CanonicalText& b,
                                      const ChangeMarks& a_changed,
                                      const ChangeMarks& b_changed)
{
    EditScript script;
    script.reserve(a.size() + b.size());

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() || j < b.size()) {
        while (i < a.size() && a_changed[static_cast<LineId>(i)] != 0) {
            script.push_back(EditOp{.kind = EditKind::kDelete, .line = a[i++]});
        }
        while (j < b.size() && b_changed[static_cast<LineId>(j)] != 0) {
            script.push_back(EditOp{.kind = EditKind::kInsert, .line = b[j++]});
        }
        // Unchanged lines pair up one to one.
        if (i < a.size() && j < b.size()) {
            script.push_back(EditOp{.kind = EditKind::kKeep, .line = a[i]});
            ++i;
            ++j;
        }
    }
    return script;
}

}  // namespace

EditScript diff(const CanonicalText& a, const CanonicalText& b)
{
    const InternedTexts texts = intern_lines(a, b);
    ChangeMarks a_changed(a.size());
    ChangeMarks b_changed(b.size());

    const SearchLines a_search =
        discard_unmatched(texts.left, count_ids(texts.right, texts.distinct), a_changed);
    const SearchLines b_search =
        discard_unmatched(texts.right, count_ids(texts.left, texts.distinct), b_changed);

    MyersDiff myers(a_search, b_search, a_changed, b_changed);
    myers.compare_range(0,
                        static_cast<LineId>(a_search.ids.size()),
                        0,
                        static_cast<LineId>(b_search.ids.size()));

    const LineId search_edits =
        count_marked(a_search, a_changed) + count_marked(b_search, b_changed);
    HunkMinimizer minimizer(a_search,
                            b_search,
                            static_cast<LineId>(a.size()),
                            static_cast<LineId>(b.size()),
                            search_edits);
    if (!minimizer.apply(a_changed, b_changed)) {
        // Band too wide: fall back to standard diff boundary shifting.
        shift_boundaries(texts.left, a_changed, b_changed);
        shift_boundaries(texts.right, b_changed, a_changed);
    }

    return build_script(a, b, a_changed, b_changed);
}

jsondelta::Result<CanonicalText> apply_script(const CanonicalText& a, const EditScript& script)
{
    CanonicalText target;
    target.reserve(script.size());

    std::size_t source_line = 0;
    for (const auto& [index, op] : std::views::enumerate(script)) {
        if (op.kind == EditKind::kInsert) {
            target.push_back(op.line);
            continue;
        }
        if (source_line >= a.size() || a[source_line] != op.line) {
            return std::unexpected(Error::make(
                "ScriptMismatch",
                std::format("Operation {} does not match source line {}", index, source_line + 1)));
        }
        if (op.kind == EditKind::kKeep) {
            target.push_back(op.line);
        }
        ++source_line;
    }

    if (source_line != a.size()) {
        return std::unexpected(Error::make(
            "ScriptMismatch",
            std::format("Script consumed {} of {} source lines", source_line, a.size())));
    }
    return target;
}

std::size_t count_hunks(const EditScript& script)
{
    std::size_t hunks = 0;
    bool in_hunk = false;
    for (const auto& op : script) {
        const bool changed = op.kind != EditKind::kKeep;
        if (changed && !in_hunk) {
            ++hunks;
        }
        in_hunk = changed;
    }
    return hunks;
}

}  // namespace jsondelta::diff
