/**
 * @file test_line_diff.cpp
 * @brief Line differ tests: edge cases, hunk layout, minimality
 */

#include "jsondelta/line_diff.hpp"

#include <algorithm>
#include <array>
#include <compare>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using jsondelta::canonical::CanonicalText;
using namespace jsondelta::diff;

namespace {

EditOp keep(std::string line)
{
    return EditOp{.kind = EditKind::kKeep, .line = std::move(line)};
}

EditOp ins(std::string line)
{
    return EditOp{.kind = EditKind::kInsert, .line = std::move(line)};
}

EditOp del(std::string line)
{
    return EditOp{.kind = EditKind::kDelete, .line = std::move(line)};
}

std::size_t edit_count(const EditScript& script)
{
    return static_cast<std::size_t>(std::ranges::count_if(
        script, [](const EditOp& op) { return op.kind != EditKind::kKeep; }));
}

// Quadratic LCS table; small inputs only.
std::size_t lcs_length(const CanonicalText& a, const CanonicalText& b)
{
    std::vector<std::vector<std::size_t>> table(a.size() + 1,
                                                std::vector<std::size_t>(b.size() + 1, 0));
    for (std::size_t i = a.size(); i-- > 0;) {
        for (std::size_t j = b.size(); j-- > 0;) {
            table[i][j] = a[i] == b[j] ? table[i + 1][j + 1] + 1
                                       : std::max(table[i + 1][j], table[i][j + 1]);
        }
    }
    return table[0][0];
}

CanonicalText random_text(std::mt19937& rng, std::size_t max_lines)
{
    std::uniform_int_distribution<std::size_t> length(0, max_lines);
    std::uniform_int_distribution<int> symbol(0, 4);
    CanonicalText text(length(rng));
    for (auto& line : text) {
        line = std::string("line-") + static_cast<char>('a' + symbol(rng));
    }
    return text;
}

/// Fewest edits, then fewest hunks.
struct AlignmentCost
{
    std::size_t edits = 0;
    std::size_t hunks = 0;

    auto operator<=>(const AlignmentCost&) const = default;
};

// Quadratic DP over all alignments; state 1 means inside a hunk.
AlignmentCost best_alignment(const CanonicalText& a, const CanonicalText& b)
{
    const AlignmentCost worst{.edits = a.size() + b.size() + 1, .hunks = 0};
    std::vector<std::vector<std::array<AlignmentCost, 2>>> table(
        a.size() + 1, std::vector<std::array<AlignmentCost, 2>>(b.size() + 1));

    for (std::size_t i = a.size() + 1; i-- > 0;) {
        for (std::size_t j = b.size() + 1; j-- > 0;) {
            for (std::size_t state = 0; state < 2; ++state) {
                if (i == a.size() && j == b.size()) {
                    table[i][j][state] = AlignmentCost{};
                    continue;
                }
                const std::size_t opens = state == 0 ? 1 : 0;
                AlignmentCost best = worst;
                if (i < a.size() && j < b.size() && a[i] == b[j]) {
                    best = std::min(best, table[i + 1][j + 1][0]);
                }
                if (i < a.size()) {
                    const auto& next = table[i + 1][j][1];
                    best = std::min(best, AlignmentCost{next.edits + 1, next.hunks + opens});
                }
                if (j < b.size()) {
                    const auto& next = table[i][j + 1][1];
                    best = std::min(best, AlignmentCost{next.edits + 1, next.hunks + opens});
                }
                table[i][j][state] = best;
            }
        }
    }
    return table[0][0][0];
}

}  // namespace

TEST(LineDiff, IdenticalTextsKeepEverything)
{
    CanonicalText a{"{", R"(  "x": 1)", "}"};
    auto script = diff(a, a);
    EXPECT_EQ(script, (EditScript{keep("{"), keep(R"(  "x": 1)"), keep("}")}));
    EXPECT_EQ(count_hunks(script), 0U);
}

TEST(LineDiff, BothEmpty)
{
    EXPECT_TRUE(diff({}, {}).empty());
}

TEST(LineDiff, EmptySourceInsertsAll)
{
    auto script = diff({}, {"a", "b"});
    EXPECT_EQ(script, (EditScript{ins("a"), ins("b")}));
}

TEST(LineDiff, EmptyTargetDeletesAll)
{
    auto script = diff({"a", "b"}, {});
    EXPECT_EQ(script, (EditScript{del("a"), del("b")}));
}

TEST(LineDiff, DisjointTextsDeleteThenInsert)
{
    auto script = diff({"a", "b", "c"}, {"x", "y"});
    EXPECT_EQ(script, (EditScript{del("a"), del("b"), del("c"), ins("x"), ins("y")}));
    EXPECT_EQ(count_hunks(script), 1U);
}

TEST(LineDiff, SingleChangedLine)
{
    CanonicalText a{"{", R"(  "x": 1)", "}"};
    CanonicalText b{"{", R"(  "x": 2)", "}"};
    auto script = diff(a, b);
    EXPECT_EQ(script,
              (EditScript{keep("{"), del(R"(  "x": 1)"), ins(R"(  "x": 2)"), keep("}")}));
}

TEST(LineDiff, ReplacedBlockIsOneHunk)
{
    auto script = diff({"1", "2", "3", "4"}, {"1", "x", "y", "4"});
    EXPECT_EQ(script,
              (EditScript{keep("1"), del("2"), del("3"), ins("x"), ins("y"), keep("4")}));
    EXPECT_EQ(count_hunks(script), 1U);
}

TEST(LineDiff, SeparateChangesAreSeparateHunks)
{
    auto script = diff({"a", "b", "c", "d", "e"}, {"a", "B", "c", "D", "e"});
    EXPECT_EQ(count_hunks(script), 2U);
    EXPECT_EQ(edit_count(script), 4U);
}

TEST(LineDiff, InsertedDuplicateSlidesForward)
{
    // The new "2" could pair with either copy; the run moves as far forward as it can.
    auto script = diff({"1", "2", "3"}, {"1", "2", "2", "3"});
    EXPECT_EQ(script, (EditScript{keep("1"), keep("2"), ins("2"), keep("3")}));
}

TEST(LineDiff, DeletedDuplicateSlidesForward)
{
    auto script = diff({"x", "y", "y", "z"}, {"x", "y", "z"});
    EXPECT_EQ(script, (EditScript{keep("x"), keep("y"), del("y"), keep("z")}));
}

TEST(LineDiff, KeptLinesChosenToMinimizeHunks)
{
    // Keeping the first "c" and the "d" after it leaves one leading and one
    // trailing hunk; the other equally short alignments split into three.
    CanonicalText a{"d", "c", "d", "c", "a", "d", "a", "c", "b", "c", "b"};
    CanonicalText b{"c", "d"};
    auto script = diff(a, b);
    EXPECT_EQ(script,
              (EditScript{del("d"),
                          keep("c"),
                          keep("d"),
                          del("c"),
                          del("a"),
                          del("d"),
                          del("a"),
                          del("c"),
                          del("b"),
                          del("c"),
                          del("b")}));
    EXPECT_EQ(count_hunks(script), 2U);
}

TEST(LineDiff, HunksAcrossDiscardedLinesAreCounted)
{
    // "x" and "y" occur on one side only; keeping "k" on both sides of them
    // would still leave them as a hunk in the middle.
    auto script = diff({"k", "x", "k", "k"}, {"k", "k", "y"});
    EXPECT_EQ(edit_count(script), 3U);
    EXPECT_EQ(count_hunks(script), 2U);
}

TEST(LineDiff, ApplyScriptReconstructsTarget)
{
    CanonicalText a{"{", R"(  "list": [)", "    1,", "    2,", "    3", "  ]", "}"};
    CanonicalText b{"{", R"(  "list": [)", "    1,", "    3,", "    2", "  ]", "}"};
    auto rebuilt = apply_script(a, diff(a, b));
    ASSERT_TRUE(rebuilt);
    EXPECT_EQ(*rebuilt, b);
}

TEST(LineDiff, ApplyScriptRejectsForeignSource)
{
    auto script = diff({"a", "b"}, {"a", "c"});

    auto mismatch = apply_script({"z", "b"}, script);
    ASSERT_FALSE(mismatch);
    EXPECT_EQ(mismatch.error().code, "ScriptMismatch");

    auto too_long = apply_script({"a", "b", "extra"}, script);
    ASSERT_FALSE(too_long);
    EXPECT_EQ(too_long.error().code, "ScriptMismatch");
}

TEST(LineDiff, MinimalAgainstLcsTable)
{
    std::mt19937 rng(20'240'601);
    for (int round = 0; round < 300; ++round) {
        auto a = random_text(rng, 24);
        auto b = random_text(rng, 24);
        auto script = diff(a, b);

        const std::size_t expected = a.size() + b.size() - 2 * lcs_length(a, b);
        ASSERT_EQ(edit_count(script), expected) << "round " << round;

        auto rebuilt = apply_script(a, script);
        ASSERT_TRUE(rebuilt) << "round " << round;
        ASSERT_EQ(*rebuilt, b) << "round " << round;
    }
}

TEST(LineDiff, FewestHunksAgainstExhaustiveTable)
{
    std::mt19937 rng(4'242);
    for (int round = 0; round < 400; ++round) {
        auto a = random_text(rng, 16);
        auto b = random_text(rng, 16);
        auto script = diff(a, b);

        const AlignmentCost best = best_alignment(a, b);
        ASSERT_EQ(edit_count(script), best.edits) << "round " << round;
        ASSERT_EQ(count_hunks(script), best.hunks) << "round " << round;
    }
}

TEST(LineDiff, DeletesPrecedeInsertsWithinHunk)
{
    std::mt19937 rng(7);
    for (int round = 0; round < 100; ++round) {
        auto script = diff(random_text(rng, 16), random_text(rng, 16));
        for (std::size_t i = 1; i < script.size(); ++i) {
            ASSERT_FALSE(script[i - 1].kind == EditKind::kInsert
                         && script[i].kind == EditKind::kDelete)
                << "round " << round << " op " << i;
        }
    }
}

TEST(LineDiff, SymmetricEditCount)
{
    std::mt19937 rng(99);
    for (int round = 0; round < 100; ++round) {
        auto a = random_text(rng, 20);
        auto b = random_text(rng, 20);
        EXPECT_EQ(edit_count(diff(a, b)), edit_count(diff(b, a))) << "round " << round;
    }
}

TEST(LineDiff, LargeTextWithFewChanges)
{
    CanonicalText a;
    for (int i = 0; i < 40'000; ++i) {
        a.push_back("    " + std::to_string(i) + ",");
    }
    CanonicalText b = a;
    b[1'000] = "    changed-1,";
    b[20'000] = "    changed-2,";
    b.insert(b.begin() + 30'000, "    inserted,");
    b.erase(b.begin() + 35'000);

    auto script = diff(a, b);
    EXPECT_EQ(edit_count(script), 6U);
    EXPECT_EQ(count_hunks(script), 4U);

    auto rebuilt = apply_script(a, script);
    ASSERT_TRUE(rebuilt);
    EXPECT_EQ(*rebuilt, b);
}
