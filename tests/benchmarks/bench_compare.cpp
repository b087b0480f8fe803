// bench_compare.cpp - canonicalization and line diff benchmarks
//
// Documents are sized to render tens of thousands of lines, with few
// changes between the two sides (the common case for configuration and
// data snapshots).

#include <jsondelta/canonical_json.hpp>
#include <jsondelta/delta.hpp>
#include <jsondelta/line_diff.hpp>

#include <string>

#include <benchmark/benchmark.h>

namespace {

using Json = jsondelta::JsonValue;

// ===========================================================================
// Test data
// ===========================================================================

// One record renders as 9 lines.
Json create_document(int records)
{
    Json items = Json::array();
    for (int i = 0; i < records; ++i) {
        items.push_back({
            {    "id",                               i},
            {  "name", "record_" + std::to_string(i)},
            {"values",           Json::array({i, i + 1, i + 2})},
        });
    }
    return Json{
        {"schema_version", "bench.v1"},
        {         "items",      items},
    };
}

// Same document with every 500th record edited.
Json create_edited_document(int records)
{
    Json doc = create_document(records);
    for (int i = 0; i < records; i += 500) {
        doc["items"][static_cast<std::size_t>(i)]["name"] = "edited_" + std::to_string(i);
    }
    return doc;
}

// ===========================================================================
// Benchmarks
// ===========================================================================

static void BM_Canonicalize(benchmark::State& state)
{
    auto json = create_document(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto result = jsondelta::canonical::canonicalize(json);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Canonicalize)->Arg(1'000)->Arg(5'000);

static void BM_LineDiff_FewChanges(benchmark::State& state)
{
    const int records = static_cast<int>(state.range(0));
    auto left = jsondelta::canonical::canonicalize(create_document(records));
    auto right = jsondelta::canonical::canonicalize(create_edited_document(records));
    if (!left || !right) {
        state.SkipWithError("canonicalization failed");
        return;
    }
    for (auto _ : state) {
        auto script = jsondelta::diff::diff(*left, *right);
        benchmark::DoNotOptimize(script);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(left->size()));
}
BENCHMARK(BM_LineDiff_FewChanges)->Arg(1'000)->Arg(5'000)->Unit(benchmark::kMillisecond);

static void BM_LineDiff_Disjoint(benchmark::State& state)
{
    jsondelta::canonical::CanonicalText left;
    jsondelta::canonical::CanonicalText right;
    for (int64_t i = 0; i < state.range(0); ++i) {
        left.push_back("left_" + std::to_string(i));
        right.push_back("right_" + std::to_string(i));
    }
    for (auto _ : state) {
        auto script = jsondelta::diff::diff(left, right);
        benchmark::DoNotOptimize(script);
    }
}
BENCHMARK(BM_LineDiff_Disjoint)->Arg(1'000)->Arg(10'000)->Unit(benchmark::kMillisecond);

static void BM_Compare(benchmark::State& state)
{
    const int records = static_cast<int>(state.range(0));
    auto left = create_document(records);
    auto right = create_edited_document(records);
    for (auto _ : state) {
        auto summary = jsondelta::delta::compare(left, right);
        benchmark::DoNotOptimize(summary);
    }
}
BENCHMARK(BM_Compare)->Arg(5'000)->Unit(benchmark::kMillisecond);

}  // namespace

BENCHMARK_MAIN();
