// jsonpatch-cpp benchmarks — measures throughput of core operations.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace jsonpatch_cpp;

// An object holding `n` records, each with a few scalar members.
static auto make_doc(std::size_t n) -> Value {
    auto records = Array{};
    records.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        records.push_back(Object{
            {"id", static_cast<std::int64_t>(i)},
            {"name", "record-" + std::to_string(i)},
            {"active", i % 2 == 0},
        });
    }
    return Object{{"records", std::move(records)}};
}

// =============================================================================
// Path parsing
// =============================================================================

static void bm_parse_pointer(benchmark::State& state) {
    for (auto _ : state) {
        auto p = parse_pointer("/records/128/name~1alias/%20x");
        benchmark::DoNotOptimize(p);
    }
}
BENCHMARK(bm_parse_pointer);

static void bm_parse_query(benchmark::State& state) {
    for (auto _ : state) {
        auto p = parse_query("$/records/*/name");
        benchmark::DoNotOptimize(p);
    }
}
BENCHMARK(bm_parse_query);

// =============================================================================
// Resolution
// =============================================================================

static void bm_pointer_get(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto path = parse_pointer("/records/" + std::to_string(state.range(0) - 1) + "/name").value();
    for (auto _ : state) {
        auto v = pointer::get(doc, path);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(bm_pointer_get)->Arg(16)->Arg(1024);

static void bm_query_wildcard(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto query = parse_query("$/records/*/active").value();
    for (auto _ : state) {
        auto paths = query_paths(query, doc);
        benchmark::DoNotOptimize(paths);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_query_wildcard)->Arg(16)->Arg(1024);

// =============================================================================
// Patching
// =============================================================================

static void bm_apply_single_add(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto op = Operation::add("/records/-", Object{{"id", -1}});
    for (auto _ : state) {
        auto out = apply_operation(doc, op);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(bm_apply_single_add)->Arg(16)->Arg(1024);

static void bm_apply_in_place_bulk_replace(benchmark::State& state) {
    auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto op = Operation::replace("$/records/*/active", true);
    for (auto _ : state) {
        auto ok = apply_in_place(doc, op);
        benchmark::DoNotOptimize(ok);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_apply_in_place_bulk_replace)->Arg(16)->Arg(1024);

static void bm_apply_patch_sequence(benchmark::State& state) {
    const auto doc = make_doc(64);
    const auto ops = std::vector<Operation>{
        Operation::test("/records/0/id", 0),
        Operation::copy("/records/0", "/records/-"),
        Operation::move("/records/1", "/records/0"),
        Operation::remove("/records/2"),
        Operation::replace("/records/3/name", "renamed"),
    };
    for (auto _ : state) {
        auto out = apply_patches(doc, ops);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(ops.size()));
}
BENCHMARK(bm_apply_patch_sequence);

// =============================================================================
// Equality
// =============================================================================

static void bm_deep_equals(benchmark::State& state) {
    const auto a = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto b = a;
    for (auto _ : state) {
        benchmark::DoNotOptimize(equals(a, b));
    }
}
BENCHMARK(bm_deep_equals)->Arg(16)->Arg(1024);

BENCHMARK_MAIN();
