// docdelta-cpp benchmarks: measures throughput of diff, apply and the codec.

#include <docdelta-cpp/docdelta.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace docdelta_cpp;

// A mapping of `n` records, each a small nested mapping with a sequence.
static auto make_doc(std::size_t n, std::int64_t salt) -> Tree {
    auto root = Mapping{};
    for (std::size_t i = 0; i < n; ++i) {
        root.put("item" + std::to_string(i), Mapping{
            {"id", static_cast<std::int64_t>(i)},
            {"value", static_cast<std::int64_t>(i) * salt},
            {"tags", Sequence{"a", "b", "c"}},
        });
    }
    return Tree{std::move(root)};
}

// =============================================================================
// Diff
// =============================================================================

static void bm_diff_identical(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_doc(n, 1);
    for (auto _ : state) {
        auto patch = diff(doc, doc);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_identical)->Range(10, 1000);

static void bm_diff_all_changed(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto base = make_doc(n, 1);
    const auto target = make_doc(n, 2);
    for (auto _ : state) {
        auto patch = diff(base, target);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_all_changed)->Range(10, 1000);

// =============================================================================
// Apply
// =============================================================================

static void bm_apply(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto base = make_doc(n, 1);
    const auto patch = diff(base, make_doc(n, 2));
    for (auto _ : state) {
        auto result = docdelta_cpp::apply(base, patch);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * patch.size()));
}
BENCHMARK(bm_apply)->Range(10, 1000);

static void bm_apply_rollback(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto doc = make_doc(n, 1);
    auto patch = diff(doc, make_doc(n, 2));
    patch.emplace_back(RemoveOp{parse_pointer("/missing")});
    for (auto _ : state) {
        try {
            apply_in_place(doc, patch);
        } catch (const ApplyError& e) {
            benchmark::DoNotOptimize(e.index());
        }
    }
}
BENCHMARK(bm_apply_rollback)->Range(10, 1000);

// =============================================================================
// Codec
// =============================================================================

static void bm_encode(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)), 3);
    for (auto _ : state) {
        auto text = encode_document(doc);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(bm_encode)->Range(10, 1000);

static void bm_decode(benchmark::State& state) {
    const auto text = encode_document(make_doc(static_cast<std::size_t>(state.range(0)), 3));
    for (auto _ : state) {
        auto doc = decode_document(text);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_decode)->Range(10, 1000);

// =============================================================================
// Text boundary
// =============================================================================

static void bm_text_diff(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto base = encode_document(make_doc(n, 1));
    const auto target = encode_document(make_doc(n, 2));
    for (auto _ : state) {
        auto patch = text::diff(base, target);
        benchmark::DoNotOptimize(patch);
    }
}
BENCHMARK(bm_text_diff)->Range(10, 100);
