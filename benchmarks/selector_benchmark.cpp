// anchorpoint-cpp benchmarks: measures throughput of resolution and set algebra.

#include <anchorpoint-cpp/anchorpoint.hpp>
#include <anchorpoint-cpp/json.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace anchorpoint_cpp;

// A long document of numbered sentences; each sentence occurs once, each
// word many times.
static auto make_document(std::size_t sentences) -> std::string {
    auto text = std::string{};
    for (std::size_t i = 0; i < sentences; ++i) {
        text += "Section " + std::to_string(i) + " of this title applies to original works. ";
    }
    return text;
}

static auto make_set(std::size_t n) -> PositionSet {
    auto positions = std::vector<PositionSelector>{};
    positions.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        // Every third interval touches its neighbour.
        const auto start = i * 10;
        positions.emplace_back(start, start + (i % 3 == 0 ? 10 : 6));
    }
    return PositionSet{std::move(positions)};
}

// =============================================================================
// Quote resolution
// =============================================================================

static void bm_resolve_unique_exact(benchmark::State& state) {
    const auto document = make_document(static_cast<std::size_t>(state.range(0)));
    const auto quote = QuoteSelector{"Section 42 of"};
    for (auto _ : state) {
        auto position = quote.resolve(document);
        benchmark::DoNotOptimize(position);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * document.size()));
}
BENCHMARK(bm_resolve_unique_exact)->Range(64, 4096);

static void bm_resolve_with_context(benchmark::State& state) {
    const auto document = make_document(static_cast<std::size_t>(state.range(0)));
    const auto quote = QuoteSelector{"original works", "Section 42 of this title applies to "};
    for (auto _ : state) {
        auto position = quote.resolve(document);
        benchmark::DoNotOptimize(position);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * document.size()));
}
BENCHMARK(bm_resolve_with_context)->Range(64, 4096);

static void bm_resolve_between_context(benchmark::State& state) {
    const auto document = make_document(static_cast<std::size_t>(state.range(0)));
    const auto quote = QuoteSelector{"", "Section 42 of", "Section 43 of"};
    for (auto _ : state) {
        auto position = quote.resolve(document);
        benchmark::DoNotOptimize(position);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * document.size()));
}
BENCHMARK(bm_resolve_between_context)->Range(64, 4096);

static void bm_unique_quote(benchmark::State& state) {
    const auto document = make_document(256);
    const auto start = document.find("original", document.find("Section 100 "));
    const auto position = PositionSelector{start, start + 8};
    for (auto _ : state) {
        auto quote = position.unique_quote(document);
        benchmark::DoNotOptimize(quote);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_unique_quote);

// =============================================================================
// Set algebra
// =============================================================================

static void bm_normalize(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto positions = std::vector<PositionSelector>{};
    for (std::size_t i = n; i > 0; --i) {
        positions.emplace_back(i * 10, i * 10 + 12);
    }
    for (auto _ : state) {
        auto set = PositionSet{positions};
        benchmark::DoNotOptimize(set);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_normalize)->Range(8, 4096);

static void bm_union(benchmark::State& state) {
    const auto a = make_set(static_cast<std::size_t>(state.range(0)));
    const auto b = a.shift(5);
    for (auto _ : state) {
        auto joined = a.union_with(b);
        benchmark::DoNotOptimize(joined);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_union)->Range(8, 1024);

static void bm_intersect(benchmark::State& state) {
    const auto a = make_set(static_cast<std::size_t>(state.range(0)));
    const auto b = a.shift(5);
    for (auto _ : state) {
        auto overlap = a.intersect(b);
        benchmark::DoNotOptimize(overlap);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_intersect)->Range(8, 256);

static void bm_add_margin(benchmark::State& state) {
    const auto set = make_set(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto wider = set.add_margin(2, 2);
        benchmark::DoNotOptimize(wider);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_add_margin)->Range(8, 1024);

// =============================================================================
// Rendering and serialization
// =============================================================================

static void bm_render(benchmark::State& state) {
    const auto document = make_document(512);
    const auto set = make_set(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto preview = TextSequence::render(document, set).preview();
        benchmark::DoNotOptimize(preview);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_render)->Range(8, 1024);

static void bm_json_round_trip(benchmark::State& state) {
    const auto set = make_set(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto loaded = load_position_set(dump(set));
        benchmark::DoNotOptimize(loaded);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_json_round_trip)->Range(8, 1024);
