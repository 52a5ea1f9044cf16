// attributed-text-cpp benchmarks -- measures throughput of core operations.

#include <attributed-text-cpp/attributed_text.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace attributed_text_cpp;

namespace {

const auto g_bold = make_named_attribution("bold");
const auto g_italics = make_named_attribution("italics");

// Alternating bold/italic runs: bold on every even block of 8, italics
// straddling block boundaries.
auto make_styled(std::int64_t blocks) -> AttributedSpans {
    auto spans = AttributedSpans{};
    for (std::int64_t b = 0; b < blocks; ++b) {
        const auto base = b * 8;
        if (b % 2 == 0) spans.add_attribution(g_bold, base, base + 5);
        spans.add_attribution(g_italics, base + 6, base + 9);
    }
    return spans;
}

}  // namespace

// =============================================================================
// Mutation
// =============================================================================

static void bm_add_disjoint(benchmark::State& state) {
    const auto n = state.range(0);
    for (auto _ : state) {
        auto spans = AttributedSpans{};
        for (std::int64_t i = 0; i < n; ++i) {
            spans.add_attribution(g_bold, i * 4, i * 4 + 1);
        }
        benchmark::DoNotOptimize(spans);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_add_disjoint)->Range(8, 512);

static void bm_add_merging(benchmark::State& state) {
    const auto n = state.range(0);
    for (auto _ : state) {
        auto spans = AttributedSpans{};
        for (std::int64_t i = 0; i < n; ++i) {
            spans.add_attribution(g_bold, i * 2, i * 2 + 3);
        }
        benchmark::DoNotOptimize(spans);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_add_merging)->Range(8, 512);

static void bm_toggle(benchmark::State& state) {
    auto spans = make_styled(state.range(0));
    for (auto _ : state) {
        spans.toggle_attribution(g_bold, 3, 12);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_toggle)->Range(8, 512);

static void bm_remove_middle(benchmark::State& state) {
    const auto styled = make_styled(state.range(0));
    const auto middle = state.range(0) * 4;
    for (auto _ : state) {
        auto spans = styled;
        spans.remove_attribution(g_italics, middle - 20, middle + 20);
        benchmark::DoNotOptimize(spans);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_remove_middle)->Range(8, 512);

// =============================================================================
// Queries
// =============================================================================

static void bm_has_attribution_at(benchmark::State& state) {
    const auto spans = make_styled(state.range(0));
    const auto offset = state.range(0) * 4 + 2;
    for (auto _ : state) {
        auto found = spans.has_attribution_at(offset, *g_italics);
        benchmark::DoNotOptimize(found);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_has_attribution_at)->Range(8, 512);

static void bm_get_all_attributions_at(benchmark::State& state) {
    const auto spans = make_styled(state.range(0));
    const auto offset = state.range(0) * 4 + 7;
    for (auto _ : state) {
        auto found = spans.get_all_attributions_at(offset);
        benchmark::DoNotOptimize(found);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_get_all_attributions_at)->Range(8, 512);

static void bm_collapse(benchmark::State& state) {
    const auto spans = make_styled(state.range(0));
    const auto length = state.range(0) * 8 + 10;
    for (auto _ : state) {
        auto collapsed = spans.collapse_spans(length);
        benchmark::DoNotOptimize(collapsed);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(spans.size()));
}
BENCHMARK(bm_collapse)->Range(8, 4096);

// =============================================================================
// Splicing
// =============================================================================

static void bm_contract(benchmark::State& state) {
    const auto styled = make_styled(state.range(0));
    for (auto _ : state) {
        auto spans = styled;
        spans.contract_attributions(5, 7);
        benchmark::DoNotOptimize(spans);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(styled.size()));
}
BENCHMARK(bm_contract)->Range(8, 4096);

static void bm_copy_and_add_at(benchmark::State& state) {
    const auto styled = make_styled(state.range(0));
    const auto split = state.range(0) * 4;
    for (auto _ : state) {
        auto left = styled.copy_attribution_region(0, split - 1);
        left.add_at(styled.copy_attribution_region(split), split);
        benchmark::DoNotOptimize(left);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(styled.size()));
}
BENCHMARK(bm_copy_and_add_at)->Range(8, 4096);
