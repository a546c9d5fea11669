// punctuation-cpp benchmarks -- measures throughput of core operations.

#include <punctuation-cpp/punctuation.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace punctuation_cpp;

static auto make_lines(std::size_t count) -> std::vector<std::string> {
    const auto shapes = std::vector<std::string>{
        "hello, my world!",
        "the quick brown fox jumps over the lazy dog",
        "\xC2\xBF" "Qu\xC3\xA9 tal? \xC2\xA1" "Bien!",
        "It costs 1,000.50 dollars; cheap.",
        "...",
        "He said: \xC2\xAByes\xC2\xBB.",
    };
    auto lines = std::vector<std::string>{};
    lines.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        lines.push_back(shapes[i % shapes.size()]);
    }
    return lines;
}

// =============================================================================
// Detection and removal
// =============================================================================

static void bm_detect(benchmark::State& state) {
    auto matcher = MarkMatcher{default_marks()};
    const auto line = std::string{"one; two: three, four... five?! \xC2\xA1six!"};
    for (auto _ : state) {
        benchmark::DoNotOptimize(matcher.detect(line));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(line.size()));
}
BENCHMARK(bm_detect);

static void bm_remove(benchmark::State& state) {
    auto punctuator = Punctuator{PunctuatorOptions{}};
    const auto lines = make_lines(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(punctuator.remove(lines));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_remove)->Arg(1000)->Arg(100000);

// =============================================================================
// Preserve and restore
// =============================================================================

static void bm_preserve(benchmark::State& state) {
    auto punctuator = Punctuator{PunctuatorOptions{}};
    const auto lines = make_lines(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(punctuator.preserve(lines));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_preserve)->Arg(1000)->Arg(100000);

static void bm_restore(benchmark::State& state) {
    auto punctuator = Punctuator{PunctuatorOptions{}};
    const auto preserved = punctuator.preserve(
        make_lines(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        benchmark::DoNotOptimize(Punctuator::restore(preserved));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_restore)->Arg(1000)->Arg(100000);

// =============================================================================
// Parallel preserve
// =============================================================================

// Arg(0): derived batch size, Arg(1): sequential baseline
static void bm_preserve_parallel(benchmark::State& state) {
    auto punctuator = Punctuator{PunctuatorOptions{}};
    const auto lines = make_lines(100000);
    for (auto _ : state) {
        if (state.range(0) == 0) {
            benchmark::DoNotOptimize(punctuator.preserve_parallel(lines));
        } else {
            benchmark::DoNotOptimize(punctuator.preserve(lines));
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(lines.size()));
}
BENCHMARK(bm_preserve_parallel)->Arg(0)->Arg(1)->UseRealTime();
