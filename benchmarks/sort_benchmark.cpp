/**
 * @file sort_benchmark.cpp
 * @brief Benchmarks for the sorting pipeline and comparator
 */

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include <suffixsort/suffixsort.hpp>

#include "bench_utils.hpp"

namespace {

void run_pipeline(benchmark::State &state, const suffixsort::SortConfig &config) {
    const auto input = suffixsort::bench::make_lines(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        state.PauseTiming();
        std::vector<std::string> lines = input;
        state.ResumeTiming();

        auto result = suffixsort::process_lines(config, std::move(lines));
        benchmark::DoNotOptimize(result.lines.data());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_Pipeline_Default(benchmark::State &state) {
    run_pipeline(state, suffixsort::SortConfig{});
}

static void BM_Pipeline_StableIgnoreCase(benchmark::State &state) {
    suffixsort::SortConfig config;
    config.stable = true;
    config.ignore_case = true;
    run_pipeline(state, config);
}

static void BM_Pipeline_Normalize(benchmark::State &state) {
    suffixsort::SortConfig config;
    config.normalize = true;
    run_pipeline(state, config);
}

static void BM_Comparator_StdSort(benchmark::State &state) {
    const auto input = suffixsort::bench::make_lines(static_cast<size_t>(state.range(0)));
    const auto cmp = suffixsort::make_comparator(suffixsort::SortConfig{});

    for (auto _ : state) {
        state.PauseTiming();
        std::vector<std::string> lines = input;
        state.ResumeTiming();

        std::sort(lines.begin(), lines.end(),
                  [&cmp](const std::string &a, const std::string &b) { return cmp.less(a, b); });
        benchmark::DoNotOptimize(lines.data());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

}  // namespace

BENCHMARK(BM_Pipeline_Default)->RangeMultiplier(8)->Range(1 << 10, 1 << 19)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Pipeline_StableIgnoreCase)->RangeMultiplier(8)->Range(1 << 10, 1 << 19)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Pipeline_Normalize)->Range(1 << 10, 1 << 16)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Comparator_StdSort)->Range(1 << 10, 1 << 16)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
