/**
 * @file bench_batch_planning.cpp
 * @brief Benchmarks for batch planning and destination resolution
 */

#include <benchmark/benchmark.h>

#include <kcenon/archive_sync/core/logging.h>
#include <kcenon/archive_sync/transfer/batch_planner.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::archive_sync::benchmark {

/**
 * @brief Plan same-family items; the probe answer is cached per bucket pair
 */
static void BM_BatchPlanner_SameFamily(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto batch_size = static_cast<std::size_t>(state.range(1));
    get_logger().set_quiet(true);

    auto items = item_generator::same_family(count);
    sync_configuration config;
    config.max_batch_size = batch_size;
    batch_planner planner(std::make_shared<fixed_probe>(true));

    for (auto _ : state) {
        auto batches = planner.plan(items, config);
        if (!batches) {
            state.SkipWithError("planning failed");
            return;
        }
        ::benchmark::DoNotOptimize(batches.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Plan a run where a share of the items must fall back
 */
static void BM_BatchPlanner_Mixed(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto cross_every = static_cast<std::size_t>(state.range(1));
    get_logger().set_quiet(true);

    auto items = item_generator::mixed(count, cross_every);
    sync_configuration config;
    batch_planner planner(std::make_shared<fixed_probe>(true));

    for (auto _ : state) {
        auto batches = planner.plan(items, config);
        if (!batches) {
            state.SkipWithError("planning failed");
            return;
        }
        ::benchmark::DoNotOptimize(batches.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Flattened destination naming with heavy basename collisions
 */
static void BM_ResolveDestinations_Flattened(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));

    std::vector<transfer_item> items;
    items.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        // 16 distinct basenames spread over many prefixes
        items.push_back(transfer_item{"s3://bench-source/day" + std::to_string(i) + "/part-" +
                                          std::to_string(i % 16) + ".zip",
                                      "s3://bench-archive/", std::nullopt, std::nullopt});
    }

    for (auto _ : state) {
        auto resolved = batch_planner::resolve_destinations(items, false);
        ::benchmark::DoNotOptimize(resolved);
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_BatchPlanner_SameFamily)
    ->Args({1000, 100})
    ->Args({10000, 100})
    ->Args({10000, 1000})
    ->Args({100000, 500})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_BatchPlanner_Mixed)
    ->Args({10000, 2})
    ->Args({10000, 10})
    ->Args({10000, 100})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ResolveDestinations_Flattened)
    ->Arg(1000)
    ->Arg(5000)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::archive_sync::benchmark
