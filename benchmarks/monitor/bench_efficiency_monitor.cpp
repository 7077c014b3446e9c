/**
 * @file bench_efficiency_monitor.cpp
 * @brief Benchmarks for statistics recording under contention
 */

#include <benchmark/benchmark.h>

#include <kcenon/archive_sync/transfer/efficiency_monitor.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::archive_sync::benchmark {

namespace {

auto make_batch(std::size_t size) -> transfer_batch {
    transfer_batch batch;
    batch.id = 1;
    batch.mode = transfer_mode::direct;
    auto items = item_generator::same_family(size);
    for (std::size_t i = 0; i < items.size(); ++i) {
        batch.entries.push_back(batch_entry{i, items[i], items[i].destination_uri});
    }
    return batch;
}

auto succeeded(const transfer_batch& batch) -> std::vector<transfer_result> {
    std::vector<transfer_result> results;
    results.reserve(batch.size());
    for (const auto& entry : batch.entries) {
        results.push_back(transfer_result::success(entry, batch.mode, 4096, duration{1}, 1));
    }
    return results;
}

efficiency_monitor g_shared_monitor;

}  // namespace

/**
 * @brief Record one batch per iteration
 */
static void BM_EfficiencyMonitor_Record(::benchmark::State& state) {
    const auto batch_size = static_cast<std::size_t>(state.range(0));
    auto batch = make_batch(batch_size);
    auto results = succeeded(batch);
    efficiency_monitor monitor;

    for (auto _ : state) {
        monitor.record(batch, transfer_mode::direct, results, duration{1});
    }

    ::benchmark::DoNotOptimize(monitor.snapshot());
    state.SetItemsProcessed(static_cast<int64_t>(batch_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Concurrent batch tasks recording into one monitor
 */
static void BM_EfficiencyMonitor_Contended(::benchmark::State& state) {
    auto batch = make_batch(100);
    auto results = succeeded(batch);

    if (state.thread_index() == 0) {
        g_shared_monitor.reset();
    }

    for (auto _ : state) {
        g_shared_monitor.record(batch, transfer_mode::direct, results, duration{1});
    }

    state.SetItemsProcessed(100 * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Snapshot cost while the monitor is populated
 */
static void BM_EfficiencyMonitor_Snapshot(::benchmark::State& state) {
    auto batch = make_batch(100);
    efficiency_monitor monitor;
    monitor.record(batch, transfer_mode::direct, succeeded(batch), duration{1});

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(monitor.snapshot());
    }
}

BENCHMARK(BM_EfficiencyMonitor_Record)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_EfficiencyMonitor_Contended)
    ->Threads(1)
    ->Threads(4)
    ->Threads(8)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_EfficiencyMonitor_Snapshot);

}  // namespace kcenon::archive_sync::benchmark
