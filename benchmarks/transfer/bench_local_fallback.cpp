/**
 * @file bench_local_fallback.cpp
 * @brief Benchmarks for buffered transfers between local paths
 */

#include <benchmark/benchmark.h>

#include <kcenon/archive_sync/core/logging.h>
#include <kcenon/archive_sync/storage/local_object_store.h>
#include <kcenon/archive_sync/storage/store_registry.h>
#include <kcenon/archive_sync/transfer/fallback_transfer_executor.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::archive_sync::benchmark {

/**
 * @brief One fallback batch of local files copied through scoped buffers
 */
static void BM_FallbackExecutor_LocalBatch(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    const auto file_size = static_cast<std::size_t>(state.range(1));
    const auto workers = static_cast<std::size_t>(state.range(2));
    get_logger().set_quiet(true);

    temp_file_manager temp_files;
    auto archive_dir = temp_files.subdirectory("archive");

    sync_configuration config;
    config.max_concurrency = workers;
    config.temp_directory = temp_files.subdirectory("buffers");
    config.retry = retry_policy::no_retry();

    transfer_batch batch;
    batch.id = 1;
    batch.mode = transfer_mode::fallback;
    for (std::size_t i = 0; i < file_count; ++i) {
        auto name = "object-" + std::to_string(i) + ".zip";
        auto source = temp_files.create_random_file("source/" + name, file_size,
                                                    static_cast<uint32_t>(i + 1));
        auto destination = (archive_dir / name).string();
        batch.entries.push_back(
            batch_entry{i, transfer_item{source.string(), destination, file_size, std::nullopt},
                        destination});
    }

    auto stores = std::make_shared<storage::store_registry>();
    stores->register_store("file", std::make_shared<storage::local_object_store>());
    fallback_transfer_executor executor(config, stores);

    for (auto _ : state) {
        auto results = executor.execute(batch);
        for (const auto& r : results) {
            if (!r.succeeded()) {
                state.SkipWithError("transfer failed");
                return;
            }
        }
        ::benchmark::DoNotOptimize(results);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_count * file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(file_count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_FallbackExecutor_LocalBatch)
    ->Args({32, static_cast<int64_t>(sizes::small_object), 1})
    ->Args({32, static_cast<int64_t>(sizes::small_object), 8})
    ->Args({16, static_cast<int64_t>(sizes::medium_object), 4})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::archive_sync::benchmark
