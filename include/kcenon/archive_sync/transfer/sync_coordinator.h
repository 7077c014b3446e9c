/**
 * @file sync_coordinator.h
 * @brief Entry point: plan, dispatch batches, record statistics, merge results
 * @version 0.1.0
 */

#ifndef KCENON_ARCHIVE_SYNC_TRANSFER_SYNC_COORDINATOR_H
#define KCENON_ARCHIVE_SYNC_TRANSFER_SYNC_COORDINATOR_H

#include <kcenon/archive_sync/adapters/thread_pool_adapter.h>
#include <kcenon/archive_sync/core/cancellation_token.h>
#include <kcenon/archive_sync/core/sync_config.h>
#include <kcenon/archive_sync/core/transfer_types.h>
#include <kcenon/archive_sync/core/types.h>
#include <kcenon/archive_sync/process/process_runner.h>
#include <kcenon/archive_sync/storage/store_registry.h>
#include <kcenon/archive_sync/transfer/efficiency_monitor.h>
#include <kcenon/archive_sync/transfer/mode_selector.h>
#include <kcenon/archive_sync/transfer/transfer_executor.h>

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::archive_sync {

/**
 * @brief Outcome of one coordinator run
 *
 * results holds exactly one entry per submitted item, in submission order.
 */
struct sync_report {
    std::vector<transfer_result> results;
    efficiency_stats stats;
};

/**
 * @brief Collaborators of a sync_coordinator
 *
 * Every member is optional. Missing members are built per run from the
 * run's configuration: a posix_process_runner, the default store registry,
 * a store_capability_probe, the two executors and a batch pool sized to
 * max_parallel_batches.
 */
struct sync_dependencies {
    std::shared_ptr<process::process_runner_interface> runner;
    std::shared_ptr<const storage::store_registry> stores;
    std::shared_ptr<capability_probe> probe;
    std::shared_ptr<transfer_executor> direct_executor;
    std::shared_ptr<transfer_executor> fallback_executor;
    std::shared_ptr<adapters::sync_thread_pool_interface> pool;
};

/**
 * @brief Orchestrates one transfer run at a time
 *
 * @code
 * sync_coordinator coordinator;
 * auto config = sync_config_builder().with_max_batch_size(200).build();
 * auto report = coordinator.sync(items, config);
 * if (!report) {
 *     // configuration error, nothing was transferred
 * }
 * for (const auto& r : report.value().results) { ... }
 * @endcode
 *
 * Item failures are reported in the results; the only error sync() returns
 * is a configuration error, raised before any I/O.
 */
class sync_coordinator {
public:
    sync_coordinator();
    explicit sync_coordinator(sync_dependencies deps);

    sync_coordinator(const sync_coordinator&) = delete;
    auto operator=(const sync_coordinator&) -> sync_coordinator& = delete;

    ~sync_coordinator();

    /**
     * @brief Transfer every item
     */
    [[nodiscard]] auto sync(const std::vector<transfer_item>& items,
                            const sync_configuration& config) -> result<sync_report>;

    /**
     * @brief Transfer every item, stopping dispatch when @p token is cancelled
     */
    [[nodiscard]] auto sync(const std::vector<transfer_item>& items,
                            const sync_configuration& config,
                            cancellation_token token) -> result<sync_report>;

    /**
     * @brief Stop dispatching batches of the run in progress
     *
     * Batches already running finish; items of batches not yet started are
     * reported as skipped with detail "cancelled".
     */
    void cancel();

    /**
     * @brief Statistics of the current or last run
     */
    [[nodiscard]] auto snapshot() const -> efficiency_stats;

private:
    sync_dependencies deps_;
    efficiency_monitor monitor_;

    mutable std::mutex token_mutex_;
    std::optional<cancellation_token> active_token_;
};

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_TRANSFER_SYNC_COORDINATOR_H
