/**
 * @file efficiency_monitor.h
 * @brief Thread-safe aggregation of efficiency statistics for one run
 * @version 0.1.0
 */

#ifndef KCENON_ARCHIVE_SYNC_TRANSFER_EFFICIENCY_MONITOR_H
#define KCENON_ARCHIVE_SYNC_TRANSFER_EFFICIENCY_MONITOR_H

#include <kcenon/archive_sync/core/transfer_types.h>

#include <memory>
#include <vector>

namespace kcenon::archive_sync {

/**
 * @brief Collects efficiency_stats from completed batches
 *
 * The only state shared between batch workers. Every update happens under
 * one mutex, so a snapshot never shows a half-recorded batch.
 *
 * @code
 * efficiency_monitor monitor;
 * monitor.record(batch, transfer_mode::direct, results, elapsed);
 * auto stats = monitor.snapshot();
 * double ratio = stats.efficiency_ratio();
 * @endcode
 */
class efficiency_monitor {
public:
    efficiency_monitor();

    efficiency_monitor(const efficiency_monitor&) = delete;
    auto operator=(const efficiency_monitor&) -> efficiency_monitor& = delete;
    efficiency_monitor(efficiency_monitor&&) noexcept;
    auto operator=(efficiency_monitor&&) noexcept -> efficiency_monitor&;

    ~efficiency_monitor();

    /**
     * @brief Account for the results of one executed batch
     *
     * Every direct success adds two to operations_saved: the read and the
     * write a fallback transfer of the same item would have cost.
     *
     * @param batch The executed batch
     * @param mode Mode the batch was executed with
     * @param results One result per batch entry
     * @param elapsed Wall time of the batch; added to total_duration
     */
    void record(const transfer_batch& batch, transfer_mode mode,
                const std::vector<transfer_result>& results, duration elapsed);

    /**
     * @brief Account for items that were never executed (cancellation)
     */
    void record_skipped(const std::vector<transfer_result>& results);

    /**
     * @brief Consistent copy of the current counters
     */
    [[nodiscard]] auto snapshot() const -> efficiency_stats;

    /**
     * @brief Clear all counters for a new run
     */
    void reset();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_TRANSFER_EFFICIENCY_MONITOR_H
