/**
 * @file efficiency_monitor.cpp
 * @brief Thread-safe aggregation of efficiency statistics for one run
 */

#include "kcenon/archive_sync/transfer/efficiency_monitor.h"

#include "kcenon/archive_sync/core/logging.h"

#include <mutex>

namespace kcenon::archive_sync {

struct efficiency_monitor::impl {
    mutable std::mutex mutex;
    efficiency_stats stats;

    void add(const transfer_result& r, transfer_mode mode) {
        ++stats.total_items;
        switch (r.status) {
            case transfer_status::succeeded:
                stats.total_bytes += r.bytes_transferred;
                if (mode == transfer_mode::direct) {
                    ++stats.direct_items;
                    stats.direct_bytes += r.bytes_transferred;
                    stats.operations_saved += 2;
                } else {
                    ++stats.fallback_items;
                    stats.fallback_bytes += r.bytes_transferred;
                }
                break;
            case transfer_status::failed:
                ++stats.failed_items;
                break;
            case transfer_status::skipped:
                ++stats.skipped_items;
                break;
        }
    }
};

efficiency_monitor::efficiency_monitor() : impl_(std::make_unique<impl>()) {}

efficiency_monitor::efficiency_monitor(efficiency_monitor&&) noexcept = default;
auto efficiency_monitor::operator=(efficiency_monitor&&) noexcept
    -> efficiency_monitor& = default;
efficiency_monitor::~efficiency_monitor() = default;

void efficiency_monitor::record(const transfer_batch& batch, transfer_mode mode,
                                const std::vector<transfer_result>& results,
                                duration elapsed) {
    if (results.size() != batch.size()) {
        AS_LOG_WARN(log_category::monitor,
                    "batch " + std::to_string(batch.id) + " produced " +
                        std::to_string(results.size()) + " results for " +
                        std::to_string(batch.size()) + " items");
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (const auto& r : results) {
        impl_->add(r, mode);
    }
    impl_->stats.total_duration += elapsed;
    ++impl_->stats.batches_recorded;
}

void efficiency_monitor::record_skipped(const std::vector<transfer_result>& results) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (const auto& r : results) {
        impl_->add(r, r.mode);
    }
}

auto efficiency_monitor::snapshot() const -> efficiency_stats {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->stats;
}

void efficiency_monitor::reset() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->stats = efficiency_stats{};
}

}  // namespace kcenon::archive_sync
