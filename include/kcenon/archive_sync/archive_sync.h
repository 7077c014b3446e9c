/**
 * @file archive_sync.h
 * @brief Main header for the archive_sync library
 * @version 0.1.0
 *
 * Include this header to access the transfer-orchestration API.
 *
 * @code
 * #include <kcenon/archive_sync/archive_sync.h>
 *
 * using namespace kcenon::archive_sync;
 *
 * auto config = sync_config_builder()
 *     .with_max_batch_size(100)
 *     .with_max_concurrency(10)
 *     .build();
 *
 * sync_coordinator coordinator;
 * auto report = coordinator.sync({
 *     {"s3://vision-raw/spot/BTCUSDT-2024-01-01.zip", "s3://lake-archive/spot/"},
 * }, config);
 * @endcode
 */

#ifndef KCENON_ARCHIVE_SYNC_ARCHIVE_SYNC_H
#define KCENON_ARCHIVE_SYNC_ARCHIVE_SYNC_H

#include <string>

// Core types
#include "kcenon/archive_sync/core/cancellation_token.h"
#include "kcenon/archive_sync/core/error_codes.h"
#include "kcenon/archive_sync/core/sync_config.h"
#include "kcenon/archive_sync/core/transfer_types.h"
#include "kcenon/archive_sync/core/types.h"

// Storage
#include "kcenon/archive_sync/storage/object_uri.h"
#include "kcenon/archive_sync/storage/store_registry.h"

// Transfer orchestration
#include "kcenon/archive_sync/transfer/batch_planner.h"
#include "kcenon/archive_sync/transfer/efficiency_monitor.h"
#include "kcenon/archive_sync/transfer/mode_selector.h"
#include "kcenon/archive_sync/transfer/sync_coordinator.h"

namespace kcenon::archive_sync {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_ARCHIVE_SYNC_H
