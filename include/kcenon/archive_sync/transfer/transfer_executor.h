/**
 * @file transfer_executor.h
 * @brief Common interface of the direct and fallback executors
 */

#ifndef KCENON_ARCHIVE_SYNC_TRANSFER_TRANSFER_EXECUTOR_H
#define KCENON_ARCHIVE_SYNC_TRANSFER_TRANSFER_EXECUTOR_H

#include <kcenon/archive_sync/core/transfer_types.h>

#include <vector>

namespace kcenon::archive_sync {

/**
 * @brief Executes one batch of a single mode
 *
 * Implementations return exactly one result per batch entry, in entry
 * order. Item failures are reported as results, never as exceptions.
 */
class transfer_executor {
public:
    virtual ~transfer_executor() = default;

    [[nodiscard]] virtual auto mode() const noexcept -> transfer_mode = 0;

    [[nodiscard]] virtual auto execute(const transfer_batch& batch)
        -> std::vector<transfer_result> = 0;
};

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_TRANSFER_TRANSFER_EXECUTOR_H
