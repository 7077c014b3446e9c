/**
 * @file batch_planner.h
 * @brief Groups transfer items into bounded, single-mode batches
 * @version 0.1.0
 */

#ifndef KCENON_ARCHIVE_SYNC_TRANSFER_BATCH_PLANNER_H
#define KCENON_ARCHIVE_SYNC_TRANSFER_BATCH_PLANNER_H

#include <kcenon/archive_sync/core/sync_config.h>
#include <kcenon/archive_sync/core/transfer_types.h>
#include <kcenon/archive_sync/core/types.h>
#include <kcenon/archive_sync/transfer/mode_selector.h>

#include <memory>
#include <string>
#include <vector>

namespace kcenon::archive_sync {

/**
 * @brief Plans batches for one run
 *
 * Planning steps:
 * 1. Validate the configuration (no I/O happens on failure)
 * 2. Resolve container destinations to object destinations
 * 3. Classify every item through a mode_selector built for this run
 * 4. Group by mode, keeping submission order inside a mode, and cut each
 *    group into chunks of at most max_batch_size
 *
 * Batches are emitted in the order of each mode's first appearance and
 * are numbered from 1.
 */
class batch_planner {
public:
    explicit batch_planner(std::shared_ptr<capability_probe> probe);

    /**
     * @brief Plan batches for a run
     * @return The batches, or a configuration error
     */
    [[nodiscard]] auto plan(const std::vector<transfer_item>& items,
                            const sync_configuration& config)
        -> result<std::vector<transfer_batch>>;

    /**
     * @brief Resolve the destination of every item, in submission order
     *
     * A destination ending in '/' is a container: the source key is appended
     * (organize_by_prefix) or the source basename is appended with "-1",
     * "-2", ... inserted before the extension when the name is already taken
     * in this run. Any other destination is used verbatim.
     */
    [[nodiscard]] static auto resolve_destinations(const std::vector<transfer_item>& items,
                                                   bool organize_by_prefix)
        -> std::vector<std::string>;

    /**
     * @brief Mode decisions of the last successful plan(), in submission order
     */
    [[nodiscard]] auto last_decisions() const -> const std::vector<mode_decision>& {
        return decisions_;
    }

private:
    std::shared_ptr<capability_probe> probe_;
    std::vector<mode_decision> decisions_;
};

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_TRANSFER_BATCH_PLANNER_H
