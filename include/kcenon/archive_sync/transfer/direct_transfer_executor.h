/**
 * @file direct_transfer_executor.h
 * @brief Server-side batch copies through the batch-copy utility
 * @version 0.1.0
 */

#ifndef KCENON_ARCHIVE_SYNC_TRANSFER_DIRECT_TRANSFER_EXECUTOR_H
#define KCENON_ARCHIVE_SYNC_TRANSFER_DIRECT_TRANSFER_EXECUTOR_H

#include <kcenon/archive_sync/core/sync_config.h>
#include <kcenon/archive_sync/process/process_runner.h>
#include <kcenon/archive_sync/process/utility_output.h>
#include <kcenon/archive_sync/transfer/transfer_executor.h>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::archive_sync {

/**
 * @brief Assign utility outcomes to manifest lines
 *
 * @param destinations Destination URI of each manifest line, as written
 * @param outcomes Outcome records in the order the utility emitted them
 * @return For each manifest line, the index of its outcome in @p outcomes
 *
 * A record is matched by its echoed destination, then by a destination
 * contained in its echoed command, then by its position. The first record
 * matched to a line wins; later ones for the same line are ignored.
 */
[[nodiscard]] auto map_outcomes(const std::vector<std::string>& destinations,
                                const std::vector<process::utility_outcome>& outcomes)
    -> std::vector<std::optional<std::size_t>>;

/**
 * @brief Runs direct batches with s5cmd
 *
 * One utility invocation per attempt: the manifest of still-pending items
 * is written to stdin, outcomes are read back as JSON lines. Items the
 * utility did not report are failed as unreported; only transient and
 * unreported failures are retried, up to retry.max_attempts invocations.
 *
 * With skip_existing, destinations already present (and of the expected
 * size, when one is given) are skipped before the first invocation. With
 * if_size_differ, items the utility passed over silently are looked up
 * afterwards and skipped when present.
 */
class direct_transfer_executor : public transfer_executor {
public:
    using sleep_function = std::function<void(std::chrono::milliseconds)>;

    direct_transfer_executor(sync_configuration config,
                             std::shared_ptr<process::process_runner_interface> runner);

    [[nodiscard]] auto mode() const noexcept -> transfer_mode override {
        return transfer_mode::direct;
    }

    [[nodiscard]] auto execute(const transfer_batch& batch)
        -> std::vector<transfer_result> override;

    /**
     * @brief Replace the backoff sleep (tests)
     */
    void set_sleep_function(sleep_function fn) { sleep_ = std::move(fn); }

    /**
     * @brief Manifest text for a list of (source, destination) pairs
     */
    [[nodiscard]] auto build_manifest(const std::vector<std::string>& sources,
                                      const std::vector<std::string>& destinations) const
        -> std::string;

private:
    /**
     * @brief Sizes of the objects among @p uris that already exist
     *
     * One listing per destination prefix. A prefix whose listing fails is
     * treated as holding none of them.
     */
    auto existing_objects(const std::vector<std::string>& uris)
        -> std::map<std::string, uint64_t>;

    sync_configuration config_;
    std::shared_ptr<process::process_runner_interface> runner_;
    sleep_function sleep_;
};

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_TRANSFER_DIRECT_TRANSFER_EXECUTOR_H
