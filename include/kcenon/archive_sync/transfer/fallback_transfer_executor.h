/**
 * @file fallback_transfer_executor.h
 * @brief Read-then-write transfers through a local temporary buffer
 * @version 0.1.0
 */

#ifndef KCENON_ARCHIVE_SYNC_TRANSFER_FALLBACK_TRANSFER_EXECUTOR_H
#define KCENON_ARCHIVE_SYNC_TRANSFER_FALLBACK_TRANSFER_EXECUTOR_H

#include <kcenon/archive_sync/adapters/thread_pool_adapter.h>
#include <kcenon/archive_sync/core/sync_config.h>
#include <kcenon/archive_sync/storage/store_registry.h>
#include <kcenon/archive_sync/transfer/transfer_executor.h>

#include <filesystem>
#include <functional>
#include <memory>

namespace kcenon::archive_sync {

/**
 * @brief Temporary file owned for the duration of one item attempt
 *
 * The file is created exclusively under the given directory and removed
 * when the buffer is destroyed.
 */
class scoped_buffer {
public:
    /**
     * @brief Create an empty buffer file
     * @param directory Parent directory; empty selects the system temp directory
     */
    [[nodiscard]] static auto create(const std::filesystem::path& directory)
        -> result<scoped_buffer>;

    scoped_buffer(scoped_buffer&& other) noexcept;
    auto operator=(scoped_buffer&& other) noexcept -> scoped_buffer&;
    scoped_buffer(const scoped_buffer&) = delete;
    auto operator=(const scoped_buffer&) -> scoped_buffer& = delete;
    ~scoped_buffer();

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    explicit scoped_buffer(std::filesystem::path path) : path_(std::move(path)) {}

    void release() noexcept;

    std::filesystem::path path_;
};

/**
 * @brief Runs fallback batches item by item
 *
 * Each item is read from its source store into a scoped_buffer, checked
 * against expected_size and content_checksum, and only then written to
 * the destination store. At most max_concurrency items of a batch are in
 * flight. Transient failures are retried per item with the configured
 * backoff.
 */
class fallback_transfer_executor : public transfer_executor {
public:
    using sleep_function = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param config Run configuration
     * @param stores Stores by scheme
     * @param pool Pool for item workers; a dedicated pool is created when null
     */
    fallback_transfer_executor(
        sync_configuration config,
        std::shared_ptr<const storage::store_registry> stores,
        std::shared_ptr<adapters::sync_thread_pool_interface> pool = nullptr);

    [[nodiscard]] auto mode() const noexcept -> transfer_mode override {
        return transfer_mode::fallback;
    }

    [[nodiscard]] auto execute(const transfer_batch& batch)
        -> std::vector<transfer_result> override;

    /**
     * @brief Replace the backoff sleep (tests)
     */
    void set_sleep_function(sleep_function fn) { sleep_ = std::move(fn); }

private:
    [[nodiscard]] auto transfer_one(const batch_entry& entry) -> transfer_result;

    sync_configuration config_;
    std::shared_ptr<const storage::store_registry> stores_;
    std::shared_ptr<adapters::sync_thread_pool_interface> pool_;
    sleep_function sleep_;
};

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_TRANSFER_FALLBACK_TRANSFER_EXECUTOR_H
