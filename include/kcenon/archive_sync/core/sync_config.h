/**
 * @file sync_config.h
 * @brief Run configuration, retry policy and batch-copy utility options
 * @version 0.1.0
 */

#ifndef KCENON_ARCHIVE_SYNC_CORE_SYNC_CONFIG_H
#define KCENON_ARCHIVE_SYNC_CORE_SYNC_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace kcenon::archive_sync {

/**
 * @brief Retry policy shared by both executors
 */
struct retry_policy {
    /// Total attempts per item, including the first one
    std::size_t max_attempts = 3;

    /// Initial delay between retries
    std::chrono::milliseconds initial_delay{1000};

    /// Maximum delay between retries
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Add jitter to retry delays
    bool use_jitter = true;

    /// Value passed to the utility's own --retry-count flag
    uint32_t utility_retry_count = 3;

    static auto no_retry() -> retry_policy {
        retry_policy policy;
        policy.max_attempts = 1;
        policy.use_jitter = false;
        return policy;
    }
};

/**
 * @brief How the external batch-copy utility (s5cmd) is invoked
 */
struct utility_options {
    /// Executable name or path, resolved through PATH
    std::string executable = "s5cmd";

    /// Extra global flags placed before the subcommand
    std::vector<std::string> extra_global_args;

    /// Multipart part size passed to each cp command
    std::optional<uint32_t> part_size_mb = 50;

    /// Anonymous access to public source buckets
    bool no_sign_request = false;

    /// Region of the source bucket when it differs from the destination
    std::optional<std::string> source_region;

    /// Custom S3-compatible endpoint (e.g. MinIO)
    std::optional<std::string> endpoint_url;

    /// Let the utility skip objects whose size already matches
    bool if_size_differ = false;
};

/**
 * @brief Configuration for one coordinator run
 *
 * Immutable for the duration of a run.
 */
struct sync_configuration {
    /// Maximum items per batch
    std::size_t max_batch_size = 100;

    /// Per-batch item parallelism (utility workers or fallback tasks)
    std::size_t max_concurrency = 10;

    /// Batches in flight at the same time
    std::size_t max_parallel_batches = 4;

    /// Keep the full source key under a container destination
    bool organize_by_prefix = true;

    /// Allow the direct (server-side copy) path
    bool direct_sync_enabled = true;

    retry_policy retry;

    /// Timeout for one utility invocation
    std::chrono::milliseconds batch_timeout{std::chrono::minutes(30)};

    /// Timeout for one fallback read or write
    std::chrono::milliseconds item_timeout{std::chrono::minutes(5)};

    /// Timeout for one capability probe
    std::chrono::milliseconds probe_timeout{std::chrono::seconds(15)};

    utility_options utility;

    /// Directory for fallback buffers (empty = system temp directory)
    std::filesystem::path temp_directory;

    /// Skip items whose destination already exists with the expected size
    bool skip_existing = false;
};

/**
 * @brief Validate a run configuration
 * @return Empty result, or a configuration error describing the first problem
 */
[[nodiscard]] auto validate(const sync_configuration& config) -> result<void>;

/**
 * @brief Delay before the given retry attempt (1-based)
 *
 * Exponential in the attempt number, capped at max_delay, optionally
 * scaled by a random jitter factor in [0.5, 1.5).
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy,
                                         std::size_t attempt) -> std::chrono::milliseconds;

/**
 * @brief Builder for sync_configuration
 *
 * @code
 * auto config = sync_config_builder()
 *     .with_max_batch_size(200)
 *     .with_max_concurrency(16)
 *     .with_direct_sync(true)
 *     .with_part_size_mb(64)
 *     .build();
 * @endcode
 */
class sync_config_builder {
public:
    auto with_max_batch_size(std::size_t size) -> sync_config_builder& {
        config_.max_batch_size = size;
        return *this;
    }

    auto with_max_concurrency(std::size_t concurrency) -> sync_config_builder& {
        config_.max_concurrency = concurrency;
        return *this;
    }

    auto with_max_parallel_batches(std::size_t batches) -> sync_config_builder& {
        config_.max_parallel_batches = batches;
        return *this;
    }

    auto with_organize_by_prefix(bool enable) -> sync_config_builder& {
        config_.organize_by_prefix = enable;
        return *this;
    }

    auto with_direct_sync(bool enable) -> sync_config_builder& {
        config_.direct_sync_enabled = enable;
        return *this;
    }

    auto with_retry_policy(const retry_policy& policy) -> sync_config_builder& {
        config_.retry = policy;
        return *this;
    }

    auto with_batch_timeout(std::chrono::milliseconds timeout) -> sync_config_builder& {
        config_.batch_timeout = timeout;
        return *this;
    }

    auto with_item_timeout(std::chrono::milliseconds timeout) -> sync_config_builder& {
        config_.item_timeout = timeout;
        return *this;
    }

    auto with_probe_timeout(std::chrono::milliseconds timeout) -> sync_config_builder& {
        config_.probe_timeout = timeout;
        return *this;
    }

    auto with_utility(const utility_options& options) -> sync_config_builder& {
        config_.utility = options;
        return *this;
    }

    auto with_utility_executable(const std::string& executable) -> sync_config_builder& {
        config_.utility.executable = executable;
        return *this;
    }

    auto with_part_size_mb(uint32_t part_size) -> sync_config_builder& {
        config_.utility.part_size_mb = part_size;
        return *this;
    }

    auto with_no_sign_request(bool enable) -> sync_config_builder& {
        config_.utility.no_sign_request = enable;
        return *this;
    }

    auto with_source_region(const std::string& region) -> sync_config_builder& {
        config_.utility.source_region = region;
        return *this;
    }

    auto with_endpoint_url(const std::string& endpoint) -> sync_config_builder& {
        config_.utility.endpoint_url = endpoint;
        return *this;
    }

    auto with_temp_directory(const std::filesystem::path& dir) -> sync_config_builder& {
        config_.temp_directory = dir;
        return *this;
    }

    auto with_skip_existing(bool enable) -> sync_config_builder& {
        config_.skip_existing = enable;
        return *this;
    }

    /**
     * @brief Build the configuration without validation
     */
    [[nodiscard]] auto build() const -> sync_configuration { return config_; }

    /**
     * @brief Build and validate the configuration
     */
    [[nodiscard]] auto build_validated() const -> result<sync_configuration> {
        auto valid = validate(config_);
        if (!valid) {
            return unexpected(valid.error());
        }
        return config_;
    }

private:
    sync_configuration config_;
};

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_CORE_SYNC_CONFIG_H
