/**
 * @file sync_config.cpp
 * @brief Configuration validation and retry delay calculation
 */

#include "kcenon/archive_sync/core/sync_config.h"

#include <algorithm>
#include <random>

namespace kcenon::archive_sync {

auto validate(const sync_configuration& config) -> result<void> {
    if (config.max_batch_size < 1) {
        return make_error(sync_error_code::config_batch_size_error,
                          "max_batch_size must be at least 1, got " +
                              std::to_string(config.max_batch_size));
    }

    if (config.max_concurrency < 1) {
        return make_error(sync_error_code::config_concurrency_error,
                          "max_concurrency must be at least 1");
    }

    if (config.max_parallel_batches < 1) {
        return make_error(sync_error_code::config_concurrency_error,
                          "max_parallel_batches must be at least 1");
    }

    const auto& retry = config.retry;
    if (retry.max_attempts < 1) {
        return make_error(sync_error_code::config_retry_error,
                          "retry max_attempts must be at least 1");
    }
    if (retry.backoff_multiplier < 1.0) {
        return make_error(sync_error_code::config_retry_error,
                          "retry backoff_multiplier must be >= 1.0");
    }
    if (retry.initial_delay.count() < 0 || retry.initial_delay > retry.max_delay) {
        return make_error(sync_error_code::config_retry_error,
                          "retry initial_delay must be within [0, max_delay]");
    }

    if (config.batch_timeout.count() <= 0 || config.item_timeout.count() <= 0 ||
        config.probe_timeout.count() <= 0) {
        return make_error(sync_error_code::config_invalid, "timeouts must be positive");
    }

    if (config.direct_sync_enabled && config.utility.executable.empty()) {
        return make_error(sync_error_code::config_utility_error,
                          "direct sync is enabled but no utility executable is set");
    }

    if (config.utility.part_size_mb && *config.utility.part_size_mb == 0) {
        return make_error(sync_error_code::config_utility_error,
                          "part_size_mb must be positive when set");
    }

    return {};
}

auto calculate_retry_delay(const retry_policy& policy,
                           std::size_t attempt) -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (std::size_t i = 1; i < attempt; ++i) {
        delay *= policy.backoff_multiplier;
        if (delay >= static_cast<double>(policy.max_delay.count())) {
            break;
        }
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
        delay = std::min(delay, static_cast<double>(policy.max_delay.count()));
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace kcenon::archive_sync
