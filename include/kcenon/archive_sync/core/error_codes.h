/**
 * @file error_codes.h
 * @brief Error codes for archive_sync (-900 to -999 range)
 * @version 0.1.0
 *
 * Error codes follow the range -900 to -999 as per ecosystem convention.
 * The range a code falls in determines how the executors treat it: a
 * configuration error aborts a run before any I/O, a transient error is
 * retried, a permanent error is reported without retry.
 */

#ifndef KCENON_ARCHIVE_SYNC_CORE_ERROR_CODES_H
#define KCENON_ARCHIVE_SYNC_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace kcenon::archive_sync {

/**
 * @brief Error codes for archive sync operations (-900 to -999)
 *
 * Error code ranges:
 * - -900 to -909: Configuration Errors (fatal, pre-flight)
 * - -910 to -929: Transient Transfer Errors (retryable)
 * - -930 to -949: Permanent Transfer Errors (not retried)
 * - -950 to -959: Partial Batch Failures (retried as transient)
 * - -960 to -969: Cancellation and Internal Errors
 */
enum class sync_error_code : int32_t {
    success = 0,

    // Configuration Errors (-900 to -909)
    config_invalid = -900,
    config_batch_size_error = -901,
    config_concurrency_error = -902,
    config_retry_error = -903,
    config_utility_error = -904,

    // Transient Transfer Errors (-910 to -929)
    transfer_timeout = -910,
    rate_limited = -911,
    utility_exit_failure = -912,
    utility_launch_failed = -913,
    stream_interrupted = -914,
    storage_unavailable = -915,
    read_failed = -916,
    write_failed = -917,

    // Permanent Transfer Errors (-930 to -949)
    malformed_uri = -930,
    source_not_found = -931,
    unsupported_scheme = -932,
    size_mismatch = -933,
    checksum_mismatch = -934,
    access_denied = -935,

    // Partial Batch Failures (-950 to -959)
    unreported_outcome = -950,

    // Cancellation and Internal Errors (-960 to -969)
    cancelled = -960,
    internal_error = -961,
};

/**
 * @brief Broad error category used by retry and reporting decisions
 */
enum class error_category {
    none,
    configuration,
    transient,
    permanent,
    partial_batch,
    cancellation,
};

/**
 * @brief Convert sync_error_code to string
 */
[[nodiscard]] constexpr auto to_string(sync_error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case sync_error_code::success:
            return "success";

        // Configuration Errors
        case sync_error_code::config_invalid:
            return "invalid configuration";
        case sync_error_code::config_batch_size_error:
            return "max_batch_size must be at least 1";
        case sync_error_code::config_concurrency_error:
            return "concurrency limits must be at least 1";
        case sync_error_code::config_retry_error:
            return "invalid retry policy";
        case sync_error_code::config_utility_error:
            return "batch-copy utility is not configured";

        // Transient Transfer Errors
        case sync_error_code::transfer_timeout:
            return "transfer timeout";
        case sync_error_code::rate_limited:
            return "rate limited by storage service";
        case sync_error_code::utility_exit_failure:
            return "batch-copy utility exited with failure";
        case sync_error_code::utility_launch_failed:
            return "batch-copy utility could not be started";
        case sync_error_code::stream_interrupted:
            return "stream interrupted";
        case sync_error_code::storage_unavailable:
            return "storage temporarily unavailable";
        case sync_error_code::read_failed:
            return "source read failed";
        case sync_error_code::write_failed:
            return "destination write failed";

        // Permanent Transfer Errors
        case sync_error_code::malformed_uri:
            return "malformed object URI";
        case sync_error_code::source_not_found:
            return "source object not found";
        case sync_error_code::unsupported_scheme:
            return "unsupported URI scheme";
        case sync_error_code::size_mismatch:
            return "transferred size does not match expected size";
        case sync_error_code::checksum_mismatch:
            return "content checksum verification failed";
        case sync_error_code::access_denied:
            return "access denied";

        // Partial Batch Failures
        case sync_error_code::unreported_outcome:
            return "unreported by batch-copy utility";

        // Cancellation and Internal Errors
        case sync_error_code::cancelled:
            return "cancelled";
        case sync_error_code::internal_error:
            return "internal error";

        default:
            return "unknown error";
    }
}

/**
 * @brief Get the raw integer value of an error code
 */
[[nodiscard]] constexpr auto to_int(sync_error_code code) noexcept -> int32_t {
    return static_cast<int32_t>(code);
}

/**
 * @brief Classify an error code into its category
 */
[[nodiscard]] constexpr auto classify(sync_error_code code) noexcept -> error_category {
    const auto value = to_int(code);
    if (value == 0) return error_category::none;
    if (value <= -900 && value >= -909) return error_category::configuration;
    if (value <= -910 && value >= -929) return error_category::transient;
    if (value <= -930 && value >= -949) return error_category::permanent;
    if (value <= -950 && value >= -959) return error_category::partial_batch;
    return error_category::cancellation;
}

[[nodiscard]] constexpr auto is_configuration_error(sync_error_code code) noexcept -> bool {
    return classify(code) == error_category::configuration;
}

[[nodiscard]] constexpr auto is_transient(sync_error_code code) noexcept -> bool {
    return classify(code) == error_category::transient;
}

[[nodiscard]] constexpr auto is_permanent(sync_error_code code) noexcept -> bool {
    return classify(code) == error_category::permanent;
}

/**
 * @brief Check whether an item failing with this code may be retried
 *
 * Unreported items of a partial batch are retried like transient failures.
 */
[[nodiscard]] constexpr auto is_retryable(sync_error_code code) noexcept -> bool {
    const auto category = classify(code);
    return category == error_category::transient ||
           category == error_category::partial_batch;
}

/**
 * @brief Convert error_category to string
 */
[[nodiscard]] constexpr auto to_string(error_category category) noexcept
    -> std::string_view {
    switch (category) {
        case error_category::none: return "none";
        case error_category::configuration: return "configuration";
        case error_category::transient: return "transient";
        case error_category::permanent: return "permanent";
        case error_category::partial_batch: return "partial_batch";
        case error_category::cancellation: return "cancellation";
        default: return "unknown";
    }
}

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_CORE_ERROR_CODES_H
