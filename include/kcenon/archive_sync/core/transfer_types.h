/**
 * @file transfer_types.h
 * @brief Transfer data model: items, batches, results and efficiency statistics
 * @version 0.1.0
 */

#ifndef KCENON_ARCHIVE_SYNC_CORE_TRANSFER_TYPES_H
#define KCENON_ARCHIVE_SYNC_CORE_TRANSFER_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error_codes.h"

namespace kcenon::archive_sync {

using duration = std::chrono::milliseconds;

/**
 * @brief Execution path chosen for an item
 */
enum class transfer_mode {
    direct,    ///< Server-side copy through the batch-copy utility
    fallback,  ///< Read into a local buffer, then write to the destination
};

[[nodiscard]] constexpr auto to_string(transfer_mode mode) noexcept -> std::string_view {
    switch (mode) {
        case transfer_mode::direct: return "direct";
        case transfer_mode::fallback: return "fallback";
        default: return "unknown";
    }
}

/**
 * @brief Final status of one submitted item
 */
enum class transfer_status {
    succeeded,
    failed,
    skipped,
};

[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept -> std::string_view {
    switch (status) {
        case transfer_status::succeeded: return "succeeded";
        case transfer_status::failed: return "failed";
        case transfer_status::skipped: return "skipped";
        default: return "unknown";
    }
}

/**
 * @brief One object to move from a source URI to a destination URI
 *
 * Identity is the (source_uri, destination_uri) pair. A destination ending
 * in '/' names a container; the object name is then derived from the source.
 */
struct transfer_item {
    std::string source_uri;
    std::string destination_uri;
    std::optional<uint64_t> expected_size;
    std::optional<std::string> content_checksum;  ///< "sha256:<hex>", "md5:<hex>" or bare hex

    [[nodiscard]] auto operator==(const transfer_item& other) const -> bool {
        return source_uri == other.source_uri && destination_uri == other.destination_uri;
    }
};

/**
 * @brief Item placed in a batch together with its run-level bookkeeping
 */
struct batch_entry {
    std::size_t index = 0;    ///< Position in the submitted item list
    transfer_item item;
    std::string destination;  ///< Resolved destination URI
};

/**
 * @brief Bounded, single-mode group of items
 */
struct transfer_batch {
    uint64_t id = 0;
    transfer_mode mode = transfer_mode::fallback;
    std::vector<batch_entry> entries;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries.empty(); }
};

/**
 * @brief Outcome for exactly one submitted item
 */
struct transfer_result {
    transfer_item item;
    transfer_status status = transfer_status::failed;
    uint64_t bytes_transferred = 0;
    duration elapsed{0};
    std::optional<std::string> error_detail;
    sync_error_code error_code = sync_error_code::success;
    transfer_mode mode = transfer_mode::fallback;
    uint32_t attempts = 0;
    std::string resolved_destination;

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return status == transfer_status::succeeded;
    }
    [[nodiscard]] auto failed() const noexcept -> bool {
        return status == transfer_status::failed;
    }
    [[nodiscard]] auto skipped() const noexcept -> bool {
        return status == transfer_status::skipped;
    }

    [[nodiscard]] static auto success(const batch_entry& entry, transfer_mode mode,
                                      uint64_t bytes, duration elapsed,
                                      uint32_t attempts) -> transfer_result;

    [[nodiscard]] static auto failure(const batch_entry& entry, transfer_mode mode,
                                      sync_error_code code, std::string detail,
                                      duration elapsed, uint32_t attempts) -> transfer_result;

    [[nodiscard]] static auto skip(const batch_entry& entry, transfer_mode mode,
                                   std::string detail) -> transfer_result;
};

/**
 * @brief Aggregate counters for one coordinator run
 *
 * direct_items and fallback_items count successes only.
 */
struct efficiency_stats {
    uint64_t total_items = 0;
    uint64_t direct_items = 0;
    uint64_t fallback_items = 0;
    uint64_t failed_items = 0;
    uint64_t skipped_items = 0;
    uint64_t total_bytes = 0;
    uint64_t direct_bytes = 0;
    uint64_t fallback_bytes = 0;
    duration total_duration{0};
    uint64_t operations_saved = 0;
    uint64_t batches_recorded = 0;

    [[nodiscard]] auto successful_items() const noexcept -> uint64_t {
        return direct_items + fallback_items;
    }

    /**
     * @brief Share of the fallback I/O operations avoided by direct copies
     *
     * A fallback transfer costs two operations per item (read + write), so
     * the ratio is operations_saved / (2 * total_items).
     */
    [[nodiscard]] auto efficiency_ratio() const noexcept -> double {
        if (total_items == 0) return 0.0;
        return static_cast<double>(operations_saved) /
               (2.0 * static_cast<double>(total_items));
    }

    /**
     * @brief Percentage of items that succeeded (0.0 - 100.0)
     */
    [[nodiscard]] auto success_rate() const noexcept -> double {
        if (total_items == 0) return 0.0;
        return static_cast<double>(successful_items()) * 100.0 /
               static_cast<double>(total_items);
    }

    /**
     * @brief Average throughput in bytes per second over recorded batch time
     */
    [[nodiscard]] auto throughput_bps() const noexcept -> double {
        if (total_duration.count() == 0) return 0.0;
        return static_cast<double>(total_bytes) * 1000.0 /
               static_cast<double>(total_duration.count());
    }
};

}  // namespace kcenon::archive_sync

// Hash support for transfer_item (identity only)
template <>
struct std::hash<kcenon::archive_sync::transfer_item> {
    auto operator()(const kcenon::archive_sync::transfer_item& item) const noexcept
        -> std::size_t {
        auto h1 = std::hash<std::string>{}(item.source_uri);
        auto h2 = std::hash<std::string>{}(item.destination_uri);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

#endif  // KCENON_ARCHIVE_SYNC_CORE_TRANSFER_TYPES_H
