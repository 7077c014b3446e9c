/**
 * @file transfer_types.cpp
 * @brief transfer_result factory helpers
 */

#include "kcenon/archive_sync/core/transfer_types.h"

#include <utility>

namespace kcenon::archive_sync {

auto transfer_result::success(const batch_entry& entry, transfer_mode mode,
                              uint64_t bytes, duration elapsed,
                              uint32_t attempts) -> transfer_result {
    transfer_result r;
    r.item = entry.item;
    r.status = transfer_status::succeeded;
    r.bytes_transferred = bytes;
    r.elapsed = elapsed;
    r.mode = mode;
    r.attempts = attempts;
    r.resolved_destination = entry.destination;
    return r;
}

auto transfer_result::failure(const batch_entry& entry, transfer_mode mode,
                              sync_error_code code, std::string detail,
                              duration elapsed, uint32_t attempts) -> transfer_result {
    transfer_result r;
    r.item = entry.item;
    r.status = transfer_status::failed;
    r.elapsed = elapsed;
    r.error_code = code;
    r.error_detail = std::move(detail);
    r.mode = mode;
    r.attempts = attempts;
    r.resolved_destination = entry.destination;
    return r;
}

auto transfer_result::skip(const batch_entry& entry, transfer_mode mode,
                           std::string detail) -> transfer_result {
    transfer_result r;
    r.item = entry.item;
    r.status = transfer_status::skipped;
    r.error_detail = std::move(detail);
    r.mode = mode;
    r.resolved_destination = entry.destination;
    return r;
}

}  // namespace kcenon::archive_sync
