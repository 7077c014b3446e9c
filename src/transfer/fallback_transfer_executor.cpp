/**
 * @file fallback_transfer_executor.cpp
 * @brief Read-then-write transfers through a local temporary buffer
 */

#include "kcenon/archive_sync/transfer/fallback_transfer_executor.h"

#include "kcenon/archive_sync/core/checksum.h"
#include "kcenon/archive_sync/core/logging.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <future>
#include <optional>
#include <thread>

#include <unistd.h>

namespace kcenon::archive_sync {

namespace {

auto elapsed_since(std::chrono::steady_clock::time_point start) -> duration {
    return std::chrono::duration_cast<duration>(std::chrono::steady_clock::now() - start);
}

auto remaining_until(std::chrono::steady_clock::time_point deadline)
    -> std::chrono::milliseconds {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

}  // namespace

// scoped_buffer

auto scoped_buffer::create(const std::filesystem::path& directory) -> result<scoped_buffer> {
    std::error_code ec;
    auto parent = directory.empty() ? std::filesystem::temp_directory_path(ec) : directory;
    if (ec) {
        return make_error(sync_error_code::write_failed,
                          "no temporary directory: " + ec.message());
    }

    auto pattern = (parent / "archive_sync-XXXXXX").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        return make_error(sync_error_code::write_failed,
                          "cannot create buffer in " + parent.string() + ": " +
                              std::strerror(errno));
    }
    ::close(fd);
    return scoped_buffer(std::filesystem::path(name.data()));
}

scoped_buffer::scoped_buffer(scoped_buffer&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

auto scoped_buffer::operator=(scoped_buffer&& other) noexcept -> scoped_buffer& {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

scoped_buffer::~scoped_buffer() { release(); }

void scoped_buffer::release() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    path_.clear();
}

// fallback_transfer_executor

fallback_transfer_executor::fallback_transfer_executor(
    sync_configuration config,
    std::shared_ptr<const storage::store_registry> stores,
    std::shared_ptr<adapters::sync_thread_pool_interface> pool)
    : config_(std::move(config)),
      stores_(std::move(stores)),
      pool_(std::move(pool)),
      sleep_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
    if (!pool_) {
        pool_ = adapters::sync_pool_factory::create(
            std::max<std::size_t>(config_.max_concurrency, 1), "archive_sync_fallback");
    }
}

auto fallback_transfer_executor::execute(const transfer_batch& batch)
    -> std::vector<transfer_result> {
    const auto count = batch.size();
    std::vector<std::optional<transfer_result>> results(count);
    std::atomic<std::size_t> next{0};

    auto worker = [&] {
        for (auto i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
            const auto& entry = batch.entries[i];
            try {
                results[i] = transfer_one(entry);
            } catch (const std::exception& e) {
                AS_LOG_ERROR(log_category::fallback,
                             "unexpected error transferring " + entry.item.source_uri + ": " +
                                 e.what());
                results[i] = transfer_result::failure(entry, transfer_mode::fallback,
                                                      sync_error_code::internal_error, e.what(),
                                                      duration{0}, 1);
            }
        }
    };

    const auto workers = std::min(std::max<std::size_t>(config_.max_concurrency, 1), count);
    std::vector<std::future<void>> futures;
    for (std::size_t w = 1; w < workers; ++w) {
        futures.push_back(pool_->submit(worker, "fallback.items"));
    }
    // The calling thread is always one of the workers, so the batch makes
    // progress even when the item pool is saturated by other batches
    worker();

    for (auto& future : futures) {
        future.wait();
    }
    for (auto& future : futures) {
        try {
            future.get();
        } catch (const std::exception& e) {
            AS_LOG_ERROR(log_category::fallback, std::string("item worker failed: ") + e.what());
        }
    }

    std::vector<transfer_result> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        if (results[i]) {
            out.push_back(std::move(*results[i]));
        } else {
            out.push_back(transfer_result::failure(batch.entries[i], transfer_mode::fallback,
                                                   sync_error_code::internal_error,
                                                   "item was not processed", duration{0}, 0));
        }
    }
    return out;
}

auto fallback_transfer_executor::transfer_one(const batch_entry& entry) -> transfer_result {
    const auto start = std::chrono::steady_clock::now();
    const auto& item = entry.item;

    auto fail = [&](sync_error_code code, std::string detail, uint32_t attempts) {
        sync_log_context ctx;
        ctx.mode = std::string(to_string(transfer_mode::fallback));
        ctx.source_uri = item.source_uri;
        ctx.destination_uri = entry.destination;
        ctx.attempt = attempts;
        ctx.error_message = detail;
        AS_LOG_WARN_CTX(log_category::fallback, "item failed", ctx);
        return transfer_result::failure(entry, transfer_mode::fallback, code, std::move(detail),
                                        elapsed_since(start), attempts);
    };

    auto src = storage::object_uri::parse(item.source_uri);
    if (!src) {
        return fail(src.error().code, src.error().message, 0);
    }
    auto dst = storage::object_uri::parse(entry.destination);
    if (!dst) {
        return fail(dst.error().code, dst.error().message, 0);
    }
    if (dst.value().is_container()) {
        return fail(sync_error_code::malformed_uri,
                    "destination names a container: " + entry.destination, 0);
    }
    if (!stores_) {
        return fail(sync_error_code::internal_error, "no object stores configured", 0);
    }

    auto src_store = stores_->find(src.value());
    if (!src_store) {
        return fail(src_store.error().code, src_store.error().message, 0);
    }
    auto dst_store = stores_->find(dst.value());
    if (!dst_store) {
        return fail(dst_store.error().code, dst_store.error().message, 0);
    }

    if (config_.skip_existing) {
        auto existing = dst_store.value()->stat(dst.value(), config_.item_timeout);
        if (!existing) {
            AS_LOG_DEBUG(log_category::fallback,
                         "cannot stat destination, transferring: " + existing.error().message);
        } else if (existing.value()) {
            auto wanted = item.expected_size;
            if (!wanted) {
                auto source_stat = src_store.value()->stat(src.value(), config_.item_timeout);
                if (source_stat && source_stat.value()) {
                    wanted = source_stat.value()->size;
                }
            }
            if (wanted && existing.value()->size == *wanted) {
                return transfer_result::skip(entry, transfer_mode::fallback,
                                             "destination up to date");
            }
        }
    }

    const auto max_attempts =
        static_cast<uint32_t>(std::max<std::size_t>(config_.retry.max_attempts, 1));
    sync_error_code last_code = sync_error_code::internal_error;
    std::string last_detail;

    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1) {
            auto delay = calculate_retry_delay(config_.retry, attempt - 1);
            AS_LOG_DEBUG(log_category::fallback,
                         "retrying " + item.source_uri + " in " +
                             std::to_string(delay.count()) + " ms");
            sleep_(delay);
        }

        // item_timeout bounds one attempt; expiry consumes the attempt
        const auto attempt_deadline = std::chrono::steady_clock::now() + config_.item_timeout;

        auto buffer = scoped_buffer::create(config_.temp_directory);
        if (!buffer) {
            last_code = buffer.error().code;
            last_detail = buffer.error().message;
            continue;
        }

        auto read = src_store.value()->read_into(src.value(), buffer.value().path(),
                                                 remaining_until(attempt_deadline));
        if (!read) {
            if (!is_retryable(read.error().code)) {
                return fail(read.error().code, read.error().message, attempt);
            }
            last_code = read.error().code;
            last_detail = read.error().message;
            continue;
        }

        if (item.expected_size && read.value() != *item.expected_size) {
            return fail(sync_error_code::size_mismatch,
                        "size mismatch: expected " + std::to_string(*item.expected_size) +
                            " bytes, read " + std::to_string(read.value()),
                        attempt);
        }

        if (item.content_checksum) {
            auto verified = checksum::verify_file(buffer.value().path(), *item.content_checksum);
            if (!verified) {
                if (!is_retryable(verified.error().code)) {
                    return fail(verified.error().code, verified.error().message, attempt);
                }
                last_code = verified.error().code;
                last_detail = verified.error().message;
                continue;
            }
        }

        auto left = remaining_until(attempt_deadline);
        if (left.count() == 0) {
            last_code = sync_error_code::transfer_timeout;
            last_detail = "item timeout of " + std::to_string(config_.item_timeout.count()) +
                          " ms expired before write";
            continue;
        }

        auto written = dst_store.value()->write_from(buffer.value().path(), dst.value(), left);
        if (!written) {
            if (!is_retryable(written.error().code)) {
                return fail(written.error().code, written.error().message, attempt);
            }
            last_code = written.error().code;
            last_detail = written.error().message;
            continue;
        }

        return transfer_result::success(entry, transfer_mode::fallback, read.value(),
                                        elapsed_since(start), attempt);
    }

    return fail(last_code,
                last_detail + " (failed after " + std::to_string(max_attempts) + " attempts)",
                max_attempts);
}

}  // namespace kcenon::archive_sync
