/**
 * @file sync_coordinator.cpp
 * @brief Entry point: plan, dispatch batches, record statistics, merge results
 */

#include "kcenon/archive_sync/transfer/sync_coordinator.h"

#include "kcenon/archive_sync/core/logging.h"
#include "kcenon/archive_sync/transfer/batch_planner.h"
#include "kcenon/archive_sync/transfer/direct_transfer_executor.h"
#include "kcenon/archive_sync/transfer/fallback_transfer_executor.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>

namespace kcenon::archive_sync {

namespace {

constexpr auto dispatch_poll_interval = std::chrono::milliseconds(50);

auto elapsed_since(std::chrono::steady_clock::time_point start) -> duration {
    return std::chrono::duration_cast<duration>(std::chrono::steady_clock::now() - start);
}

auto cancelled_result(const batch_entry& entry, transfer_mode mode) -> transfer_result {
    auto r = transfer_result::skip(entry, mode, "cancelled");
    r.error_code = sync_error_code::cancelled;
    return r;
}

/**
 * @brief Runs a callable when leaving scope
 */
class scope_exit {
public:
    explicit scope_exit(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~scope_exit() { fn_(); }

    scope_exit(const scope_exit&) = delete;
    auto operator=(const scope_exit&) -> scope_exit& = delete;

private:
    std::function<void()> fn_;
};

auto failed_batch(const transfer_batch& batch, const std::string& detail)
    -> std::vector<transfer_result> {
    std::vector<transfer_result> results;
    results.reserve(batch.size());
    for (const auto& entry : batch.entries) {
        results.push_back(transfer_result::failure(entry, batch.mode,
                                                   sync_error_code::internal_error, detail,
                                                   duration{0}, 1));
    }
    return results;
}

/**
 * @brief Run one batch, converting escaping exceptions and missing results
 *        into failed results
 */
auto run_batch(transfer_executor& executor, const transfer_batch& batch)
    -> std::vector<transfer_result> {
    std::vector<transfer_result> results;
    try {
        results = executor.execute(batch);
    } catch (const std::exception& e) {
        AS_LOG_ERROR(log_category::coordinator,
                     "executor failed on batch " + std::to_string(batch.id) + ": " + e.what());
        return failed_batch(batch, std::string("executor failed: ") + e.what());
    } catch (...) {
        AS_LOG_ERROR(log_category::coordinator,
                     "executor failed on batch " + std::to_string(batch.id) +
                         " with a non-standard exception");
        return failed_batch(batch, "executor failed: unknown exception");
    }

    if (results.size() > batch.size()) {
        results.resize(batch.size());
    }
    for (auto i = results.size(); i < batch.size(); ++i) {
        results.push_back(transfer_result::failure(batch.entries[i], batch.mode,
                                                   sync_error_code::internal_error,
                                                   "executor returned no result",
                                                   duration{0}, 0));
    }
    return results;
}

}  // namespace

sync_coordinator::sync_coordinator() : sync_coordinator(sync_dependencies{}) {}

sync_coordinator::sync_coordinator(sync_dependencies deps) : deps_(std::move(deps)) {
    get_logger().initialize();
}

sync_coordinator::~sync_coordinator() = default;

auto sync_coordinator::sync(const std::vector<transfer_item>& items,
                            const sync_configuration& config) -> result<sync_report> {
    return sync(items, config, cancellation_token{});
}

auto sync_coordinator::sync(const std::vector<transfer_item>& items,
                            const sync_configuration& config,
                            cancellation_token token) -> result<sync_report> {
    const auto run_start = std::chrono::steady_clock::now();
    monitor_.reset();

    // Registered before planning so cancel() during capability probes is seen
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        active_token_ = token;
    }
    scope_exit unregister_token([this] {
        std::lock_guard<std::mutex> lock(token_mutex_);
        active_token_.reset();
    });

    auto runner = deps_.runner;
    if (!runner) {
        runner = std::make_shared<process::posix_process_runner>();
    }
    auto stores = deps_.stores;
    if (!stores) {
        stores = std::make_shared<storage::store_registry>(
            storage::store_registry::create_default(config.utility, runner));
    }
    auto probe = deps_.probe;
    if (!probe) {
        probe = std::make_shared<store_capability_probe>(stores);
    }

    batch_planner planner(probe);
    auto planned = planner.plan(items, config);
    if (!planned) {
        return unexpected(planned.error());
    }
    auto& batches = planned.value();

    auto direct = deps_.direct_executor;
    if (!direct) {
        direct = std::make_shared<direct_transfer_executor>(config, runner);
    }
    auto fallback = deps_.fallback_executor;
    if (!fallback) {
        fallback = std::make_shared<fallback_transfer_executor>(config, stores);
    }
    auto pool = deps_.pool;
    if (!pool) {
        pool = adapters::sync_pool_factory::create(config.max_parallel_batches,
                                                   "archive_sync_batches");
    }

    std::vector<std::optional<transfer_result>> slots(items.size());
    std::vector<std::future<void>> futures;
    std::mutex window_mutex;
    std::condition_variable window_cv;
    std::size_t in_flight = 0;
    std::size_t dispatched = 0;

    for (; dispatched < batches.size(); ++dispatched) {
        {
            std::unique_lock<std::mutex> lock(window_mutex);
            while (in_flight >= config.max_parallel_batches && !token.is_cancelled()) {
                window_cv.wait_for(lock, dispatch_poll_interval);
            }
            if (token.is_cancelled()) {
                break;
            }
            ++in_flight;
        }

        const auto* batch = &batches[dispatched];
        auto executor = batch->mode == transfer_mode::direct ? direct : fallback;

        AS_LOG_DEBUG(log_category::coordinator,
                     "dispatching batch " + std::to_string(batch->id) + " (" +
                         std::string(to_string(batch->mode)) + ", " +
                         std::to_string(batch->size()) + " items)");

        std::function<void()> task = [this, executor, batch, &slots, &window_mutex,
                                      &window_cv, &in_flight] {
            scope_exit release_slot([&window_mutex, &window_cv, &in_flight] {
                std::lock_guard<std::mutex> lock(window_mutex);
                --in_flight;
                window_cv.notify_all();
            });

            const auto start = std::chrono::steady_clock::now();
            auto results = run_batch(*executor, *batch);
            monitor_.record(*batch, batch->mode, results, elapsed_since(start));

            for (std::size_t i = 0; i < results.size(); ++i) {
                slots[batch->entries[i].index] = std::move(results[i]);
            }
        };

        try {
            futures.push_back(pool->submit(task, std::string(to_string(batch->mode))));
        } catch (const std::exception& e) {
            AS_LOG_WARN(log_category::coordinator,
                        "batch pool rejected batch " + std::to_string(batch->id) +
                            ", running it inline: " + e.what());
            try {
                task();
            } catch (...) {
                AS_LOG_ERROR(log_category::coordinator,
                             "inline batch " + std::to_string(batch->id) + " failed");
            }
        }
    }

    for (auto& future : futures) {
        future.wait();
    }
    for (auto& future : futures) {
        try {
            future.get();
        } catch (const std::exception& e) {
            AS_LOG_ERROR(log_category::coordinator, std::string("batch task failed: ") + e.what());
        } catch (...) {
            AS_LOG_ERROR(log_category::coordinator, "batch task failed with unknown exception");
        }
    }

    if (dispatched < batches.size()) {
        std::vector<transfer_result> skipped;
        for (auto b = dispatched; b < batches.size(); ++b) {
            for (const auto& entry : batches[b].entries) {
                skipped.push_back(cancelled_result(entry, batches[b].mode));
                slots[entry.index] = skipped.back();
            }
        }
        monitor_.record_skipped(skipped);
        AS_LOG_INFO(log_category::coordinator,
                    "run cancelled: " + std::to_string(skipped.size()) + " items skipped");
    }

    sync_report report;
    report.results.reserve(items.size());
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (slots[i]) {
            report.results.push_back(std::move(*slots[i]));
            continue;
        }
        // A batch task died before storing its results
        batch_entry orphan{i, items[i], items[i].destination_uri};
        auto failed = transfer_result::failure(orphan, transfer_mode::fallback,
                                               sync_error_code::internal_error,
                                               "no result recorded", duration{0}, 0);
        monitor_.record_skipped({failed});
        report.results.push_back(std::move(failed));
    }
    report.stats = monitor_.snapshot();

    sync_log_context ctx;
    ctx.item_count = report.stats.total_items;
    ctx.bytes = report.stats.total_bytes;
    ctx.duration_ms = static_cast<uint64_t>(elapsed_since(run_start).count());
    AS_LOG_INFO_CTX(log_category::coordinator,
                    "run finished: " + std::to_string(report.stats.direct_items) + " direct, " +
                        std::to_string(report.stats.fallback_items) + " fallback, " +
                        std::to_string(report.stats.failed_items) + " failed, " +
                        std::to_string(report.stats.skipped_items) + " skipped",
                    ctx);
    return report;
}

void sync_coordinator::cancel() {
    std::lock_guard<std::mutex> lock(token_mutex_);
    if (active_token_) {
        active_token_->cancel();
    }
}

auto sync_coordinator::snapshot() const -> efficiency_stats { return monitor_.snapshot(); }

}  // namespace kcenon::archive_sync
