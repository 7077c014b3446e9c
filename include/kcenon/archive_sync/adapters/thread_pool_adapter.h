// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter used to run transfer batches and items
 *
 * Provides one pool interface with two backends:
 * - thread_system's thread_pool when the library is available
 * - std::async when it is not
 *
 * Tasks are submitted to a named lane ("direct", "fallback", "items") so
 * the number of queued tasks can be inspected per lane.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::archive_sync::adapters {

/**
 * @brief Interface for the worker pool that executes transfer work
 */
class sync_thread_pool_interface {
public:
    virtual ~sync_thread_pool_interface() = default;

    /**
     * @brief Submit a task on a lane
     * @param task The task to execute
     * @param lane Lane name used for pending-task accounting
     * @return Future completed when the task finishes (carries its exception)
     */
    virtual std::future<void> submit(std::function<void()> task,
                                     const std::string& lane = "default") = 0;

    /**
     * @brief Submit a task that starts after a delay (retry backoff)
     */
    virtual std::future<void> submit_delayed(std::function<void()> task,
                                             std::chrono::milliseconds delay,
                                             const std::string& lane = "default") = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted on a lane that have not finished yet
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& lane) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Pool backed by thread_system::thread_pool
 *
 * @note Thread-safe: all public methods may be called from multiple threads.
 */
class thread_system_pool_adapter : public sync_thread_pool_interface {
public:
    explicit thread_system_pool_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "archive_sync_pool",
        size_t worker_count = 0);

    ~thread_system_pool_adapter() override;

    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    thread_system_pool_adapter& operator=(const thread_system_pool_adapter&) = delete;

    /**
     * @brief Create a started pool with the given number of workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pool_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "archive_sync_pool");

    std::future<void> submit(std::function<void()> task,
                             const std::string& lane = "default") override;
    std::future<void> submit_delayed(std::function<void()> task,
                                     std::chrono::milliseconds delay,
                                     const std::string& lane = "default") override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& lane) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool using std::async
 *
 * Every task gets its own thread; callers bound concurrency themselves.
 */
class async_pool : public sync_thread_pool_interface {
public:
    async_pool();
    ~async_pool() override;

    async_pool(const async_pool&) = delete;
    async_pool& operator=(const async_pool&) = delete;

    std::future<void> submit(std::function<void()> task,
                             const std::string& lane = "default") override;
    std::future<void> submit_delayed(std::function<void()> task,
                                     std::chrono::milliseconds delay,
                                     const std::string& lane = "default") override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& lane) const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Creates the best available pool
 *
 * thread_system_pool_adapter when KCENON_WITH_THREAD_SYSTEM, async_pool otherwise.
 */
class sync_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<sync_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "archive_sync_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::archive_sync::adapters
