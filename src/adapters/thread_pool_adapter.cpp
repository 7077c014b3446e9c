// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "kcenon/archive_sync/adapters/thread_pool_adapter.h"

#include <exception>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::archive_sync::adapters {

// ============================================================================
// Lane accounting (shared by both pools)
// ============================================================================

namespace {

class lane_counter {
public:
    void increment(const std::string& lane) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[lane];
    }

    void decrement(const std::string& lane) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(lane);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& lane) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(lane);
        return it == counts_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

#if KCENON_WITH_THREAD_SYSTEM
// Runs the task, releases the lane, then publishes the outcome on the promise.
void run_tracked(const std::function<void()>& task, std::promise<void>& promise,
                 lane_counter& lanes, const std::string& lane) {
    std::exception_ptr failure;
    try {
        task();
    } catch (...) {
        failure = std::current_exception();
    }
    lanes.decrement(lane);
    if (failure) {
        promise.set_exception(failure);
    } else {
        promise.set_value();
    }
}
#endif

auto default_worker_count(size_t requested) -> size_t {
    if (requested != 0) return requested;
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

}  // namespace

// ============================================================================
// thread_system_pool_adapter
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_pool_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    lane_counter lanes;
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_pool_adapter::~thread_system_pool_adapter() {
    if (pimpl_ && pimpl_->pool) {
        pimpl_->pool->stop();
    }
}

std::shared_ptr<thread_system_pool_adapter>
thread_system_pool_adapter::create_default(size_t worker_count,
                                           const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_pool_adapter>(std::move(pool), pool_name,
                                                        worker_count);
}

std::future<void> thread_system_pool_adapter::submit(std::function<void()> task,
                                                     const std::string& lane) {
    return submit_delayed(std::move(task), std::chrono::milliseconds(0), lane);
}

std::future<void> thread_system_pool_adapter::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay,
    const std::string& lane) {
    pimpl_->lanes.increment(lane);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    // The adapter outlives every task it runs (the pool is stopped in the destructor).
    auto* lanes = &pimpl_->lanes;
    auto wrapped = [task = std::move(task), promise, lanes, lane, delay]() {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        run_tracked(task, *promise, *lanes, lane);
    };

    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped), lane));
    return future;
}

size_t thread_system_pool_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_pool_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_pool_adapter::pending_tasks(const std::string& lane) const {
    return pimpl_->lanes.count(lane);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_pool
// ============================================================================

struct async_pool::impl {
    lane_counter lanes;
};

async_pool::async_pool() : pimpl_(std::make_shared<impl>()) {}

async_pool::~async_pool() = default;

std::future<void> async_pool::submit(std::function<void()> task, const std::string& lane) {
    return submit_delayed(std::move(task), std::chrono::milliseconds(0), lane);
}

std::future<void> async_pool::submit_delayed(std::function<void()> task,
                                             std::chrono::milliseconds delay,
                                             const std::string& lane) {
    pimpl_->lanes.increment(lane);

    auto state = pimpl_;
    return std::async(std::launch::async, [state, task = std::move(task), lane, delay]() {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        try {
            task();
        } catch (...) {
            state->lanes.decrement(lane);
            throw;
        }
        state->lanes.decrement(lane);
    });
}

size_t async_pool::worker_count() const {
    return default_worker_count(0);
}

bool async_pool::is_running() const { return true; }

size_t async_pool::pending_tasks(const std::string& lane) const {
    return pimpl_->lanes.count(lane);
}

// ============================================================================
// sync_pool_factory
// ============================================================================

std::shared_ptr<sync_thread_pool_interface> sync_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pool_adapter::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_pool>();
#endif
}

}  // namespace kcenon::archive_sync::adapters
