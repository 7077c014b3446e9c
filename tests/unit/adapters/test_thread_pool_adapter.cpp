/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the batch and item worker pools
 */

#include <gtest/gtest.h>

#include <kcenon/archive_sync/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

namespace kcenon::archive_sync::test {

using adapters::sync_pool_factory;
using adapters::sync_thread_pool_interface;

class ThreadPoolAdapterTest : public ::testing::Test {
protected:
    void SetUp() override { pool_ = sync_pool_factory::create(4, "archive_sync_test_pool"); }

    std::shared_ptr<sync_thread_pool_interface> pool_;
};

TEST_F(ThreadPoolAdapterTest, FactoryCreatesRunningPool) {
    ASSERT_NE(pool_, nullptr);
    EXPECT_TRUE(pool_->is_running());
    EXPECT_GE(pool_->worker_count(), 1u);
}

TEST_F(ThreadPoolAdapterTest, SubmitRunsEveryTask) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(pool_->submit([&counter] { ++counter; }, "direct"));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), 32);
    EXPECT_EQ(pool_->pending_tasks("direct"), 0u);
}

TEST_F(ThreadPoolAdapterTest, ExceptionTravelsThroughFuture) {
    auto future = pool_->submit([] { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(ThreadPoolAdapterTest, DelayedSubmitWaits) {
    const auto start = std::chrono::steady_clock::now();
    auto future = pool_->submit_delayed([] {}, std::chrono::milliseconds(50), "retry");
    future.get();
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

TEST_F(ThreadPoolAdapterTest, PendingTasksTracksLane) {
    std::promise<void> gate;
    auto opened = gate.get_future().share();

    auto blocked = pool_->submit([opened] { opened.wait(); }, "fallback");
    EXPECT_EQ(pool_->pending_tasks("fallback"), 1u);
    EXPECT_EQ(pool_->pending_tasks("direct"), 0u);

    gate.set_value();
    blocked.get();
    EXPECT_EQ(pool_->pending_tasks("fallback"), 0u);
}

}  // namespace kcenon::archive_sync::test
