/**
 * @file test_sync_scenarios.cpp
 * @brief End-to-end coordinator runs over scripted and in-memory backends
 */

#include "test_fixtures.h"

#include <algorithm>
#include <atomic>
#include <set>
#include <stdexcept>

namespace kcenon::archive_sync::test {

namespace {

class throwing_executor : public transfer_executor {
public:
    [[nodiscard]] auto mode() const noexcept -> transfer_mode override {
        return transfer_mode::direct;
    }

    [[nodiscard]] auto execute(const transfer_batch&) -> std::vector<transfer_result> override {
        throw std::runtime_error("utility crashed");
    }
};

class int_throwing_executor : public transfer_executor {
public:
    [[nodiscard]] auto mode() const noexcept -> transfer_mode override {
        return transfer_mode::direct;
    }

    [[nodiscard]] auto execute(const transfer_batch&) -> std::vector<transfer_result> override {
        ++calls_;
        throw 42;
    }

    [[nodiscard]] auto calls() const -> std::size_t { return calls_.load(); }

private:
    std::atomic<std::size_t> calls_{0};
};

class throwing_probe : public capability_probe {
public:
    [[nodiscard]] auto supports_direct(const storage::object_uri&, const storage::object_uri&,
                                       std::chrono::milliseconds) -> result<bool> override {
        throw std::runtime_error("credentials provider exploded");
    }
};

}  // namespace

class SyncScenariosTest : public SyncFixture {};

// =============================================================================
// Direct runs
// =============================================================================

TEST_F(SyncScenariosTest, ThousandSameFamilyItemsGoDirect) {
    runner_->set_default(scripted_process_runner::all_succeed(2048));
    auto probe = std::make_shared<counting_probe>(true);
    auto deps = dependencies();
    deps.probe = probe;
    sync_coordinator coordinator(deps);

    auto items = same_family_items(1000);
    auto report = coordinator.sync(items, config_);

    ASSERT_TRUE(report);
    const auto& results = report.value().results;
    ASSERT_EQ(results.size(), 1000u);
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_TRUE(results[i].succeeded()) << results[i].error_detail.value_or("");
        EXPECT_EQ(results[i].item, items[i]);
        EXPECT_EQ(results[i].mode, transfer_mode::direct);
    }

    const auto& stats = report.value().stats;
    EXPECT_EQ(stats.total_items, 1000u);
    EXPECT_EQ(stats.direct_items, 1000u);
    EXPECT_EQ(stats.fallback_items, 0u);
    EXPECT_EQ(stats.operations_saved, 2000u);
    EXPECT_EQ(stats.batches_recorded, 10u);
    EXPECT_DOUBLE_EQ(stats.efficiency_ratio(), 1.0);

    // One utility invocation per batch, one probe per bucket pair
    EXPECT_EQ(runner_->call_count(), 10u);
    EXPECT_EQ(probe->calls(), 1u);
    EXPECT_EQ(store_->read_calls(), 0u);
}

TEST_F(SyncScenariosTest, DestinationKeepsSourcePrefix) {
    runner_->set_default(scripted_process_runner::all_succeed());
    auto deps = dependencies();
    deps.probe = std::make_shared<counting_probe>(true);
    sync_coordinator coordinator(deps);

    auto report = coordinator.sync(same_family_items(2), config_);

    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().results[0].resolved_destination,
              "s3://lake-archive/spot/daily/k0.zip");
    auto pairs = parse_manifest(runner_->requests().front().stdin_data);
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[1].second, "s3://lake-archive/spot/daily/k1.zip");
}

TEST_F(SyncScenariosTest, PartialUtilityOutputEndToEnd) {
    runner_->push([](const process::process_request& request)
                      -> result<process::process_output> {
        auto pairs = parse_manifest(request.stdin_data);
        process::process_output output;
        output.exit_code = 1;
        for (std::size_t i = 0; i < 3 && i < pairs.size(); ++i) {
            output.stdout_data += success_line(pairs[i].first, pairs[i].second, 10);
        }
        return output;
    });
    auto deps = dependencies();
    deps.probe = std::make_shared<counting_probe>(true);
    sync_coordinator coordinator(deps);

    auto report = coordinator.sync(same_family_items(5), config_);

    ASSERT_TRUE(report);
    const auto& results = report.value().results;
    ASSERT_EQ(results.size(), 5u);
    EXPECT_TRUE(results[0].succeeded());
    EXPECT_TRUE(results[1].succeeded());
    EXPECT_TRUE(results[2].succeeded());
    EXPECT_EQ(results[3].error_code, sync_error_code::unreported_outcome);
    EXPECT_EQ(results[4].error_code, sync_error_code::unreported_outcome);

    const auto& stats = report.value().stats;
    EXPECT_EQ(stats.direct_items, 3u);
    EXPECT_EQ(stats.failed_items, 2u);
    EXPECT_EQ(stats.operations_saved, 6u);
}

// =============================================================================
// Fallback and mixed runs
// =============================================================================

TEST_F(SyncScenariosTest, DirectDisabledRoutesEverythingThroughFallback) {
    auto items = same_family_items(30);
    for (const auto& item : items) {
        store_->put(item.source_uri, "content of " + item.source_uri);
    }
    config_.direct_sync_enabled = false;
    sync_coordinator coordinator(dependencies());

    auto report = coordinator.sync(items, config_);

    ASSERT_TRUE(report);
    const auto& results = report.value().results;
    ASSERT_EQ(results.size(), 30u);
    for (const auto& r : results) {
        EXPECT_TRUE(r.succeeded()) << r.error_detail.value_or("");
        EXPECT_EQ(r.mode, transfer_mode::fallback);
    }
    EXPECT_EQ(report.value().stats.fallback_items, 30u);
    EXPECT_EQ(report.value().stats.operations_saved, 0u);
    EXPECT_EQ(runner_->call_count(), 0u);
    EXPECT_EQ(store_->get("s3://lake-archive/spot/daily/k7.zip").value_or(""),
              "content of s3://vision-raw/spot/daily/k7.zip");
    EXPECT_TRUE(std::filesystem::is_empty(buffer_dir_));
}

TEST_F(SyncScenariosTest, MixedFamiliesSplitByMode) {
    runner_->set_default(scripted_process_runner::all_succeed(64));
    auto items = same_family_items(6);
    for (std::size_t i = 0; i < 4; ++i) {
        auto source = "s3://vision-raw/cold/c" + std::to_string(i) + ".zip";
        store_->put(source, std::string(32, 'c'));
        auto destination = (archive_dir_ / ("c" + std::to_string(i) + ".zip")).string();
        items.insert(items.begin() + static_cast<std::ptrdiff_t>(i * 2 + 1),
                     transfer_item{source, destination, 32, std::nullopt});
    }
    auto deps = dependencies();
    deps.probe = std::make_shared<counting_probe>(true);
    sync_coordinator coordinator(deps);

    auto report = coordinator.sync(items, config_);

    ASSERT_TRUE(report);
    const auto& results = report.value().results;
    ASSERT_EQ(results.size(), 10u);
    std::set<std::size_t> fallback_positions;
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_TRUE(results[i].succeeded()) << results[i].error_detail.value_or("");
        if (results[i].mode == transfer_mode::fallback) {
            fallback_positions.insert(i);
        }
    }
    EXPECT_EQ(fallback_positions, (std::set<std::size_t>{1, 3, 5, 7}));
    EXPECT_EQ(report.value().stats.direct_items, 6u);
    EXPECT_EQ(report.value().stats.fallback_items, 4u);
    EXPECT_EQ(report.value().stats.operations_saved, 12u);
    EXPECT_EQ(report.value().stats.batches_recorded, 2u);
    EXPECT_EQ(read_file(archive_dir_ / "c2.zip"), std::string(32, 'c'));
}

// =============================================================================
// Error containment
// =============================================================================

TEST_F(SyncScenariosTest, ExecutorExceptionBecomesItemFailures) {
    auto deps = dependencies();
    deps.probe = std::make_shared<counting_probe>(true);
    deps.direct_executor = std::make_shared<throwing_executor>();
    sync_coordinator coordinator(deps);

    auto report = coordinator.sync(same_family_items(150), config_);

    ASSERT_TRUE(report);
    const auto& results = report.value().results;
    ASSERT_EQ(results.size(), 150u);
    for (const auto& r : results) {
        EXPECT_TRUE(r.failed());
        EXPECT_EQ(r.error_code, sync_error_code::internal_error);
        EXPECT_NE(r.error_detail.value_or("").find("utility crashed"), std::string::npos);
    }
    EXPECT_EQ(report.value().stats.failed_items, 150u);
}

TEST_F(SyncScenariosTest, NonStandardExceptionReleasesBatchSlot) {
    config_.max_parallel_batches = 1;
    auto executor = std::make_shared<int_throwing_executor>();
    auto deps = dependencies();
    deps.probe = std::make_shared<counting_probe>(true);
    deps.direct_executor = executor;
    sync_coordinator coordinator(deps);

    auto report = coordinator.sync(same_family_items(250), config_);

    ASSERT_TRUE(report);
    const auto& results = report.value().results;
    ASSERT_EQ(results.size(), 250u);
    for (const auto& r : results) {
        EXPECT_TRUE(r.failed());
        EXPECT_EQ(r.error_code, sync_error_code::internal_error);
        EXPECT_EQ(r.error_detail.value_or(""), "executor failed: unknown exception");
    }
    EXPECT_EQ(executor->calls(), 3u);
    EXPECT_EQ(report.value().stats.failed_items, 250u);
}

TEST_F(SyncScenariosTest, ThrowingProbeFallsBackInsteadOfAborting) {
    auto items = same_family_items(4);
    for (const auto& item : items) {
        store_->put(item.source_uri, "payload");
    }
    auto deps = dependencies();
    deps.probe = std::make_shared<throwing_probe>();
    sync_coordinator coordinator(deps);

    auto report = coordinator.sync(items, config_);

    ASSERT_TRUE(report);
    for (const auto& r : report.value().results) {
        EXPECT_TRUE(r.succeeded());
        EXPECT_EQ(r.mode, transfer_mode::fallback);
    }
    EXPECT_EQ(runner_->call_count(), 0u);
}

TEST_F(SyncScenariosTest, ProbeFailureFallsBackPerItem) {
    auto items = same_family_items(3);
    for (const auto& item : items) {
        store_->put(item.source_uri, "x");
    }
    auto deps = dependencies();
    deps.probe = std::make_shared<counting_probe>(
        make_error(sync_error_code::storage_unavailable, "probe timed out"));
    sync_coordinator coordinator(deps);

    auto report = coordinator.sync(items, config_);

    ASSERT_TRUE(report);
    for (const auto& r : report.value().results) {
        EXPECT_TRUE(r.succeeded());
        EXPECT_EQ(r.mode, transfer_mode::fallback);
    }
    EXPECT_EQ(runner_->call_count(), 0u);
}

TEST_F(SyncScenariosTest, InvalidConfigurationAbortsBeforeAnyIo) {
    auto probe = std::make_shared<counting_probe>(true);
    auto deps = dependencies();
    deps.probe = probe;
    sync_coordinator coordinator(deps);
    config_.max_batch_size = 0;

    auto report = coordinator.sync(same_family_items(10), config_);

    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().code, sync_error_code::config_batch_size_error);
    EXPECT_EQ(probe->calls(), 0u);
    EXPECT_EQ(runner_->call_count(), 0u);
    EXPECT_EQ(store_->read_calls(), 0u);
}

TEST_F(SyncScenariosTest, EmptyRunReportsNothing) {
    sync_coordinator coordinator(dependencies());

    auto report = coordinator.sync({}, config_);

    ASSERT_TRUE(report);
    EXPECT_TRUE(report.value().results.empty());
    EXPECT_EQ(report.value().stats.total_items, 0u);
}

TEST_F(SyncScenariosTest, SnapshotReflectsLastRun) {
    runner_->set_default(scripted_process_runner::all_succeed(1));
    auto deps = dependencies();
    deps.probe = std::make_shared<counting_probe>(true);
    sync_coordinator coordinator(deps);

    ASSERT_TRUE(coordinator.sync(same_family_items(20), config_));
    ASSERT_TRUE(coordinator.sync(same_family_items(5), config_));

    EXPECT_EQ(coordinator.snapshot().total_items, 5u);
}

}  // namespace kcenon::archive_sync::test
