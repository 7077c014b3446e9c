/**
 * @file test_mode_selector.cpp
 * @brief Unit tests for direct/fallback mode selection
 */

#include <gtest/gtest.h>

#include <kcenon/archive_sync/storage/store_registry.h>
#include <kcenon/archive_sync/transfer/mode_selector.h>

#include "test_doubles.h"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::archive_sync::test {

namespace {

class throwing_probe : public capability_probe {
public:
    [[nodiscard]] auto supports_direct(const storage::object_uri&, const storage::object_uri&,
                                       std::chrono::milliseconds) -> result<bool> override {
        ++calls_;
        throw std::runtime_error("region lookup failed");
    }

    [[nodiscard]] auto calls() const -> std::size_t { return calls_.load(); }

private:
    std::atomic<std::size_t> calls_{0};
};

}  // namespace

class ModeSelectorTest : public ::testing::Test {
protected:
    static auto probe_answering(result<bool> answer) -> std::shared_ptr<counting_probe> {
        return std::make_shared<counting_probe>(std::move(answer));
    }

    sync_configuration config_;
};

TEST_F(ModeSelectorTest, DirectWhenProbeConfirms) {
    auto probe = probe_answering(true);
    mode_selector selector(config_, probe);

    auto decision = selector.decide("s3://vision/a.zip", "s3://lake/a.zip");
    EXPECT_EQ(decision.mode, transfer_mode::direct);
    EXPECT_EQ(decision.reason, classification_reason::direct_supported);
    EXPECT_EQ(probe->calls(), 1u);
}

TEST_F(ModeSelectorTest, DisabledNeverProbes) {
    config_.direct_sync_enabled = false;
    auto probe = probe_answering(true);
    mode_selector selector(config_, probe);

    auto decision = selector.decide("s3://vision/a.zip", "s3://lake/a.zip");
    EXPECT_EQ(decision.mode, transfer_mode::fallback);
    EXPECT_EQ(decision.reason, classification_reason::direct_disabled);
    EXPECT_EQ(probe->calls(), 0u);
}

TEST_F(ModeSelectorTest, FamilyMismatchIsFallback) {
    auto probe = probe_answering(true);
    mode_selector selector(config_, probe);

    auto decision = selector.decide("s3://vision/a.zip", "/mnt/archive/a.zip");
    EXPECT_EQ(decision.mode, transfer_mode::fallback);
    EXPECT_EQ(decision.reason, classification_reason::family_mismatch);
    EXPECT_EQ(probe->calls(), 0u);
}

TEST_F(ModeSelectorTest, S3AliasesShareFamily) {
    auto probe = probe_answering(true);
    mode_selector selector(config_, probe);

    EXPECT_EQ(selector.decide("s3a://vision/a.zip", "s3://lake/a.zip").mode,
              transfer_mode::direct);
}

TEST_F(ModeSelectorTest, UnsupportedFamilyIsFallback) {
    auto probe = probe_answering(true);
    mode_selector selector(config_, probe);

    auto decision = selector.decide("gs://vision/a.zip", "gs://lake/a.zip");
    EXPECT_EQ(decision.mode, transfer_mode::fallback);
    EXPECT_EQ(decision.reason, classification_reason::unsupported_family);
}

TEST_F(ModeSelectorTest, MalformedUriIsFallback) {
    auto probe = probe_answering(true);
    mode_selector selector(config_, probe);

    auto decision = selector.decide("s3://", "s3://lake/a.zip");
    EXPECT_EQ(decision.mode, transfer_mode::fallback);
    EXPECT_EQ(decision.reason, classification_reason::malformed_uri);
}

TEST_F(ModeSelectorTest, ProbeNegativeIsFallback) {
    auto probe = probe_answering(false);
    mode_selector selector(config_, probe);

    auto decision = selector.decide("s3://vision/a.zip", "s3://lake/a.zip");
    EXPECT_EQ(decision.mode, transfer_mode::fallback);
    EXPECT_EQ(decision.reason, classification_reason::probe_negative);
}

TEST_F(ModeSelectorTest, ProbeErrorIsNonFatalFallback) {
    auto probe = probe_answering(make_error(sync_error_code::storage_unavailable, "503"));
    mode_selector selector(config_, probe);

    auto decision = selector.decide("s3://vision/a.zip", "s3://lake/a.zip");
    EXPECT_EQ(decision.mode, transfer_mode::fallback);
    EXPECT_EQ(decision.reason, classification_reason::probe_failed);
}

TEST_F(ModeSelectorTest, ThrowingProbeIsCachedAsFailure) {
    auto probe = std::make_shared<throwing_probe>();
    mode_selector selector(config_, probe);

    auto first = selector.decide("s3://vision/a.zip", "s3://lake/a.zip");
    auto second = selector.decide("s3://vision/b.zip", "s3://lake/b.zip");

    EXPECT_EQ(first.mode, transfer_mode::fallback);
    EXPECT_EQ(first.reason, classification_reason::probe_failed);
    EXPECT_EQ(second.reason, classification_reason::probe_failed);
    EXPECT_EQ(probe->calls(), 1u);
}

TEST_F(ModeSelectorTest, MissingProbeIsFallback) {
    mode_selector selector(config_, nullptr);
    EXPECT_EQ(selector.decide("s3://vision/a.zip", "s3://lake/a.zip").reason,
              classification_reason::probe_failed);
}

TEST_F(ModeSelectorTest, ProbeIsCachedPerBucketPair) {
    auto probe = probe_answering(true);
    mode_selector selector(config_, probe);

    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(selector.decide("s3://vision/" + std::to_string(i) + ".zip",
                                  "s3://lake/" + std::to_string(i) + ".zip")
                      .mode,
                  transfer_mode::direct);
    }
    (void)selector.decide("s3://other/a.zip", "s3://lake/a.zip");

    EXPECT_EQ(probe->calls(), 2u);
    EXPECT_EQ(selector.probe_calls(), 2u);
}

TEST_F(ModeSelectorTest, ProbeErrorsAreCachedToo) {
    auto probe = probe_answering(make_error(sync_error_code::transfer_timeout, "slow"));
    mode_selector selector(config_, probe);

    (void)selector.decide("s3://vision/a.zip", "s3://lake/a.zip");
    (void)selector.decide("s3://vision/b.zip", "s3://lake/b.zip");
    EXPECT_EQ(probe->calls(), 1u);
}

TEST_F(ModeSelectorTest, ConcurrentCallersProbeOnce) {
    auto probe = probe_answering(true);
    mode_selector selector(config_, probe);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&selector, t] {
            for (int i = 0; i < 50; ++i) {
                (void)selector.decide("s3://vision/" + std::to_string(t * 100 + i),
                                      "s3://lake/x");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(probe->calls(), 1u);
}

TEST_F(ModeSelectorTest, ClassifyIsDeterministic) {
    auto probe = probe_answering(true);
    mode_selector selector(config_, probe);
    transfer_item item{"s3://vision/a.zip", "s3://lake/a.zip", std::nullopt, std::nullopt};

    auto first = selector.classify(item);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(selector.classify(item), first);
    }
}

TEST_F(ModeSelectorTest, ReasonNames) {
    EXPECT_EQ(to_string(classification_reason::direct_supported), "direct_supported");
    EXPECT_EQ(to_string(classification_reason::probe_failed), "probe_failed");
}

// =============================================================================
// Store-backed probe
// =============================================================================

TEST(StoreCapabilityProbeTest, AsksSourceStore) {
    auto registry = std::make_shared<storage::store_registry>();
    auto memory = std::make_shared<memory_object_store>(true);
    registry->register_store("s3", memory);
    store_capability_probe probe(registry);

    auto src = storage::object_uri::parse("s3://vision/a.zip").value();
    auto dst = storage::object_uri::parse("s3://lake/a.zip").value();
    auto answer = probe.supports_direct(src, dst, std::chrono::seconds(1));
    ASSERT_TRUE(answer);
    EXPECT_TRUE(answer.value());

    memory->set_probe_result(make_error(sync_error_code::access_denied, "denied"));
    answer = probe.supports_direct(src, dst, std::chrono::seconds(1));
    ASSERT_FALSE(answer);
    EXPECT_EQ(answer.error().code, sync_error_code::access_denied);
}

TEST(StoreCapabilityProbeTest, UnregisteredSchemeIsError) {
    store_capability_probe probe(std::make_shared<storage::store_registry>());
    auto src = storage::object_uri::parse("s3://vision/a.zip").value();
    auto answer = probe.supports_direct(src, src, std::chrono::seconds(1));
    ASSERT_FALSE(answer);
    EXPECT_EQ(answer.error().code, sync_error_code::unsupported_scheme);
}

}  // namespace kcenon::archive_sync::test
