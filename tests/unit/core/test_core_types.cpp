/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, result types and the transfer data model
 */

#include <gtest/gtest.h>

#include <kcenon/archive_sync/core/cancellation_token.h>
#include <kcenon/archive_sync/core/error_codes.h>
#include <kcenon/archive_sync/core/transfer_types.h>
#include <kcenon/archive_sync/core/types.h>

#include <thread>
#include <unordered_set>

namespace kcenon::archive_sync::test {

// =============================================================================
// Error codes
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, CodesStayInReservedRange) {
    for (auto code : {sync_error_code::config_invalid, sync_error_code::transfer_timeout,
                      sync_error_code::access_denied, sync_error_code::unreported_outcome,
                      sync_error_code::internal_error}) {
        EXPECT_LE(to_int(code), -900);
        EXPECT_GE(to_int(code), -999);
    }
}

TEST_F(ErrorCodeTest, Classification) {
    EXPECT_EQ(classify(sync_error_code::success), error_category::none);
    EXPECT_EQ(classify(sync_error_code::config_batch_size_error), error_category::configuration);
    EXPECT_EQ(classify(sync_error_code::rate_limited), error_category::transient);
    EXPECT_EQ(classify(sync_error_code::write_failed), error_category::transient);
    EXPECT_EQ(classify(sync_error_code::source_not_found), error_category::permanent);
    EXPECT_EQ(classify(sync_error_code::size_mismatch), error_category::permanent);
    EXPECT_EQ(classify(sync_error_code::unreported_outcome), error_category::partial_batch);
    EXPECT_EQ(classify(sync_error_code::cancelled), error_category::cancellation);
}

TEST_F(ErrorCodeTest, RetryableCodes) {
    EXPECT_TRUE(is_retryable(sync_error_code::transfer_timeout));
    EXPECT_TRUE(is_retryable(sync_error_code::utility_launch_failed));
    EXPECT_TRUE(is_retryable(sync_error_code::unreported_outcome));

    EXPECT_FALSE(is_retryable(sync_error_code::malformed_uri));
    EXPECT_FALSE(is_retryable(sync_error_code::checksum_mismatch));
    EXPECT_FALSE(is_retryable(sync_error_code::config_invalid));
    EXPECT_FALSE(is_retryable(sync_error_code::cancelled));
}

TEST_F(ErrorCodeTest, Predicates) {
    EXPECT_TRUE(is_configuration_error(sync_error_code::config_retry_error));
    EXPECT_TRUE(is_transient(sync_error_code::storage_unavailable));
    EXPECT_TRUE(is_permanent(sync_error_code::unsupported_scheme));
    EXPECT_FALSE(is_permanent(sync_error_code::unreported_outcome));
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_EQ(to_string(sync_error_code::success), "success");
    EXPECT_EQ(to_string(sync_error_code::unreported_outcome), "unreported by batch-copy utility");
    EXPECT_EQ(to_string(error_category::partial_batch), "partial_batch");
}

// =============================================================================
// result<T>
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = make_error(sync_error_code::malformed_uri, "bad uri");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, sync_error_code::malformed_uri);
    EXPECT_EQ(r.error().message, "bad uri");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok);

    result<void> failed = make_error(sync_error_code::config_invalid, "nope");
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, sync_error_code::config_invalid);
}

// =============================================================================
// Transfer data model
// =============================================================================

class TransferTypesTest : public ::testing::Test {
protected:
    static auto entry(const std::string& src, const std::string& dst) -> batch_entry {
        return batch_entry{3, transfer_item{src, dst, std::nullopt, std::nullopt}, dst};
    }
};

TEST_F(TransferTypesTest, ItemIdentityIgnoresMetadata) {
    transfer_item a{"s3://a/k", "s3://b/k", 10, std::nullopt};
    transfer_item b{"s3://a/k", "s3://b/k", 99, std::string("md5:00")};
    transfer_item c{"s3://a/k", "s3://b/other", 10, std::nullopt};

    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
    EXPECT_EQ(std::hash<transfer_item>{}(a), std::hash<transfer_item>{}(b));

    std::unordered_set<transfer_item> set{a, b, c};
    EXPECT_EQ(set.size(), 2u);
}

TEST_F(TransferTypesTest, ResultFactories) {
    auto e = entry("s3://a/k", "s3://b/k");

    auto ok = transfer_result::success(e, transfer_mode::direct, 512, duration{7}, 1);
    EXPECT_TRUE(ok.succeeded());
    EXPECT_EQ(ok.bytes_transferred, 512u);
    EXPECT_EQ(ok.mode, transfer_mode::direct);
    EXPECT_EQ(ok.resolved_destination, "s3://b/k");
    EXPECT_FALSE(ok.error_detail.has_value());

    auto bad = transfer_result::failure(e, transfer_mode::fallback,
                                        sync_error_code::read_failed, "io", duration{1}, 3);
    EXPECT_TRUE(bad.failed());
    EXPECT_EQ(bad.error_code, sync_error_code::read_failed);
    EXPECT_EQ(bad.attempts, 3u);
    EXPECT_EQ(bad.error_detail.value_or(""), "io");

    auto skipped = transfer_result::skip(e, transfer_mode::fallback, "cancelled");
    EXPECT_TRUE(skipped.skipped());
    EXPECT_EQ(skipped.attempts, 0u);
}

TEST_F(TransferTypesTest, ModeAndStatusNames) {
    EXPECT_EQ(to_string(transfer_mode::direct), "direct");
    EXPECT_EQ(to_string(transfer_mode::fallback), "fallback");
    EXPECT_EQ(to_string(transfer_status::skipped), "skipped");
}

TEST_F(TransferTypesTest, EfficiencyRatios) {
    efficiency_stats stats;
    EXPECT_DOUBLE_EQ(stats.efficiency_ratio(), 0.0);
    EXPECT_DOUBLE_EQ(stats.success_rate(), 0.0);

    stats.total_items = 10;
    stats.direct_items = 6;
    stats.fallback_items = 3;
    stats.failed_items = 1;
    stats.operations_saved = 12;
    stats.total_bytes = 4000;
    stats.total_duration = duration{2000};

    EXPECT_EQ(stats.successful_items(), 9u);
    EXPECT_DOUBLE_EQ(stats.efficiency_ratio(), 0.6);
    EXPECT_DOUBLE_EQ(stats.success_rate(), 90.0);
    EXPECT_DOUBLE_EQ(stats.throughput_bps(), 2000.0);
}

// =============================================================================
// Cancellation token
// =============================================================================

TEST(CancellationTokenTest, CopiesShareState) {
    cancellation_token token;
    auto copy = token;
    EXPECT_FALSE(copy.is_cancelled());

    std::thread canceller([token]() mutable { token.cancel(); });
    canceller.join();

    EXPECT_TRUE(copy.is_cancelled());
}

}  // namespace kcenon::archive_sync::test
