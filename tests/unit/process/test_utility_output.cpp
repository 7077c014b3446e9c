/**
 * @file test_utility_output.cpp
 * @brief Unit tests for parsing s5cmd JSON-lines output
 */

#include <gtest/gtest.h>

#include <kcenon/archive_sync/process/utility_output.h>

namespace kcenon::archive_sync::test {

using namespace process;

TEST(UtilityOutputTest, ParsesSuccessRecord) {
    auto outcome = parse_outcome_line(
        R"({"operation":"cp","success":true,"source":"s3://a/k","destination":"s3://b/k",)"
        R"("object":{"type":"file","size":2048}})");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success);
    EXPECT_EQ(outcome->operation, "cp");
    EXPECT_EQ(outcome->source.value_or(""), "s3://a/k");
    EXPECT_EQ(outcome->destination.value_or(""), "s3://b/k");
    EXPECT_EQ(outcome->size.value_or(0), 2048u);
    EXPECT_FALSE(outcome->error.has_value());
}

TEST(UtilityOutputTest, ParsesErrorRecord) {
    auto outcome = parse_outcome_line(
        R"({"operation":"cp","command":"cp 's3://a/k' 's3://b/k'","error":"NoSuchKey"})");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->success);
    EXPECT_EQ(outcome->command.value_or(""), "cp 's3://a/k' 's3://b/k'");
    EXPECT_EQ(outcome->error.value_or(""), "NoSuchKey");
}

TEST(UtilityOutputTest, TopLevelSizeIsAccepted) {
    auto outcome = parse_outcome_line(R"({"operation":"cp","success":true,"size":7})");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->size.value_or(0), 7u);
}

TEST(UtilityOutputTest, NonOutcomeLinesAreIgnored) {
    EXPECT_FALSE(parse_outcome_line("").has_value());
    EXPECT_FALSE(parse_outcome_line("ERROR plain text").has_value());
    EXPECT_FALSE(parse_outcome_line("{not json").has_value());
    EXPECT_FALSE(parse_outcome_line(R"({"operation":"cp"})").has_value());
}

TEST(UtilityOutputTest, ParseOutcomesKeepsOrder) {
    const std::string output =
        R"({"operation":"cp","success":true,"source":"s3://a/1","destination":"s3://b/1"})"
        "\n"
        "progress: 50%\n"
        R"({"operation":"cp","command":"cp 's3://a/2' 's3://b/2'","error":"AccessDenied"})"
        "\n"
        R"({"operation":"cp","success":true,"source":"s3://a/3","destination":"s3://b/3"})";

    auto outcomes = parse_outcomes(output);
    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_FALSE(outcomes[1].success);
    EXPECT_EQ(outcomes[2].destination.value_or(""), "s3://b/3");
}

TEST(UtilityOutputTest, ParseListing) {
    const std::string output =
        R"({"key":"s3://bucket/spot/a.zip","type":"file","size":100,"etag":"abc"})"
        "\n"
        R"({"key":"s3://bucket/spot/daily/","type":"directory"})"
        "\n";

    auto entries = parse_listing(output);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].key, "s3://bucket/spot/a.zip");
    EXPECT_EQ(entries[0].size, 100u);
    EXPECT_EQ(entries[0].etag.value_or(""), "abc");
    EXPECT_FALSE(entries[0].is_directory);
    EXPECT_TRUE(entries[1].is_directory);
}

}  // namespace kcenon::archive_sync::test
