/**
 * @file test_local_object_store.cpp
 * @brief Unit tests for the filesystem-backed object store
 */

#include <gtest/gtest.h>

#include <kcenon/archive_sync/storage/local_object_store.h>
#include <kcenon/archive_sync/storage/store_registry.h>

#include "test_doubles.h"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace kcenon::archive_sync::test {

using storage::local_object_store;
using storage::object_uri;

class LocalObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "archive_sync_local_store_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_ / "src");
    }

    void TearDown() override { std::filesystem::remove_all(test_dir_); }

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    auto uri(const std::filesystem::path& path) -> object_uri {
        return object_uri::parse(path.string()).value();
    }

    local_object_store store_;
    std::filesystem::path test_dir_;
    const std::chrono::milliseconds timeout_{std::chrono::seconds(5)};
};

TEST_F(LocalObjectStoreTest, StatExistingAndMissing) {
    write_file(test_dir_ / "src" / "a.zip", "12345");

    auto found = store_.stat(uri(test_dir_ / "src" / "a.zip"), timeout_);
    ASSERT_TRUE(found);
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->size, 5u);

    auto missing = store_.stat(uri(test_dir_ / "src" / "nope.zip"), timeout_);
    ASSERT_TRUE(missing);
    EXPECT_FALSE(missing.value().has_value());
}

TEST_F(LocalObjectStoreTest, ReadIntoBuffer) {
    write_file(test_dir_ / "src" / "a.zip", "archive-bytes");
    auto buffer = test_dir_ / "buffer";

    auto read = store_.read_into(uri(test_dir_ / "src" / "a.zip"), buffer, timeout_);
    ASSERT_TRUE(read);
    EXPECT_EQ(read.value(), 13u);
    EXPECT_EQ(read_file(buffer), "archive-bytes");
}

TEST_F(LocalObjectStoreTest, ReadMissingSource) {
    auto read = store_.read_into(uri(test_dir_ / "src" / "missing"), test_dir_ / "buffer",
                                 timeout_);
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().code, sync_error_code::source_not_found);
}

TEST_F(LocalObjectStoreTest, WriteCreatesParentsAndLeavesNoPartials) {
    auto buffer = test_dir_ / "buffer";
    write_file(buffer, "payload");
    auto target = test_dir_ / "dst" / "nested" / "a.zip";

    auto written = store_.write_from(buffer, uri(target), timeout_);
    ASSERT_TRUE(written);
    EXPECT_EQ(written.value(), 7u);
    EXPECT_EQ(read_file(target), "payload");

    std::size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(target.parent_path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(LocalObjectStoreTest, WriteReplacesExisting) {
    auto target = test_dir_ / "a.zip";
    write_file(target, "old");
    auto buffer = test_dir_ / "buffer";
    write_file(buffer, "new content");

    ASSERT_TRUE(store_.write_from(buffer, uri(target), timeout_));
    EXPECT_EQ(read_file(target), "new content");
}

TEST_F(LocalObjectStoreTest, ExpiredTimeoutStopsCopy) {
    write_file(test_dir_ / "src" / "a.zip", "archive-bytes");
    const std::chrono::milliseconds expired{0};

    auto read = store_.read_into(uri(test_dir_ / "src" / "a.zip"), test_dir_ / "buffer",
                                 expired);
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().code, sync_error_code::transfer_timeout);
    EXPECT_TRUE(is_retryable(read.error().code));

    auto target = test_dir_ / "dst" / "a.zip";
    auto written = store_.write_from(test_dir_ / "src" / "a.zip", uri(target), expired);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().code, sync_error_code::transfer_timeout);
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_TRUE(std::filesystem::is_empty(target.parent_path()));
}

TEST_F(LocalObjectStoreTest, LargeFileCopiedInChunks) {
    std::string content(3 * 1024 * 1024 + 17, 'x');
    write_file(test_dir_ / "src" / "big.bin", content);
    auto buffer = test_dir_ / "buffer";

    auto read = store_.read_into(uri(test_dir_ / "src" / "big.bin"), buffer, timeout_);
    ASSERT_TRUE(read);
    EXPECT_EQ(read.value(), content.size());
    EXPECT_EQ(std::filesystem::file_size(buffer), content.size());
}

TEST_F(LocalObjectStoreTest, NoServerSideCopy) {
    auto probe = store_.supports_server_side_copy(uri(test_dir_ / "a"), uri(test_dir_ / "b"),
                                                  timeout_);
    ASSERT_TRUE(probe);
    EXPECT_FALSE(probe.value());
}

// =============================================================================
// Store registry
// =============================================================================

TEST(StoreRegistryTest, DefaultRegistryCoversFileAndS3) {
    auto registry = storage::store_registry::create_default(
        utility_options{}, std::make_shared<scripted_process_runner>());

    EXPECT_TRUE(registry.contains("file"));
    EXPECT_TRUE(registry.contains("s3"));
    EXPECT_TRUE(registry.contains("s3a"));
    EXPECT_FALSE(registry.contains("gs"));

    auto local = registry.find(object_uri::parse("/tmp/a").value());
    ASSERT_TRUE(local);
    EXPECT_EQ(local.value()->name(), "local");

    auto s3 = registry.find(object_uri::parse("s3n://b/k").value());
    ASSERT_TRUE(s3);
    EXPECT_EQ(s3.value()->name(), "s5cmd");
}

TEST(StoreRegistryTest, UnknownSchemeIsUnsupported) {
    storage::store_registry registry;
    auto found = registry.find(object_uri::parse("gs://bucket/key").value());
    ASSERT_FALSE(found);
    EXPECT_EQ(found.error().code, sync_error_code::unsupported_scheme);
}

TEST(StoreRegistryTest, RegisterReplaces) {
    storage::store_registry registry;
    auto memory = std::make_shared<memory_object_store>();
    registry.register_store("gs", memory);

    auto found = registry.find(object_uri::parse("gs://bucket/key").value());
    ASSERT_TRUE(found);
    EXPECT_EQ(found.value().get(), memory.get());
}

}  // namespace kcenon::archive_sync::test
