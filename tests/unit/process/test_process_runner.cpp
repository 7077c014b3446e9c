/**
 * @file test_process_runner.cpp
 * @brief Unit tests for the fork/exec process runner
 */

#include <gtest/gtest.h>

#include <kcenon/archive_sync/process/process_runner.h>

#include <filesystem>
#include <fstream>
#include <iterator>

namespace kcenon::archive_sync::test {

using process::posix_process_runner;
using process::process_request;

class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "archive_sync_process_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir_); }

    static auto shell(const std::string& script) -> process_request {
        process_request request;
        request.args = {"/bin/sh", "-c", script};
        request.timeout = std::chrono::seconds(10);
        return request;
    }

    posix_process_runner runner_{std::chrono::milliseconds(200)};
    std::filesystem::path test_dir_;
};

TEST_F(ProcessRunnerTest, CapturesStdoutAndStderr) {
    auto output = runner_.run(shell("echo out; echo err >&2"));
    ASSERT_TRUE(output);
    EXPECT_EQ(output.value().exit_code, 0);
    EXPECT_TRUE(output.value().succeeded());
    EXPECT_EQ(output.value().stdout_data, "out\n");
    EXPECT_EQ(output.value().stderr_data, "err\n");
}

TEST_F(ProcessRunnerTest, WritesStdinData) {
    auto request = shell("cat");
    request.stdin_data = "cp 'a' 'b'\ncp 'c' 'd'\n";

    auto output = runner_.run(request);
    ASSERT_TRUE(output);
    EXPECT_EQ(output.value().stdout_data, request.stdin_data);
}

TEST_F(ProcessRunnerTest, LargeStdinDoesNotDeadlock) {
    auto request = shell("cat");
    request.stdin_data.assign(1 << 20, 'x');

    auto output = runner_.run(request);
    ASSERT_TRUE(output);
    EXPECT_EQ(output.value().stdout_data.size(), request.stdin_data.size());
}

TEST_F(ProcessRunnerTest, ReportsExitCode) {
    auto output = runner_.run(shell("exit 3"));
    ASSERT_TRUE(output);
    EXPECT_EQ(output.value().exit_code, 3);
    EXPECT_FALSE(output.value().succeeded());
    EXPECT_FALSE(output.value().timed_out);
}

TEST_F(ProcessRunnerTest, TimeoutTerminatesChild) {
    auto request = shell("exec sleep 30");
    request.timeout = std::chrono::milliseconds(200);

    auto output = runner_.run(request);
    ASSERT_TRUE(output);
    EXPECT_TRUE(output.value().timed_out);
    EXPECT_FALSE(output.value().succeeded());
    EXPECT_LT(output.value().elapsed, std::chrono::seconds(10));
}

TEST_F(ProcessRunnerTest, MissingExecutableIsLaunchFailure) {
    process_request request;
    request.args = {"archive_sync-no-such-binary"};

    auto output = runner_.run(request);
    ASSERT_FALSE(output);
    EXPECT_EQ(output.error().code, sync_error_code::utility_launch_failed);
}

TEST_F(ProcessRunnerTest, EmptyCommandIsLaunchFailure) {
    auto output = runner_.run(process_request{});
    ASSERT_FALSE(output);
    EXPECT_EQ(output.error().code, sync_error_code::utility_launch_failed);
}

TEST_F(ProcessRunnerTest, FileRedirection) {
    auto input = test_dir_ / "in.bin";
    auto result_file = test_dir_ / "out.bin";
    {
        std::ofstream out(input, std::ios::binary);
        out << "payload";
    }

    auto request = shell("cat");
    request.stdin_file = input;
    request.stdout_file = result_file;

    auto output = runner_.run(request);
    ASSERT_TRUE(output);
    EXPECT_EQ(output.value().exit_code, 0);
    EXPECT_TRUE(output.value().stdout_data.empty());

    std::ifstream in(result_file, std::ios::binary);
    std::string copied((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(copied, "payload");
}

}  // namespace kcenon::archive_sync::test
