/**
 * @file process_runner.h
 * @brief Subprocess execution for the external batch-copy utility
 * @version 0.1.0
 */

#ifndef KCENON_ARCHIVE_SYNC_PROCESS_PROCESS_RUNNER_H
#define KCENON_ARCHIVE_SYNC_PROCESS_PROCESS_RUNNER_H

#include <kcenon/archive_sync/core/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::archive_sync::process {

/**
 * @brief Description of one subprocess invocation
 */
struct process_request {
    /// argv; args[0] is resolved through PATH
    std::vector<std::string> args;

    /// Data written to the child's stdin (ignored when stdin_file is set)
    std::string stdin_data;

    /// Redirect stdin from a file
    std::optional<std::filesystem::path> stdin_file;

    /// Redirect stdout to a file instead of capturing it
    std::optional<std::filesystem::path> stdout_file;

    /// Wall-clock limit; the child is terminated when it expires
    std::chrono::milliseconds timeout{std::chrono::minutes(30)};
};

/**
 * @brief Outcome of a subprocess that was started
 */
struct process_output {
    int exit_code = -1;          ///< Exit status, or 128 + signal number
    std::string stdout_data;     ///< Empty when stdout was redirected
    std::string stderr_data;
    bool timed_out = false;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return !timed_out && exit_code == 0;
    }
};

/**
 * @brief Runs external processes
 *
 * A result error means the process could not be started at all
 * (utility_launch_failed); everything after a successful start, including a
 * timeout or a non-zero exit, is reported through process_output.
 */
class process_runner_interface {
public:
    virtual ~process_runner_interface() = default;

    [[nodiscard]] virtual auto run(const process_request& request)
        -> result<process_output> = 0;
};

/**
 * @brief fork/exec based runner with pipe I/O and deadline enforcement
 *
 * On timeout the child receives SIGTERM, then SIGKILL after
 * termination_grace if it is still alive.
 */
class posix_process_runner : public process_runner_interface {
public:
    explicit posix_process_runner(
        std::chrono::milliseconds termination_grace = std::chrono::seconds(5));

    [[nodiscard]] auto run(const process_request& request)
        -> result<process_output> override;

private:
    std::chrono::milliseconds termination_grace_;
};

}  // namespace kcenon::archive_sync::process

#endif  // KCENON_ARCHIVE_SYNC_PROCESS_PROCESS_RUNNER_H
