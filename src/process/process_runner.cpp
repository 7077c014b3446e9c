/**
 * @file process_runner.cpp
 * @brief POSIX implementation of the subprocess runner
 */

#include "kcenon/archive_sync/process/process_runner.h"

#include "kcenon/archive_sync/core/logging.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kcenon::archive_sync::process {

namespace {

using clock_type = std::chrono::steady_clock;

/**
 * @brief Owning file descriptor
 */
class unique_fd {
public:
    unique_fd() = default;
    explicit unique_fd(int fd) : fd_(fd) {}
    ~unique_fd() { reset(); }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;
    unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
    unique_fd& operator=(unique_fd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

    auto release() noexcept -> int {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct pipe_pair {
    unique_fd read_end;
    unique_fd write_end;
};

auto make_pipe(pipe_pair& p) -> bool {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    p.read_end.reset(fds[0]);
    p.write_end.reset(fds[1]);
    return true;
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

auto decode_status(int status) -> int {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Child side after fork: wire up stdio and exec. Only async-signal-safe calls.
[[noreturn]] void exec_child(const process_request& request, char* const* argv,
                             const pipe_pair& in, const pipe_pair& out, const pipe_pair& err,
                             const pipe_pair& exec_status) {
    bool wired = true;

    if (request.stdin_file) {
        int fd = ::open(request.stdin_file->c_str(), O_RDONLY);
        wired = fd >= 0 && ::dup2(fd, STDIN_FILENO) >= 0;
    } else {
        wired = ::dup2(in.read_end.get(), STDIN_FILENO) >= 0;
    }

    if (wired && request.stdout_file) {
        int fd = ::open(request.stdout_file->c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
        wired = fd >= 0 && ::dup2(fd, STDOUT_FILENO) >= 0;
    } else if (wired) {
        wired = ::dup2(out.write_end.get(), STDOUT_FILENO) >= 0;
    }

    if (wired) {
        wired = ::dup2(err.write_end.get(), STDERR_FILENO) >= 0;
    }

    if (wired) {
        ::execvp(argv[0], argv);
    }

    int saved = errno;
    ssize_t ignored = ::write(exec_status.write_end.get(), &saved, sizeof(saved));
    (void)ignored;
    ::_exit(127);
}

}  // namespace

posix_process_runner::posix_process_runner(std::chrono::milliseconds termination_grace)
    : termination_grace_(termination_grace) {}

auto posix_process_runner::run(const process_request& request) -> result<process_output> {
    if (request.args.empty() || request.args.front().empty()) {
        return make_error(sync_error_code::utility_launch_failed, "empty command line");
    }

    ignore_sigpipe_once();

    pipe_pair in, out, err, exec_status;
    if (!make_pipe(in) || !make_pipe(out) || !make_pipe(err) || !make_pipe(exec_status)) {
        return make_error(sync_error_code::utility_launch_failed,
                          std::string("pipe creation failed: ") + std::strerror(errno));
    }

    std::vector<char*> argv;
    argv.reserve(request.args.size() + 1);
    for (const auto& arg : request.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const auto started = clock_type::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        return make_error(sync_error_code::utility_launch_failed,
                          std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        exec_child(request, argv.data(), in, out, err, exec_status);
    }

    // Parent keeps the opposite ends only.
    in.read_end.reset();
    out.write_end.reset();
    err.write_end.reset();
    exec_status.write_end.reset();

    int exec_errno = 0;
    ssize_t got = ::read(exec_status.read_end.get(), &exec_errno, sizeof(exec_errno));
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        return make_error(sync_error_code::utility_launch_failed,
                          "cannot execute '" + request.args.front() +
                              "': " + std::strerror(exec_errno));
    }

    process_output output;

    if (request.stdin_file) {
        in.write_end.reset();
    } else {
        set_nonblocking(in.write_end.get());
    }
    if (request.stdout_file) {
        out.read_end.reset();
    }

    std::size_t stdin_offset = 0;
    if (!request.stdin_file && request.stdin_data.empty()) {
        in.write_end.reset();
    }

    const auto deadline = started + request.timeout;
    std::array<char, 8192> buffer{};

    while (in.write_end.valid() || out.read_end.valid() || err.read_end.valid()) {
        auto now = clock_type::now();
        if (now >= deadline) {
            output.timed_out = true;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::min<int64_t>(remaining.count(), 250));

        std::vector<pollfd> fds;
        if (in.write_end.valid()) fds.push_back({in.write_end.get(), POLLOUT, 0});
        if (out.read_end.valid()) fds.push_back({out.read_end.get(), POLLIN, 0});
        if (err.read_end.valid()) fds.push_back({err.read_end.get(), POLLIN, 0});

        int ready = ::poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (const auto& p : fds) {
            if (p.revents == 0) continue;

            if (p.fd == in.write_end.get()) {
                if (p.revents & (POLLERR | POLLHUP)) {
                    in.write_end.reset();
                    continue;
                }
                const auto& data = request.stdin_data;
                ssize_t n = ::write(p.fd, data.data() + stdin_offset, data.size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    in.write_end.reset();
                    continue;
                }
                if (stdin_offset >= data.size()) {
                    in.write_end.reset();
                }
                continue;
            }

            std::string& sink = p.fd == out.read_end.get() ? output.stdout_data
                                                           : output.stderr_data;
            unique_fd& source = p.fd == out.read_end.get() ? out.read_end : err.read_end;
            ssize_t n = ::read(p.fd, buffer.data(), buffer.size());
            if (n > 0) {
                sink.append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                source.reset();
            }
        }
    }

    int status = 0;
    bool reaped = false;

    // The child may still run after closing its output streams.
    while (!output.timed_out) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR)) {
            reaped = true;
            break;
        }
        if (clock_type::now() >= deadline) {
            output.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (output.timed_out && !reaped) {
        AS_LOG_WARN(log_category::process,
                    "terminating '" + request.args.front() + "' after timeout of " +
                        std::to_string(request.timeout.count()) + "ms");
        ::kill(pid, SIGTERM);

        const auto kill_deadline = clock_type::now() + termination_grace_;
        while (clock_type::now() < kill_deadline) {
            if (::waitpid(pid, &status, WNOHANG) == pid) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (!reaped) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
        }
    }

    output.exit_code = decode_status(status);
    output.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_type::now() - started);
    return output;
}

}  // namespace kcenon::archive_sync::process
