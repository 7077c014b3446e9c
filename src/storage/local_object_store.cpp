/**
 * @file local_object_store.cpp
 * @brief Filesystem-backed object store
 */

#include "kcenon/archive_sync/storage/local_object_store.h"

#include "kcenon/archive_sync/core/logging.h"

#include <atomic>
#include <cerrno>
#include <fstream>
#include <random>
#include <vector>

namespace kcenon::archive_sync::storage {

namespace {

using clock_type = std::chrono::steady_clock;

constexpr std::size_t copy_chunk_size = 1024 * 1024;

auto open_failure(sync_error_code failure_code, const std::filesystem::path& path)
    -> unexpected {
    auto code = errno == EACCES ? sync_error_code::access_denied : failure_code;
    return make_error(code, "cannot open " + path.string());
}

/**
 * @brief Chunked copy that gives up with transfer_timeout once @p deadline passes
 */
auto copy_before_deadline(const std::filesystem::path& from, const std::filesystem::path& to,
                          clock_type::time_point deadline, sync_error_code failure_code)
    -> result<uint64_t> {
    errno = 0;
    std::ifstream in(from, std::ios::binary);
    if (!in) {
        return open_failure(failure_code, from);
    }
    errno = 0;
    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    if (!out) {
        return open_failure(failure_code, to);
    }

    std::vector<char> chunk(copy_chunk_size);
    uint64_t total = 0;
    while (in) {
        if (clock_type::now() >= deadline) {
            return make_error(sync_error_code::transfer_timeout,
                              "copy of " + from.string() + " timed out after " +
                                  std::to_string(total) + " bytes");
        }
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        auto got = in.gcount();
        if (got <= 0) {
            break;
        }
        out.write(chunk.data(), got);
        if (!out) {
            return make_error(failure_code, "write to " + to.string() + " failed");
        }
        total += static_cast<uint64_t>(got);
    }

    if (in.bad()) {
        return make_error(failure_code, "read of " + from.string() + " failed");
    }
    out.flush();
    if (!out) {
        return make_error(failure_code, "flush of " + to.string() + " failed");
    }
    return total;
}

auto temp_sibling(const std::filesystem::path& target) -> std::filesystem::path {
    static std::atomic<uint64_t> counter{0};
    thread_local std::mt19937_64 gen(std::random_device{}());
    auto suffix = std::to_string(gen()) + "-" + std::to_string(counter.fetch_add(1));
    auto name = "." + target.filename().string() + ".partial-" + suffix;
    return target.parent_path() / name;
}

}  // namespace

auto local_object_store::stat(const object_uri& uri, std::chrono::milliseconds)
    -> result<std::optional<object_stat>> {
    std::error_code ec;
    std::filesystem::path path(uri.key);

    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return std::optional<object_stat>{};
    }
    if (!std::filesystem::is_regular_file(status)) {
        return make_error(sync_error_code::source_not_found,
                          "not a regular file: " + path.string());
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return make_error(sync_error_code::read_failed,
                          "cannot stat " + path.string() + ": " + ec.message());
    }
    return std::optional<object_stat>{object_stat{size, std::nullopt}};
}

auto local_object_store::read_into(const object_uri& source,
                                   const std::filesystem::path& buffer,
                                   std::chrono::milliseconds timeout) -> result<uint64_t> {
    const auto deadline = clock_type::now() + timeout;
    std::error_code ec;
    std::filesystem::path path(source.key);

    if (!std::filesystem::is_regular_file(path, ec)) {
        return make_error(sync_error_code::source_not_found,
                          "source object not found: " + path.string());
    }

    return copy_before_deadline(path, buffer, deadline, sync_error_code::read_failed);
}

auto local_object_store::write_from(const std::filesystem::path& buffer,
                                    const object_uri& destination,
                                    std::chrono::milliseconds timeout) -> result<uint64_t> {
    const auto deadline = clock_type::now() + timeout;
    std::error_code ec;
    std::filesystem::path target(destination.key);

    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_error(sync_error_code::write_failed,
                              "cannot create " + target.parent_path().string() + ": " +
                                  ec.message());
        }
    }

    auto staging = temp_sibling(target);
    auto copied = copy_before_deadline(buffer, staging, deadline, sync_error_code::write_failed);
    if (!copied) {
        std::error_code ignore;
        std::filesystem::remove(staging, ignore);
        return unexpected(copied.error());
    }

    std::filesystem::rename(staging, target, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(staging, ignore);
        return make_error(sync_error_code::write_failed,
                          "publish " + target.string() + " failed: " + ec.message());
    }

    auto size = std::filesystem::file_size(target, ec);
    if (ec) {
        return make_error(sync_error_code::write_failed,
                          "cannot size " + target.string() + ": " + ec.message());
    }

    AS_LOG_DEBUG(log_category::storage, "published " + target.string());
    return size;
}

auto local_object_store::supports_server_side_copy(const object_uri&, const object_uri&,
                                                   std::chrono::milliseconds)
    -> result<bool> {
    return false;
}

}  // namespace kcenon::archive_sync::storage
