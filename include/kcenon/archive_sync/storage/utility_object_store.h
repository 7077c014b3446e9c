/**
 * @file utility_object_store.h
 * @brief Object store that drives the batch-copy utility for single objects
 */

#ifndef KCENON_ARCHIVE_SYNC_STORAGE_UTILITY_OBJECT_STORE_H
#define KCENON_ARCHIVE_SYNC_STORAGE_UTILITY_OBJECT_STORE_H

#include <kcenon/archive_sync/core/sync_config.h>
#include <kcenon/archive_sync/process/process_runner.h>
#include <kcenon/archive_sync/storage/object_store.h>

#include <memory>

namespace kcenon::archive_sync::storage {

/**
 * @brief S3-family store backed by s5cmd
 *
 * - stat: `s5cmd --json ls <uri>`
 * - read_into: `s5cmd cat <uri>` with stdout redirected to the buffer
 * - write_from: `s5cmd pipe <uri>` with stdin redirected from the buffer;
 *   the upload is committed as one multipart object, so a failed write
 *   leaves nothing at the destination
 * - supports_server_side_copy: lists both buckets; reachable buckets on
 *   the same endpoint allow a server-side copy
 */
class utility_object_store : public object_store {
public:
    utility_object_store(utility_options options,
                         std::shared_ptr<process::process_runner_interface> runner);

    [[nodiscard]] auto name() const -> std::string_view override { return "s5cmd"; }

    [[nodiscard]] auto stat(const object_uri& uri, std::chrono::milliseconds timeout)
        -> result<std::optional<object_stat>> override;

    [[nodiscard]] auto read_into(const object_uri& source,
                                 const std::filesystem::path& buffer,
                                 std::chrono::milliseconds timeout)
        -> result<uint64_t> override;

    [[nodiscard]] auto write_from(const std::filesystem::path& buffer,
                                  const object_uri& destination,
                                  std::chrono::milliseconds timeout)
        -> result<uint64_t> override;

    [[nodiscard]] auto supports_server_side_copy(const object_uri& source,
                                                 const object_uri& destination,
                                                 std::chrono::milliseconds timeout)
        -> result<bool> override;

private:
    [[nodiscard]] auto run_command(std::vector<std::string> command_args,
                                   std::chrono::milliseconds timeout,
                                   process::process_request request)
        -> result<process::process_output>;

    [[nodiscard]] auto bucket_reachable(const object_uri& uri,
                                        std::chrono::milliseconds timeout)
        -> result<bool>;

    utility_options options_;
    std::shared_ptr<process::process_runner_interface> runner_;
};

}  // namespace kcenon::archive_sync::storage

#endif  // KCENON_ARCHIVE_SYNC_STORAGE_UTILITY_OBJECT_STORE_H
