/**
 * @file local_object_store.h
 * @brief Filesystem-backed object store
 */

#ifndef KCENON_ARCHIVE_SYNC_STORAGE_LOCAL_OBJECT_STORE_H
#define KCENON_ARCHIVE_SYNC_STORAGE_LOCAL_OBJECT_STORE_H

#include <kcenon/archive_sync/storage/object_store.h>

namespace kcenon::archive_sync::storage {

/**
 * @brief Object store for file:// URIs and bare paths
 *
 * Writes go to a sibling temporary file that is renamed over the
 * destination once complete. Timeouts are not enforced for local I/O.
 */
class local_object_store : public object_store {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "local"; }

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

    /**
     * @brief Always false: local copies go through the fallback path
     */
    [[nodiscard]] auto supports_server_side_copy(const object_uri& source,
                                                 const object_uri& destination,
                                                 std::chrono::milliseconds timeout)
        -> result<bool> override;
};

}  // namespace kcenon::archive_sync::storage

#endif  // KCENON_ARCHIVE_SYNC_STORAGE_LOCAL_OBJECT_STORE_H
