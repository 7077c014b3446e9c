/**
 * @file object_store.h
 * @brief Abstract object-store interface used by the fallback path and probes
 * @version 0.1.0
 */

#ifndef KCENON_ARCHIVE_SYNC_STORAGE_OBJECT_STORE_H
#define KCENON_ARCHIVE_SYNC_STORAGE_OBJECT_STORE_H

#include <kcenon/archive_sync/core/types.h>
#include <kcenon/archive_sync/storage/object_uri.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::archive_sync::storage {

/**
 * @brief Metadata returned by object_store::stat
 */
struct object_stat {
    uint64_t size = 0;
    std::optional<std::string> etag;
};

/**
 * @brief Backend able to read and write objects of one or more schemes
 *
 * Implementations must make write_from atomic from the reader's point of
 * view: after a failed write no partial object is visible at the
 * destination, and after a successful one the full object is.
 */
class object_store {
public:
    virtual ~object_store() = default;

    /**
     * @brief Short name used in logs ("local", "s5cmd", ...)
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Look up an object
     * @return Metadata, std::nullopt when the object does not exist, or an error
     */
    [[nodiscard]] virtual auto stat(const object_uri& uri,
                                    std::chrono::milliseconds timeout)
        -> result<std::optional<object_stat>> = 0;

    /**
     * @brief Copy the object's full content into a local buffer file
     * @param source Object to read
     * @param buffer Existing local file to overwrite
     * @param timeout Deadline for the read
     * @return Bytes written to the buffer
     */
    [[nodiscard]] virtual auto read_into(const object_uri& source,
                                         const std::filesystem::path& buffer,
                                         std::chrono::milliseconds timeout)
        -> result<uint64_t> = 0;

    /**
     * @brief Atomically publish a local buffer file as the destination object
     * @return Bytes written
     */
    [[nodiscard]] virtual auto write_from(const std::filesystem::path& buffer,
                                          const object_uri& destination,
                                          std::chrono::milliseconds timeout)
        -> result<uint64_t> = 0;

    /**
     * @brief Check whether a server-side copy between two locations is possible
     *
     * Called with a short timeout; any error is treated by callers as "no".
     */
    [[nodiscard]] virtual auto supports_server_side_copy(const object_uri& source,
                                                         const object_uri& destination,
                                                         std::chrono::milliseconds timeout)
        -> result<bool> = 0;
};

}  // namespace kcenon::archive_sync::storage

#endif  // KCENON_ARCHIVE_SYNC_STORAGE_OBJECT_STORE_H
