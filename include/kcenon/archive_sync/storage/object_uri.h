/**
 * @file object_uri.h
 * @brief Object-storage URI parsing and protocol families
 */

#ifndef KCENON_ARCHIVE_SYNC_STORAGE_OBJECT_URI_H
#define KCENON_ARCHIVE_SYNC_STORAGE_OBJECT_URI_H

#include <kcenon/archive_sync/core/types.h>

#include <string>
#include <string_view>

namespace kcenon::archive_sync::storage {

/**
 * @brief Group of URI schemes served by the same backend protocol
 */
enum class protocol_family {
    s3,       ///< s3, s3a, s3n
    gcs,      ///< gs, gcs
    azure,    ///< az, abfs, abfss, wasb, wasbs
    local,    ///< file, or a bare path
    http,     ///< http, https
    unknown,
};

[[nodiscard]] constexpr auto to_string(protocol_family family) noexcept -> std::string_view {
    switch (family) {
        case protocol_family::s3: return "s3";
        case protocol_family::gcs: return "gcs";
        case protocol_family::azure: return "azure";
        case protocol_family::local: return "local";
        case protocol_family::http: return "http";
        default: return "unknown";
    }
}

/**
 * @brief Family for a (lowercase) scheme name
 */
[[nodiscard]] auto family_of_scheme(std::string_view scheme) -> protocol_family;

/**
 * @brief Parsed object location
 *
 * For the local family the bucket is empty and the key is the filesystem
 * path. For every other family the key never starts with '/'.
 */
struct object_uri {
    std::string scheme;
    std::string bucket;
    std::string key;
    protocol_family family = protocol_family::unknown;

    /**
     * @brief Parse a URI
     * @return Parsed URI, or malformed_uri on empty input, missing bucket or
     *         control characters
     */
    [[nodiscard]] static auto parse(std::string_view text) -> result<object_uri>;

    /**
     * @brief Canonical string form (scheme://bucket/key, or the path for local URIs)
     */
    [[nodiscard]] auto str() const -> std::string;

    /**
     * @brief Form understood by the family's tooling (s3a:// and s3n:// become s3://)
     */
    [[nodiscard]] auto canonical() const -> std::string;

    /**
     * @brief True when the URI names a container rather than an object
     */
    [[nodiscard]] auto is_container() const noexcept -> bool;

    /**
     * @brief Last path segment of the key
     */
    [[nodiscard]] auto basename() const -> std::string;

    /**
     * @brief Same location with a different key
     */
    [[nodiscard]] auto with_key(std::string new_key) const -> object_uri;
};

}  // namespace kcenon::archive_sync::storage

#endif  // KCENON_ARCHIVE_SYNC_STORAGE_OBJECT_URI_H
