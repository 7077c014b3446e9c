/**
 * @file store_registry.h
 * @brief Scheme-to-store lookup table
 */

#ifndef KCENON_ARCHIVE_SYNC_STORAGE_STORE_REGISTRY_H
#define KCENON_ARCHIVE_SYNC_STORAGE_STORE_REGISTRY_H

#include <kcenon/archive_sync/core/sync_config.h>
#include <kcenon/archive_sync/process/process_runner.h>
#include <kcenon/archive_sync/storage/object_store.h>

#include <map>
#include <memory>
#include <string>

namespace kcenon::archive_sync::storage {

/**
 * @brief Maps URI schemes to the object store that serves them
 *
 * Populated before a run and read-only afterwards.
 */
class store_registry {
public:
    /**
     * @brief Register a store for a (lowercase) scheme, replacing any previous one
     */
    void register_store(const std::string& scheme, std::shared_ptr<object_store> store);

    /**
     * @brief Store for a parsed URI
     * @return The store, or unsupported_scheme
     */
    [[nodiscard]] auto find(const object_uri& uri) const -> result<std::shared_ptr<object_store>>;

    [[nodiscard]] auto contains(const std::string& scheme) const -> bool;

    /**
     * @brief Registry with the local store for "file" and the utility store
     *        for the S3 family schemes
     */
    [[nodiscard]] static auto create_default(
        const utility_options& options,
        std::shared_ptr<process::process_runner_interface> runner) -> store_registry;

private:
    std::map<std::string, std::shared_ptr<object_store>> stores_;
};

}  // namespace kcenon::archive_sync::storage

#endif  // KCENON_ARCHIVE_SYNC_STORAGE_STORE_REGISTRY_H
