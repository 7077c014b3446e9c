/**
 * @file mode_selector.h
 * @brief Per-item choice between the direct and fallback transfer paths
 * @version 0.1.0
 */

#ifndef KCENON_ARCHIVE_SYNC_TRANSFER_MODE_SELECTOR_H
#define KCENON_ARCHIVE_SYNC_TRANSFER_MODE_SELECTOR_H

#include <kcenon/archive_sync/core/sync_config.h>
#include <kcenon/archive_sync/core/transfer_types.h>
#include <kcenon/archive_sync/storage/object_uri.h>
#include <kcenon/archive_sync/storage/store_registry.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>

namespace kcenon::archive_sync {

/**
 * @brief Runtime check whether a server-side copy is possible
 */
class capability_probe {
public:
    virtual ~capability_probe() = default;

    /**
     * @return true/false when the probe could decide, an error otherwise
     */
    [[nodiscard]] virtual auto supports_direct(const storage::object_uri& source,
                                               const storage::object_uri& destination,
                                               std::chrono::milliseconds timeout)
        -> result<bool> = 0;
};

/**
 * @brief Probe that asks the store registered for the source scheme
 */
class store_capability_probe : public capability_probe {
public:
    explicit store_capability_probe(std::shared_ptr<const storage::store_registry> stores);

    [[nodiscard]] auto supports_direct(const storage::object_uri& source,
                                       const storage::object_uri& destination,
                                       std::chrono::milliseconds timeout)
        -> result<bool> override;

private:
    std::shared_ptr<const storage::store_registry> stores_;
};

/**
 * @brief Why an item was assigned its mode
 */
enum class classification_reason {
    direct_supported,    ///< Every condition for a server-side copy held
    direct_disabled,     ///< direct_sync_enabled is false
    malformed_uri,       ///< Source or destination did not parse
    family_mismatch,     ///< Source and destination use different protocol families
    unsupported_family,  ///< The family is not served by the batch-copy utility
    probe_negative,      ///< The capability probe answered no
    probe_failed,        ///< The capability probe could not decide
};

[[nodiscard]] constexpr auto to_string(classification_reason reason) noexcept
    -> std::string_view {
    switch (reason) {
        case classification_reason::direct_supported: return "direct_supported";
        case classification_reason::direct_disabled: return "direct_disabled";
        case classification_reason::malformed_uri: return "malformed_uri";
        case classification_reason::family_mismatch: return "family_mismatch";
        case classification_reason::unsupported_family: return "unsupported_family";
        case classification_reason::probe_negative: return "probe_negative";
        case classification_reason::probe_failed: return "probe_failed";
        default: return "unknown";
    }
}

/**
 * @brief Mode assigned to one item and the reason for it
 */
struct mode_decision {
    transfer_mode mode = transfer_mode::fallback;
    classification_reason reason = classification_reason::direct_disabled;
};

/**
 * @brief Classifies items as direct or fallback
 *
 * Direct is chosen only when both URIs parse, share the S3 protocol family,
 * direct sync is enabled, and the capability probe answers yes. Any doubt
 * resolves to fallback. Probe answers, errors included, are cached per
 * (family, source bucket, destination bucket), so one selector gives the
 * same answer for the same pair for its whole lifetime.
 *
 * @note Thread-safe.
 */
class mode_selector {
public:
    mode_selector(const sync_configuration& config, std::shared_ptr<capability_probe> probe);

    /**
     * @brief Decide the mode for a source and a resolved destination
     */
    [[nodiscard]] auto decide(std::string_view source, std::string_view destination)
        -> mode_decision;

    /**
     * @brief Mode for an item whose destination is used as given
     */
    [[nodiscard]] auto classify(const transfer_item& item) -> transfer_mode;

    /**
     * @brief Number of probe calls made (cache misses)
     */
    [[nodiscard]] auto probe_calls() const -> std::size_t;

private:
    using cache_key = std::tuple<storage::protocol_family, std::string, std::string>;

    [[nodiscard]] auto probe(const storage::object_uri& source,
                             const storage::object_uri& destination)
        -> classification_reason;

    bool direct_enabled_;
    std::chrono::milliseconds probe_timeout_;
    std::shared_ptr<capability_probe> probe_;

    mutable std::mutex mutex_;
    std::map<cache_key, classification_reason> cache_;
    std::size_t probe_calls_ = 0;
};

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_TRANSFER_MODE_SELECTOR_H
