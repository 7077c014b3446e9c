/**
 * @file mode_selector.cpp
 * @brief Per-item choice between the direct and fallback transfer paths
 */

#include "kcenon/archive_sync/transfer/mode_selector.h"

#include "kcenon/archive_sync/core/logging.h"

namespace kcenon::archive_sync {

store_capability_probe::store_capability_probe(
    std::shared_ptr<const storage::store_registry> stores)
    : stores_(std::move(stores)) {}

auto store_capability_probe::supports_direct(const storage::object_uri& source,
                                             const storage::object_uri& destination,
                                             std::chrono::milliseconds timeout)
    -> result<bool> {
    if (!stores_) {
        return make_error(sync_error_code::internal_error, "no object stores configured");
    }
    auto store = stores_->find(source);
    if (!store) {
        return unexpected(store.error());
    }
    return store.value()->supports_server_side_copy(source, destination, timeout);
}

mode_selector::mode_selector(const sync_configuration& config,
                             std::shared_ptr<capability_probe> probe)
    : direct_enabled_(config.direct_sync_enabled),
      probe_timeout_(config.probe_timeout),
      probe_(std::move(probe)) {}

auto mode_selector::decide(std::string_view source, std::string_view destination)
    -> mode_decision {
    if (!direct_enabled_) {
        return {transfer_mode::fallback, classification_reason::direct_disabled};
    }

    auto src = storage::object_uri::parse(source);
    auto dst = storage::object_uri::parse(destination);
    if (!src || !dst) {
        AS_LOG_WARN(log_category::selector,
                    "cannot parse transfer URIs, using fallback: " +
                        (!src ? src.error().message : dst.error().message));
        return {transfer_mode::fallback, classification_reason::malformed_uri};
    }

    if (src.value().family != dst.value().family) {
        return {transfer_mode::fallback, classification_reason::family_mismatch};
    }
    if (src.value().family != storage::protocol_family::s3) {
        return {transfer_mode::fallback, classification_reason::unsupported_family};
    }

    auto reason = probe(src.value(), dst.value());
    auto mode = reason == classification_reason::direct_supported ? transfer_mode::direct
                                                                  : transfer_mode::fallback;
    return {mode, reason};
}

auto mode_selector::classify(const transfer_item& item) -> transfer_mode {
    return decide(item.source_uri, item.destination_uri).mode;
}

auto mode_selector::probe_calls() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return probe_calls_;
}

auto mode_selector::probe(const storage::object_uri& source,
                          const storage::object_uri& destination)
    -> classification_reason {
    cache_key key{source.family, source.bucket, destination.bucket};

    // Held across the probe so concurrent callers never probe the same pair twice
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }

    ++probe_calls_;
    auto reason = classification_reason::probe_failed;
    if (!probe_) {
        AS_LOG_WARN(log_category::selector, "no capability probe configured, using fallback");
    } else {
        auto answer = [&]() -> result<bool> {
            try {
                return probe_->supports_direct(source, destination, probe_timeout_);
            } catch (const std::exception& e) {
                return make_error(sync_error_code::internal_error,
                                  std::string("probe threw: ") + e.what());
            } catch (...) {
                return make_error(sync_error_code::internal_error, "probe threw");
            }
        }();

        if (!answer) {
            AS_LOG_WARN(log_category::selector,
                        "capability probe failed for " + source.bucket + " -> " +
                            destination.bucket + ", using fallback: " +
                            answer.error().message);
        } else {
            reason = answer.value() ? classification_reason::direct_supported
                                    : classification_reason::probe_negative;
            AS_LOG_DEBUG(log_category::selector,
                         "capability probe " + source.bucket + " -> " + destination.bucket +
                             ": " + std::string(to_string(reason)));
        }
    }

    cache_.emplace(std::move(key), reason);
    return reason;
}

}  // namespace kcenon::archive_sync
