/**
 * @file store_registry.cpp
 * @brief Scheme-to-store lookup table
 */

#include "kcenon/archive_sync/storage/store_registry.h"

#include "kcenon/archive_sync/storage/local_object_store.h"
#include "kcenon/archive_sync/storage/utility_object_store.h"

namespace kcenon::archive_sync::storage {

void store_registry::register_store(const std::string& scheme,
                                    std::shared_ptr<object_store> store) {
    stores_[scheme] = std::move(store);
}

auto store_registry::find(const object_uri& uri) const
    -> result<std::shared_ptr<object_store>> {
    auto it = stores_.find(uri.scheme);
    if (it == stores_.end() || !it->second) {
        return make_error(sync_error_code::unsupported_scheme,
                          "no object store registered for scheme '" + uri.scheme + "'");
    }
    return it->second;
}

auto store_registry::contains(const std::string& scheme) const -> bool {
    return stores_.count(scheme) > 0;
}

auto store_registry::create_default(const utility_options& options,
                                    std::shared_ptr<process::process_runner_interface> runner)
    -> store_registry {
    store_registry registry;
    registry.register_store("file", std::make_shared<local_object_store>());

    auto utility = std::make_shared<utility_object_store>(options, std::move(runner));
    for (const auto* scheme : {"s3", "s3a", "s3n"}) {
        registry.register_store(scheme, utility);
    }
    return registry;
}

}  // namespace kcenon::archive_sync::storage
