/**
 * @file batch_planner.cpp
 * @brief Groups transfer items into bounded, single-mode batches
 */

#include "kcenon/archive_sync/transfer/batch_planner.h"

#include "kcenon/archive_sync/core/logging.h"
#include "kcenon/archive_sync/storage/object_uri.h"

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace kcenon::archive_sync {

namespace {

auto ends_with_slash(const std::string& text) -> bool {
    return !text.empty() && text.back() == '/';
}

auto with_suffix(const std::string& relative, std::size_t n) -> std::string {
    auto slash = relative.find_last_of('/');
    auto name_start = slash == std::string::npos ? 0 : slash + 1;
    auto dot = relative.find_last_of('.');
    if (dot == std::string::npos || dot <= name_start) {
        return relative + "-" + std::to_string(n);
    }
    return relative.substr(0, dot) + "-" + std::to_string(n) + relative.substr(dot);
}

}  // namespace

batch_planner::batch_planner(std::shared_ptr<capability_probe> probe)
    : probe_(std::move(probe)) {}

auto batch_planner::resolve_destinations(const std::vector<transfer_item>& items,
                                         bool organize_by_prefix)
    -> std::vector<std::string> {
    std::vector<std::string> resolved;
    resolved.reserve(items.size());
    std::unordered_set<std::string> taken;

    // Explicit destinations are claimed before any derived name
    for (const auto& item : items) {
        if (!ends_with_slash(item.destination_uri)) {
            taken.insert(item.destination_uri);
        }
    }

    for (const auto& item : items) {
        if (!ends_with_slash(item.destination_uri)) {
            resolved.push_back(item.destination_uri);
            continue;
        }

        auto source = storage::object_uri::parse(item.source_uri);
        if (!source || source.value().is_container()) {
            // Left unresolved; the executor reports the failure
            resolved.push_back(item.destination_uri);
            continue;
        }

        std::string relative;
        if (organize_by_prefix) {
            relative = source.value().key;
            relative.erase(0, relative.find_first_not_of('/'));
        } else {
            relative = source.value().basename();
        }

        auto destination = item.destination_uri + relative;
        for (std::size_t n = 1; taken.count(destination) > 0; ++n) {
            destination = item.destination_uri + with_suffix(relative, n);
        }
        taken.insert(destination);
        resolved.push_back(std::move(destination));
    }
    return resolved;
}

auto batch_planner::plan(const std::vector<transfer_item>& items,
                         const sync_configuration& config)
    -> result<std::vector<transfer_batch>> {
    auto valid = validate(config);
    if (!valid) {
        AS_LOG_ERROR(log_category::planner, "invalid configuration: " + valid.error().message);
        return unexpected(valid.error());
    }

    auto destinations = resolve_destinations(items, config.organize_by_prefix);
    mode_selector selector(config, probe_);

    std::vector<transfer_mode> mode_order;
    std::vector<std::vector<batch_entry>> groups;
    std::vector<mode_decision> decisions;
    decisions.reserve(items.size());

    for (std::size_t i = 0; i < items.size(); ++i) {
        auto decision = selector.decide(items[i].source_uri, destinations[i]);
        decisions.push_back(decision);

        auto slot = std::find(mode_order.begin(), mode_order.end(), decision.mode);
        if (slot == mode_order.end()) {
            mode_order.push_back(decision.mode);
            groups.emplace_back();
            slot = std::prev(mode_order.end());
        }
        auto& group = groups[static_cast<std::size_t>(slot - mode_order.begin())];
        group.push_back(batch_entry{i, items[i], destinations[i]});
    }

    std::vector<transfer_batch> batches;
    uint64_t next_id = 1;
    for (std::size_t g = 0; g < groups.size(); ++g) {
        auto& group = groups[g];
        for (std::size_t start = 0; start < group.size(); start += config.max_batch_size) {
            auto end = std::min(group.size(), start + config.max_batch_size);
            transfer_batch batch;
            batch.id = next_id++;
            batch.mode = mode_order[g];
            auto first = group.begin() + static_cast<std::ptrdiff_t>(start);
            auto last = group.begin() + static_cast<std::ptrdiff_t>(end);
            batch.entries.assign(std::make_move_iterator(first), std::make_move_iterator(last));
            batches.push_back(std::move(batch));
        }
    }

    decisions_ = std::move(decisions);

    AS_LOG_INFO(log_category::planner,
                "planned " + std::to_string(items.size()) + " items into " +
                    std::to_string(batches.size()) + " batches (" +
                    std::to_string(selector.probe_calls()) + " capability probes)");
    return batches;
}

}  // namespace kcenon::archive_sync
