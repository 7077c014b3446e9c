/**
 * @file direct_transfer_executor.cpp
 * @brief Server-side batch copies through the batch-copy utility
 */

#include "kcenon/archive_sync/transfer/direct_transfer_executor.h"

#include "kcenon/archive_sync/core/logging.h"
#include "kcenon/archive_sync/process/utility_command.h"
#include "kcenon/archive_sync/storage/object_uri.h"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <map>
#include <set>
#include <thread>

namespace kcenon::archive_sync {

namespace {

auto elapsed_since(std::chrono::steady_clock::time_point start) -> duration {
    return std::chrono::duration_cast<duration>(std::chrono::steady_clock::now() - start);
}

// True when destination occurs in command as a whole argument
auto command_mentions(const std::string& command, const std::string& destination) -> bool {
    if (destination.empty()) return false;
    for (auto pos = command.find(destination); pos != std::string::npos;
         pos = command.find(destination, pos + 1)) {
        auto end = pos + destination.size();
        if (end == command.size() || command[end] == ' ' || command[end] == '\'' ||
            command[end] == '"') {
            return true;
        }
    }
    return false;
}

auto parent_prefix(const std::string& uri) -> std::string {
    auto slash = uri.find_last_of('/');
    return slash == std::string::npos ? uri : uri.substr(0, slash + 1);
}

auto mentions_missing(const process::process_output& output) -> bool {
    auto missing = [](const std::string& text) {
        return text.find("no object found") != std::string::npos;
    };
    return missing(output.stderr_data) || missing(output.stdout_data);
}

struct pending_failure {
    sync_error_code code = sync_error_code::unreported_outcome;
    std::string detail;
};

}  // namespace

auto map_outcomes(const std::vector<std::string>& destinations,
                  const std::vector<process::utility_outcome>& outcomes)
    -> std::vector<std::optional<std::size_t>> {
    std::vector<std::optional<std::size_t>> assigned(destinations.size());
    std::vector<bool> consumed(outcomes.size(), false);

    std::map<std::string, std::vector<std::size_t>> lines_by_destination;
    for (std::size_t line = 0; line < destinations.size(); ++line) {
        lines_by_destination[destinations[line]].push_back(line);
    }

    // Echoed destination
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (!outcomes[i].destination) continue;
        auto it = lines_by_destination.find(*outcomes[i].destination);
        if (it == lines_by_destination.end()) continue;

        consumed[i] = true;
        for (auto line : it->second) {
            if (!assigned[line]) {
                assigned[line] = i;
                break;
            }
        }
    }

    // Destination inside the echoed command; the longest match wins
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (consumed[i] || !outcomes[i].command) continue;

        std::optional<std::size_t> best;
        bool mentioned = false;
        for (std::size_t line = 0; line < destinations.size(); ++line) {
            if (!command_mentions(*outcomes[i].command, destinations[line])) continue;
            mentioned = true;
            if (assigned[line]) continue;
            if (!best || destinations[line].size() > destinations[*best].size()) {
                best = line;
            }
        }
        if (best) {
            assigned[*best] = i;
        }
        consumed[i] = mentioned;
    }

    // Position, for records that name nothing
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (consumed[i] || outcomes[i].destination || outcomes[i].command) continue;
        if (i < assigned.size() && !assigned[i]) {
            assigned[i] = i;
        }
    }
    return assigned;
}

direct_transfer_executor::direct_transfer_executor(
    sync_configuration config, std::shared_ptr<process::process_runner_interface> runner)
    : config_(std::move(config)),
      runner_(std::move(runner)),
      sleep_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {}

auto direct_transfer_executor::existing_objects(const std::vector<std::string>& uris)
    -> std::map<std::string, uint64_t> {
    std::set<std::string> wanted(uris.begin(), uris.end());
    std::set<std::string> prefixes;
    for (const auto& uri : uris) {
        prefixes.insert(parent_prefix(uri));
    }

    std::map<std::string, uint64_t> existing;
    for (const auto& prefix : prefixes) {
        process::process_request request;
        request.args = process::utility_base_args(config_.utility, true);
        request.args.emplace_back("ls");
        request.args.push_back(prefix);
        request.timeout = config_.item_timeout;

        auto ran = runner_->run(request);
        if (!ran) {
            AS_LOG_WARN(log_category::direct,
                        "cannot list " + prefix + ": " + ran.error().message);
            continue;
        }
        const auto& output = ran.value();
        if (!output.succeeded()) {
            if (output.timed_out || !mentions_missing(output)) {
                AS_LOG_WARN(log_category::direct,
                            "listing " + prefix + " failed (exit code " +
                                std::to_string(output.exit_code) + ")");
            }
            continue;
        }

        for (const auto& entry : process::parse_listing(output.stdout_data)) {
            if (!entry.is_directory && wanted.count(entry.key) > 0) {
                existing[entry.key] = entry.size;
            }
        }
    }
    return existing;
}

auto direct_transfer_executor::build_manifest(const std::vector<std::string>& sources,
                                              const std::vector<std::string>& destinations) const
    -> std::string {
    std::string manifest;
    for (std::size_t i = 0; i < sources.size() && i < destinations.size(); ++i) {
        manifest += process::manifest_copy_line(config_.utility, sources[i], destinations[i]);
        manifest += '\n';
    }
    return manifest;
}

auto direct_transfer_executor::execute(const transfer_batch& batch)
    -> std::vector<transfer_result> {
    const auto start = std::chrono::steady_clock::now();
    const auto count = batch.size();

    std::vector<std::optional<transfer_result>> results(count);
    std::vector<std::string> sources(count);
    std::vector<std::string> destinations(count);
    std::vector<uint32_t> attempts(count, 0);
    std::vector<pending_failure> failures(count);
    std::vector<std::size_t> pending;

    for (std::size_t i = 0; i < count; ++i) {
        const auto& entry = batch.entries[i];
        auto src = storage::object_uri::parse(entry.item.source_uri);
        auto dst = storage::object_uri::parse(entry.destination);
        if (!src || !dst) {
            const auto& err = !src ? src.error() : dst.error();
            results[i] = transfer_result::failure(entry, transfer_mode::direct, err.code,
                                                  err.message, duration{0}, 0);
            continue;
        }
        if (dst.value().is_container()) {
            results[i] = transfer_result::failure(
                entry, transfer_mode::direct, sync_error_code::malformed_uri,
                "destination names a container: " + entry.destination, duration{0}, 0);
            continue;
        }
        sources[i] = src.value().canonical();
        destinations[i] = dst.value().canonical();
        pending.push_back(i);
    }

    if (config_.skip_existing && !pending.empty()) {
        std::vector<std::string> wanted;
        for (auto idx : pending) {
            wanted.push_back(destinations[idx]);
        }
        auto existing = existing_objects(wanted);

        std::vector<std::size_t> to_copy;
        for (auto idx : pending) {
            const auto& entry = batch.entries[idx];
            const auto& expected = entry.item.expected_size;
            auto found = existing.find(destinations[idx]);
            if (found != existing.end() && (!expected || *expected == found->second)) {
                results[idx] = transfer_result::skip(entry, transfer_mode::direct,
                                                     "destination up to date");
                continue;
            }
            to_copy.push_back(idx);
        }
        if (to_copy.size() != pending.size()) {
            AS_LOG_INFO(log_category::direct,
                        std::to_string(pending.size() - to_copy.size()) + " items of batch " +
                            std::to_string(batch.id) + " already at destination");
        }
        pending = std::move(to_copy);
    }

    const auto max_attempts =
        static_cast<uint32_t>(std::max<std::size_t>(config_.retry.max_attempts, 1));
    auto args = process::utility_run_args(config_.utility, config_.max_concurrency,
                                          config_.retry.utility_retry_count);

    for (uint32_t attempt = 1; attempt <= max_attempts && !pending.empty(); ++attempt) {
        if (attempt > 1) {
            auto delay = calculate_retry_delay(config_.retry, attempt - 1);
            AS_LOG_INFO(log_category::direct,
                        "retrying " + std::to_string(pending.size()) + " items of batch " +
                            std::to_string(batch.id) + " in " + std::to_string(delay.count()) +
                            " ms (attempt " + std::to_string(attempt) + ")");
            sleep_(delay);
        }

        std::vector<std::string> attempt_sources;
        std::vector<std::string> attempt_destinations;
        for (auto idx : pending) {
            attempt_sources.push_back(sources[idx]);
            attempt_destinations.push_back(destinations[idx]);
            ++attempts[idx];
        }

        process::process_request request;
        request.args = args;
        request.stdin_data = build_manifest(attempt_sources, attempt_destinations);
        request.timeout = config_.batch_timeout;

        std::vector<std::size_t> retry_next;
        auto fail = [&](std::size_t idx, sync_error_code code, std::string detail) {
            if (is_retryable(code)) {
                failures[idx] = pending_failure{code, std::move(detail)};
                retry_next.push_back(idx);
                return;
            }
            results[idx] = transfer_result::failure(batch.entries[idx], transfer_mode::direct,
                                                    code, std::move(detail),
                                                    elapsed_since(start), attempts[idx]);
        };

        auto ran = runner_->run(request);
        if (!ran) {
            AS_LOG_ERROR(log_category::direct, "utility launch failed: " + ran.error().message);
            for (auto idx : pending) {
                fail(idx, ran.error().code, ran.error().message);
            }
            pending = std::move(retry_next);
            continue;
        }

        const auto& output = ran.value();
        auto outcomes = process::parse_outcomes(output.stdout_data);
        auto error_outcomes = process::parse_outcomes(output.stderr_data);
        outcomes.insert(outcomes.end(), std::make_move_iterator(error_outcomes.begin()),
                        std::make_move_iterator(error_outcomes.end()));
        auto mapping = map_outcomes(attempt_destinations, outcomes);

        std::size_t reported = 0;
        std::vector<std::size_t> silent;
        for (std::size_t k = 0; k < pending.size(); ++k) {
            auto idx = pending[k];
            const auto& entry = batch.entries[idx];

            if (!mapping[k]) {
                if (config_.utility.if_size_differ && output.succeeded()) {
                    // Size-equal objects produce no record with --if-size-differ
                    silent.push_back(idx);
                } else if (output.timed_out) {
                    fail(idx, sync_error_code::transfer_timeout,
                         "unreported before batch timeout of " +
                             std::to_string(config_.batch_timeout.count()) + " ms");
                } else if (output.exit_code != 0) {
                    fail(idx, sync_error_code::unreported_outcome,
                         "unreported by utility (exit code " + std::to_string(output.exit_code) +
                             ")");
                } else {
                    fail(idx, sync_error_code::unreported_outcome, "unreported by utility");
                }
                continue;
            }

            ++reported;
            const auto& outcome = outcomes[*mapping[k]];
            if (!outcome.success) {
                auto text = outcome.error.value_or("utility reported failure");
                fail(idx, process::classify_utility_error(text), text);
                continue;
            }

            const auto& expected = entry.item.expected_size;
            if (expected && outcome.size && *outcome.size != *expected) {
                fail(idx, sync_error_code::size_mismatch,
                     "size mismatch: expected " + std::to_string(*expected) +
                         " bytes, utility reported " + std::to_string(*outcome.size));
                continue;
            }

            auto bytes = outcome.size ? *outcome.size : expected.value_or(0);
            results[idx] = transfer_result::success(entry, transfer_mode::direct, bytes,
                                                    elapsed_since(start), attempts[idx]);
        }

        if (!silent.empty()) {
            std::vector<std::string> wanted;
            for (auto idx : silent) {
                wanted.push_back(destinations[idx]);
            }
            auto existing = existing_objects(wanted);
            for (auto idx : silent) {
                if (existing.count(destinations[idx]) > 0) {
                    ++reported;
                    results[idx] = transfer_result::skip(batch.entries[idx], transfer_mode::direct,
                                                         "destination up to date");
                    results[idx]->attempts = attempts[idx];
                    continue;
                }
                fail(idx, sync_error_code::unreported_outcome, "unreported by utility");
            }
        }

        sync_log_context ctx;
        ctx.batch_id = batch.id;
        ctx.mode = std::string(to_string(transfer_mode::direct));
        ctx.item_count = pending.size();
        ctx.attempt = attempt;
        ctx.duration_ms = static_cast<uint64_t>(output.elapsed.count());
        ctx.exit_code = output.exit_code;
        if (reported != pending.size() || !output.succeeded()) {
            ctx.error_message = std::to_string(pending.size() - reported) + " items unreported";
            AS_LOG_WARN_CTX(log_category::direct, "partial batch outcome", ctx);
        } else {
            AS_LOG_DEBUG_CTX(log_category::direct, "batch attempt completed", ctx);
        }

        pending = std::move(retry_next);
    }

    for (auto idx : pending) {
        auto& failure = failures[idx];
        results[idx] = transfer_result::failure(
            batch.entries[idx], transfer_mode::direct, failure.code,
            failure.detail + " (failed after " + std::to_string(attempts[idx]) + " attempts)",
            elapsed_since(start), attempts[idx]);
    }

    std::vector<transfer_result> out;
    out.reserve(count);
    for (auto& r : results) {
        out.push_back(std::move(*r));
    }
    return out;
}

}  // namespace kcenon::archive_sync
