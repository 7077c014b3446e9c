/**
 * @file utility_object_store.cpp
 * @brief s5cmd-backed object store
 */

#include "kcenon/archive_sync/storage/utility_object_store.h"

#include "kcenon/archive_sync/core/logging.h"
#include "kcenon/archive_sync/process/utility_command.h"
#include "kcenon/archive_sync/process/utility_output.h"

#include <algorithm>
#include <cctype>

namespace kcenon::archive_sync::storage {

namespace {

auto lowercase(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

auto is_not_found(const process::process_output& output) -> bool {
    auto text = lowercase(output.stderr_data + output.stdout_data);
    return text.find("no object found") != std::string::npos ||
           text.find("nosuchkey") != std::string::npos;
}

auto failure_text(const process::process_output& output) -> std::string {
    for (const auto& outcome : process::parse_outcomes(output.stderr_data)) {
        if (outcome.error) return *outcome.error;
    }
    if (!output.stderr_data.empty()) {
        auto text = output.stderr_data;
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.pop_back();
        }
        return text;
    }
    return "exit code " + std::to_string(output.exit_code);
}

auto command_error(const std::string& what, const process::process_output& output)
    -> unexpected {
    if (output.timed_out) {
        return make_error(sync_error_code::transfer_timeout,
                          what + " timed out after " +
                              std::to_string(output.elapsed.count()) + " ms");
    }
    auto text = failure_text(output);
    return make_error(process::classify_utility_error(text), what + " failed: " + text);
}

auto buffer_size(const std::filesystem::path& path, sync_error_code code)
    -> result<uint64_t> {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return make_error(code, "cannot size buffer " + path.string() + ": " + ec.message());
    }
    return static_cast<uint64_t>(size);
}

}  // namespace

utility_object_store::utility_object_store(
    utility_options options, std::shared_ptr<process::process_runner_interface> runner)
    : options_(std::move(options)), runner_(std::move(runner)) {}

auto utility_object_store::run_command(std::vector<std::string> command_args,
                                       std::chrono::milliseconds timeout,
                                       process::process_request request)
    -> result<process::process_output> {
    request.args = process::utility_base_args(options_, true);
    request.args.insert(request.args.end(),
                        std::make_move_iterator(command_args.begin()),
                        std::make_move_iterator(command_args.end()));
    request.timeout = timeout;
    return runner_->run(request);
}

auto utility_object_store::stat(const object_uri& uri, std::chrono::milliseconds timeout)
    -> result<std::optional<object_stat>> {
    auto ran = run_command({"ls", uri.canonical()}, timeout, {});
    if (!ran) {
        return unexpected(ran.error());
    }
    const auto& output = ran.value();

    if (!output.succeeded()) {
        if (!output.timed_out && is_not_found(output)) {
            return std::optional<object_stat>{};
        }
        return command_error("ls " + uri.canonical(), output);
    }

    auto wanted = uri.canonical();
    for (const auto& entry : process::parse_listing(output.stdout_data)) {
        if (!entry.is_directory && entry.key == wanted) {
            return std::optional<object_stat>{object_stat{entry.size, entry.etag}};
        }
    }
    return std::optional<object_stat>{};
}

auto utility_object_store::read_into(const object_uri& source,
                                     const std::filesystem::path& buffer,
                                     std::chrono::milliseconds timeout)
    -> result<uint64_t> {
    process::process_request request;
    request.stdout_file = buffer;

    auto ran = run_command({"cat", source.canonical()}, timeout, std::move(request));
    if (!ran) {
        return unexpected(ran.error());
    }
    if (!ran.value().succeeded()) {
        if (!ran.value().timed_out && is_not_found(ran.value())) {
            return make_error(sync_error_code::source_not_found,
                              "source object not found: " + source.canonical());
        }
        return command_error("cat " + source.canonical(), ran.value());
    }
    return buffer_size(buffer, sync_error_code::read_failed);
}

auto utility_object_store::write_from(const std::filesystem::path& buffer,
                                      const object_uri& destination,
                                      std::chrono::milliseconds timeout)
    -> result<uint64_t> {
    auto size = buffer_size(buffer, sync_error_code::write_failed);
    if (!size) {
        return size;
    }

    process::process_request request;
    request.stdin_file = buffer;

    std::vector<std::string> command{"pipe"};
    if (options_.part_size_mb) {
        command.emplace_back("--part-size");
        command.push_back(std::to_string(*options_.part_size_mb));
    }
    command.push_back(destination.canonical());

    auto ran = run_command(std::move(command), timeout, std::move(request));
    if (!ran) {
        return unexpected(ran.error());
    }
    if (!ran.value().succeeded()) {
        return command_error("pipe " + destination.canonical(), ran.value());
    }

    AS_LOG_DEBUG(log_category::storage, "uploaded " + destination.canonical());
    return size;
}

auto utility_object_store::bucket_reachable(const object_uri& uri,
                                            std::chrono::milliseconds timeout)
    -> result<bool> {
    auto bucket_uri = uri.with_key("").canonical();
    auto ran = run_command({"ls", bucket_uri}, timeout, {});
    if (!ran) {
        return unexpected(ran.error());
    }
    const auto& output = ran.value();
    if (output.succeeded()) {
        return true;
    }
    if (output.timed_out) {
        return command_error("ls " + bucket_uri, output);
    }

    // An empty bucket lists as "no object found" but is reachable
    if (is_not_found(output)) {
        return true;
    }

    auto text = failure_text(output);
    auto code = process::classify_utility_error(text);
    if (code == sync_error_code::source_not_found || code == sync_error_code::access_denied) {
        return false;
    }
    return make_error(code, "ls " + bucket_uri + " failed: " + text);
}

auto utility_object_store::supports_server_side_copy(const object_uri& source,
                                                     const object_uri& destination,
                                                     std::chrono::milliseconds timeout)
    -> result<bool> {
    if (source.family != protocol_family::s3 || destination.family != protocol_family::s3) {
        return false;
    }

    for (const auto* uri : {&source, &destination}) {
        auto reachable = bucket_reachable(*uri, timeout);
        if (!reachable) {
            return reachable;
        }
        if (!reachable.value()) {
            AS_LOG_DEBUG(log_category::storage,
                         "bucket not reachable for server-side copy: " + uri->bucket);
            return false;
        }
    }
    return true;
}

}  // namespace kcenon::archive_sync::storage
