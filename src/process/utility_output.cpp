/**
 * @file utility_output.cpp
 * @brief JSON-lines parsing of batch-copy utility output (jsoncpp)
 */

#include "kcenon/archive_sync/process/utility_output.h"

#include "kcenon/archive_sync/core/logging.h"

#include <json/json.h>

#include <memory>

namespace kcenon::archive_sync::process {

namespace {

auto trim(std::string_view text) -> std::string_view {
    const auto* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

auto parse_object(std::string_view line, Json::Value& root) -> bool {
    line = trim(line);
    if (line.empty() || line.front() != '{') {
        return false;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(line.data(), line.data() + line.size(), &root, &errors)) {
        AS_LOG_DEBUG(log_category::process, "ignoring unparsable output line: " + errors);
        return false;
    }
    return root.isObject();
}

auto optional_string(const Json::Value& root, const char* name) -> std::optional<std::string> {
    const auto& value = root[name];
    if (value.isString() && !value.asString().empty()) {
        return value.asString();
    }
    return std::nullopt;
}

auto optional_size(const Json::Value& value) -> std::optional<uint64_t> {
    if (value.isUInt64()) {
        return value.asUInt64();
    }
    if (value.isInt64() && value.asInt64() >= 0) {
        return static_cast<uint64_t>(value.asInt64());
    }
    return std::nullopt;
}

template <typename Fn>
void for_each_line(std::string_view output, Fn&& fn) {
    while (!output.empty()) {
        auto newline = output.find('\n');
        auto line = output.substr(0, newline);
        fn(line);
        if (newline == std::string_view::npos) break;
        output.remove_prefix(newline + 1);
    }
}

}  // namespace

auto parse_outcome_line(std::string_view line) -> std::optional<utility_outcome> {
    Json::Value root;
    if (!parse_object(line, root)) {
        return std::nullopt;
    }

    utility_outcome outcome;
    outcome.operation = root.get("operation", "").asString();
    outcome.source = optional_string(root, "source");
    outcome.destination = optional_string(root, "destination");
    outcome.command = optional_string(root, "command");
    outcome.error = optional_string(root, "error");

    if (root["object"].isObject()) {
        outcome.size = optional_size(root["object"]["size"]);
    }
    if (!outcome.size) {
        outcome.size = optional_size(root["size"]);
    }

    if (root["success"].isBool()) {
        outcome.success = root["success"].asBool() && !outcome.error;
    } else {
        outcome.success = false;
    }

    // A record with neither a verdict nor an error is not an outcome
    if (!root["success"].isBool() && !outcome.error) {
        return std::nullopt;
    }
    return outcome;
}

auto parse_outcomes(std::string_view output) -> std::vector<utility_outcome> {
    std::vector<utility_outcome> outcomes;
    for_each_line(output, [&](std::string_view line) {
        if (auto outcome = parse_outcome_line(line)) {
            outcomes.push_back(std::move(*outcome));
        }
    });
    return outcomes;
}

auto parse_listing(std::string_view output) -> std::vector<listing_entry> {
    std::vector<listing_entry> entries;
    for_each_line(output, [&](std::string_view line) {
        Json::Value root;
        if (!parse_object(line, root) || !root["key"].isString()) {
            return;
        }
        listing_entry entry;
        entry.key = root["key"].asString();
        entry.size = optional_size(root["size"]).value_or(0);
        entry.etag = optional_string(root, "etag");
        entry.is_directory = root.get("type", "").asString() == "directory";
        entries.push_back(std::move(entry));
    });
    return entries;
}

}  // namespace kcenon::archive_sync::process
