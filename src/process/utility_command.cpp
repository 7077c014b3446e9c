/**
 * @file utility_command.cpp
 * @brief s5cmd command-line construction and error classification
 */

#include "kcenon/archive_sync/process/utility_command.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace kcenon::archive_sync::process {

namespace {

auto lowercase(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

auto contains_any(const std::string& haystack, std::initializer_list<std::string_view> needles)
    -> bool {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

auto is_echoed_operand(std::string_view token) -> bool {
    return !token.empty() && (token.front() == '/' || token.find("://") != std::string_view::npos);
}

/**
 * @brief Replace URIs and absolute paths echoed back by the utility with a space
 *
 * Object keys and local paths may hold digits or words that would otherwise
 * be read as status codes or error markers.
 */
auto strip_operands(const std::string& text) -> std::string {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            out += c;
            ++i;
            continue;
        }

        std::size_t begin = i;
        std::size_t end;
        std::size_t next;
        if (c == '\'' || c == '"') {
            auto close = text.find(c, i + 1);
            end = close == std::string::npos ? text.size() : close;
            begin = i + 1;
            next = close == std::string::npos ? text.size() : close + 1;
        } else {
            end = text.find_first_of(" \t\r\n'\"", i);
            if (end == std::string::npos) end = text.size();
            next = end;
        }

        std::string_view token(text.data() + begin, end - begin);
        if (is_echoed_operand(token)) {
            out += ' ';
        } else {
            out.append(text, i, next - i);
        }
        i = next;
    }
    return out;
}

/**
 * @brief HTTP status following "status code" or "statuscode", if any
 */
auto status_code_in(const std::string& text) -> int {
    for (std::string_view marker : {"status code", "statuscode"}) {
        auto pos = text.find(marker);
        while (pos != std::string::npos) {
            auto at = pos + marker.size();
            while (at < text.size() && (text[at] == ':' || text[at] == ' ' || text[at] == '=')) {
                ++at;
            }
            if (at + 3 <= text.size() && std::isdigit(static_cast<unsigned char>(text[at])) &&
                std::isdigit(static_cast<unsigned char>(text[at + 1])) &&
                std::isdigit(static_cast<unsigned char>(text[at + 2])) &&
                (at + 3 == text.size() ||
                 !std::isdigit(static_cast<unsigned char>(text[at + 3])))) {
                return std::stoi(text.substr(at, 3));
            }
            pos = text.find(marker, pos + 1);
        }
    }
    return 0;
}

}  // namespace

auto utility_base_args(const utility_options& options, bool json_output)
    -> std::vector<std::string> {
    std::vector<std::string> args{options.executable};

    if (options.endpoint_url) {
        args.emplace_back("--endpoint-url");
        args.push_back(*options.endpoint_url);
    }
    if (options.no_sign_request) {
        args.emplace_back("--no-sign-request");
    }
    args.insert(args.end(), options.extra_global_args.begin(),
                options.extra_global_args.end());
    if (json_output) {
        args.emplace_back("--json");
    }
    return args;
}

auto utility_run_args(const utility_options& options, std::size_t workers,
                      uint32_t retry_count) -> std::vector<std::string> {
    auto args = utility_base_args(options, true);
    args.emplace_back("--numworkers");
    args.push_back(std::to_string(std::max<std::size_t>(workers, 1)));
    args.emplace_back("--retry-count");
    args.push_back(std::to_string(retry_count));
    args.emplace_back("run");
    return args;
}

auto manifest_copy_line(const utility_options& options, std::string_view source,
                        std::string_view destination) -> std::string {
    std::string line = "cp";
    if (options.if_size_differ) {
        line += " --if-size-differ";
    }
    if (options.source_region) {
        line += " --source-region " + *options.source_region;
    }
    if (options.part_size_mb) {
        line += " --part-size " + std::to_string(*options.part_size_mb);
    }
    line += ' ';
    line += quote_argument(source);
    line += ' ';
    line += quote_argument(destination);
    return line;
}

auto quote_argument(std::string_view value) -> std::string {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted += '\'';
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

auto classify_utility_error(std::string_view message) -> sync_error_code {
    const auto text = strip_operands(lowercase(message));
    const auto status = status_code_in(text);

    // Transient conditions win over anything else in the same message
    if (status == 429 || contains_any(text, {"slowdown", "throttl", "too many requests",
                                             "requestlimitexceeded"})) {
        return sync_error_code::rate_limited;
    }
    if (contains_any(text, {"timeout", "timed out", "deadline exceeded"})) {
        return sync_error_code::transfer_timeout;
    }
    if ((status >= 500 && status < 600) ||
        contains_any(text, {"internalerror", "serviceunavailable", "connection reset",
                            "broken pipe", "unexpected eof"})) {
        return sync_error_code::storage_unavailable;
    }

    if (status == 404 ||
        contains_any(text, {"nosuchkey", "no object found", "not found", "nosuchbucket"})) {
        return sync_error_code::source_not_found;
    }
    if (status == 403 || contains_any(text, {"accessdenied", "access denied", "forbidden",
                                             "invalidaccesskeyid", "signaturedoesnotmatch"})) {
        return sync_error_code::access_denied;
    }
    if (contains_any(text, {"invalid url", "invalid uri", "not a valid", "parse error"})) {
        return sync_error_code::malformed_uri;
    }
    return sync_error_code::utility_exit_failure;
}

}  // namespace kcenon::archive_sync::process
