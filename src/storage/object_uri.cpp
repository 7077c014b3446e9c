/**
 * @file object_uri.cpp
 * @brief Object-storage URI parsing
 */

#include "kcenon/archive_sync/storage/object_uri.h"

#include <algorithm>
#include <cctype>

namespace kcenon::archive_sync::storage {

namespace {

auto has_control_chars(std::string_view text) -> bool {
    return std::any_of(text.begin(), text.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x20 || c == 0x7f;
    });
}

auto valid_scheme(std::string_view scheme) -> bool {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

}  // namespace

auto family_of_scheme(std::string_view scheme) -> protocol_family {
    if (scheme == "s3" || scheme == "s3a" || scheme == "s3n") return protocol_family::s3;
    if (scheme == "gs" || scheme == "gcs") return protocol_family::gcs;
    if (scheme == "az" || scheme == "abfs" || scheme == "abfss" || scheme == "wasb" ||
        scheme == "wasbs") {
        return protocol_family::azure;
    }
    if (scheme == "file" || scheme.empty()) return protocol_family::local;
    if (scheme == "http" || scheme == "https") return protocol_family::http;
    return protocol_family::unknown;
}

auto object_uri::parse(std::string_view text) -> result<object_uri> {
    if (text.empty()) {
        return make_error(sync_error_code::malformed_uri, "empty URI");
    }
    if (has_control_chars(text)) {
        return make_error(sync_error_code::malformed_uri,
                          "URI contains control characters");
    }

    object_uri uri;
    auto sep = text.find("://");

    if (sep == std::string_view::npos) {
        uri.scheme = "file";
        uri.family = protocol_family::local;
        uri.key = std::string(text);
        return uri;
    }

    std::string scheme(text.substr(0, sep));
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (!valid_scheme(scheme)) {
        return make_error(sync_error_code::malformed_uri,
                          "invalid scheme in URI: " + std::string(text));
    }

    uri.scheme = scheme;
    uri.family = family_of_scheme(scheme);
    auto rest = text.substr(sep + 3);

    if (uri.family == protocol_family::local) {
        if (rest.empty()) {
            return make_error(sync_error_code::malformed_uri, "file URI without a path");
        }
        uri.key = std::string(rest);
        return uri;
    }

    auto slash = rest.find('/');
    uri.bucket = std::string(rest.substr(0, slash));
    if (uri.bucket.empty()) {
        return make_error(sync_error_code::malformed_uri,
                          "URI has no bucket: " + std::string(text));
    }
    if (slash != std::string_view::npos) {
        uri.key = std::string(rest.substr(slash + 1));
    }
    return uri;
}

auto object_uri::str() const -> std::string {
    if (family == protocol_family::local) {
        return key;
    }
    return scheme + "://" + bucket + "/" + key;
}

auto object_uri::canonical() const -> std::string {
    if (family == protocol_family::s3) {
        return "s3://" + bucket + "/" + key;
    }
    return str();
}

auto object_uri::is_container() const noexcept -> bool {
    return key.empty() || key.back() == '/';
}

auto object_uri::basename() const -> std::string {
    auto trimmed = std::string_view(key);
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.remove_suffix(1);
    }
    auto pos = trimmed.find_last_of('/');
    return std::string(pos == std::string_view::npos ? trimmed : trimmed.substr(pos + 1));
}

auto object_uri::with_key(std::string new_key) const -> object_uri {
    object_uri copy = *this;
    copy.key = std::move(new_key);
    return copy;
}

}  // namespace kcenon::archive_sync::storage
