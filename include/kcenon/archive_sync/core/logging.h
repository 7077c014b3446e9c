// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if ARCHIVE_SYNC_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::archive_sync {

/**
 * @brief Log categories for archive_sync
 */
struct log_category {
    static constexpr std::string_view coordinator = "archive_sync.coordinator";
    static constexpr std::string_view planner = "archive_sync.planner";
    static constexpr std::string_view selector = "archive_sync.selector";
    static constexpr std::string_view direct = "archive_sync.direct";
    static constexpr std::string_view fallback = "archive_sync.fallback";
    static constexpr std::string_view monitor = "archive_sync.monitor";
    static constexpr std::string_view process = "archive_sync.process";
    static constexpr std::string_view storage = "archive_sync.storage";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief What the masker hides in log output
 */
struct masking_config {
    bool mask_query_strings = false;  ///< Presigned URL signatures and tokens
    bool mask_credentials = false;    ///< Access key ids and secret=value pairs
    bool mask_object_keys = false;    ///< Object key prefixes inside URIs
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, false, "*", 4};
    }
};

/**
 * @brief Masks credentials and object locations in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_query_strings && !config_.mask_credentials &&
            !config_.mask_object_keys) {
            return input;
        }

        std::string out = input;

        if (config_.mask_credentials) {
            out = mask_credentials(out);
        }

        if (config_.mask_query_strings || config_.mask_object_keys) {
            out = mask_uris(out);
        }

        return out;
    }

    /**
     * @brief Mask a single object URI
     *
     * The scheme, bucket and final path segment stay visible; the query
     * string and the key prefix are hidden when configured.
     */
    [[nodiscard]] auto mask_uri(const std::string& uri) const -> std::string {
        if (uri.empty()) {
            return uri;
        }

        std::string base = uri;
        std::string query;
        auto qpos = uri.find('?');
        if (qpos != std::string::npos) {
            base = uri.substr(0, qpos);
            query = uri.substr(qpos);
        }

        if (config_.mask_query_strings && !query.empty()) {
            query = "?" + std::string(3, config_.mask_char[0]);
        }

        if (config_.mask_object_keys) {
            auto scheme_end = base.find("://");
            auto bucket_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
            auto key_start = base.find('/', bucket_start);
            auto last_sep = base.find_last_of('/');
            if (key_start != std::string::npos && last_sep > key_start) {
                auto hidden = last_sep - key_start - 1;
                base = base.substr(0, key_start + 1) +
                       std::string(hidden, config_.mask_char[0]) +
                       base.substr(last_sep);
            }
        }

        return base + query;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    // Access key ids keep their first visible_chars
    [[nodiscard]] auto mask_key_id(const std::string& key_id) const -> std::string {
        if (key_id.size() <= config_.visible_chars) {
            return std::string(key_id.size(), config_.mask_char[0]);
        }
        return key_id.substr(0, config_.visible_chars) +
               std::string(key_id.size() - config_.visible_chars, config_.mask_char[0]);
    }

    [[nodiscard]] auto mask_credentials(const std::string& input) const -> std::string {
        static const std::regex key_id_pattern(R"(\b(AKIA|ASIA)[A-Z0-9]{16}\b)");
        static const std::regex secret_pattern(
            R"(((?:secret|token|signature|password|X-Amz-Signature|X-Amz-Credential|)"
            R"(X-Amz-Security-Token)=)([^&\s'"]+))",
            std::regex::icase);

        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), key_id_pattern);
        std::sregex_iterator end;
        size_t last_pos = 0;
        for (; it != end; ++it) {
            out += input.substr(last_pos, it->position() - last_pos);
            out += mask_key_id(it->str());
            last_pos = it->position() + it->length();
        }
        out += input.substr(last_pos);

        return std::regex_replace(out, secret_pattern,
                                  "$1" + std::string(3, config_.mask_char[0]));
    }

    [[nodiscard]] auto mask_uris(const std::string& input) const -> std::string {
        static const std::regex uri_pattern(R"([a-zA-Z][a-zA-Z0-9+.-]*://[^\s'"]+)");

        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), uri_pattern);
        std::sregex_iterator end;
        size_t last_pos = 0;
        for (; it != end; ++it) {
            out += input.substr(last_pos, it->position() - last_pos);
            out += mask_uri(it->str());
            last_pos = it->position() + it->length();
        }
        out += input.substr(last_pos);
        return out;
    }

    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for batch and item operations
 */
struct sync_log_context {
    std::optional<uint64_t> batch_id;
    std::string mode;
    std::string source_uri;
    std::string destination_uri;
    std::optional<uint64_t> item_count;
    std::optional<uint64_t> bytes;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> duration_ms;
    std::optional<int> exit_code;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto masked_uri = [&](const std::string& uri) {
            return masker ? masker->mask_uri(uri) : uri;
        };

        if (batch_id) add_int("batch_id", static_cast<int64_t>(*batch_id));
        if (!mode.empty()) add_field("mode", mode);
        if (!source_uri.empty()) add_field("source", masked_uri(source_uri));
        if (!destination_uri.empty()) add_field("destination", masked_uri(destination_uri));
        if (item_count) add_int("items", static_cast<int64_t>(*item_count));
        if (bytes) add_int("bytes", static_cast<int64_t>(*bytes));
        if (attempt) add_int("attempt", *attempt);
        if (duration_ms) add_int("duration_ms", static_cast<int64_t>(*duration_ms));
        if (exit_code) add_int("exit_code", *exit_code);
        if (error_message) {
            add_field("error", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief One log record as a single-line JSON object
 *
 * Context fields are merged into the top level; the message and URIs pass
 * through @p masker.
 */
inline auto format_json_record(log_level level, std::string_view category,
                               std::string_view message, const sync_log_context* context,
                               const sensitive_info_masker& masker,
                               const char* file = nullptr, int line = 0) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << "{\"timestamp\":\"" << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count() << "Z\""
        << ",\"level\":\"" << log_level_to_string(level) << "\""
        << ",\"category\":\"" << category << "\""
        << ",\"message\":\"" << detail::escape_json_string(masker.mask(std::string(message)))
        << "\"";

    if (context) {
        auto fields = context->to_json_with_masking(&masker);
        if (fields.size() > 2) {
            oss << "," << fields.substr(1, fields.size() - 2);
        }
    }
    if (file && line > 0) {
        oss << ",\"at\":\"" << detail::escape_json_string(file) << ":" << line << "\"";
    }
    oss << "}";
    return oss.str();
}

class sync_logger;

sync_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief archive_sync logging interface
 *
 * Forwards to logger_system when available, otherwise writes to stderr.
 */
class sync_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const sync_log_context*)>;

    sync_logger() = default;
    ~sync_logger() = default;

    sync_logger(const sync_logger&) = delete;
    sync_logger& operator=(const sync_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. The coordinator calls it on construction.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if ARCHIVE_SYNC_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void set_level(log_level level) {
        min_level_.store(level);
#if ARCHIVE_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Set a callback that receives every enabled log record
     *
     * When set, records are also still written to the regular sink.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Suppress the stderr sink (callbacks still fire)
     */
    void set_quiet(bool quiet) { quiet_.store(quiet); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const sync_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string rendered;
        if (format == log_output_format::json) {
            rendered = format_json_record(level, category, message, context, current_masker,
                                          file, line);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << current_masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            rendered = oss.str();
        }

        write(level, rendered, file, line, function, format);
    }

    void flush() {
#if ARCHIVE_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write(log_level level, const std::string& rendered,
               [[maybe_unused]] const char* file, [[maybe_unused]] int line,
               [[maybe_unused]] const char* function, log_output_format format) {
#if ARCHIVE_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), rendered, file, line, function);
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        if (quiet_.load()) return;

        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        if (format == log_output_format::json) {
            std::cerr << rendered << "\n";
        } else {
            std::cerr << get_timestamp() << " [" << log_level_to_string(level) << "] "
                      << rendered << "\n";
        }
    }

#if ARCHIVE_SYNC_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> quiet_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline sync_logger& get_logger() {
    static sync_logger instance;
    return instance;
}

#define AS_LOG(level, category, message) \
    kcenon::archive_sync::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define AS_LOG_CTX(level, category, message, context) \
    kcenon::archive_sync::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define AS_LOG_DEBUG(category, message) \
    AS_LOG(kcenon::archive_sync::log_level::debug, category, message)

#define AS_LOG_INFO(category, message) \
    AS_LOG(kcenon::archive_sync::log_level::info, category, message)

#define AS_LOG_WARN(category, message) \
    AS_LOG(kcenon::archive_sync::log_level::warn, category, message)

#define AS_LOG_ERROR(category, message) \
    AS_LOG(kcenon::archive_sync::log_level::error, category, message)

#define AS_LOG_DEBUG_CTX(category, message, ctx) \
    AS_LOG_CTX(kcenon::archive_sync::log_level::debug, category, message, ctx)

#define AS_LOG_INFO_CTX(category, message, ctx) \
    AS_LOG_CTX(kcenon::archive_sync::log_level::info, category, message, ctx)

#define AS_LOG_WARN_CTX(category, message, ctx) \
    AS_LOG_CTX(kcenon::archive_sync::log_level::warn, category, message, ctx)

} // namespace kcenon::archive_sync
