/**
 * @file utility_output.h
 * @brief Typed records parsed from the batch-copy utility's JSON-lines output
 */

#ifndef KCENON_ARCHIVE_SYNC_PROCESS_UTILITY_OUTPUT_H
#define KCENON_ARCHIVE_SYNC_PROCESS_UTILITY_OUTPUT_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::archive_sync::process {

/**
 * @brief One per-object outcome reported by the utility
 *
 * Success records carry source, destination and object size; error
 * records carry the failing command line and the error text.
 */
struct utility_outcome {
    std::string operation;
    bool success = false;
    std::optional<std::string> source;
    std::optional<std::string> destination;
    std::optional<uint64_t> size;
    std::optional<std::string> command;
    std::optional<std::string> error;
};

/**
 * @brief One object row of a JSON listing
 */
struct listing_entry {
    std::string key;
    uint64_t size = 0;
    std::optional<std::string> etag;
    bool is_directory = false;
};

/**
 * @brief Parse one output line
 * @return The outcome, or std::nullopt when the line is not an outcome record
 */
[[nodiscard]] auto parse_outcome_line(std::string_view line) -> std::optional<utility_outcome>;

/**
 * @brief Parse every outcome record of a captured stream, in order
 *
 * Lines that are not JSON objects are skipped.
 */
[[nodiscard]] auto parse_outcomes(std::string_view output) -> std::vector<utility_outcome>;

/**
 * @brief Parse every object row of a JSON listing
 */
[[nodiscard]] auto parse_listing(std::string_view output) -> std::vector<listing_entry>;

}  // namespace kcenon::archive_sync::process

#endif  // KCENON_ARCHIVE_SYNC_PROCESS_UTILITY_OUTPUT_H
