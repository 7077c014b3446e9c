/**
 * @file utility_command.h
 * @brief Command-line construction and error classification for s5cmd
 */

#ifndef KCENON_ARCHIVE_SYNC_PROCESS_UTILITY_COMMAND_H
#define KCENON_ARCHIVE_SYNC_PROCESS_UTILITY_COMMAND_H

#include <kcenon/archive_sync/core/error_codes.h>
#include <kcenon/archive_sync/core/sync_config.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::archive_sync::process {

/**
 * @brief Executable plus global flags shared by every utility invocation
 *
 * Produces: <exe> [--endpoint-url U] [--no-sign-request] [extra...] [--json]
 */
[[nodiscard]] auto utility_base_args(const utility_options& options, bool json_output)
    -> std::vector<std::string>;

/**
 * @brief Arguments for a batch run reading its manifest from stdin
 *
 * Produces the base args followed by
 * --numworkers N --retry-count R run
 */
[[nodiscard]] auto utility_run_args(const utility_options& options,
                                    std::size_t workers,
                                    uint32_t retry_count) -> std::vector<std::string>;

/**
 * @brief One manifest line copying source to destination
 *
 * Produces: cp [--if-size-differ] [--source-region R] [--part-size N] 'src' 'dst'
 */
[[nodiscard]] auto manifest_copy_line(const utility_options& options,
                                      std::string_view source,
                                      std::string_view destination) -> std::string;

/**
 * @brief Single-quote an argument for the utility's manifest parser
 */
[[nodiscard]] auto quote_argument(std::string_view value) -> std::string;

/**
 * @brief Map a utility error message to an error code
 *
 * Missing objects, missing buckets and denied access are permanent;
 * throttling, timeouts, server errors and anything unrecognized are
 * transient.
 */
[[nodiscard]] auto classify_utility_error(std::string_view message) -> sync_error_code;

}  // namespace kcenon::archive_sync::process

#endif  // KCENON_ARCHIVE_SYNC_PROCESS_UTILITY_COMMAND_H
