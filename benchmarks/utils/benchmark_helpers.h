/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_ARCHIVE_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_ARCHIVE_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/archive_sync/core/transfer_types.h>
#include <kcenon/archive_sync/transfer/mode_selector.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::archive_sync::benchmark {

/**
 * @brief Helper class for generating transfer items
 */
class item_generator {
public:
    /**
     * @brief Items copied between two buckets of the S3 family
     * @param count Number of items
     * @param prefix_depth Number of key path segments above the object name
     */
    static auto same_family(std::size_t count, std::size_t prefix_depth = 2)
        -> std::vector<transfer_item>;

    /**
     * @brief Same-family items with every @p cross_every-th item sent to a
     *        local destination instead
     */
    static auto mixed(std::size_t count, std::size_t cross_every) -> std::vector<transfer_item>;
};

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::string;

/**
 * @brief Capability probe that answers without any I/O
 */
class fixed_probe : public capability_probe {
public:
    explicit fixed_probe(bool answer) : answer_(answer) {}

    [[nodiscard]] auto supports_direct(const storage::object_uri&, const storage::object_uri&,
                                       std::chrono::milliseconds) -> result<bool> override {
        ++calls_;
        return answer_;
    }

    [[nodiscard]] auto calls() const -> std::size_t { return calls_.load(); }

private:
    bool answer_;
    std::atomic<std::size_t> calls_{0};
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     * @param name File name relative to the base directory
     * @param size File size
     * @param seed Random seed
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Create (or return) a subdirectory of the base directory
     */
    auto subdirectory(const std::string& name) -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Clean up all temporary files
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    bool owns_dir_ = false;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_object = 64 * KB;
constexpr std::size_t medium_object = 1 * MB;
}  // namespace sizes

}  // namespace kcenon::archive_sync::benchmark

#endif  // KCENON_ARCHIVE_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H
