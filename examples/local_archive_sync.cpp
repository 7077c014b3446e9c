/**
 * @file local_archive_sync.cpp
 * @brief Archive a local directory through the fallback path
 *
 * This example demonstrates:
 * - Building a sync_configuration with the builder
 * - Copying every file of a directory into an archive container
 * - Reading per-item results and the efficiency statistics of a run
 */

#include <kcenon/archive_sync/archive_sync.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::archive_sync;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Create sample archives for the demo
 */
void create_test_files(const std::filesystem::path& directory, std::size_t count) {
    std::filesystem::create_directories(directory);
    std::cout << "Creating " << count << " test files in " << directory << "..." << std::endl;

    for (std::size_t i = 0; i < count; ++i) {
        auto path = directory / ("daily_" + std::to_string(i + 1) + ".zip");
        std::ofstream file(path, std::ios::binary);
        std::string line(1024, static_cast<char>('A' + (i % 26)));
        for (std::size_t k = 0; k < i + 1; ++k) {
            file << line;
        }
    }
}

void print_usage(const char* program) {
    std::cout << "Local Archive Sync Example" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <source-dir> <archive-dir>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -j, --jobs <n>          Concurrent item transfers (default: 4)" << std::endl;
    std::cout << "  -b, --batch-size <n>    Items per batch (default: 100)" << std::endl;
    std::cout << "  --skip-existing         Skip files already archived with the same size"
              << std::endl;
    std::cout << "  --create-test <count>   Create test files in <source-dir> first"
              << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::size_t jobs = 4;
    std::size_t batch_size = 100;
    bool skip_existing = false;
    std::size_t create_test_count = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            jobs = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "-b" || arg == "--batch-size") {
            if (++i >= argc) {
                std::cerr << "Error: --batch-size requires an argument" << std::endl;
                return 1;
            }
            batch_size = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "--skip-existing") {
            skip_existing = true;
        } else if (arg == "--create-test") {
            if (++i >= argc) {
                std::cerr << "Error: --create-test requires an argument" << std::endl;
                return 1;
            }
            create_test_count = static_cast<std::size_t>(std::stoul(argv[i]));
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::filesystem::path source_dir = positional[0];
    std::filesystem::path archive_dir = positional[1];

    if (create_test_count > 0) {
        create_test_files(source_dir, create_test_count);
    }
    if (!std::filesystem::is_directory(source_dir)) {
        std::cerr << "Error: not a directory: " << source_dir << std::endl;
        return 1;
    }
    std::filesystem::create_directories(archive_dir);

    std::vector<transfer_item> items;
    for (const auto& entry : std::filesystem::directory_iterator(source_dir)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        items.push_back(transfer_item{entry.path().string(), archive_dir.string() + "/",
                                      entry.file_size(), std::nullopt});
    }

    auto config = sync_config_builder()
                      .with_max_batch_size(batch_size)
                      .with_max_concurrency(jobs)
                      .with_organize_by_prefix(false)
                      .with_skip_existing(skip_existing)
                      .build_validated();
    if (!config) {
        std::cerr << "Configuration error: " << config.error().message << std::endl;
        return 1;
    }

    std::cout << "archive_sync " << version::to_string() << std::endl;
    std::cout << "Archiving " << items.size() << " files from " << source_dir << " to "
              << archive_dir << std::endl
              << std::endl;

    sync_coordinator coordinator;
    auto report = coordinator.sync(items, config.value());
    if (!report) {
        std::cerr << "Sync failed: " << report.error().message << std::endl;
        return 1;
    }

    for (const auto& r : report.value().results) {
        std::cout << "  [" << to_string(r.status) << "] " << r.item.source_uri;
        if (r.succeeded()) {
            std::cout << " -> " << r.resolved_destination << " ("
                      << format_bytes(r.bytes_transferred) << ")";
        } else if (r.error_detail) {
            std::cout << ": " << *r.error_detail;
        }
        std::cout << std::endl;
    }

    const auto& stats = report.value().stats;
    std::cout << std::endl;
    std::cout << "Summary:" << std::endl;
    std::cout << "  Archived:  " << stats.successful_items() << "/" << stats.total_items
              << std::endl;
    std::cout << "  Failed:    " << stats.failed_items << std::endl;
    std::cout << "  Skipped:   " << stats.skipped_items << std::endl;
    std::cout << "  Bytes:     " << format_bytes(stats.total_bytes) << std::endl;

    return stats.failed_items == 0 ? 0 : 2;
}
