/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <random>

namespace kcenon::archive_sync::benchmark {

// item_generator implementation

auto item_generator::same_family(std::size_t count, std::size_t prefix_depth)
    -> std::vector<transfer_item> {
    std::vector<transfer_item> items;
    items.reserve(count);

    std::string prefix;
    for (std::size_t d = 0; d < prefix_depth; ++d) {
        prefix += "p" + std::to_string(d) + "/";
    }

    for (std::size_t i = 0; i < count; ++i) {
        items.push_back(transfer_item{
            "s3://bench-source/" + prefix + "object-" + std::to_string(i) + ".zip",
            "s3://bench-archive/", std::nullopt, std::nullopt});
    }
    return items;
}

auto item_generator::mixed(std::size_t count, std::size_t cross_every)
    -> std::vector<transfer_item> {
    auto items = same_family(count);
    if (cross_every == 0) {
        return items;
    }
    for (std::size_t i = 0; i < items.size(); i += cross_every) {
        items[i].destination_uri = "/var/archive/bench/";
    }
    return items;
}

auto generate_random_data(std::size_t size, uint32_t seed) -> std::string {
    std::string data(size, '\0');

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<char>(dis(gen));
    }

    return data;
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() /
                    ("archive_sync_benchmarks_" + std::to_string(std::random_device{}()));
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_random_file(const std::string& name, std::size_t size,
                                           uint32_t seed) -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    auto data = generate_random_data(size, seed);
    std::ofstream file(path, std::ios::binary);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

auto temp_file_manager::subdirectory(const std::string& name) -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return path;
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    if (owns_dir_) {
        std::error_code ec;
        std::filesystem::remove_all(base_dir_, ec);
        owns_dir_ = false;
    }
}

}  // namespace kcenon::archive_sync::benchmark
