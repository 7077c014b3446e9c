/**
 * @file checksum.cpp
 * @brief Implementation of content checksum utilities
 */

#include <kcenon/archive_sync/core/checksum.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

#include <openssl/evp.h>

namespace kcenon::archive_sync {

namespace {

constexpr std::size_t read_block_size = 64 * 1024;

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

auto evp_for(checksum_algorithm algorithm) -> const EVP_MD* {
    switch (algorithm) {
        case checksum_algorithm::md5: return EVP_md5();
        case checksum_algorithm::sha256:
        default: return EVP_sha256();
    }
}

auto to_hex(const unsigned char* data, unsigned int length) -> std::string {
    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(data[i]);
    }
    return oss.str();
}

auto is_hex(std::string_view text) -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

auto lowercase(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

}  // namespace

auto checksum::parse(std::string_view text) -> result<checksum_notation> {
    checksum_notation notation;
    std::string_view hex = text;

    auto colon = text.find(':');
    if (colon != std::string_view::npos) {
        auto name = lowercase(text.substr(0, colon));
        hex = text.substr(colon + 1);
        if (name == "sha256") {
            notation.algorithm = checksum_algorithm::sha256;
        } else if (name == "md5") {
            notation.algorithm = checksum_algorithm::md5;
        } else {
            return make_error(sync_error_code::checksum_mismatch,
                              "unsupported checksum algorithm: " + name);
        }
    } else if (hex.size() == 32) {
        notation.algorithm = checksum_algorithm::md5;
    } else {
        notation.algorithm = checksum_algorithm::sha256;
    }

    const std::size_t expected_len = notation.algorithm == checksum_algorithm::md5 ? 32 : 64;
    if (hex.size() != expected_len || !is_hex(hex)) {
        return make_error(sync_error_code::checksum_mismatch,
                          "malformed checksum: " + std::string(text));
    }

    notation.hex_digest = lowercase(hex);
    return notation;
}

auto checksum::digest_file(const std::filesystem::path& path,
                           checksum_algorithm algorithm) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error(sync_error_code::read_failed,
                          "cannot open for digest: " + path.string());
    }

    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), evp_for(algorithm), nullptr) != 1) {
        return make_error(sync_error_code::internal_error, "EVP digest init failed");
    }

    std::vector<char> buffer(read_block_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = file.gcount();
        if (got > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
            return make_error(sync_error_code::internal_error, "EVP digest update failed");
        }
    }
    if (file.bad()) {
        return make_error(sync_error_code::read_failed,
                          "read error while hashing: " + path.string());
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md.data(), &md_len) != 1) {
        return make_error(sync_error_code::internal_error, "EVP digest final failed");
    }

    return to_hex(md.data(), md_len);
}

auto checksum::digest(std::string_view data, checksum_algorithm algorithm) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    EVP_Digest(data.data(), data.size(), md.data(), &md_len, evp_for(algorithm), nullptr);
    return to_hex(md.data(), md_len);
}

auto checksum::verify_file(const std::filesystem::path& path,
                           std::string_view expected) -> result<void> {
    auto notation = checksum::parse(expected);
    if (!notation) {
        return unexpected(notation.error());
    }

    auto actual = checksum::digest_file(path, notation.value().algorithm);
    if (!actual) {
        return unexpected(actual.error());
    }

    if (actual.value() != notation.value().hex_digest) {
        return make_error(sync_error_code::checksum_mismatch,
                          std::string(to_string(notation.value().algorithm)) +
                              " mismatch: expected " + notation.value().hex_digest +
                              ", got " + actual.value());
    }
    return {};
}

}  // namespace kcenon::archive_sync
