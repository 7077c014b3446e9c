/**
 * @file checksum.h
 * @brief Content checksum utilities for fallback buffer verification
 */

#ifndef KCENON_ARCHIVE_SYNC_CORE_CHECKSUM_H
#define KCENON_ARCHIVE_SYNC_CORE_CHECKSUM_H

#include <kcenon/archive_sync/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace kcenon::archive_sync {

/**
 * @brief Supported content digest algorithms
 */
enum class checksum_algorithm {
    sha256,
    md5,
};

/**
 * @brief Parsed form of a transfer_item content checksum
 */
struct checksum_notation {
    checksum_algorithm algorithm = checksum_algorithm::sha256;
    std::string hex_digest;  ///< Lowercase hex
};

/**
 * @brief Checksum utilities backed by OpenSSL EVP digests
 *
 * Accepted checksum notations:
 * - "sha256:<64 hex>" / "md5:<32 hex>"
 * - bare hex, where the length selects the algorithm (64 = sha256, 32 = md5)
 */
class checksum {
public:
    /**
     * @brief Parse a checksum notation
     * @param text Checksum text
     * @return Parsed notation, or checksum_mismatch error on malformed input
     */
    [[nodiscard]] static auto parse(std::string_view text) -> result<checksum_notation>;

    /**
     * @brief Digest a file
     * @param path File to hash
     * @param algorithm Digest algorithm
     * @return Lowercase hex digest, or read_failed error
     */
    [[nodiscard]] static auto digest_file(const std::filesystem::path& path,
                                          checksum_algorithm algorithm)
        -> result<std::string>;

    /**
     * @brief Digest an in-memory buffer
     */
    [[nodiscard]] static auto digest(std::string_view data, checksum_algorithm algorithm)
        -> std::string;

    /**
     * @brief Verify a file against a checksum notation
     * @return Empty result on match; checksum_mismatch or read error otherwise
     */
    [[nodiscard]] static auto verify_file(const std::filesystem::path& path,
                                          std::string_view expected) -> result<void>;
};

[[nodiscard]] constexpr auto to_string(checksum_algorithm algorithm) noexcept
    -> std::string_view {
    switch (algorithm) {
        case checksum_algorithm::sha256: return "sha256";
        case checksum_algorithm::md5: return "md5";
        default: return "unknown";
    }
}

}  // namespace kcenon::archive_sync

#endif  // KCENON_ARCHIVE_SYNC_CORE_CHECKSUM_H
