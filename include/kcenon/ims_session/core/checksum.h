// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file checksum.h
 * @brief SHA-256 utilities for downloaded content verification
 */

#ifndef KCENON_IMS_SESSION_CORE_CHECKSUM_H
#define KCENON_IMS_SESSION_CORE_CHECKSUM_H

#include <kcenon/ims_session/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief SHA-256 calculations backed by OpenSSL EVP
 *
 * Digests are lower-case hex strings. Comparison with an expected digest is
 * case-insensitive.
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 hash as hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Verify SHA-256 hash of a file
     * @param path Path to the file
     * @param expected Expected hash as hex string
     * @return true if hash matches, false otherwise
     */
    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, const std::string& expected) -> bool;

    /**
     * @brief Calculate SHA-256 hash of data
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_CORE_CHECKSUM_H
