// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file session_config.h
 * @brief Configuration for downloads, sessions and the service
 */

#ifndef KCENON_IMS_SESSION_CORE_SESSION_CONFIG_H
#define KCENON_IMS_SESSION_CORE_SESSION_CONFIG_H

#include <kcenon/ims_session/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief Configuration for the download engine
 */
struct download_config {
    /// Default slice size (64KB)
    static constexpr std::size_t default_chunk_size = 64 * 1024;

    /// Maximum allowed slice size (4MB)
    static constexpr std::size_t max_chunk_size = 4 * 1024 * 1024;

    /// Upper bound for automatic retries
    static constexpr std::size_t max_allowed_retries = 10;

    /// Bytes written between two suspension checks
    std::size_t chunk_size = default_chunk_size;

    /// Retries of a transient transport failure
    std::size_t max_retries = 3;

    /// Delay before each retry
    std::chrono::milliseconds retry_delay{1000};

    /// Timeout of one HTTP request
    std::chrono::milliseconds request_timeout{30000};

    /// Verify the SHA-256 digest when the content carries one
    bool verify_checksum = true;

    std::string user_agent = "ims-session/1.0";

    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "chunk size must be positive"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        if (max_retries > max_allowed_retries) {
            return unexpected(error{
                error_code::invalid_configuration,
                "too many retries (maximum: " + std::to_string(max_allowed_retries) + ")"});
        }
        if (retry_delay.count() < 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "retry delay must not be negative"});
        }
        if (request_timeout.count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "request timeout must be positive"});
        }
        return {};
    }
};

/**
 * @brief Configuration applied to every file sharing session
 */
struct session_config {
    /// How long an invitation may stay unanswered
    std::chrono::milliseconds ringing_timeout{std::chrono::seconds(30)};

    download_config download;

    /// Overrides the settings provider when not empty
    std::filesystem::path download_directory;

    [[nodiscard]] auto validate() const -> result<void> {
        if (ringing_timeout.count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "ringing timeout must be positive"});
        }
        return download.validate();
    }
};

/**
 * @brief Configuration for file_sharing_service
 */
struct service_config {
    session_config session;

    /// Worker threads of the thread_system pool (0 = hardware concurrency)
    std::size_t worker_threads = 0;

    [[nodiscard]] auto validate() const -> result<void> {
        return session.validate();
    }
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_CORE_SESSION_CONFIG_H
