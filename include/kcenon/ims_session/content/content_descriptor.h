// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file content_descriptor.h
 * @brief Description of a transferred file and its final location
 */

#ifndef KCENON_IMS_SESSION_CONTENT_CONTENT_DESCRIPTOR_H
#define KCENON_IMS_SESSION_CONTENT_CONTENT_DESCRIPTOR_H

#include <kcenon/ims_session/content/content_location.h>
#include <kcenon/ims_session/core/types.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief Immutable attributes of a transferred object
 */
struct content_info {
    std::string name;
    uint64_t size = 0;  ///< 0 when the size was not announced
    std::string mime_type = "application/octet-stream";
    std::chrono::system_clock::time_point expiration{};  ///< epoch = never expires
    std::optional<std::string> sha256;
};

/**
 * @brief Content descriptor owned by a session
 *
 * Attributes are fixed at construction. The storage location is unset until
 * the transfer completes and may be assigned only once.
 */
class content_descriptor {
public:
    explicit content_descriptor(content_info info);

    content_descriptor(const content_descriptor&) = delete;
    auto operator=(const content_descriptor&) -> content_descriptor& = delete;

    [[nodiscard]] auto info() const -> const content_info& { return info_; }
    [[nodiscard]] auto name() const -> const std::string& { return info_.name; }
    [[nodiscard]] auto size() const -> uint64_t { return info_.size; }
    [[nodiscard]] auto mime_type() const -> const std::string& { return info_.mime_type; }
    [[nodiscard]] auto expiration() const -> std::chrono::system_clock::time_point {
        return info_.expiration;
    }
    [[nodiscard]] auto sha256() const -> const std::optional<std::string>& {
        return info_.sha256;
    }

    /**
     * @brief Check whether the content expired at the given instant
     */
    [[nodiscard]] auto is_expired(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const
        -> bool;

    /**
     * @brief Assign the storage location
     * @return location_already_set on the second call, invalid_argument if empty
     */
    [[nodiscard]] auto set_location(content_location location) -> result<void>;

    [[nodiscard]] auto location() const -> std::optional<content_location>;

    [[nodiscard]] auto has_location() const -> bool;

private:
    const content_info info_;
    mutable std::mutex mutex_;
    std::optional<content_location> location_;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_CONTENT_CONTENT_DESCRIPTOR_H
