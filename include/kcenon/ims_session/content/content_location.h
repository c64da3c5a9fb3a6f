// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file content_location.h
 * @brief Local storage location of received content
 */

#ifndef KCENON_IMS_SESSION_CONTENT_CONTENT_LOCATION_H
#define KCENON_IMS_SESSION_CONTENT_CONTENT_LOCATION_H

#include <kcenon/ims_session/core/types.h>

#include <filesystem>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief A file:// URI naming where content was stored
 */
class content_location {
public:
    content_location() = default;

    /**
     * @brief Build a location from a local path
     *
     * Relative paths are made absolute. Characters outside the URI
     * unreserved set are percent-encoded.
     */
    [[nodiscard]] static auto from_path(const std::filesystem::path& path) -> content_location;

    /**
     * @brief Parse a file:// URI
     * @return Location, or invalid_argument for other schemes
     */
    [[nodiscard]] static auto from_uri(const std::string& uri) -> result<content_location>;

    [[nodiscard]] auto uri() const -> const std::string& { return uri_; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return uri_.empty(); }

    auto operator==(const content_location&) const -> bool = default;

private:
    content_location(std::string uri, std::filesystem::path path)
        : uri_(std::move(uri)), path_(std::move(path)) {}

    std::string uri_;
    std::filesystem::path path_;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_CONTENT_CONTENT_LOCATION_H
