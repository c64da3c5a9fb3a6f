// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file content_descriptor.cpp
 * @brief Implementation of content_descriptor
 */

#include <kcenon/ims_session/content/content_descriptor.h>

namespace kcenon::ims_session {

content_descriptor::content_descriptor(content_info info) : info_(std::move(info)) {}

auto content_descriptor::is_expired(std::chrono::system_clock::time_point now) const -> bool {
    if (info_.expiration == std::chrono::system_clock::time_point{}) {
        return false;
    }
    return now >= info_.expiration;
}

auto content_descriptor::set_location(content_location location) -> result<void> {
    if (location.empty()) {
        return unexpected(error{error_code::invalid_argument, "empty content location"});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (location_) {
        return unexpected(error{error_code::location_already_set,
                                "location already set to " + location_->uri()});
    }
    location_ = std::move(location);
    return {};
}

auto content_descriptor::location() const -> std::optional<content_location> {
    std::lock_guard<std::mutex> lock(mutex_);
    return location_;
}

auto content_descriptor::has_location() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return location_.has_value();
}

}  // namespace kcenon::ims_session
