// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file delivery_types.h
 * @brief Delivery report (IMDN) value types
 */

#ifndef KCENON_IMS_SESSION_DELIVERY_DELIVERY_TYPES_H
#define KCENON_IMS_SESSION_DELIVERY_DELIVERY_TYPES_H

#include <chrono>
#include <optional>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief IMDN disposition reported to the sender
 */
enum class delivery_status {
    delivered,
    displayed,
    failed
};

[[nodiscard]] constexpr auto to_string(delivery_status status) -> const char* {
    switch (status) {
        case delivery_status::delivered: return "delivered";
        case delivery_status::displayed: return "displayed";
        case delivery_status::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Transport that carried a delivery report
 */
enum class delivery_transport {
    in_session,   ///< MSRP of an established chat session
    out_of_band   ///< Standalone SIP MESSAGE
};

[[nodiscard]] constexpr auto to_string(delivery_transport transport) -> const char* {
    switch (transport) {
        case delivery_transport::in_session: return "in_session";
        case delivery_transport::out_of_band: return "out_of_band";
        default: return "unknown";
    }
}

/**
 * @brief Input to the delivery report dispatcher
 */
struct delivery_request {
    std::string contact;
    std::string message_id;
    delivery_status status = delivery_status::displayed;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::optional<std::string> contribution_id;
    bool is_group = false;
    std::string remote_instance_id;
};

/**
 * @brief A dispatched delivery report
 */
struct delivery_report {
    std::string message_id;
    delivery_status status = delivery_status::displayed;
    std::chrono::system_clock::time_point timestamp{};
    delivery_transport transport = delivery_transport::out_of_band;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_DELIVERY_DELIVERY_TYPES_H
