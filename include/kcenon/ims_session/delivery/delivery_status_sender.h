// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file delivery_status_sender.h
 * @brief Out-of-band delivery report sender
 */

#ifndef KCENON_IMS_SESSION_DELIVERY_DELIVERY_STATUS_SENDER_H
#define KCENON_IMS_SESSION_DELIVERY_DELIVERY_STATUS_SENDER_H

#include <kcenon/ims_session/core/types.h>
#include <kcenon/ims_session/delivery/delivery_types.h>

#include <chrono>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief Sends IMDN reports as standalone SIP MESSAGE requests
 *
 * Implemented by the signalling layer.
 */
class delivery_status_sender {
public:
    virtual ~delivery_status_sender() = default;

    [[nodiscard]] virtual auto send_delivery_status_immediately(
        const std::string& contact,
        const std::string& message_id,
        delivery_status status,
        const std::string& remote_instance_id,
        std::chrono::system_clock::time_point timestamp) -> result<void> = 0;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_DELIVERY_DELIVERY_STATUS_SENDER_H
