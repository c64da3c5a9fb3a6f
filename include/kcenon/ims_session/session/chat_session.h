// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file chat_session.h
 * @brief Chat session counterpart consulted for in-session delivery reports
 */

#ifndef KCENON_IMS_SESSION_SESSION_CHAT_SESSION_H
#define KCENON_IMS_SESSION_SESSION_CHAT_SESSION_H

#include <kcenon/ims_session/core/types.h>
#include <kcenon/ims_session/delivery/delivery_types.h>

#include <chrono>
#include <optional>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief A live chat session owned by the messaging layer
 *
 * Registered in the session_registry while its dialog exists.
 */
class chat_session {
public:
    virtual ~chat_session() = default;

    [[nodiscard]] virtual auto session_id() const -> std::string = 0;

    /// Set for group chats
    [[nodiscard]] virtual auto contribution_id() const -> std::optional<std::string> = 0;

    /// Set for one-to-one chats
    [[nodiscard]] virtual auto remote_contact() const -> std::optional<std::string> = 0;

    [[nodiscard]] virtual auto is_group_chat() const -> bool = 0;

    /**
     * @brief Whether the MSRP media path is up
     */
    [[nodiscard]] virtual auto is_media_established() const -> bool = 0;

    /**
     * @brief Send a delivery report over MSRP
     */
    [[nodiscard]] virtual auto send_msrp_delivery_status(
        const std::string& contact,
        const std::string& message_id,
        delivery_status status,
        std::chrono::system_clock::time_point timestamp) -> result<void> = 0;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_SESSION_CHAT_SESSION_H
