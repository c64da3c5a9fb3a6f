// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file session_types.h
 * @brief Session state, reasons and identity
 */

#ifndef KCENON_IMS_SESSION_SESSION_SESSION_TYPES_H
#define KCENON_IMS_SESSION_SESSION_SESSION_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::ims_session {

/**
 * @brief File sharing session lifecycle state
 */
enum class session_state {
    invited,      ///< Invitation received, waiting for the user
    accepted,     ///< Accepted, download not started
    rejected,     ///< Rejected by user, timeout or system (terminal)
    downloading,  ///< Worker is transferring the file
    paused,       ///< Suspended by user, offset preserved
    completed,    ///< File stored (terminal)
    error,        ///< Download failed (terminal)
    cancelled     ///< Aborted by user or system (terminal)
};

[[nodiscard]] constexpr auto to_string(session_state state) -> const char* {
    switch (state) {
        case session_state::invited: return "invited";
        case session_state::accepted: return "accepted";
        case session_state::rejected: return "rejected";
        case session_state::downloading: return "downloading";
        case session_state::paused: return "paused";
        case session_state::completed: return "completed";
        case session_state::error: return "error";
        case session_state::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(session_state state) -> bool {
    return state == session_state::rejected || state == session_state::completed ||
           state == session_state::error || state == session_state::cancelled;
}

/**
 * @brief Check whether a lifecycle transition is permitted
 */
[[nodiscard]] constexpr auto is_valid_transition(session_state from, session_state to) -> bool {
    switch (from) {
        case session_state::invited:
            return to == session_state::accepted || to == session_state::rejected;
        case session_state::accepted:
            return to == session_state::downloading;
        case session_state::downloading:
            return to == session_state::paused || to == session_state::completed ||
                   to == session_state::error || to == session_state::cancelled;
        case session_state::paused:
            return to == session_state::downloading || to == session_state::cancelled;
        default:
            return false;
    }
}

/**
 * @brief User answer to an invitation
 */
enum class invitation_status {
    pending,
    accepted,
    rejected,
    timeout
};

[[nodiscard]] constexpr auto to_string(invitation_status status) -> const char* {
    switch (status) {
        case invitation_status::pending: return "pending";
        case invitation_status::accepted: return "accepted";
        case invitation_status::rejected: return "rejected";
        case invitation_status::timeout: return "timeout";
        default: return "unknown";
    }
}

enum class rejection_reason {
    by_user,
    timeout,
    by_system,
    low_space,
    max_size
};

[[nodiscard]] constexpr auto to_string(rejection_reason reason) -> const char* {
    switch (reason) {
        case rejection_reason::by_user: return "by_user";
        case rejection_reason::timeout: return "timeout";
        case rejection_reason::by_system: return "by_system";
        case rejection_reason::low_space: return "low_space";
        case rejection_reason::max_size: return "max_size";
        default: return "unknown";
    }
}

enum class termination_reason {
    by_user,
    by_system,
    by_remote
};

[[nodiscard]] constexpr auto to_string(termination_reason reason) -> const char* {
    switch (reason) {
        case termination_reason::by_user: return "by_user";
        case termination_reason::by_system: return "by_system";
        case termination_reason::by_remote: return "by_remote";
        default: return "unknown";
    }
}

enum class session_direction {
    terminating,  ///< Invited by the remote party
    originating   ///< Initiated locally
};

/**
 * @brief Identity of a file sharing session
 */
struct session_identity {
    std::string session_id;
    std::string file_transfer_id;        ///< Message id used in delivery reports
    std::string remote_contact;
    std::string remote_instance_id;
    std::optional<std::string> contribution_id;
    std::optional<std::string> chat_session_id;
    bool is_group = false;
    session_direction direction = session_direction::terminating;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
    std::chrono::system_clock::time_point invited_at{};
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_SESSION_SESSION_TYPES_H
