// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file session_listener.h
 * @brief Observer of file sharing session events
 */

#ifndef KCENON_IMS_SESSION_SESSION_SESSION_LISTENER_H
#define KCENON_IMS_SESSION_SESSION_SESSION_LISTENER_H

#include <kcenon/ims_session/content/content_location.h>
#include <kcenon/ims_session/core/error_codes.h>
#include <kcenon/ims_session/core/types.h>
#include <kcenon/ims_session/session/session_types.h>

#include <string>

namespace kcenon::ims_session {

/**
 * @brief Receives session events
 *
 * Callbacks run outside the session's transition guard, on the thread that
 * caused the event (caller thread or session worker). A listener may call
 * back into the session. The default implementations do nothing.
 */
class session_listener {
public:
    virtual ~session_listener() = default;

    virtual void on_session_accepted(const std::string& /*session_id*/) {}

    virtual void on_session_rejected(const std::string& /*session_id*/,
                                     rejection_reason /*reason*/) {}

    virtual void on_transfer_started(const std::string& /*session_id*/) {}

    virtual void on_transfer_progress(const std::string& /*session_id*/,
                                      const transfer_progress& /*progress*/) {}

    virtual void on_transfer_paused(const std::string& /*session_id*/) {}

    virtual void on_transfer_resumed(const std::string& /*session_id*/) {}

    virtual void on_transfer_completed(const std::string& /*session_id*/,
                                       const content_location& /*location*/) {}

    virtual void on_transfer_error(const std::string& /*session_id*/,
                                   const session_failure& /*failure*/) {}

    virtual void on_session_aborted(const std::string& /*session_id*/,
                                    termination_reason /*reason*/) {}
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_SESSION_SESSION_LISTENER_H
