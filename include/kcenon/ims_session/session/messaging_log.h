// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file messaging_log.h
 * @brief Persistent record of file transfers
 */

#ifndef KCENON_IMS_SESSION_SESSION_MESSAGING_LOG_H
#define KCENON_IMS_SESSION_SESSION_MESSAGING_LOG_H

#include <kcenon/ims_session/content/content_location.h>
#include <kcenon/ims_session/core/types.h>
#include <kcenon/ims_session/session/session_types.h>

#include <string>

namespace kcenon::ims_session {

/**
 * @brief Write-only sink for transfer state
 *
 * Write failures are logged by the caller and never abort a session.
 */
class messaging_log {
public:
    virtual ~messaging_log() = default;

    [[nodiscard]] virtual auto set_file_transfer_state(const std::string& file_transfer_id,
                                                       session_state state) -> result<void> = 0;

    [[nodiscard]] virtual auto set_file_transfer_progress(const std::string& file_transfer_id,
                                                          const transfer_progress& progress)
        -> result<void> = 0;

    [[nodiscard]] virtual auto set_file_transfer_location(const std::string& file_transfer_id,
                                                          const content_location& location)
        -> result<void> = 0;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_SESSION_MESSAGING_LOG_H
