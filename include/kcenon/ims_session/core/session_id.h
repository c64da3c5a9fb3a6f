// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file session_id.h
 * @brief Session identifier generation
 */

#ifndef KCENON_IMS_SESSION_CORE_SESSION_ID_H
#define KCENON_IMS_SESSION_CORE_SESSION_ID_H

#include <string>

namespace kcenon::ims_session {

/**
 * @brief Generate a random (version 4) UUID string
 *
 * Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
 */
[[nodiscard]] auto generate_session_id() -> std::string;

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_CORE_SESSION_ID_H
