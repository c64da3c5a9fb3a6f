// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file ims_session.h
 * @brief Main header for ims_session_system library
 * @version 0.1.0
 *
 * This is the primary include file for the ims_session_system library.
 * Include this header to access the file sharing session core.
 *
 * @code
 * #include <kcenon/ims_session/ims_session.h>
 *
 * using namespace kcenon::ims_session;
 *
 * auto service = file_sharing_service::builder()
 *     .with_settings_provider(settings)
 *     .build();
 *
 * auto session = service.value().receive_invitation(invitation);
 * @endcode
 */

#ifndef KCENON_IMS_SESSION_IMS_SESSION_H
#define KCENON_IMS_SESSION_IMS_SESSION_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/ims_session/core/types.h"
#include "kcenon/ims_session/core/error_codes.h"
#include "kcenon/ims_session/core/session_config.h"
#include "kcenon/ims_session/core/settings_provider.h"

// Content
#include "kcenon/ims_session/content/content_descriptor.h"
#include "kcenon/ims_session/content/content_location.h"

// Download
#include "kcenon/ims_session/download/download_engine.h"
#include "kcenon/ims_session/download/http_adapter.h"

// Delivery
#include "kcenon/ims_session/delivery/delivery_report_dispatcher.h"

// Session
#include "kcenon/ims_session/session/file_sharing_session.h"
#include "kcenon/ims_session/session/session_registry.h"

// Service
#include "kcenon/ims_session/service/file_sharing_service.h"

// Adapters
#include "kcenon/ims_session/adapters/worker_pool.h"

namespace kcenon::ims_session {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_IMS_SESSION_H
