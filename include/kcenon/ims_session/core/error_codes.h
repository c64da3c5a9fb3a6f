// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file error_codes.h
 * @brief Failure classification for file sharing sessions
 *
 * Maps raw error codes onto the failure taxonomy reported to session
 * subscribers. User-requested suspensions are classified but never reported.
 */

#ifndef KCENON_IMS_SESSION_CORE_ERROR_CODES_H
#define KCENON_IMS_SESSION_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

#include "types.h"

namespace kcenon::ims_session {

/**
 * @brief Failure taxonomy
 */
enum class failure_kind {
    none,
    user_cancelled,            ///< Not an error, suppresses reporting
    user_paused,               ///< Not an error, suppresses reporting
    transfer_incomplete,       ///< Resource absent or integrity check failed
    transport_failure,         ///< Network-level I/O failure
    unexpected_fault,          ///< Anything not anticipated above
    invalid_state_transition,  ///< Lifecycle call from a forbidding state
};

[[nodiscard]] constexpr auto to_string(failure_kind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case failure_kind::none:
            return "none";
        case failure_kind::user_cancelled:
            return "user_cancelled";
        case failure_kind::user_paused:
            return "user_paused";
        case failure_kind::transfer_incomplete:
            return "transfer_incomplete";
        case failure_kind::transport_failure:
            return "transport_failure";
        case failure_kind::unexpected_fault:
            return "unexpected_fault";
        case failure_kind::invalid_state_transition:
            return "invalid_state_transition";
        default:
            return "unknown";
    }
}

/**
 * @brief Classify an error code into the failure taxonomy
 */
[[nodiscard]] constexpr auto classify(error_code code) noexcept -> failure_kind {
    switch (code) {
        case error_code::success:
            return failure_kind::none;
        case error_code::transfer_cancelled:
            return failure_kind::user_cancelled;
        case error_code::transfer_paused:
            return failure_kind::user_paused;
        case error_code::transfer_incomplete:
        case error_code::resource_changed:
        case error_code::file_hash_mismatch:
            return failure_kind::transfer_incomplete;
        case error_code::transport_failure:
        case error_code::file_write_error:
        case error_code::http_not_available:
        case error_code::request_aborted:
            return failure_kind::transport_failure;
        case error_code::invalid_state_transition:
        case error_code::worker_already_running:
            return failure_kind::invalid_state_transition;
        default:
            return failure_kind::unexpected_fault;
    }
}

/**
 * @brief Check if a failure kind is a user suspension (never reported)
 */
[[nodiscard]] constexpr auto is_user_suspension(failure_kind kind) noexcept -> bool {
    return kind == failure_kind::user_cancelled || kind == failure_kind::user_paused;
}

/**
 * @brief Check if an error may succeed when the request is re-issued
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return code == error_code::transport_failure;
}

/**
 * @brief Reason carried by a reported file sharing failure
 */
enum class failure_reason {
    media_download_failed,
};

[[nodiscard]] constexpr auto to_string(failure_reason reason) noexcept
    -> std::string_view {
    switch (reason) {
        case failure_reason::media_download_failed:
            return "media_download_failed";
        default:
            return "unknown";
    }
}

/**
 * @brief Classified failure delivered to session subscribers
 */
struct session_failure {
    failure_kind kind = failure_kind::none;
    failure_reason reason = failure_reason::media_download_failed;
    error cause;

    session_failure() = default;

    explicit session_failure(error e)
        : kind(classify(e.code)), cause(std::move(e)) {}

    session_failure(failure_kind k, error e)
        : kind(k), cause(std::move(e)) {}
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_CORE_ERROR_CODES_H
