// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file types.h
 * @brief Core type definitions for ims_session_system
 */

#ifndef KCENON_IMS_SESSION_CORE_TYPES_H
#define KCENON_IMS_SESSION_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::ims_session {

/**
 * @brief Error codes for session operations
 *
 * Error code ranges:
 * - -800 to -819: Session lifecycle errors
 * - -820 to -839: Transfer errors
 * - -840 to -849: HTTP adapter errors
 * - -850 to -859: Delivery report errors
 * - -860 to -869: Persistence errors
 * - -870 to -879: Configuration errors
 */
enum class error_code : int32_t {
    success = 0,

    // Session lifecycle errors (-800 to -819)
    invalid_state_transition = -800,
    worker_already_running = -801,
    session_not_found = -802,
    session_already_exists = -803,
    not_initialized = -804,
    invalid_argument = -805,
    location_already_set = -806,

    // Transfer errors (-820 to -839)
    transfer_cancelled = -820,
    transfer_paused = -821,
    transfer_incomplete = -822,
    transport_failure = -823,
    resource_changed = -824,
    file_hash_mismatch = -825,
    file_write_error = -826,
    unexpected_fault = -827,

    // HTTP adapter errors (-840 to -849)
    http_not_available = -840,
    request_aborted = -841,

    // Delivery report errors (-850 to -859)
    duplicate_delivery_report = -850,
    delivery_send_failed = -851,

    // Persistence errors (-860 to -869)
    log_write_failed = -860,

    // Configuration errors (-870 to -879)
    invalid_configuration = -870,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::worker_already_running:
            return "worker already running for session";
        case error_code::session_not_found:
            return "session not found";
        case error_code::session_already_exists:
            return "session already exists";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::location_already_set:
            return "content location already set";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::transfer_paused:
            return "transfer paused";
        case error_code::transfer_incomplete:
            return "transfer incomplete";
        case error_code::transport_failure:
            return "transport failure";
        case error_code::resource_changed:
            return "remote resource changed";
        case error_code::file_hash_mismatch:
            return "SHA-256 verification failed";
        case error_code::file_write_error:
            return "file write error";
        case error_code::unexpected_fault:
            return "unexpected fault";
        case error_code::http_not_available:
            return "HTTP client not available";
        case error_code::request_aborted:
            return "request aborted";
        case error_code::duplicate_delivery_report:
            return "delivery report already dispatched";
        case error_code::delivery_send_failed:
            return "delivery report send failed";
        case error_code::log_write_failed:
            return "messaging log write failed";
        case error_code::invalid_configuration:
            return "invalid configuration";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Transfer progress snapshot
 */
struct transfer_progress {
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;

    [[nodiscard]] auto completion_percentage() const noexcept -> double {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(bytes_transferred) /
               static_cast<double>(total_bytes) * 100.0;
    }
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_CORE_TYPES_H
