// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/ims_session/config/feature_flags.h"

#if IMS_SESSION_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::ims_session {

/**
 * @brief Log categories for the session system
 */
struct log_category {
    static constexpr std::string_view session = "ims_session.session";
    static constexpr std::string_view download = "ims_session.download";
    static constexpr std::string_view http = "ims_session.http";
    static constexpr std::string_view delivery = "ims_session.delivery";
    static constexpr std::string_view registry = "ims_session.registry";
    static constexpr std::string_view service = "ims_session.service";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 *
 * Contacts are MSISDNs or SIP URIs and count as personal data.
 */
struct masking_config {
    bool mask_contacts = false;
    bool mask_paths = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks contact identifiers and local paths in log output
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_contacts && !config_.mask_paths) {
            return input;
        }

        std::string result = input;

        if (config_.mask_contacts) {
            result = mask_phone_numbers(result);
        }

        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }

        return result;
    }

    /**
     * @brief Mask a contact, keeping only the trailing visible characters
     *
     * "tel:+33612345678" becomes "tel:********5678"; the URI scheme is kept.
     */
    [[nodiscard]] auto mask_contact(const std::string& contact) const -> std::string {
        if (!config_.mask_contacts || contact.empty()) {
            return contact;
        }

        std::string scheme;
        std::string body = contact;
        auto colon = contact.find(':');
        if (colon != std::string::npos) {
            scheme = contact.substr(0, colon + 1);
            body = contact.substr(colon + 1);
        }

        if (body.size() <= config_.visible_chars) {
            return scheme + std::string(body.size(), config_.mask_char[0]);
        }

        auto hidden = body.size() - config_.visible_chars;
        return scheme + std::string(hidden, config_.mask_char[0]) + body.substr(hidden);
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        return masked_dir + "/" + path.substr(last_sep + 1);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_phone_numbers(const std::string& input) const -> std::string {
        static const std::regex phone_pattern(R"(\+?\d{6,15})");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), phone_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            auto number = it->str();
            auto hidden = number.size() > config_.visible_chars
                              ? number.size() - config_.visible_chars
                              : number.size();
            result += std::string(hidden, config_.mask_char[0]) + number.substr(hidden);
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(R"((?:\/[a-zA-Z0-9._-]+)+)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_path(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

namespace detail {

[[nodiscard]] inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for session operations
 */
struct session_log_context {
    std::string session_id;
    std::string file_transfer_id;
    std::optional<std::string> contact;
    std::optional<std::string> remote_instance_id;
    std::optional<std::string> state;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> total_bytes;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!session_id.empty()) add_field("session_id", session_id);
        if (!file_transfer_id.empty()) add_field("file_transfer_id", file_transfer_id);
        if (contact) {
            add_field("contact", masker ? masker->mask_contact(*contact) : *contact);
        }
        if (remote_instance_id) add_field("remote_instance_id", *remote_instance_id);
        if (state) add_field("state", *state);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<session_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << *source_file << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Session system logger
 *
 * Routes records to logger_system when it is integrated, otherwise to stderr.
 * A user callback receives every enabled record, which is how embedders
 * forward records to their own sink.
 */
class session_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const session_log_context*)>;

    session_logger() = default;
    ~session_logger() = default;

    session_logger(const session_logger&) = delete;
    session_logger& operator=(const session_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; later calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if IMS_SESSION_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if IMS_SESSION_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if IMS_SESSION_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Disable stderr output (records still reach the callback)
     */
    void set_console_output(bool enabled) {
        console_output_.store(enabled);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const session_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string line_str;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;
            line_str = entry.to_json_with_masking(&current_masker);
        } else {
            std::ostringstream oss;
            oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
                << category << "] " << current_masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            line_str = oss.str();
        }

#if IMS_SESSION_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_str, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_str);
            }
            return;
        }
#endif
        if (console_output_.load()) {
            output_to_stderr(line_str);
        }
    }

    void flush() {
#if IMS_SESSION_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if IMS_SESSION_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline session_logger& get_logger() {
    static session_logger instance;
    return instance;
}

#define IMS_LOG(level, category, message) \
    kcenon::ims_session::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define IMS_LOG_CTX(level, category, message, context) \
    kcenon::ims_session::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define IMS_LOG_TRACE(category, message) \
    IMS_LOG(kcenon::ims_session::log_level::trace, category, message)

#define IMS_LOG_DEBUG(category, message) \
    IMS_LOG(kcenon::ims_session::log_level::debug, category, message)

#define IMS_LOG_INFO(category, message) \
    IMS_LOG(kcenon::ims_session::log_level::info, category, message)

#define IMS_LOG_WARN(category, message) \
    IMS_LOG(kcenon::ims_session::log_level::warn, category, message)

#define IMS_LOG_ERROR(category, message) \
    IMS_LOG(kcenon::ims_session::log_level::error, category, message)

#define IMS_LOG_DEBUG_CTX(category, message, ctx) \
    IMS_LOG_CTX(kcenon::ims_session::log_level::debug, category, message, ctx)

#define IMS_LOG_INFO_CTX(category, message, ctx) \
    IMS_LOG_CTX(kcenon::ims_session::log_level::info, category, message, ctx)

#define IMS_LOG_WARN_CTX(category, message, ctx) \
    IMS_LOG_CTX(kcenon::ims_session::log_level::warn, category, message, ctx)

#define IMS_LOG_ERROR_CTX(category, message, ctx) \
    IMS_LOG_CTX(kcenon::ims_session::log_level::error, category, message, ctx)

} // namespace kcenon::ims_session
