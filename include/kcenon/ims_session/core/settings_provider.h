// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file settings_provider.h
 * @brief Runtime settings consulted by sessions
 */

#ifndef KCENON_IMS_SESSION_CORE_SETTINGS_PROVIDER_H
#define KCENON_IMS_SESSION_CORE_SETTINGS_PROVIDER_H

#include <atomic>
#include <filesystem>
#include <mutex>

namespace kcenon::ims_session {

/**
 * @brief Read access to user settings
 *
 * Values may change at runtime; callers read them once per decision.
 */
class settings_provider {
public:
    virtual ~settings_provider() = default;

    /**
     * @brief Whether displayed reports are sent for one-to-one transfers
     */
    [[nodiscard]] virtual auto is_send_one_to_one_displayed_reports_enabled() const
        -> bool = 0;

    /**
     * @brief Directory receiving downloaded files
     */
    [[nodiscard]] virtual auto download_directory() const -> std::filesystem::path = 0;
};

/**
 * @brief In-process settings provider
 */
class memory_settings_provider : public settings_provider {
public:
    explicit memory_settings_provider(
        std::filesystem::path download_dir = std::filesystem::temp_directory_path(),
        bool send_displayed_reports = true)
        : send_displayed_reports_(send_displayed_reports),
          download_dir_(std::move(download_dir)) {}

    [[nodiscard]] auto is_send_one_to_one_displayed_reports_enabled() const
        -> bool override {
        return send_displayed_reports_.load();
    }

    [[nodiscard]] auto download_directory() const -> std::filesystem::path override {
        std::lock_guard<std::mutex> lock(mutex_);
        return download_dir_;
    }

    void set_send_one_to_one_displayed_reports(bool enabled) {
        send_displayed_reports_.store(enabled);
    }

    void set_download_directory(std::filesystem::path dir) {
        std::lock_guard<std::mutex> lock(mutex_);
        download_dir_ = std::move(dir);
    }

private:
    std::atomic<bool> send_displayed_reports_;
    mutable std::mutex mutex_;
    std::filesystem::path download_dir_;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_CORE_SETTINGS_PROVIDER_H
