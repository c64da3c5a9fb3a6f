// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file download_engine.h
 * @brief Resumable HTTP download with cooperative pause and cancel
 */

#ifndef KCENON_IMS_SESSION_DOWNLOAD_DOWNLOAD_ENGINE_H
#define KCENON_IMS_SESSION_DOWNLOAD_DOWNLOAD_ENGINE_H

#include <kcenon/ims_session/core/session_config.h>
#include <kcenon/ims_session/core/types.h>
#include <kcenon/ims_session/download/http_adapter.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief Download task status
 */
enum class download_status {
    pending,
    active,
    paused,
    cancelled,
    completed,
    failed
};

[[nodiscard]] constexpr auto to_string(download_status status) -> const char* {
    switch (status) {
        case download_status::pending: return "pending";
        case download_status::active: return "active";
        case download_status::paused: return "paused";
        case download_status::cancelled: return "cancelled";
        case download_status::completed: return "completed";
        case download_status::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Description of one download
 */
struct download_task {
    std::string transfer_id;                ///< Used in log records
    std::string uri;                        ///< Remote resource
    std::filesystem::path destination;      ///< Local file
    uint64_t total_size = 0;                ///< 0 when unknown until the response
    std::optional<std::string> expected_sha256;
};

/**
 * @brief Snapshot of a download_task and its runtime state
 */
struct download_snapshot {
    download_task task;
    uint64_t offset = 0;
    std::optional<std::string> etag;
    download_status status = download_status::pending;
};

using download_progress_callback = std::function<void(const transfer_progress&)>;

/**
 * @brief Resumable, byte-range aware downloader for one session
 *
 * fetch() and resume_from() run on the session worker and block until the
 * attempt ends. pause_transfer_by_user() and cancel() may be called from any
 * thread; they take effect before the next slice is written.
 *
 * @code
 * download_engine engine(adapter, task, config);
 * auto r = engine.fetch(on_progress);
 * if (!r && engine.is_paused()) {
 *     // later
 *     r = engine.resume_from(on_progress);
 * }
 * @endcode
 */
class download_engine {
public:
    download_engine(std::shared_ptr<http_adapter> http,
                    download_task task,
                    download_config config = {});
    ~download_engine();

    download_engine(const download_engine&) = delete;
    auto operator=(const download_engine&) -> download_engine& = delete;

    /**
     * @brief Download the resource from byte 0
     *
     * Requires status pending. The destination is truncated.
     * An exception raised by the adapter or the progress callback is
     * returned as unexpected_fault; the status still settles on paused,
     * cancelled or failed.
     * @return transfer_paused / transfer_cancelled when suspended, otherwise
     *         the classified download error
     */
    [[nodiscard]] auto fetch(const download_progress_callback& on_progress = {})
        -> result<void>;

    /**
     * @brief Continue a paused download from the preserved offset
     *
     * Sends "Range: bytes=<offset>-" and "If-Range" with the known ETag.
     * Fails with resource_changed if the server no longer serves the same
     * entity.
     */
    [[nodiscard]] auto resume_from(const download_progress_callback& on_progress = {})
        -> result<void>;

    /**
     * @brief Request a pause (idempotent, ignored after cancel)
     */
    void pause_transfer_by_user();

    /**
     * @brief Request cancellation (overrides a pause)
     */
    void cancel();

    [[nodiscard]] auto is_paused() const -> bool;
    [[nodiscard]] auto is_cancelled() const -> bool;

    [[nodiscard]] auto status() const -> download_status;
    [[nodiscard]] auto progress() const -> transfer_progress;
    [[nodiscard]] auto snapshot() const -> download_snapshot;
    [[nodiscard]] auto destination() const -> const std::filesystem::path&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_DOWNLOAD_DOWNLOAD_ENGINE_H
