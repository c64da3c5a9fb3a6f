// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file file_sharing_session.h
 * @brief Terminating HTTP file sharing session
 */

#ifndef KCENON_IMS_SESSION_SESSION_FILE_SHARING_SESSION_H
#define KCENON_IMS_SESSION_SESSION_FILE_SHARING_SESSION_H

#include <kcenon/ims_session/adapters/worker_pool.h>
#include <kcenon/ims_session/content/content_descriptor.h>
#include <kcenon/ims_session/core/logging.h>
#include <kcenon/ims_session/core/session_config.h>
#include <kcenon/ims_session/core/settings_provider.h>
#include <kcenon/ims_session/core/types.h>
#include <kcenon/ims_session/download/download_engine.h>
#include <kcenon/ims_session/download/http_adapter.h>
#include <kcenon/ims_session/session/messaging_log.h>
#include <kcenon/ims_session/session/session_listener.h>
#include <kcenon/ims_session/session/session_types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::ims_session {

class delivery_report_dispatcher;
class session_registry;

/**
 * @brief Inbound file transfer invitation
 */
struct file_transfer_invitation {
    session_identity identity;
    std::string download_uri;
    content_info file;
    std::optional<content_info> icon;
};

/**
 * @brief Direction and group dependent behaviour
 */
struct session_strategies {
    /// Whether a displayed report is sent once the file is stored
    std::function<bool(const session_identity&, const settings_provider&)>
        should_send_displayed_report;

    /// Local path receiving the file
    std::function<std::filesystem::path(const session_identity&,
                                        const content_info&,
                                        const std::filesystem::path& download_dir)>
        resolve_download_path;

    /**
     * @brief Strategies of a terminating session
     *
     * Displayed reports only for one-to-one transfers with the setting on.
     * The file is stored under the download directory with its announced
     * name; a numeric suffix avoids overwriting an existing file.
     */
    [[nodiscard]] static auto terminating() -> session_strategies;
};

/**
 * @brief Collaborators of a session
 *
 * registry, http, workers and settings are required. The session keeps only
 * weak references to the registry and the dispatcher.
 */
struct session_context {
    std::shared_ptr<session_registry> registry;
    std::shared_ptr<delivery_report_dispatcher> dispatcher;
    std::shared_ptr<http_adapter> http;
    std::shared_ptr<adapters::worker_pool_interface> workers;
    std::shared_ptr<settings_provider> settings;
    std::shared_ptr<messaging_log> log;
    session_config config;
    session_strategies strategies = session_strategies::terminating();
};

/**
 * @brief State machine of one inbound HTTP file transfer
 *
 * Lifecycle:
 * @code
 * invited -> accepted -> downloading -> completed
 *        \-> rejected         |  ^  \-> error
 *                             v  |   \-> cancelled
 *                            paused -> cancelled
 * @endcode
 *
 * Every lifecycle call from a state that forbids it fails with
 * invalid_state_transition and changes nothing. At most one worker runs at
 * a time. Listeners are notified outside the transition guard.
 */
class file_sharing_session : public std::enable_shared_from_this<file_sharing_session> {
    struct construction_key {
        explicit construction_key() = default;
    };

public:
    /**
     * @brief Create a session in state invited
     *
     * The session is not registered; file_sharing_service does that.
     * @return invalid_argument when a required collaborator is missing,
     *         invalid_configuration when the config does not validate
     */
    [[nodiscard]] static auto create(file_transfer_invitation invitation, session_context context)
        -> result<std::shared_ptr<file_sharing_session>>;

    /**
     * @brief Reachable only through create()
     */
    file_sharing_session(construction_key key,
                         file_transfer_invitation invitation,
                         session_context context,
                         std::filesystem::path download_path);

    ~file_sharing_session();

    file_sharing_session(const file_sharing_session&) = delete;
    auto operator=(const file_sharing_session&) -> file_sharing_session& = delete;

    // Invitation

    /**
     * @brief Accept the invitation (invited -> accepted)
     */
    [[nodiscard]] auto accept() -> result<void>;

    /**
     * @brief Reject the invitation (invited -> rejected)
     *
     * Releases a pending wait_for_user_answer() and deregisters the session.
     */
    [[nodiscard]] auto reject(rejection_reason reason) -> result<void>;

    /**
     * @brief Block until the user answers or the timeout elapses
     *
     * On timeout the session is rejected with rejection_reason::timeout.
     */
    [[nodiscard]] auto wait_for_user_answer(std::chrono::milliseconds timeout)
        -> invitation_status;

    /**
     * @brief wait_for_user_answer() with the configured ringing timeout
     */
    [[nodiscard]] auto wait_for_user_answer() -> invitation_status;

    // Transfer

    /**
     * @brief Start the download (accepted -> downloading)
     * @return worker_already_running if a previous worker is still alive
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Pause the download (downloading -> paused)
     */
    [[nodiscard]] auto pause() -> result<void>;

    /**
     * @brief Resume from the preserved offset (paused -> downloading)
     * @return worker_already_running until the paused worker has exited
     */
    [[nodiscard]] auto resume() -> result<void>;

    /**
     * @brief Cancel on user request (downloading/paused -> cancelled)
     */
    [[nodiscard]] auto cancel() -> result<void>;

    /**
     * @brief Abort on system request (downloading/paused -> cancelled)
     */
    [[nodiscard]] auto interrupt() -> result<void>;

    /**
     * @brief Abort with an explicit reason
     */
    [[nodiscard]] auto abort_session(termination_reason reason) -> result<void>;

    // Queries

    [[nodiscard]] auto state() const -> session_state;
    [[nodiscard]] auto current_invitation_status() const -> invitation_status;
    [[nodiscard]] auto progress() const -> transfer_progress;
    [[nodiscard]] auto identity() const -> const session_identity& { return identity_; }
    [[nodiscard]] auto content() const -> const content_descriptor& { return *content_; }

    /// nullptr when the invitation carried no icon
    [[nodiscard]] auto icon() const -> const content_descriptor* { return icon_.get(); }

    [[nodiscard]] auto download_uri() const -> const std::string& { return download_uri_; }
    [[nodiscard]] auto download_path() const -> const std::filesystem::path&;
    [[nodiscard]] auto download_state() const -> download_snapshot;

    [[nodiscard]] auto is_worker_active() const -> bool;

    /**
     * @brief Wait until the current worker (if any) has exited
     * @return true if no worker is running any more
     */
    [[nodiscard]] auto wait_for_worker(std::chrono::milliseconds timeout) const -> bool;

    [[nodiscard]] auto is_initiated_by_remote() const -> bool;

    // Listeners

    void add_listener(std::shared_ptr<session_listener> listener);
    void remove_listener(const std::shared_ptr<session_listener>& listener);

private:
    [[nodiscard]] auto worker_active_locked() const -> bool;
    [[nodiscard]] auto submit_worker_locked(bool resuming) -> result<void>;
    void release_answer_locked(invitation_status status);

    void run_worker(bool resuming);
    void handle_success();
    void handle_failure(const error& err);
    void handle_progress(const transfer_progress& progress);
    void send_displayed_report();
    void deregister();

    void persist_state(session_state state);
    void persist_progress(const transfer_progress& progress);
    void persist_location(const content_location& location);

    template <typename Fn>
    void persist(const char* what, Fn&& write);

    [[nodiscard]] auto log_context() const -> session_log_context;

    template <typename Fn>
    void notify(Fn&& fn);

    const session_identity identity_;
    const std::string download_uri_;
    std::unique_ptr<content_descriptor> content_;
    std::unique_ptr<content_descriptor> icon_;

    std::weak_ptr<session_registry> registry_;
    std::weak_ptr<delivery_report_dispatcher> dispatcher_;
    std::shared_ptr<adapters::worker_pool_interface> workers_;
    std::shared_ptr<settings_provider> settings_;
    std::shared_ptr<messaging_log> log_;
    session_config config_;
    session_strategies strategies_;

    std::unique_ptr<download_engine> engine_;

    // Transition guard
    mutable std::mutex mutex_;
    session_state state_ = session_state::invited;
    invitation_status invitation_ = invitation_status::pending;
    bool answer_released_ = false;
    std::promise<invitation_status> answer_promise_;
    std::shared_future<invitation_status> answer_future_;
    std::shared_future<void> worker_;

    mutable std::mutex listeners_mutex_;
    std::vector<std::shared_ptr<session_listener>> listeners_;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_SESSION_FILE_SHARING_SESSION_H
