// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file file_sharing_service.h
 * @brief Entry point receiving file sharing invitations
 */

#ifndef KCENON_IMS_SESSION_SERVICE_FILE_SHARING_SERVICE_H
#define KCENON_IMS_SESSION_SERVICE_FILE_SHARING_SERVICE_H

#include <kcenon/ims_session/adapters/worker_pool.h>
#include <kcenon/ims_session/core/session_config.h>
#include <kcenon/ims_session/core/settings_provider.h>
#include <kcenon/ims_session/core/types.h>
#include <kcenon/ims_session/delivery/delivery_report_dispatcher.h>
#include <kcenon/ims_session/delivery/delivery_status_sender.h>
#include <kcenon/ims_session/download/http_adapter.h>
#include <kcenon/ims_session/session/file_sharing_session.h>
#include <kcenon/ims_session/session/messaging_log.h>
#include <kcenon/ims_session/session/session_registry.h>

#include <memory>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief Creates, registers and owns the collaborators of file sharing sessions
 *
 * @code
 * auto service_result = file_sharing_service::builder()
 *     .with_settings_provider(settings)
 *     .with_messaging_log(log)
 *     .build();
 *
 * if (service_result.has_value()) {
 *     auto& service = service_result.value();
 *     auto session = service.receive_invitation(invitation);
 * }
 * @endcode
 */
class file_sharing_service {
public:
    /**
     * @brief Builder for file_sharing_service
     *
     * Collaborators left unset get defaults: a libcurl adapter, the best
     * available worker pool, an in-memory settings provider and a fresh
     * registry. Without a delivery sender, out-of-band reports fail.
     */
    class builder {
    public:
        builder();

        auto with_config(const service_config& config) -> builder&;

        /**
         * @brief Set the session configuration only
         */
        auto with_session_config(const session_config& config) -> builder&;

        auto with_http_adapter(std::shared_ptr<http_adapter> adapter) -> builder&;
        auto with_settings_provider(std::shared_ptr<settings_provider> settings) -> builder&;
        auto with_messaging_log(std::shared_ptr<messaging_log> log) -> builder&;
        auto with_delivery_sender(std::shared_ptr<delivery_status_sender> sender) -> builder&;
        auto with_worker_pool(std::shared_ptr<adapters::worker_pool_interface> workers)
            -> builder&;
        auto with_registry(std::shared_ptr<session_registry> registry) -> builder&;

        /**
         * @brief Override the direction dependent behaviour of new sessions
         */
        auto with_strategies(session_strategies strategies) -> builder&;

        /**
         * @brief Build the service
         * @return invalid_configuration when the config does not validate
         */
        [[nodiscard]] auto build() -> result<file_sharing_service>;

    private:
        service_config config_;
        std::shared_ptr<http_adapter> http_;
        std::shared_ptr<settings_provider> settings_;
        std::shared_ptr<messaging_log> log_;
        std::shared_ptr<delivery_status_sender> sender_;
        std::shared_ptr<adapters::worker_pool_interface> workers_;
        std::shared_ptr<session_registry> registry_;
        session_strategies strategies_ = session_strategies::terminating();
    };

    ~file_sharing_service();

    file_sharing_service(file_sharing_service&&) noexcept;
    auto operator=(file_sharing_service&&) noexcept -> file_sharing_service&;

    file_sharing_service(const file_sharing_service&) = delete;
    auto operator=(const file_sharing_service&) -> file_sharing_service& = delete;

    /**
     * @brief Create and register a session for an inbound invitation
     *
     * An empty session id is replaced by a generated one.
     * @return session_already_exists when the id is taken
     */
    [[nodiscard]] auto receive_invitation(file_transfer_invitation invitation)
        -> result<std::shared_ptr<file_sharing_session>>;

    [[nodiscard]] auto find_session(const std::string& session_id) const
        -> std::shared_ptr<file_sharing_session>;

    /**
     * @brief Send a delivery report through the shared dispatcher
     */
    [[nodiscard]] auto send_delivery_report(const delivery_request& request)
        -> result<delivery_report>;

    [[nodiscard]] auto registry() const -> std::shared_ptr<session_registry>;
    [[nodiscard]] auto dispatcher() const -> std::shared_ptr<delivery_report_dispatcher>;
    [[nodiscard]] auto settings() const -> std::shared_ptr<settings_provider>;
    [[nodiscard]] auto config() const -> const service_config&;

private:
    struct impl;

    explicit file_sharing_service(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_SERVICE_FILE_SHARING_SERVICE_H
