// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file file_sharing_service.cpp
 * @brief Implementation of file_sharing_service
 */

#include "kcenon/ims_session/service/file_sharing_service.h"

#include "kcenon/ims_session/config/feature_flags.h"
#include "kcenon/ims_session/core/logging.h"
#include "kcenon/ims_session/core/session_id.h"
#include "kcenon/ims_session/download/network_http_adapter.h"

#if IMS_SESSION_HAS_CURL
#include "kcenon/ims_session/download/curl_http_adapter.h"
#endif

namespace kcenon::ims_session {

struct file_sharing_service::impl {
    service_config config;
    std::shared_ptr<http_adapter> http;
    std::shared_ptr<settings_provider> settings;
    std::shared_ptr<messaging_log> log;
    std::shared_ptr<adapters::worker_pool_interface> workers;
    std::shared_ptr<session_registry> registry;
    std::shared_ptr<delivery_report_dispatcher> dispatcher;
    session_strategies strategies;

    auto make_context() const -> session_context {
        session_context ctx;
        ctx.registry = registry;
        ctx.dispatcher = dispatcher;
        ctx.http = http;
        ctx.workers = workers;
        ctx.settings = settings;
        ctx.log = log;
        ctx.config = config.session;
        ctx.strategies = strategies;
        return ctx;
    }
};

// builder implementation
file_sharing_service::builder::builder() = default;

auto file_sharing_service::builder::with_config(const service_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto file_sharing_service::builder::with_session_config(const session_config& config)
    -> builder& {
    config_.session = config;
    return *this;
}

auto file_sharing_service::builder::with_http_adapter(std::shared_ptr<http_adapter> adapter)
    -> builder& {
    http_ = std::move(adapter);
    return *this;
}

auto file_sharing_service::builder::with_settings_provider(
    std::shared_ptr<settings_provider> settings) -> builder& {
    settings_ = std::move(settings);
    return *this;
}

auto file_sharing_service::builder::with_messaging_log(std::shared_ptr<messaging_log> log)
    -> builder& {
    log_ = std::move(log);
    return *this;
}

auto file_sharing_service::builder::with_delivery_sender(
    std::shared_ptr<delivery_status_sender> sender) -> builder& {
    sender_ = std::move(sender);
    return *this;
}

auto file_sharing_service::builder::with_worker_pool(
    std::shared_ptr<adapters::worker_pool_interface> workers) -> builder& {
    workers_ = std::move(workers);
    return *this;
}

auto file_sharing_service::builder::with_registry(std::shared_ptr<session_registry> registry)
    -> builder& {
    registry_ = std::move(registry);
    return *this;
}

auto file_sharing_service::builder::with_strategies(session_strategies strategies) -> builder& {
    strategies_ = std::move(strategies);
    return *this;
}

auto file_sharing_service::builder::build() -> result<file_sharing_service> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (!strategies_.should_send_displayed_report || !strategies_.resolve_download_path) {
        return unexpected(error{error_code::invalid_configuration,
                                "session strategies must be complete"});
    }

    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    auto state = std::make_unique<impl>();
    state->config = config_;
    state->strategies = strategies_;
    state->log = log_;

    state->http = http_;
    if (!state->http) {
#if IMS_SESSION_HAS_CURL
        curl_http_options options;
        options.user_agent = config_.session.download.user_agent;
        state->http = std::make_shared<curl_http_adapter>(options);
#else
        state->http = std::make_shared<network_http_adapter>(
            config_.session.download.request_timeout);
#endif
    }

    state->settings = settings_;
    if (!state->settings) {
        state->settings = std::make_shared<memory_settings_provider>();
    }

    state->workers = workers_;
    if (!state->workers) {
        state->workers = adapters::worker_pool_factory::create(config_.worker_threads);
    }

    state->registry = registry_ ? registry_ : std::make_shared<session_registry>();
    state->dispatcher = std::make_shared<delivery_report_dispatcher>(state->registry, sender_);

    IMS_LOG_INFO(log_category::service,
                 "file sharing service ready (http=" + state->http->name() + ")");

    return file_sharing_service{std::move(state)};
}

// file_sharing_service implementation
file_sharing_service::file_sharing_service(std::unique_ptr<impl> impl)
    : impl_(std::move(impl)) {}

file_sharing_service::~file_sharing_service() = default;

file_sharing_service::file_sharing_service(file_sharing_service&&) noexcept = default;
auto file_sharing_service::operator=(file_sharing_service&&) noexcept
    -> file_sharing_service& = default;

auto file_sharing_service::receive_invitation(file_transfer_invitation invitation)
    -> result<std::shared_ptr<file_sharing_session>> {
    if (invitation.identity.session_id.empty()) {
        invitation.identity.session_id = generate_session_id();
    }
    if (invitation.identity.invited_at == std::chrono::system_clock::time_point{}) {
        invitation.identity.invited_at = std::chrono::system_clock::now();
    }

    auto created = file_sharing_session::create(std::move(invitation), impl_->make_context());
    if (!created) {
        IMS_LOG_ERROR(log_category::service,
                      "cannot create session: " + created.error().message);
        return unexpected(created.error());
    }

    auto session = created.value();
    if (auto added = impl_->registry->add_file_sharing_session(session); !added) {
        IMS_LOG_WARN(log_category::service,
                     "session " + session->identity().session_id + " already registered");
        return unexpected(added.error());
    }

    session_log_context ctx;
    ctx.session_id = session->identity().session_id;
    ctx.file_transfer_id = session->identity().file_transfer_id;
    ctx.contact = session->identity().remote_contact;
    ctx.total_bytes = session->content().size();
    IMS_LOG_INFO_CTX(log_category::service,
                     "invitation received for " + session->content().name(), ctx);

    return session;
}

auto file_sharing_service::find_session(const std::string& session_id) const
    -> std::shared_ptr<file_sharing_session> {
    return impl_->registry->find_file_sharing_session(session_id);
}

auto file_sharing_service::send_delivery_report(const delivery_request& request)
    -> result<delivery_report> {
    return impl_->dispatcher->report(request);
}

auto file_sharing_service::registry() const -> std::shared_ptr<session_registry> {
    return impl_->registry;
}

auto file_sharing_service::dispatcher() const -> std::shared_ptr<delivery_report_dispatcher> {
    return impl_->dispatcher;
}

auto file_sharing_service::settings() const -> std::shared_ptr<settings_provider> {
    return impl_->settings;
}

auto file_sharing_service::config() const -> const service_config& {
    return impl_->config;
}

}  // namespace kcenon::ims_session
