// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file file_sharing_session.cpp
 * @brief Implementation of file_sharing_session
 */

#include "kcenon/ims_session/session/file_sharing_session.h"

#include "kcenon/ims_session/core/error_codes.h"
#include "kcenon/ims_session/core/logging.h"
#include "kcenon/ims_session/delivery/delivery_report_dispatcher.h"
#include "kcenon/ims_session/session/session_registry.h"

#include <system_error>

namespace kcenon::ims_session {

namespace {

/**
 * @brief Reduce an announced name to a single safe path component
 */
auto sanitize_file_name(const std::string& name) -> std::string {
    auto base = std::filesystem::path(name).filename().string();
    if (base == "." || base == "..") {
        base.clear();
    }
    for (auto& c : base) {
        if (c == '/' || c == '\\' || c == ':' || static_cast<unsigned char>(c) < 0x20) {
            c = '_';
        }
    }
    return base;
}

auto unique_path(const std::filesystem::path& candidate) -> std::filesystem::path {
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return candidate;
    }

    auto stem = candidate.stem().string();
    auto ext = candidate.extension().string();
    for (int n = 1; n < 10000; ++n) {
        auto next = candidate.parent_path() / (stem + "_" + std::to_string(n) + ext);
        if (!std::filesystem::exists(next, ec)) {
            return next;
        }
    }
    return candidate;
}

auto invalid_transition(session_state from, const char* operation) -> result<void> {
    return unexpected(error{error_code::invalid_state_transition,
                            std::string("cannot ") + operation + " in state " +
                                to_string(from)});
}

}  // namespace

// ============================================================================
// session_strategies
// ============================================================================

auto session_strategies::terminating() -> session_strategies {
    session_strategies strategies;

    strategies.should_send_displayed_report = [](const session_identity& identity,
                                                 const settings_provider& settings) {
        return !identity.is_group && settings.is_send_one_to_one_displayed_reports_enabled();
    };

    strategies.resolve_download_path = [](const session_identity& identity,
                                          const content_info& file,
                                          const std::filesystem::path& download_dir) {
        auto name = sanitize_file_name(file.name);
        if (name.empty()) {
            name = sanitize_file_name(identity.file_transfer_id);
        }
        if (name.empty()) {
            name = identity.session_id;
        }
        return unique_path(download_dir / name);
    };

    return strategies;
}

// ============================================================================
// Construction
// ============================================================================

auto file_sharing_session::create(file_transfer_invitation invitation, session_context context)
    -> result<std::shared_ptr<file_sharing_session>> {
    if (!context.registry) {
        return unexpected(error{error_code::invalid_argument, "session registry required"});
    }
    if (!context.http) {
        return unexpected(error{error_code::invalid_argument, "HTTP adapter required"});
    }
    if (!context.workers) {
        return unexpected(error{error_code::invalid_argument, "worker pool required"});
    }
    if (!context.settings) {
        return unexpected(error{error_code::invalid_argument, "settings provider required"});
    }
    if (!context.strategies.should_send_displayed_report ||
        !context.strategies.resolve_download_path) {
        return unexpected(error{error_code::invalid_argument, "incomplete session strategies"});
    }
    if (invitation.identity.session_id.empty()) {
        return unexpected(error{error_code::invalid_argument, "empty session id"});
    }
    if (invitation.download_uri.empty()) {
        return unexpected(error{error_code::invalid_argument, "empty download URI"});
    }
    if (auto valid = context.config.validate(); !valid) {
        return unexpected(valid.error());
    }

    auto download_dir = context.config.download_directory.empty()
                            ? context.settings->download_directory()
                            : context.config.download_directory;
    auto path = context.strategies.resolve_download_path(invitation.identity, invitation.file,
                                                         download_dir);

    return std::make_shared<file_sharing_session>(construction_key{}, std::move(invitation),
                                                  std::move(context), std::move(path));
}

file_sharing_session::file_sharing_session(construction_key /*key*/,
                                           file_transfer_invitation invitation,
                                           session_context context,
                                           std::filesystem::path download_path)
    : identity_(std::move(invitation.identity)),
      download_uri_(std::move(invitation.download_uri)),
      content_(std::make_unique<content_descriptor>(invitation.file)),
      registry_(context.registry),
      dispatcher_(context.dispatcher),
      workers_(std::move(context.workers)),
      settings_(std::move(context.settings)),
      log_(std::move(context.log)),
      config_(std::move(context.config)),
      strategies_(std::move(context.strategies)) {
    if (invitation.icon) {
        icon_ = std::make_unique<content_descriptor>(std::move(*invitation.icon));
    }

    download_task task;
    task.transfer_id = identity_.file_transfer_id;
    task.uri = download_uri_;
    task.destination = std::move(download_path);
    task.total_size = content_->size();
    task.expected_sha256 = content_->sha256();
    engine_ = std::make_unique<download_engine>(std::move(context.http), std::move(task),
                                                config_.download);

    answer_future_ = answer_promise_.get_future().share();
}

file_sharing_session::~file_sharing_session() = default;

template <typename Fn>
void file_sharing_session::notify(Fn&& fn) {
    std::vector<std::shared_ptr<session_listener>> snapshot;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        snapshot = listeners_;
    }
    for (const auto& listener : snapshot) {
        try {
            fn(*listener);
        } catch (const std::exception& e) {
            IMS_LOG_WARN(log_category::session,
                         "listener failed for " + identity_.session_id + ": " + e.what());
        } catch (...) {
            IMS_LOG_WARN(log_category::session,
                         "listener failed for " + identity_.session_id + ": unknown exception");
        }
    }
}

// ============================================================================
// Invitation
// ============================================================================

void file_sharing_session::release_answer_locked(invitation_status status) {
    if (answer_released_) {
        return;
    }
    answer_released_ = true;
    answer_promise_.set_value(status);
}

auto file_sharing_session::accept() -> result<void> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_valid_transition(state_, session_state::accepted)) {
            return invalid_transition(state_, "accept");
        }
        state_ = session_state::accepted;
        invitation_ = invitation_status::accepted;
        release_answer_locked(invitation_);
    }

    auto ctx = log_context();
    IMS_LOG_INFO_CTX(log_category::session, "invitation accepted", ctx);
    persist_state(session_state::accepted);
    notify([this](session_listener& l) { l.on_session_accepted(identity_.session_id); });
    return {};
}

auto file_sharing_session::reject(rejection_reason reason) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_valid_transition(state_, session_state::rejected)) {
            return invalid_transition(state_, "reject");
        }
        state_ = session_state::rejected;
        invitation_ = reason == rejection_reason::timeout ? invitation_status::timeout
                                                          : invitation_status::rejected;
        release_answer_locked(invitation_);
    }

    auto ctx = log_context();
    IMS_LOG_INFO_CTX(log_category::session,
                     std::string("invitation rejected (") + to_string(reason) + ")", ctx);
    deregister();
    persist_state(session_state::rejected);
    notify([this, reason](session_listener& l) {
        l.on_session_rejected(identity_.session_id, reason);
    });
    return {};
}

auto file_sharing_session::wait_for_user_answer(std::chrono::milliseconds timeout)
    -> invitation_status {
    std::shared_future<invitation_status> answer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        answer = answer_future_;
    }

    if (answer.wait_for(timeout) == std::future_status::ready) {
        return answer.get();
    }

    if (reject(rejection_reason::timeout)) {
        return invitation_status::timeout;
    }

    // Answered between the timeout and the reject; the gate is already released
    return answer.get();
}

auto file_sharing_session::wait_for_user_answer() -> invitation_status {
    return wait_for_user_answer(config_.ringing_timeout);
}

// ============================================================================
// Transfer control
// ============================================================================

auto file_sharing_session::worker_active_locked() const -> bool {
    return worker_.valid() &&
           worker_.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

auto file_sharing_session::submit_worker_locked(bool resuming) -> result<void> {
    auto self = shared_from_this();
    try {
        worker_ = workers_
                      ->submit([self, resuming]() { self->run_worker(resuming); },
                               resuming ? "session_resume" : "session_download")
                      .share();
    } catch (const std::system_error& e) {
        return unexpected(error{error_code::unexpected_fault,
                                std::string("cannot start worker: ") + e.what()});
    }
    return {};
}

auto file_sharing_session::start() -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_active_locked()) {
        return unexpected(error{error_code::worker_already_running,
                                "worker still running for " + identity_.session_id});
    }
    if (state_ != session_state::accepted) {
        return invalid_transition(state_, "start");
    }

    state_ = session_state::downloading;
    auto submitted = submit_worker_locked(false);
    if (!submitted) {
        state_ = session_state::accepted;
    }
    return submitted;
}

auto file_sharing_session::pause() -> result<void> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_valid_transition(state_, session_state::paused)) {
            return invalid_transition(state_, "pause");
        }
        state_ = session_state::paused;
        engine_->pause_transfer_by_user();
    }

    auto ctx = log_context();
    IMS_LOG_INFO_CTX(log_category::session, "transfer paused by user", ctx);
    persist_state(session_state::paused);
    notify([this](session_listener& l) { l.on_transfer_paused(identity_.session_id); });
    return {};
}

auto file_sharing_session::resume() -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_active_locked()) {
        return unexpected(error{error_code::worker_already_running,
                                "paused worker has not exited for " + identity_.session_id});
    }
    if (state_ != session_state::paused) {
        return invalid_transition(state_, "resume");
    }

    state_ = session_state::downloading;
    auto submitted = submit_worker_locked(true);
    if (!submitted) {
        state_ = session_state::paused;
    }
    return submitted;
}

auto file_sharing_session::cancel() -> result<void> {
    return abort_session(termination_reason::by_user);
}

auto file_sharing_session::interrupt() -> result<void> {
    return abort_session(termination_reason::by_system);
}

auto file_sharing_session::abort_session(termination_reason reason) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_valid_transition(state_, session_state::cancelled)) {
            return invalid_transition(state_, "abort");
        }
        state_ = session_state::cancelled;
        engine_->cancel();
    }

    auto ctx = log_context();
    IMS_LOG_INFO_CTX(log_category::session,
                     std::string("session aborted (") + to_string(reason) + ")", ctx);
    deregister();
    persist_state(session_state::cancelled);
    notify([this, reason](session_listener& l) {
        l.on_session_aborted(identity_.session_id, reason);
    });
    return {};
}

// ============================================================================
// Worker
// ============================================================================

void file_sharing_session::run_worker(bool resuming) {
    if (resuming) {
        persist_state(session_state::downloading);
        notify([this](session_listener& l) { l.on_transfer_resumed(identity_.session_id); });
    } else {
        persist_state(session_state::downloading);
        notify([this](session_listener& l) { l.on_transfer_started(identity_.session_id); });
    }

    auto on_progress = [this](const transfer_progress& p) { handle_progress(p); };

    result<void> outcome;
    try {
        if (resuming && engine_->status() == download_status::completed) {
            // The last bytes landed while the pause was being requested
            outcome = result<void>{};
        } else {
            outcome = resuming ? engine_->resume_from(on_progress) : engine_->fetch(on_progress);
        }
    } catch (const std::exception& e) {
        outcome = unexpected(error{error_code::unexpected_fault, e.what()});
    } catch (...) {
        outcome = unexpected(error{error_code::unexpected_fault, "unknown exception"});
    }

    if (outcome) {
        handle_success();
    } else {
        handle_failure(outcome.error());
    }
}

void file_sharing_session::handle_progress(const transfer_progress& progress) {
    persist_progress(progress);
    notify([this, &progress](session_listener& l) {
        l.on_transfer_progress(identity_.session_id, progress);
    });
}

void file_sharing_session::handle_success() {
    auto location = content_location::from_path(engine_->destination());

    std::optional<error> finalize_error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != session_state::downloading) {
            // Paused or cancelled while the last bytes arrived
            return;
        }
        auto stored = content_->set_location(location);
        if (stored) {
            state_ = session_state::completed;
        } else {
            finalize_error = stored.error();
        }
    }

    if (finalize_error) {
        handle_failure(*finalize_error);
        return;
    }

    auto ctx = log_context();
    IMS_LOG_INFO_CTX(log_category::session, "file stored at " + location.uri(), ctx);

    persist_location(location);
    persist_state(session_state::completed);
    notify([this, &location](session_listener& l) {
        l.on_transfer_completed(identity_.session_id, location);
    });

    if (strategies_.should_send_displayed_report(identity_, *settings_)) {
        send_displayed_report();
    }

    deregister();
}

void file_sharing_session::handle_failure(const error& err) {
    // A requested suspension wins over whatever the transfer layer raised
    if (engine_->is_cancelled() || engine_->is_paused()) {
        return;
    }

    session_failure failure(err);
    if (is_user_suspension(failure.kind)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != session_state::downloading) {
            return;
        }
        state_ = session_state::error;
    }

    auto ctx = log_context();
    ctx.error_message = err.message;
    IMS_LOG_ERROR_CTX(log_category::session,
                      std::string("download failed (") + std::string(to_string(failure.kind)) +
                          ") for remote instance " + identity_.remote_instance_id,
                      ctx);

    persist_state(session_state::error);
    notify([this, &failure](session_listener& l) {
        l.on_transfer_error(identity_.session_id, failure);
    });
    deregister();
}

void file_sharing_session::send_displayed_report() {
    auto dispatcher = dispatcher_.lock();
    if (!dispatcher) {
        auto ctx = log_context();
        IMS_LOG_WARN_CTX(log_category::session, "no dispatcher for displayed report", ctx);
        return;
    }

    delivery_request request;
    request.contact = identity_.remote_contact;
    request.message_id = identity_.file_transfer_id;
    request.status = delivery_status::displayed;
    request.timestamp = std::chrono::system_clock::now();
    request.contribution_id = identity_.contribution_id;
    request.is_group = identity_.is_group;
    request.remote_instance_id = identity_.remote_instance_id;

    auto sent = dispatcher->report(request);
    if (!sent) {
        auto ctx = log_context();
        ctx.error_message = sent.error().message;
        IMS_LOG_WARN_CTX(log_category::session, "displayed report not sent", ctx);
    }
}

void file_sharing_session::deregister() {
    if (auto registry = registry_.lock()) {
        registry->remove_file_sharing_session(identity_.session_id);
    }
}

// ============================================================================
// Persistence
// ============================================================================

template <typename Fn>
void file_sharing_session::persist(const char* what, Fn&& write) {
    if (!log_) {
        return;
    }
    auto ctx = log_context();
    try {
        auto r = write(*log_);
        if (r) {
            return;
        }
        ctx.error_message = r.error().message;
    } catch (const std::exception& e) {
        ctx.error_message = e.what();
    } catch (...) {
        ctx.error_message = "unknown exception";
    }
    IMS_LOG_WARN_CTX(log_category::session, std::string("cannot record transfer ") + what, ctx);
}

void file_sharing_session::persist_state(session_state state) {
    persist("state", [this, state](messaging_log& log) {
        return log.set_file_transfer_state(identity_.file_transfer_id, state);
    });
}

void file_sharing_session::persist_progress(const transfer_progress& progress) {
    persist("progress", [this, &progress](messaging_log& log) {
        return log.set_file_transfer_progress(identity_.file_transfer_id, progress);
    });
}

void file_sharing_session::persist_location(const content_location& location) {
    persist("location", [this, &location](messaging_log& log) {
        return log.set_file_transfer_location(identity_.file_transfer_id, location);
    });
}

// ============================================================================
// Queries
// ============================================================================

auto file_sharing_session::state() const -> session_state {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto file_sharing_session::current_invitation_status() const -> invitation_status {
    std::lock_guard<std::mutex> lock(mutex_);
    return invitation_;
}

auto file_sharing_session::progress() const -> transfer_progress {
    return engine_->progress();
}

auto file_sharing_session::download_path() const -> const std::filesystem::path& {
    return engine_->destination();
}

auto file_sharing_session::download_state() const -> download_snapshot {
    return engine_->snapshot();
}

auto file_sharing_session::is_worker_active() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_active_locked();
}

auto file_sharing_session::wait_for_worker(std::chrono::milliseconds timeout) const -> bool {
    std::shared_future<void> worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker = worker_;
    }
    if (!worker.valid()) {
        return true;
    }
    return worker.wait_for(timeout) == std::future_status::ready;
}

auto file_sharing_session::is_initiated_by_remote() const -> bool {
    return identity_.direction == session_direction::terminating;
}

auto file_sharing_session::log_context() const -> session_log_context {
    session_log_context ctx;
    ctx.session_id = identity_.session_id;
    ctx.file_transfer_id = identity_.file_transfer_id;
    ctx.contact = identity_.remote_contact;
    if (!identity_.remote_instance_id.empty()) {
        ctx.remote_instance_id = identity_.remote_instance_id;
    }
    auto p = engine_->progress();
    ctx.bytes_transferred = p.bytes_transferred;
    ctx.total_bytes = p.total_bytes;
    return ctx;
}

// ============================================================================
// Listeners
// ============================================================================

void file_sharing_session::add_listener(std::shared_ptr<session_listener> listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void file_sharing_session::remove_listener(const std::shared_ptr<session_listener>& listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    std::erase(listeners_, listener);
}

}  // namespace kcenon::ims_session
