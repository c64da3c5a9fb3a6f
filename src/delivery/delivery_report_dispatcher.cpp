// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file delivery_report_dispatcher.cpp
 * @brief Implementation of delivery_report_dispatcher
 */

#include "kcenon/ims_session/delivery/delivery_report_dispatcher.h"

#include "kcenon/ims_session/core/logging.h"
#include "kcenon/ims_session/session/session_registry.h"

namespace kcenon::ims_session {

delivery_report_dispatcher::delivery_report_dispatcher(
    std::shared_ptr<session_registry> registry, std::shared_ptr<delivery_status_sender> sender)
    : registry_(std::move(registry)), sender_(std::move(sender)) {}

auto delivery_report_dispatcher::reserve(const report_key& key) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return dispatched_.insert(key).second;
}

void delivery_report_dispatcher::release(const report_key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    dispatched_.erase(key);
}

auto delivery_report_dispatcher::report(const delivery_request& request)
    -> result<delivery_report> {
    if (request.message_id.empty()) {
        return unexpected(error{error_code::invalid_argument, "empty message id"});
    }

    const report_key key{request.message_id, request.status};
    if (!reserve(key)) {
        return unexpected(error{error_code::duplicate_delivery_report,
                                std::string(to_string(request.status)) +
                                    " report already sent for " + request.message_id});
    }

    session_log_context ctx;
    ctx.file_transfer_id = request.message_id;
    ctx.contact = request.contact;
    ctx.remote_instance_id = request.remote_instance_id;

    delivery_report sent;
    sent.message_id = request.message_id;
    sent.status = request.status;
    sent.timestamp = request.timestamp;

    std::shared_ptr<chat_session> counterpart;
    if (registry_) {
        if (request.is_group) {
            if (request.contribution_id) {
                counterpart = registry_->find_group_chat_session(*request.contribution_id);
            }
        } else {
            counterpart = registry_->find_one_to_one_chat_session(request.contact);
        }
    }

    if (counterpart && counterpart->is_media_established()) {
        auto r = counterpart->send_msrp_delivery_status(request.contact, request.message_id,
                                                        request.status, request.timestamp);
        if (r) {
            sent.transport = delivery_transport::in_session;
            IMS_LOG_DEBUG_CTX(log_category::delivery,
                              std::string("sent ") + to_string(request.status) +
                                  " report in session",
                              ctx);
            return sent;
        }
        ctx.error_message = r.error().message;
        IMS_LOG_WARN_CTX(log_category::delivery,
                         "in-session report failed, falling back to out-of-band", ctx);
    }

    if (!sender_) {
        release(key);
        return unexpected(error{error_code::delivery_send_failed,
                                "no out-of-band delivery sender configured"});
    }

    auto r = sender_->send_delivery_status_immediately(request.contact, request.message_id,
                                                       request.status,
                                                       request.remote_instance_id,
                                                       request.timestamp);
    if (!r) {
        release(key);
        ctx.error_message = r.error().message;
        IMS_LOG_ERROR_CTX(log_category::delivery, "out-of-band report failed", ctx);
        return unexpected(error{error_code::delivery_send_failed, r.error().message});
    }

    sent.transport = delivery_transport::out_of_band;
    IMS_LOG_DEBUG_CTX(log_category::delivery,
                      std::string("sent ") + to_string(request.status) + " report out-of-band",
                      ctx);
    return sent;
}

auto delivery_report_dispatcher::has_dispatched(const std::string& message_id,
                                                delivery_status status) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return dispatched_.count(report_key{message_id, status}) > 0;
}

auto delivery_report_dispatcher::dispatched_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return dispatched_.size();
}

}  // namespace kcenon::ims_session
