// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file delivery_report_dispatcher.h
 * @brief Chooses the transport for a delivery report and sends it
 */

#ifndef KCENON_IMS_SESSION_DELIVERY_DELIVERY_REPORT_DISPATCHER_H
#define KCENON_IMS_SESSION_DELIVERY_DELIVERY_REPORT_DISPATCHER_H

#include <kcenon/ims_session/core/types.h>
#include <kcenon/ims_session/delivery/delivery_status_sender.h>
#include <kcenon/ims_session/delivery/delivery_types.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace kcenon::ims_session {

class session_registry;

/**
 * @brief Sends delivery reports in-session when possible, out-of-band otherwise
 *
 * The counterpart chat session is looked up by contribution id for group
 * context and by contact for one-to-one. When it exists and its media path
 * is established the report goes over MSRP; otherwise, or when that send
 * fails, it goes out-of-band addressed with the remote instance id.
 * Each (message id, status) pair is dispatched at most once.
 */
class delivery_report_dispatcher {
public:
    delivery_report_dispatcher(std::shared_ptr<session_registry> registry,
                               std::shared_ptr<delivery_status_sender> sender);

    delivery_report_dispatcher(const delivery_report_dispatcher&) = delete;
    auto operator=(const delivery_report_dispatcher&) -> delivery_report_dispatcher& = delete;

    /**
     * @brief Dispatch one report
     * @return The report with its chosen transport, or
     *         - duplicate_delivery_report when already dispatched
     *         - delivery_send_failed when no transport accepted it
     */
    [[nodiscard]] auto report(const delivery_request& request) -> result<delivery_report>;

    [[nodiscard]] auto has_dispatched(const std::string& message_id,
                                      delivery_status status) const -> bool;

    [[nodiscard]] auto dispatched_count() const -> std::size_t;

private:
    using report_key = std::pair<std::string, delivery_status>;

    auto reserve(const report_key& key) -> bool;
    void release(const report_key& key);

    std::shared_ptr<session_registry> registry_;
    std::shared_ptr<delivery_status_sender> sender_;

    mutable std::mutex mutex_;
    std::set<report_key> dispatched_;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_DELIVERY_DELIVERY_REPORT_DISPATCHER_H
