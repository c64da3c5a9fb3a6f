// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file network_http_adapter.cpp
 * @brief network_system implementation of http_adapter
 */

#include "kcenon/ims_session/download/network_http_adapter.h"

#include "kcenon/ims_session/config/feature_flags.h"
#include "kcenon/ims_session/core/logging.h"

#include <algorithm>
#include <cctype>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::ims_session {

struct network_http_adapter::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_head(
        const kcenon::network::internal::http_response& resp) -> http_response_head {
        http_response_head head;
        head.status_code = resp.status_code;
        for (const auto& [name, value] : resp.headers) {
            std::string lower = name;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            head.headers[lower] = value;
        }
        return head;
    }
#endif
};

network_http_adapter::network_http_adapter(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_adapter::~network_http_adapter() = default;

network_http_adapter::network_http_adapter(network_http_adapter&&) noexcept = default;
auto network_http_adapter::operator=(network_http_adapter&&) noexcept
    -> network_http_adapter& = default;

auto network_http_adapter::is_available() const -> bool {
    return impl_ && impl_->available;
}

auto network_http_adapter::get(const http_request& request,
                               const http_head_handler& on_head,
                               const http_body_sink& sink) -> result<http_response_head> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized, "HTTP client not initialized"}};
    }

    if (request.is_aborted && request.is_aborted()) {
        return unexpected{error{error_code::request_aborted, "request stopped: " + request.url}};
    }

    IMS_LOG_DEBUG(log_category::http, "GET " + request.url);

    auto response = impl_->client->get(request.url, {}, request.headers);
    if (response.is_err()) {
        return unexpected{error{error_code::transport_failure, "HTTP GET request failed"}};
    }

    const auto& resp = response.value();
    auto head = impl_->convert_head(resp);

    if (on_head && !on_head(head)) {
        return unexpected{error{error_code::request_aborted, "request stopped: " + request.url}};
    }

    if (request.is_aborted && request.is_aborted()) {
        return unexpected{error{error_code::request_aborted, "request stopped: " + request.url}};
    }

    if (sink && !resp.body.empty()) {
        auto data = std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(resp.body.data()), resp.body.size());
        if (!sink(data)) {
            return unexpected{
                error{error_code::request_aborted, "request stopped: " + request.url}};
        }
    }

    return head;
#else
    (void)request;
    (void)on_head;
    (void)sink;
    return unexpected{error{error_code::http_not_available,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

}  // namespace kcenon::ims_session
