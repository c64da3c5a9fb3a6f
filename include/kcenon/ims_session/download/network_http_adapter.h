// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file network_http_adapter.h
 * @brief network_system implementation of http_adapter
 */

#ifndef KCENON_IMS_SESSION_DOWNLOAD_NETWORK_HTTP_ADAPTER_H
#define KCENON_IMS_SESSION_DOWNLOAD_NETWORK_HTTP_ADAPTER_H

#include <kcenon/ims_session/download/http_adapter.h>

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief http_adapter backed by kcenon network_system http_client
 *
 * network_system buffers the whole response; the body is handed to the sink
 * in one fragment after the head. Without BUILD_WITH_NETWORK_SYSTEM every
 * request fails with http_not_available.
 */
class network_http_adapter : public http_adapter {
public:
    explicit network_http_adapter(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    ~network_http_adapter() override;

    network_http_adapter(network_http_adapter&&) noexcept;
    auto operator=(network_http_adapter&&) noexcept -> network_http_adapter&;

    [[nodiscard]] auto get(const http_request& request,
                           const http_head_handler& on_head,
                           const http_body_sink& sink)
        -> result<http_response_head> override;

    [[nodiscard]] auto name() const -> std::string override { return "network_system"; }

    /**
     * @brief Check whether network_system support is compiled in
     */
    [[nodiscard]] auto is_available() const -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_DOWNLOAD_NETWORK_HTTP_ADAPTER_H
