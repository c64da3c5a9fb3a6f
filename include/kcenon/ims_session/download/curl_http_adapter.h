// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file curl_http_adapter.h
 * @brief libcurl implementation of http_adapter
 */

#ifndef KCENON_IMS_SESSION_DOWNLOAD_CURL_HTTP_ADAPTER_H
#define KCENON_IMS_SESSION_DOWNLOAD_CURL_HTTP_ADAPTER_H

#include <kcenon/ims_session/download/http_adapter.h>

#include <memory>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief Options for curl_http_adapter
 */
struct curl_http_options {
    std::string user_agent = "ims-session/1.0";
    bool follow_redirects = true;
    bool verify_peer = true;
    std::chrono::milliseconds connect_timeout{10000};
};

/**
 * @brief http_adapter backed by libcurl easy handles
 *
 * Each get() uses its own easy handle, so one adapter can serve concurrent
 * sessions. curl_global_init runs once per process.
 */
class curl_http_adapter : public http_adapter {
public:
    explicit curl_http_adapter(curl_http_options options = {});
    ~curl_http_adapter() override;

    curl_http_adapter(const curl_http_adapter&) = delete;
    auto operator=(const curl_http_adapter&) -> curl_http_adapter& = delete;

    [[nodiscard]] auto get(const http_request& request,
                           const http_head_handler& on_head,
                           const http_body_sink& sink)
        -> result<http_response_head> override;

    [[nodiscard]] auto name() const -> std::string override { return "libcurl"; }

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_DOWNLOAD_CURL_HTTP_ADAPTER_H
