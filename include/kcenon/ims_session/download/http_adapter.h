// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file http_adapter.h
 * @brief Streaming HTTP GET abstraction used by the download engine
 */

#ifndef KCENON_IMS_SESSION_DOWNLOAD_HTTP_ADAPTER_H
#define KCENON_IMS_SESSION_DOWNLOAD_HTTP_ADAPTER_H

#include <kcenon/ims_session/core/types.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>

namespace kcenon::ims_session {

/**
 * @brief Outgoing GET request
 */
struct http_request {
    std::string url;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds timeout{30000};

    /// Polled while the transfer runs; returning true aborts it
    std::function<bool()> is_aborted;
};

/**
 * @brief Status line and headers of a response
 *
 * Header names are stored in lower case.
 */
struct http_response_head {
    int status_code = 0;
    std::map<std::string, std::string> headers;

    [[nodiscard]] auto header(const std::string& lower_name) const
        -> std::optional<std::string> {
        auto it = headers.find(lower_name);
        if (it == headers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Invoked once with the response head, before any body bytes
 *
 * Returning false stops the transfer without reading the body.
 */
using http_head_handler = std::function<bool(const http_response_head&)>;

/**
 * @brief Invoked for every received body fragment
 *
 * Returning false stops the transfer.
 */
using http_body_sink = std::function<bool(std::span<const std::byte>)>;

/**
 * @brief Streaming HTTP client interface
 *
 * Implementations must call the head handler before the first sink call and
 * must not retain the request after get() returns.
 */
class http_adapter {
public:
    virtual ~http_adapter() = default;

    /**
     * @brief Perform a GET request, streaming the body into the sink
     * @return Response head, or
     *         - request_aborted when the abort predicate, head handler or sink stopped it
     *         - transport_failure for network errors
     *         - http_not_available when no backend is compiled in
     */
    [[nodiscard]] virtual auto get(const http_request& request,
                                   const http_head_handler& on_head,
                                   const http_body_sink& sink)
        -> result<http_response_head> = 0;

    /**
     * @brief Backend name for diagnostics
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

}  // namespace kcenon::ims_session

#endif  // KCENON_IMS_SESSION_DOWNLOAD_HTTP_ADAPTER_H
