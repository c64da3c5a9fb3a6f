// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file curl_http_adapter.cpp
 * @brief libcurl implementation of http_adapter
 */

#include "kcenon/ims_session/download/curl_http_adapter.h"

#include "kcenon/ims_session/core/logging.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <mutex>
#include <optional>

namespace kcenon::ims_session {

namespace {

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto trim(const std::string& value) -> std::string {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

/**
 * @brief RAII owner of a CURL easy handle
 */
class curl_easy_handle {
public:
    curl_easy_handle() : handle_(curl_easy_init()) {}
    ~curl_easy_handle() {
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }

    curl_easy_handle(const curl_easy_handle&) = delete;
    auto operator=(const curl_easy_handle&) -> curl_easy_handle& = delete;

    [[nodiscard]] auto get() const -> CURL* { return handle_; }
    [[nodiscard]] explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

/**
 * @brief RAII owner of a curl_slist
 */
class curl_header_list {
public:
    curl_header_list() = default;
    ~curl_header_list() {
        if (list_) {
            curl_slist_free_all(list_);
        }
    }

    curl_header_list(const curl_header_list&) = delete;
    auto operator=(const curl_header_list&) -> curl_header_list& = delete;

    void append(const std::string& line) {
        list_ = curl_slist_append(list_, line.c_str());
    }

    [[nodiscard]] auto get() const -> curl_slist* { return list_; }

private:
    curl_slist* list_ = nullptr;
};

/**
 * @brief Per-request state shared with the libcurl callbacks
 */
struct transfer_state {
    CURL* handle = nullptr;
    const http_request* request = nullptr;
    const http_head_handler* on_head = nullptr;
    const http_body_sink* sink = nullptr;
    http_response_head head;
    bool head_delivered = false;
    bool stopped = false;
    std::optional<std::string> fault;

    /**
     * @brief Record an exception raised by a handler; libcurl frames must not unwind
     */
    void capture_fault() {
        stopped = true;
        try {
            throw;
        } catch (const std::exception& e) {
            fault = e.what();
        } catch (...) {
            fault = "unknown exception";
        }
    }

    auto deliver_head() -> bool {
        if (head_delivered) {
            return true;
        }
        head_delivered = true;

        long code = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code);
        head.status_code = static_cast<int>(code);

        if (*on_head && !(*on_head)(head)) {
            stopped = true;
            return false;
        }
        return true;
    }
};

auto parse_header_line(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* state = static_cast<transfer_state*>(userdata);
    const size_t total = size * nitems;
    std::string line(buffer, total);

    // A new status line starts a new response (redirects, 100-continue)
    if (line.rfind("HTTP/", 0) == 0) {
        state->head.headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        state->head.headers[to_lower(trim(line.substr(0, colon)))] =
            trim(line.substr(colon + 1));
    }
    return total;
}

auto deliver_body(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* state = static_cast<transfer_state*>(userdata);
    const size_t total = size * nmemb;

    if (!state->deliver_head()) {
        return 0;
    }

    if (state->request->is_aborted && state->request->is_aborted()) {
        state->stopped = true;
        return 0;
    }

    if (*state->sink) {
        auto data = std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), total);
        if (!(*state->sink)(data)) {
            state->stopped = true;
            return 0;
        }
    }
    return total;
}

auto check_aborted(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
    auto* state = static_cast<transfer_state*>(clientp);
    if (state->request->is_aborted && state->request->is_aborted()) {
        state->stopped = true;
        return 1;
    }
    return 0;
}

auto header_callback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    try {
        return parse_header_line(buffer, size, nitems, userdata);
    } catch (...) {
        static_cast<transfer_state*>(userdata)->capture_fault();
        return 0;
    }
}

auto write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
    try {
        return deliver_body(ptr, size, nmemb, userdata);
    } catch (...) {
        static_cast<transfer_state*>(userdata)->capture_fault();
        return 0;
    }
}

auto progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal,
                       curl_off_t ulnow) -> int {
    try {
        return check_aborted(clientp, dltotal, dlnow, ultotal, ulnow);
    } catch (...) {
        static_cast<transfer_state*>(clientp)->capture_fault();
        return 1;
    }
}

}  // namespace

struct curl_http_adapter::impl {
    curl_http_options options;

    explicit impl(curl_http_options opts) : options(std::move(opts)) {}
};

curl_http_adapter::curl_http_adapter(curl_http_options options)
    : impl_(std::make_unique<impl>(std::move(options))) {
    ensure_curl_global_init();
}

curl_http_adapter::~curl_http_adapter() = default;

auto curl_http_adapter::get(const http_request& request,
                            const http_head_handler& on_head,
                            const http_body_sink& sink) -> result<http_response_head> {
    curl_easy_handle easy;
    if (!easy) {
        return unexpected(error{error_code::transport_failure, "curl_easy_init failed"});
    }

    transfer_state state;
    state.handle = easy.get();
    state.request = &request;
    state.on_head = &on_head;
    state.sink = &sink;

    curl_header_list header_list;
    for (const auto& [name, value] : request.headers) {
        header_list.append(name + ": " + value);
    }

    CURL* h = easy.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, impl_->options.follow_redirects ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, impl_->options.verify_peer ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, impl_->options.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(impl_->options.connect_timeout.count()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);

    IMS_LOG_DEBUG(log_category::http, "GET " + request.url);

    CURLcode rc = curl_easy_perform(h);

    if (state.fault) {
        return unexpected(error{error_code::unexpected_fault,
                                "handler failed: " + *state.fault});
    }

    if (state.stopped) {
        return unexpected(error{error_code::request_aborted, "request stopped: " + request.url});
    }

    if (rc != CURLE_OK) {
        return unexpected(error{error_code::transport_failure,
                                std::string("curl: ") + curl_easy_strerror(rc)});
    }

    // Empty bodies never reach the write callback
    if (!state.deliver_head()) {
        return unexpected(error{error_code::request_aborted, "request stopped: " + request.url});
    }

    return state.head;
}

}  // namespace kcenon::ims_session
