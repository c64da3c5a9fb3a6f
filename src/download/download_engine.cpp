// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file download_engine.cpp
 * @brief Implementation of download_engine
 */

#include "kcenon/ims_session/download/download_engine.h"

#include "kcenon/ims_session/core/checksum.h"
#include "kcenon/ims_session/core/error_codes.h"
#include "kcenon/ims_session/core/logging.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <fstream>
#include <mutex>
#include <system_error>

namespace kcenon::ims_session {

namespace {

enum class suspension : int {
    none = 0,
    paused = 1,
    cancelled = 2
};

struct content_range {
    uint64_t first = 0;
    std::optional<uint64_t> total;
};

// "bytes 400-999/1000" or "bytes 400-999/*"
auto parse_content_range(const std::string& value) -> std::optional<content_range> {
    constexpr std::string_view prefix = "bytes ";
    if (value.rfind(prefix, 0) != 0) {
        return std::nullopt;
    }

    auto dash = value.find('-', prefix.size());
    auto slash = value.find('/', prefix.size());
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) {
        return std::nullopt;
    }

    content_range range;
    try {
        range.first = std::stoull(value.substr(prefix.size(), dash - prefix.size()));
        auto total_str = value.substr(slash + 1);
        if (total_str != "*") {
            range.total = std::stoull(total_str);
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return range;
}

// "bytes */1000" as sent with 416 Range Not Satisfiable
auto parse_unsatisfied_range(const std::optional<std::string>& value)
    -> std::optional<uint64_t> {
    constexpr std::string_view prefix = "bytes */";
    if (!value || value->rfind(prefix, 0) != 0) {
        return std::nullopt;
    }
    try {
        return std::stoull(value->substr(prefix.size()));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto parse_length(const std::optional<std::string>& value) -> std::optional<uint64_t> {
    if (!value) {
        return std::nullopt;
    }
    try {
        return std::stoull(*value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

struct download_engine::impl {
    std::shared_ptr<http_adapter> http;
    download_task task;
    download_config config;

    std::atomic<int> suspend_flag{static_cast<int>(suspension::none)};
    std::atomic<uint64_t> offset{0};
    std::atomic<uint64_t> total_size{0};

    mutable std::mutex mutex;
    std::condition_variable suspend_cv;
    std::optional<std::string> etag;
    download_status status = download_status::pending;

    impl(std::shared_ptr<http_adapter> adapter, download_task t, download_config cfg)
        : http(std::move(adapter)), task(std::move(t)), config(std::move(cfg)) {
        total_size.store(task.total_size);
    }

    [[nodiscard]] auto current_suspension() const -> suspension {
        return static_cast<suspension>(suspend_flag.load());
    }

    [[nodiscard]] auto suspension_error() const -> result<void> {
        switch (current_suspension()) {
            case suspension::cancelled:
                return unexpected(error{error_code::transfer_cancelled});
            case suspension::paused:
                return unexpected(error{error_code::transfer_paused});
            default:
                return {};
        }
    }

    [[nodiscard]] auto log_context() const -> session_log_context {
        session_log_context ctx;
        ctx.file_transfer_id = task.transfer_id;
        ctx.bytes_transferred = offset.load();
        ctx.total_bytes = total_size.load();
        return ctx;
    }

    void set_status(download_status s) {
        std::lock_guard<std::mutex> lock(mutex);
        status = s;
    }

    void finish(const result<void>& r) {
        if (r) {
            set_status(download_status::completed);
            return;
        }
        switch (current_suspension()) {
            case suspension::cancelled:
                set_status(download_status::cancelled);
                break;
            case suspension::paused:
                set_status(download_status::paused);
                break;
            default:
                set_status(download_status::failed);
                break;
        }
    }

    /**
     * @brief Sleep before a retry; false when a suspension arrived meanwhile
     */
    auto wait_retry_delay() -> bool {
        std::unique_lock<std::mutex> lock(mutex);
        return !suspend_cv.wait_for(lock, config.retry_delay, [this] {
            return current_suspension() != suspension::none;
        });
    }

    auto prepare_destination(uint64_t from) -> result<std::ofstream> {
        std::error_code ec;
        auto parent = task.destination.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return unexpected(error{error_code::file_write_error,
                                        "cannot create directory: " + parent.string()});
            }
        }

        if (from == 0) {
            std::ofstream out(task.destination, std::ios::binary | std::ios::trunc);
            if (!out) {
                return unexpected(error{error_code::file_write_error,
                                        "cannot open file: " + task.destination.string()});
            }
            return std::move(out);
        }

        auto existing = std::filesystem::file_size(task.destination, ec);
        if (ec || existing < from) {
            return unexpected(error{error_code::transfer_incomplete,
                                    "partial file lost: " + task.destination.string()});
        }

        // Drop anything past the preserved offset so nothing is duplicated
        std::filesystem::resize_file(task.destination, from, ec);
        if (ec) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot truncate file: " + ec.message()});
        }

        std::ofstream out(task.destination, std::ios::binary | std::ios::app);
        if (!out) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot open file: " + task.destination.string()});
        }
        return std::move(out);
    }

    /**
     * @brief One HTTP request from the current offset
     */
    auto run_attempt(const download_progress_callback& on_progress) -> result<void> {
        if (auto s = suspension_error(); !s) {
            return s;
        }

        const uint64_t from = offset.load();
        const uint64_t known_total = total_size.load();
        if (from > 0 && known_total > 0 && from >= known_total) {
            IMS_LOG_DEBUG(log_category::download, "offset already at total size, no request");
            return {};
        }

        auto file = prepare_destination(from);
        if (!file) {
            return unexpected(file.error());
        }
        std::ofstream& out = file.value();

        std::optional<std::string> known_etag;
        {
            std::lock_guard<std::mutex> lock(mutex);
            known_etag = etag;
        }

        http_request request;
        request.url = task.uri;
        request.timeout = config.request_timeout;
        request.headers["User-Agent"] = config.user_agent;
        if (from > 0) {
            request.headers["Range"] = "bytes=" + std::to_string(from) + "-";
            if (known_etag) {
                request.headers["If-Range"] = *known_etag;
            }
        }
        request.is_aborted = [this] { return current_suspension() != suspension::none; };

        std::optional<error> head_error;
        bool already_complete = false;
        bool write_failed = false;

        auto on_head = [&](const http_response_head& head) -> bool {
            const int status_code = head.status_code;

            if (status_code == 404 || status_code == 410) {
                head_error = error{error_code::transfer_incomplete,
                                   "resource absent (HTTP " + std::to_string(status_code) + ")"};
                return false;
            }

            if (status_code == 416 && from > 0) {
                auto total = parse_unsatisfied_range(head.header("content-range"));
                if (total && *total == from) {
                    total_size.store(from);
                    already_complete = true;
                    return false;
                }
            }

            if (!head.is_success()) {
                head_error = error{error_code::transport_failure,
                                   "unexpected HTTP status " + std::to_string(status_code)};
                return false;
            }

            auto server_etag = head.header("etag");

            if (from > 0) {
                if (status_code != 206) {
                    head_error = error{error_code::resource_changed,
                                       "server ignored range request (HTTP " +
                                           std::to_string(status_code) + ")"};
                    return false;
                }
                if (known_etag && server_etag && *server_etag != *known_etag) {
                    head_error = error{error_code::resource_changed,
                                       "entity tag changed from " + *known_etag + " to " +
                                           *server_etag};
                    return false;
                }
            }

            if (status_code == 206) {
                auto range_header = head.header("content-range");
                auto range = range_header ? parse_content_range(*range_header) : std::nullopt;
                if (!range || range->first != from) {
                    head_error = error{error_code::transport_failure,
                                       "unexpected Content-Range: " +
                                           range_header.value_or("<none>")};
                    return false;
                }
                if (range->total && total_size.load() == 0) {
                    total_size.store(*range->total);
                }
            } else if (total_size.load() == 0) {
                if (auto length = parse_length(head.header("content-length"))) {
                    total_size.store(*length);
                }
            }

            if (server_etag) {
                std::lock_guard<std::mutex> lock(mutex);
                if (!etag) {
                    etag = server_etag;
                }
            }
            return true;
        };

        auto sink = [&](std::span<const std::byte> data) -> bool {
            const std::size_t slice = config.chunk_size;
            std::size_t pos = 0;
            while (pos < data.size()) {
                if (current_suspension() != suspension::none) {
                    return false;
                }
                const std::size_t len = std::min(slice, data.size() - pos);
                out.write(reinterpret_cast<const char*>(data.data() + pos),
                          static_cast<std::streamsize>(len));
                if (!out) {
                    write_failed = true;
                    return false;
                }
                pos += len;
                offset.fetch_add(len);
                if (on_progress) {
                    on_progress(transfer_progress{offset.load(), total_size.load()});
                }
            }
            return true;
        };

        auto response = http->get(request, on_head, sink);
        out.flush();

        if (auto s = suspension_error(); !s) {
            return s;
        }
        if (head_error) {
            return unexpected(*head_error);
        }
        if (already_complete) {
            return {};
        }
        if (write_failed || !out) {
            return unexpected(error{error_code::file_write_error,
                                    "write failed: " + task.destination.string()});
        }
        if (!response) {
            return unexpected(response.error());
        }
        return {};
    }

    /**
     * @brief run_with_retries with any exception turned into unexpected_fault
     */
    auto run_guarded(const download_progress_callback& on_progress) -> result<void> {
        try {
            return run_with_retries(on_progress);
        } catch (const std::exception& e) {
            return unexpected(error{error_code::unexpected_fault, e.what()});
        } catch (...) {
            return unexpected(error{error_code::unexpected_fault, "unknown exception"});
        }
    }

    auto run_with_retries(const download_progress_callback& on_progress) -> result<void> {
        auto r = run_attempt(on_progress);

        std::size_t attempt = 0;
        while (!r && is_retryable(r.error().code) && attempt < config.max_retries) {
            ++attempt;
            auto ctx = log_context();
            ctx.error_message = r.error().message;
            IMS_LOG_WARN_CTX(log_category::download,
                             "transport failure, retry " + std::to_string(attempt) + "/" +
                                 std::to_string(config.max_retries),
                             ctx);
            if (!wait_retry_delay()) {
                return suspension_error();
            }
            r = run_attempt(on_progress);
        }

        if (!r) {
            return r;
        }
        return verify_completion();
    }

    auto verify_completion() -> result<void> {
        std::error_code ec;
        if (!std::filesystem::exists(task.destination, ec)) {
            return unexpected(error{error_code::transfer_incomplete,
                                    "downloaded file missing: " + task.destination.string()});
        }

        const uint64_t total = total_size.load();
        if (total > 0) {
            auto on_disk = std::filesystem::file_size(task.destination, ec);
            if (ec || offset.load() != total || on_disk != total) {
                return unexpected(error{
                    error_code::transfer_incomplete,
                    "received " + std::to_string(offset.load()) + " of " +
                        std::to_string(total) + " bytes"});
            }
        }

        if (config.verify_checksum && task.expected_sha256) {
            if (!checksum::verify_sha256(task.destination, *task.expected_sha256)) {
                return unexpected(error{error_code::file_hash_mismatch,
                                        "SHA-256 mismatch for " + task.destination.string()});
            }
        }
        return {};
    }
};

download_engine::download_engine(std::shared_ptr<http_adapter> http,
                                 download_task task,
                                 download_config config)
    : impl_(std::make_unique<impl>(std::move(http), std::move(task), std::move(config))) {}

download_engine::~download_engine() = default;

auto download_engine::fetch(const download_progress_callback& on_progress) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->status != download_status::pending) {
            return unexpected(error{error_code::invalid_state_transition,
                                    std::string("fetch from status ") +
                                        to_string(impl_->status)});
        }
        impl_->status = download_status::active;
    }

    if (!impl_->http) {
        result<void> r = unexpected(error{error_code::http_not_available,
                                          "no HTTP adapter configured"});
        impl_->finish(r);
        return r;
    }

    impl_->offset.store(0);
    auto ctx = impl_->log_context();
    IMS_LOG_DEBUG_CTX(log_category::download, "fetch " + impl_->task.uri, ctx);

    auto r = impl_->run_guarded(on_progress);
    impl_->finish(r);
    return r;
}

auto download_engine::resume_from(const download_progress_callback& on_progress)
    -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->status == download_status::active ||
            impl_->status == download_status::completed) {
            return unexpected(error{error_code::invalid_state_transition,
                                    std::string("resume from status ") +
                                        to_string(impl_->status)});
        }
        impl_->status = download_status::active;
    }

    // Only a pause is lifted; a cancel stays in force
    int expected = static_cast<int>(suspension::paused);
    impl_->suspend_flag.compare_exchange_strong(expected, static_cast<int>(suspension::none));

    if (!impl_->http) {
        result<void> r = unexpected(error{error_code::http_not_available,
                                          "no HTTP adapter configured"});
        impl_->finish(r);
        return r;
    }

    auto ctx = impl_->log_context();
    IMS_LOG_DEBUG_CTX(log_category::download,
                      "resume " + impl_->task.uri + " from " +
                          std::to_string(impl_->offset.load()),
                      ctx);

    auto r = impl_->run_guarded(on_progress);
    impl_->finish(r);
    return r;
}

void download_engine::pause_transfer_by_user() {
    int expected = static_cast<int>(suspension::none);
    if (impl_->suspend_flag.compare_exchange_strong(expected,
                                                    static_cast<int>(suspension::paused))) {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->status == download_status::pending) {
            impl_->status = download_status::paused;
        }
        impl_->suspend_cv.notify_all();
    }
}

void download_engine::cancel() {
    impl_->suspend_flag.store(static_cast<int>(suspension::cancelled));
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->status != download_status::active &&
        impl_->status != download_status::completed) {
        impl_->status = download_status::cancelled;
    }
    impl_->suspend_cv.notify_all();
}

auto download_engine::is_paused() const -> bool {
    return impl_->current_suspension() == suspension::paused;
}

auto download_engine::is_cancelled() const -> bool {
    return impl_->current_suspension() == suspension::cancelled;
}

auto download_engine::status() const -> download_status {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->status;
}

auto download_engine::progress() const -> transfer_progress {
    return transfer_progress{impl_->offset.load(), impl_->total_size.load()};
}

auto download_engine::snapshot() const -> download_snapshot {
    download_snapshot snap;
    snap.task = impl_->task;
    snap.task.total_size = impl_->total_size.load();
    snap.offset = impl_->offset.load();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    snap.etag = impl_->etag;
    snap.status = impl_->status;
    return snap;
}

auto download_engine::destination() const -> const std::filesystem::path& {
    return impl_->task.destination;
}

}  // namespace kcenon::ims_session
