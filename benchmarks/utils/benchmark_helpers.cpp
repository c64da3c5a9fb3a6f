// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace kcenon::ims_session::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

// temp_directory implementation

temp_directory::temp_directory() {
    path_ = std::filesystem::temp_directory_path() /
            ("ims_session_bench_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(path_);
}

temp_directory::~temp_directory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

// memory_http_adapter implementation

memory_http_adapter::memory_http_adapter(std::vector<std::byte> content, std::size_t slice_size)
    : content_(std::move(content)), slice_size_(std::max<std::size_t>(slice_size, 1)) {}

auto memory_http_adapter::get(const http_request& request,
                              const http_head_handler& on_head,
                              const http_body_sink& sink) -> result<http_response_head> {
    http_response_head head;
    head.headers["etag"] = "\"bench\"";

    uint64_t from = 0;
    if (auto range = request.headers.find("Range"); range != request.headers.end()) {
        from = std::stoull(range->second.substr(std::string("bytes=").size()));
    }

    if (from >= content_.size() && from > 0) {
        head.status_code = 416;
        head.headers["content-range"] = "bytes */" + std::to_string(content_.size());
        on_head(head);
        return head;
    }

    if (from > 0) {
        head.status_code = 206;
        head.headers["content-range"] = "bytes " + std::to_string(from) + "-" +
                                        std::to_string(content_.size() - 1) + "/" +
                                        std::to_string(content_.size());
    } else {
        head.status_code = 200;
        head.headers["content-length"] = std::to_string(content_.size());
    }

    if (!on_head(head)) {
        return head;
    }

    for (uint64_t pos = from; pos < content_.size();) {
        if (request.is_aborted && request.is_aborted()) {
            return unexpected(error{error_code::request_aborted, "aborted"});
        }
        auto len = std::min<uint64_t>(slice_size_, content_.size() - pos);
        if (!sink(std::span<const std::byte>(content_.data() + pos, len))) {
            return unexpected(error{error_code::request_aborted, "aborted by sink"});
        }
        pos += len;
    }
    return head;
}

// Formatting utilities

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(sizes::MB) << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(sizes::KB) << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace kcenon::ims_session::benchmark
