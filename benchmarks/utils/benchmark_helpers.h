// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_IMS_SESSION_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_IMS_SESSION_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/ims_session/download/http_adapter.h>

#include <cstddef>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::ims_session::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Temporary directory removed on destruction
 */
class temp_directory {
public:
    temp_directory();
    ~temp_directory();

    temp_directory(const temp_directory&) = delete;
    auto operator=(const temp_directory&) -> temp_directory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief HTTP adapter serving an in-memory resource
 *
 * Honors "Range: bytes=N-" and delivers the body in fixed slices so the
 * download engine runs its normal write path without a network.
 */
class memory_http_adapter : public http_adapter {
public:
    memory_http_adapter(std::vector<std::byte> content, std::size_t slice_size);

    [[nodiscard]] auto get(const http_request& request,
                           const http_head_handler& on_head,
                           const http_body_sink& sink)
        -> result<http_response_head> override;

    [[nodiscard]] auto name() const -> std::string override { return "memory"; }

private:
    std::vector<std::byte> content_;
    std::size_t slice_size_;
};

/**
 * @brief Format bytes as human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 4 * MB;
constexpr std::size_t large_file = 32 * MB;

constexpr std::size_t http_slice = 16 * KB;
}  // namespace sizes

}  // namespace kcenon::ims_session::benchmark

#endif  // KCENON_IMS_SESSION_BENCHMARKS_BENCHMARK_HELPERS_H
