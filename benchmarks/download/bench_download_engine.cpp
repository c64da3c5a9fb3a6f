// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file bench_download_engine.cpp
 * @brief Benchmarks for the resumable download engine
 *
 * Measures the engine write path against an in-memory origin, with and
 * without digest verification, and the cost of a pause/resume cycle.
 */

#include <benchmark/benchmark.h>

#include <kcenon/ims_session/core/checksum.h>
#include <kcenon/ims_session/core/logging.h>
#include <kcenon/ims_session/download/download_engine.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::ims_session::benchmark {

namespace {

auto make_task(const std::filesystem::path& dir, std::size_t size, int64_t iteration)
    -> download_task {
    download_task task;
    task.transfer_id = "bench-" + std::to_string(iteration);
    task.uri = "https://ftcontent.example.com/bench";
    task.destination = dir / ("bench_" + std::to_string(iteration) + ".bin");
    task.total_size = size;
    return task;
}

}  // namespace

/**
 * @brief Full download of a resource, no digest announced
 */
static void BM_DownloadEngine_Fetch(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    get_logger().set_level(log_level::error);

    temp_directory dir;
    auto http = std::make_shared<memory_http_adapter>(generate_random_data(file_size, 42),
                                                      sizes::http_slice);

    int64_t iteration = 0;
    for (auto _ : state) {
        download_engine engine(http, make_task(dir.path(), file_size, iteration++));
        auto r = engine.fetch();
        if (!r) {
            state.SkipWithError(r.error().message.c_str());
            return;
        }

        state.PauseTiming();
        std::filesystem::remove(engine.destination());
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_DownloadEngine_Fetch)
    ->Arg(sizes::small_file)
    ->Arg(sizes::medium_file)
    ->Arg(sizes::large_file)
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Full download followed by SHA-256 verification of the stored file
 */
static void BM_DownloadEngine_FetchVerified(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    get_logger().set_level(log_level::error);

    temp_directory dir;
    auto content = generate_random_data(file_size, 42);
    auto digest = checksum::sha256(std::span<const std::byte>(content.data(), content.size()));
    auto http = std::make_shared<memory_http_adapter>(std::move(content), sizes::http_slice);

    int64_t iteration = 0;
    for (auto _ : state) {
        auto task = make_task(dir.path(), file_size, iteration++);
        task.expected_sha256 = digest;
        download_engine engine(http, std::move(task));
        auto r = engine.fetch();
        if (!r) {
            state.SkipWithError(r.error().message.c_str());
            return;
        }

        state.PauseTiming();
        std::filesystem::remove(engine.destination());
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_DownloadEngine_FetchVerified)
    ->Arg(sizes::small_file)
    ->Arg(sizes::medium_file)
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Pause half way, then resume with a Range request
 */
static void BM_DownloadEngine_PauseResume(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    get_logger().set_level(log_level::error);

    temp_directory dir;
    auto http = std::make_shared<memory_http_adapter>(generate_random_data(file_size, 42),
                                                      sizes::http_slice);

    int64_t iteration = 0;
    for (auto _ : state) {
        download_config config;
        config.chunk_size = sizes::http_slice;
        download_engine engine(http, make_task(dir.path(), file_size, iteration++), config);

        auto paused = engine.fetch([&engine, file_size](const transfer_progress& p) {
            if (p.bytes_transferred >= file_size / 2) {
                engine.pause_transfer_by_user();
            }
        });
        if (paused || !engine.is_paused()) {
            state.SkipWithError("download was not paused");
            return;
        }

        auto r = engine.resume_from();
        if (!r) {
            state.SkipWithError(r.error().message.c_str());
            return;
        }

        state.PauseTiming();
        std::filesystem::remove(engine.destination());
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_DownloadEngine_PauseResume)
    ->Arg(sizes::medium_file)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::ims_session::benchmark
