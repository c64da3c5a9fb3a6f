// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool.h
 * @brief Worker pool abstraction for session workers
 *
 * Every session attempt (initial download or resume) runs as one task.
 * Supports thread_system integration and a standalone fallback.
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::ims_session::adapters {

/**
 * @brief Interface for submitting session work
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @param name Task name for diagnostics
     * @return Future for the task completion
     *
     * The returned future must not block in its destructor, so a task may
     * release the last reference to the object that holds its future.
     */
    virtual std::future<void> submit(std::function<void()> task,
                                     const std::string& name = "session_task") = 0;

    /**
     * @brief Get the number of worker threads (0 = unbounded)
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted and not yet finished
     */
    [[nodiscard]] virtual size_t active_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Worker pool backed by thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    explicit thread_system_worker_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "ims_session_pool",
        size_t worker_count = 0);

    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    /**
     * @brief Create a started pool
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "ims_session_pool");

    std::future<void> submit(std::function<void()> task,
                             const std::string& name = "session_task") override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t active_tasks() const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool running each task on its own detached thread
 *
 * Completion is reported through a promise, never through a std::async
 * future.
 */
class thread_per_task_pool : public worker_pool_interface {
public:
    thread_per_task_pool();
    ~thread_per_task_pool() override;

    thread_per_task_pool(const thread_per_task_pool&) = delete;
    thread_per_task_pool& operator=(const thread_per_task_pool&) = delete;

    std::future<void> submit(std::function<void()> task,
                             const std::string& name = "session_task") override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t active_tasks() const override;

private:
    std::shared_ptr<std::atomic<size_t>> active_;
};

/**
 * @brief Factory selecting the best available worker pool
 *
 * 1. thread_system_worker_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. thread_per_task_pool (fallback)
 */
class worker_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "ims_session_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::ims_session::adapters
