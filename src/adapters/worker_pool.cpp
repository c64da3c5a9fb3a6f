// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool.cpp
 * @brief Worker pool implementations for ims_session_system
 */

#include "kcenon/ims_session/adapters/worker_pool.h"

#include <exception>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::ims_session::adapters {

namespace {

/**
 * @brief Run a task, release its active slot, then complete the promise
 */
void run_and_complete(const std::function<void()>& task,
                      std::promise<void>& promise,
                      std::atomic<size_t>& active) {
    std::exception_ptr failure;
    try {
        task();
    } catch (...) {
        failure = std::current_exception();
    }
    active.fetch_sub(1, std::memory_order_relaxed);
    if (failure) {
        promise.set_exception(failure);
    } else {
        promise.set_value();
    }
}

}  // namespace

// ============================================================================
// thread_system_worker_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<std::atomic<size_t>> active = std::make_shared<std::atomic<size_t>>(0);
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_worker_pool::~thread_system_worker_pool() = default;

std::shared_ptr<thread_system_worker_pool>
thread_system_worker_pool::create_default(size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) {
            worker_count = 4;
        }
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_worker_pool::submit(std::function<void()> task,
                                                    const std::string& name) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto active = pimpl_->active;
    active->fetch_add(1, std::memory_order_relaxed);

    auto wrapped_task = [task = std::move(task), promise, active]() {
        run_and_complete(task, *promise, *active);
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), name);
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_worker_pool::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_worker_pool::active_tasks() const {
    return pimpl_->active->load(std::memory_order_relaxed);
}

std::shared_ptr<kcenon::thread::thread_pool> thread_system_worker_pool::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// thread_per_task_pool implementation
// ============================================================================

thread_per_task_pool::thread_per_task_pool()
    : active_(std::make_shared<std::atomic<size_t>>(0)) {}

thread_per_task_pool::~thread_per_task_pool() = default;

std::future<void> thread_per_task_pool::submit(std::function<void()> task,
                                               const std::string& /*name*/) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto active = active_;
    active->fetch_add(1, std::memory_order_relaxed);

    std::thread([task = std::move(task), promise, active]() {
        run_and_complete(task, *promise, *active);
    }).detach();

    return future;
}

size_t thread_per_task_pool::worker_count() const { return 0; }

bool thread_per_task_pool::is_running() const { return true; }

size_t thread_per_task_pool::active_tasks() const {
    return active_->load(std::memory_order_relaxed);
}

// ============================================================================
// worker_pool_factory implementation
// ============================================================================

std::shared_ptr<worker_pool_interface> worker_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<thread_per_task_pool>();
#endif
}

}  // namespace kcenon::ims_session::adapters
