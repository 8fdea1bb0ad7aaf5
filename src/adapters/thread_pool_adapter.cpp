// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementation for cube_client_system
 */

#include "kcenon/cube/adapters/thread_pool_adapter.h"

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

namespace kcenon::cube::adapters {

namespace {

auto default_worker_count() -> size_t {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

// Decrements the active counter when a task finishes, however it finishes.
class active_task_guard {
public:
    explicit active_task_guard(std::atomic<size_t>& counter) : counter_(counter) {
        counter_.fetch_add(1, std::memory_order_relaxed);
    }
    ~active_task_guard() { counter_.fetch_sub(1, std::memory_order_relaxed); }

    active_task_guard(const active_task_guard&) = delete;
    active_task_guard& operator=(const active_task_guard&) = delete;

private:
    std::atomic<size_t>& counter_;
};

}  // namespace

// ============================================================================
// thread_system_worker_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs one transfer task and fulfils its promise
 */
class transfer_job : public kcenon::thread::job {
public:
    transfer_job(std::function<void()> func, std::shared_ptr<std::promise<void>> promise)
        : job("cube_transfer_task"), func_(std::move(func)), promise_(std::move(promise)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        try {
            func_();
            promise_->set_value();
        } catch (...) {
            // The exception travels to the executor through the future.
            promise_->set_exception(std::current_exception());
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
    std::shared_ptr<std::promise<void>> promise_;
};

// Implementation struct for thread_system_worker_pool
struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    size_t worker_count{0};
    std::shared_ptr<std::atomic<size_t>> active = std::make_shared<std::atomic<size_t>>(0);
    std::atomic<bool> stopped{false};
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->worker_count = worker_count;
}

thread_system_worker_pool::~thread_system_worker_pool() {
    shutdown();
}

std::shared_ptr<thread_system_worker_pool>
thread_system_worker_pool::create(size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = default_worker_count();
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), worker_count);
}

std::future<void> thread_system_worker_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto active = pimpl_->active;
    auto counted = [task = std::move(task), active]() {
        active_task_guard guard(*active);
        task();
    };

    pimpl_->pool->enqueue(std::make_unique<transfer_job>(std::move(counted), promise));
    return future;
}

size_t thread_system_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

size_t thread_system_worker_pool::active_tasks() const {
    return pimpl_->active->load(std::memory_order_relaxed);
}

void thread_system_worker_pool::shutdown() {
    if (pimpl_ && pimpl_->pool && !pimpl_->stopped.exchange(true)) {
        pimpl_->pool->stop(false);
    }
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_worker_pool implementation
// ============================================================================

async_worker_pool::async_worker_pool()
    : active_(std::make_shared<std::atomic<size_t>>(0)) {}

async_worker_pool::~async_worker_pool() = default;

std::future<void> async_worker_pool::submit(std::function<void()> task) {
    return std::async(std::launch::async,
                      [active = active_, task = std::move(task)]() {
                          active_task_guard guard(*active);
                          task();
                      });
}

size_t async_worker_pool::worker_count() const {
    return default_worker_count();
}

size_t async_worker_pool::active_tasks() const {
    return active_->load(std::memory_order_relaxed);
}

void async_worker_pool::shutdown() {
    // Futures returned by std::async wait for their task on destruction.
}

// ============================================================================
// worker_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_worker_pool> worker_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_worker_pool>();
#endif
}

}  // namespace kcenon::cube::adapters
