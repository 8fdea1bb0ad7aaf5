// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool used to run transfer tasks
 *
 * Transfer tasks run on thread_system's thread_pool when the library is
 * built with it, and on std::async otherwise. The executor decides how many
 * tasks are in flight; the pool only runs what it is given.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::cube::adapters {

/**
 * @brief Interface for the pool that runs transfer tasks
 */
class transfer_worker_pool {
public:
    virtual ~transfer_worker_pool() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion; it carries any exception the task threw
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Number of submitted tasks that have not finished yet
     */
    [[nodiscard]] virtual size_t active_tasks() const = 0;

    /**
     * @brief Wait for submitted tasks and release the workers
     */
    virtual void shutdown() = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that runs transfer tasks on thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public transfer_worker_pool {
public:
    /**
     * @brief Construct with an existing, started thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_worker_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        size_t worker_count = 0);

    ~thread_system_worker_pool() override;

    // Non-copyable
    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    /**
     * @brief Create a pool with its own workers
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification in thread_system diagnostics
     * @return Shared pointer to the adapter
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> create(
        size_t worker_count = 0,
        const std::string& pool_name = "cube_transfer_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] size_t active_tasks() const override;
    void shutdown() override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every task gets its own thread, so worker_count() reports the hardware
 * concurrency only as a hint.
 */
class async_worker_pool : public transfer_worker_pool {
public:
    async_worker_pool();
    ~async_worker_pool() override;

    // Non-copyable, non-movable
    async_worker_pool(const async_worker_pool&) = delete;
    async_worker_pool& operator=(const async_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] size_t active_tasks() const override;
    void shutdown() override;

private:
    std::shared_ptr<std::atomic<size_t>> active_;
};

/**
 * @brief Factory for creating the worker pool
 *
 * Selects thread_system_worker_pool when KCENON_WITH_THREAD_SYSTEM is set
 * and async_worker_pool otherwise.
 */
class worker_pool_factory {
public:
    /**
     * @brief Create the best available worker pool
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     * @return Shared pointer to the pool
     */
    [[nodiscard]] static std::shared_ptr<transfer_worker_pool> create(
        size_t worker_count = 0,
        const std::string& pool_name = "cube_transfer_pool");

    /**
     * @brief Check if thread_system is available
     * @return true if thread_system can be used
     */
    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::cube::adapters
