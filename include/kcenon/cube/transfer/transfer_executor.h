/**
 * @file transfer_executor.h
 * @brief Runs transfer tasks with bounded concurrency
 */

#ifndef KCENON_CUBE_TRANSFER_TRANSFER_EXECUTOR_H
#define KCENON_CUBE_TRANSFER_TRANSFER_EXECUTOR_H

#include <cstddef>
#include <memory>

#include "kcenon/cube/adapters/thread_pool_adapter.h"
#include "kcenon/cube/core/types.h"
#include "kcenon/cube/transfer/event_channel.h"
#include "kcenon/cube/transfer/task_source.h"
#include "kcenon/cube/transfer/transfer_types.h"

namespace kcenon::cube {

/**
 * @brief Bounded transfer executor
 *
 * run() pulls tasks from a source and keeps at most concurrency of them on
 * the worker pool. Completions come back through an event_channel and are
 * counted against the length the caller declared:
 * - more completions than declared fails with executor_overfull as soon as
 *   it happens,
 * - an exhausted source with fewer completions fails with executor_underfull.
 *
 * A fatal error (a task error the failure_policy does not isolate, a source
 * error, or overfull) stops dispatch at once. Tasks already running are
 * waited for, then the error is returned.
 *
 * When an event channel is attached, the executor sends transfer_start
 * before a task is submitted, the task's transfer_chunk events while it
 * runs, and transfer_done when its completion is received. The channel is
 * not closed by the executor.
 *
 * @code
 * auto events = std::make_shared<event_channel<transfer_event>>();
 * transfer_executor executor(executor_config{3}, events);
 * vector_task_source source(std::move(tasks));
 * auto summary = executor.run(source, tasks_count);
 * @endcode
 */
class transfer_executor {
public:
    /**
     * @param config Concurrency bound and failure policy
     * @param events Optional channel for progress events
     * @param pool Worker pool; created by worker_pool_factory when null
     */
    explicit transfer_executor(
        executor_config config,
        std::shared_ptr<event_channel<transfer_event>> events = nullptr,
        std::shared_ptr<adapters::transfer_worker_pool> pool = nullptr);

    ~transfer_executor();

    transfer_executor(const transfer_executor&) = delete;
    auto operator=(const transfer_executor&) -> transfer_executor& = delete;
    transfer_executor(transfer_executor&&) noexcept;
    auto operator=(transfer_executor&&) noexcept -> transfer_executor&;

    /**
     * @brief Run every task of @p source
     * @param declared_length Number of tasks the source is expected to yield
     */
    [[nodiscard]] auto run(transfer_task_source& source, std::size_t declared_length)
        -> result<executor_summary>;

    [[nodiscard]] auto config() const -> const executor_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_TRANSFER_TRANSFER_EXECUTOR_H
