/**
 * @file transfer_runner.h
 * @brief Executor run wired to a progress aggregator
 */

#ifndef KCENON_CUBE_TRANSFER_TRANSFER_RUNNER_H
#define KCENON_CUBE_TRANSFER_TRANSFER_RUNNER_H

#include <cstddef>
#include <memory>

#include "kcenon/cube/adapters/thread_pool_adapter.h"
#include "kcenon/cube/core/types.h"
#include "kcenon/cube/transfer/progress_aggregator.h"
#include "kcenon/cube/transfer/task_source.h"
#include "kcenon/cube/transfer/transfer_types.h"

namespace kcenon::cube {

/**
 * @brief Run tasks with a progress aggregator consuming their events
 *
 * The aggregator runs on its own thread for the duration of the run. When
 * @p renderer is null and config.hidden is false, progress is drawn on
 * stderr by a console_progress_renderer.
 *
 * @param pool Worker pool; created by worker_pool_factory when null
 */
[[nodiscard]] auto run_transfers(transfer_task_source& source,
                                 std::size_t declared_length,
                                 const transfer_config& config,
                                 std::shared_ptr<progress_renderer> renderer = nullptr,
                                 std::shared_ptr<adapters::transfer_worker_pool> pool = nullptr)
    -> result<executor_summary>;

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_TRANSFER_TRANSFER_RUNNER_H
