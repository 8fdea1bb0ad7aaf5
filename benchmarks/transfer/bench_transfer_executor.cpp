/**
 * @file bench_transfer_executor.cpp
 * @brief Benchmarks for the bounded transfer executor and progress aggregation
 */

#include <benchmark/benchmark.h>

#include <kcenon/cube/transfer/event_channel.h>
#include <kcenon/cube/transfer/progress_aggregator.h>
#include <kcenon/cube/transfer/task_source.h>
#include <kcenon/cube/transfer/transfer_executor.h>

#include "utils/benchmark_helpers.h"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace kcenon::cube::benchmark {

namespace {

auto make_tasks(std::size_t count, uint64_t size, std::chrono::microseconds delay)
    -> std::vector<transfer_task> {
    std::vector<transfer_task> tasks;
    tasks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        transfer_task task;
        task.name = "file_" + std::to_string(i);
        task.size = size;
        task.work = [size, delay](const chunk_reporter& report) -> result<uint64_t> {
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            report(size);
            return size;
        };
        tasks.push_back(std::move(task));
    }
    return tasks;
}

}  // namespace

/**
 * @brief Dispatch overhead for tasks that do no work
 */
static void BM_Executor_EmptyTasks(::benchmark::State& state) {
    const auto task_count = static_cast<std::size_t>(state.range(0));
    const auto concurrency = static_cast<std::size_t>(state.range(1));

    auto pool = adapters::worker_pool_factory::create(concurrency, "bench_pool");

    for (auto _ : state) {
        state.PauseTiming();
        vector_task_source source(make_tasks(task_count, sizes::small_file,
                                             std::chrono::microseconds(0)));
        transfer_executor executor(executor_config{concurrency}, nullptr, pool);
        state.ResumeTiming();

        auto summary = executor.run(source, task_count);
        if (!summary) {
            state.SkipWithError("Executor run failed");
            return;
        }
        ::benchmark::DoNotOptimize(summary.value().bytes_transferred);
    }

    state.SetItemsProcessed(static_cast<int64_t>(task_count) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Executor_EmptyTasks)
    ->Args({100, 1})
    ->Args({100, 4})
    ->Args({1000, 8})
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Wall time for latency-bound tasks as concurrency grows
 */
static void BM_Executor_LatencyBound(::benchmark::State& state) {
    const auto concurrency = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t task_count = 32;

    auto pool = adapters::worker_pool_factory::create(concurrency, "bench_pool");

    for (auto _ : state) {
        state.PauseTiming();
        vector_task_source source(make_tasks(task_count, sizes::medium_file,
                                             std::chrono::microseconds(500)));
        transfer_executor executor(executor_config{concurrency}, nullptr, pool);
        state.ResumeTiming();

        auto summary = executor.run(source, task_count);
        if (!summary) {
            state.SkipWithError("Executor run failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(task_count * sizes::medium_file) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Executor_LatencyBound)
    ->Arg(1)
    ->Arg(4)
    ->Arg(8)
    ->Arg(16)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief Executor with an event channel drained by a progress aggregator
 */
static void BM_Executor_WithProgress(::benchmark::State& state) {
    const auto task_count = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t concurrency = 4;

    auto pool = adapters::worker_pool_factory::create(concurrency, "bench_pool");

    for (auto _ : state) {
        state.PauseTiming();
        vector_task_source source(make_tasks(task_count, sizes::large_file,
                                             std::chrono::microseconds(0)));
        auto events = std::make_shared<event_channel<transfer_event>>();
        transfer_progress_aggregator aggregator(sizes::MB, task_count);
        transfer_executor executor(executor_config{concurrency}, events, pool);
        state.ResumeTiming();

        std::thread consumer([&] { aggregator.consume(*events); });
        auto summary = executor.run(source, task_count);
        events->close();
        consumer.join();

        if (!summary || aggregator.completed() != task_count) {
            state.SkipWithError("Progress did not account for every task");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(task_count) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Executor_WithProgress)->Arg(64)->Arg(512)->Unit(::benchmark::kMillisecond);

/**
 * @brief Raw aggregator update cost
 */
static void BM_ProgressAggregator_Update(::benchmark::State& state) {
    transfer_progress_aggregator aggregator(sizes::MB);
    task_id id = 0;

    for (auto _ : state) {
        aggregator.update(transfer_start{id, "file", sizes::large_file});
        aggregator.update(transfer_chunk{id, sizes::large_file});
        aggregator.update(transfer_done{id});
        ++id;
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 3);
}
BENCHMARK(BM_ProgressAggregator_Update);

}  // namespace kcenon::cube::benchmark
