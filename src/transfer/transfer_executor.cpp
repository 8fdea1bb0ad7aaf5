/**
 * @file transfer_executor.cpp
 * @brief Implementation of the bounded transfer executor
 */

#include "kcenon/cube/transfer/transfer_executor.h"

#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "kcenon/cube/core/logging.h"

namespace kcenon::cube {

namespace {

struct task_completion {
    task_id id = 0;
    std::string name;
    result<uint64_t> outcome;
    std::chrono::milliseconds duration{0};
};

}  // namespace

struct transfer_executor::impl {
    executor_config config;
    std::shared_ptr<event_channel<transfer_event>> events;
    std::shared_ptr<adapters::transfer_worker_pool> pool;

    impl(executor_config cfg,
         std::shared_ptr<event_channel<transfer_event>> evts,
         std::shared_ptr<adapters::transfer_worker_pool> p)
        : config(cfg), events(std::move(evts)), pool(std::move(p)) {}

    void emit(transfer_event event) const {
        if (events) {
            events->send(std::move(event));
        }
    }

    auto is_isolated(const error& err) const -> bool {
        return config.on_failure == failure_policy::isolate_file_errors &&
               err.is_task_local();
    }

    void dispatch(task_id id,
                  transfer_task task,
                  const std::shared_ptr<event_channel<task_completion>>& completions,
                  std::unordered_map<task_id, std::future<void>>& running) {
        emit(transfer_start{id, task.name, task.size});

        auto progress = events;
        auto body = [id, task = std::move(task), progress, completions]() {
            chunk_reporter reporter = [id, progress](uint64_t delta) {
                if (progress) {
                    progress->send(transfer_chunk{id, delta});
                }
            };

            auto started = std::chrono::steady_clock::now();
            result<uint64_t> outcome = unexpected{error{error_code::internal_error,
                "task did not run"}};
            try {
                outcome = task.work(reporter);
            } catch (const std::exception& e) {
                outcome = unexpected{error{error_code::internal_error,
                    std::string("task threw: ") + e.what()}};
            } catch (...) {
                outcome = unexpected{error{error_code::internal_error,
                    "task threw a non-standard exception"}};
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);

            completions->send(task_completion{id, task.name, std::move(outcome), elapsed});
        };

        running.emplace(id, pool->submit(std::move(body)));
    }
};

transfer_executor::transfer_executor(
    executor_config config,
    std::shared_ptr<event_channel<transfer_event>> events,
    std::shared_ptr<adapters::transfer_worker_pool> pool)
    : impl_(std::make_unique<impl>(config, std::move(events), std::move(pool))) {
    if (impl_->config.concurrency == 0) {
        impl_->config.concurrency = 1;
    }
    if (!impl_->pool) {
        impl_->pool = adapters::worker_pool_factory::create(impl_->config.concurrency);
    }
}

transfer_executor::~transfer_executor() = default;
transfer_executor::transfer_executor(transfer_executor&&) noexcept = default;
auto transfer_executor::operator=(transfer_executor&&) noexcept -> transfer_executor& = default;

auto transfer_executor::config() const -> const executor_config& {
    return impl_->config;
}

auto transfer_executor::run(transfer_task_source& source, std::size_t declared_length)
    -> result<executor_summary> {
    auto completions = std::make_shared<event_channel<task_completion>>();
    std::unordered_map<task_id, std::future<void>> running;

    executor_summary summary;
    summary.declared = declared_length;

    std::optional<error> fatal;
    bool exhausted = false;
    task_id next_id = 0;

    CUBE_LOG_DEBUG(log_category::executor,
                   "Starting run: declared=" + std::to_string(declared_length) +
                   " concurrency=" + std::to_string(impl_->config.concurrency) +
                   " policy=" + to_string(impl_->config.on_failure));

    while (true) {
        while (!fatal && !exhausted && running.size() < impl_->config.concurrency) {
            auto task = source.next();
            if (!task) {
                fatal = task.error();
                CUBE_LOG_ERROR(log_category::executor,
                               "Task source failed: " + task.error().describe());
                break;
            }
            if (!task.value()) {
                exhausted = true;
                break;
            }
            impl_->dispatch(next_id++, std::move(*task.value()), completions, running);
        }

        if (running.empty()) {
            break;
        }

        auto done = completions->receive();
        if (!done) {
            fatal = error{error_code::internal_error, "completion channel closed"};
            break;
        }

        auto it = running.find(done->id);
        if (it != running.end()) {
            it->second.get();
            running.erase(it);
        }

        ++summary.completed;
        impl_->emit(transfer_done{done->id});

        request_log_context ctx;
        ctx.task_id = done->id;
        ctx.filename = done->name;
        ctx.duration_ms = static_cast<uint64_t>(done->duration.count());

        if (done->outcome) {
            ++summary.succeeded;
            summary.bytes_transferred += done->outcome.value();
            ctx.bytes_transferred = done->outcome.value();
            CUBE_LOG_DEBUG_CTX(log_category::executor, "Task completed", ctx);
        } else {
            const auto& err = done->outcome.error();
            ctx.error_message = err.describe();
            summary.failures.push_back(task_failure{done->id, done->name, err});
            if (impl_->is_isolated(err)) {
                CUBE_LOG_WARN_CTX(log_category::executor, "Task failed", ctx);
            } else {
                CUBE_LOG_ERROR_CTX(log_category::executor, "Task failed, stopping dispatch", ctx);
                if (!fatal) {
                    fatal = err;
                }
            }
        }

        if (summary.completed > declared_length && !fatal) {
            fatal = error{error_code::executor_overfull,
                "more than " + std::to_string(declared_length) + " tasks completed"};
            CUBE_LOG_ERROR(log_category::executor, fatal->message);
        }
    }

    if (fatal) {
        return unexpected{*fatal};
    }
    if (summary.completed < declared_length) {
        CUBE_LOG_ERROR(log_category::executor,
                       "Source exhausted after " + std::to_string(summary.completed) +
                       " of " + std::to_string(declared_length) + " tasks");
        return unexpected{error{error_code::executor_underfull,
            "expected " + std::to_string(declared_length) + " tasks, source yielded " +
            std::to_string(summary.completed)}};
    }

    CUBE_LOG_INFO(log_category::executor,
                  "Run finished: " + std::to_string(summary.succeeded) + " succeeded, " +
                  std::to_string(summary.failed()) + " failed");
    return summary;
}

}  // namespace kcenon::cube
