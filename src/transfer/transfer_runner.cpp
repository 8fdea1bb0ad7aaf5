/**
 * @file transfer_runner.cpp
 * @brief Executor run wired to a progress aggregator
 */

#include "kcenon/cube/transfer/transfer_runner.h"

#include <iostream>
#include <thread>
#include <utility>

#include "kcenon/cube/transfer/event_channel.h"
#include "kcenon/cube/transfer/transfer_executor.h"

namespace kcenon::cube {

namespace {

/**
 * @brief Closes the event channel and joins its consumer on every exit path
 */
class consumer_guard {
public:
    consumer_guard(std::shared_ptr<event_channel<transfer_event>> events, std::thread consumer)
        : events_(std::move(events)), consumer_(std::move(consumer)) {}

    ~consumer_guard() {
        events_->close();
        if (consumer_.joinable()) {
            consumer_.join();
        }
    }

    consumer_guard(const consumer_guard&) = delete;
    auto operator=(const consumer_guard&) -> consumer_guard& = delete;

private:
    std::shared_ptr<event_channel<transfer_event>> events_;
    std::thread consumer_;
};

}  // namespace

auto run_transfers(transfer_task_source& source,
                   std::size_t declared_length,
                   const transfer_config& config,
                   std::shared_ptr<progress_renderer> renderer,
                   std::shared_ptr<adapters::transfer_worker_pool> pool)
    -> result<executor_summary> {
    auto valid = config.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    if (!renderer && !config.hidden) {
        renderer = std::make_shared<console_progress_renderer>(std::cerr);
    }

    auto events = std::make_shared<event_channel<transfer_event>>();
    transfer_progress_aggregator aggregator(config.size_threshold, declared_length,
                                            config.hidden ? nullptr : renderer);
    consumer_guard guard(events,
                         std::thread([&aggregator, events]() { aggregator.consume(*events); }));

    transfer_executor executor(config.executor(), events, std::move(pool));
    return executor.run(source, declared_length);
}

}  // namespace kcenon::cube
