/**
 * @file test_transfer_executor.cpp
 * @brief Unit tests for the bounded transfer executor
 */

#include <gtest/gtest.h>

#include <kcenon/cube/transfer/transfer_executor.h>
#include <kcenon/cube/transfer/transfer_runner.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <optional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace kcenon::cube::test {

namespace {

/**
 * @brief Tracks how many tasks run at once
 */
struct concurrency_probe {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> started{0};

    void enter() {
        ++started;
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
    }

    void leave() { --running; }
};

auto sized_task(std::shared_ptr<concurrency_probe> probe,
                std::string name,
                uint64_t size,
                std::chrono::milliseconds delay = std::chrono::milliseconds(5),
                std::optional<error> failure = std::nullopt) -> transfer_task {
    transfer_task task;
    task.name = std::move(name);
    task.size = size;
    task.work = [probe, size, delay, failure](const chunk_reporter& report) -> result<uint64_t> {
        probe->enter();
        std::this_thread::sleep_for(delay);
        if (failure) {
            probe->leave();
            return unexpected{*failure};
        }
        report(size / 2);
        report(size - size / 2);
        probe->leave();
        return size;
    };
    return task;
}

auto make_tasks(const std::shared_ptr<concurrency_probe>& probe, std::size_t n)
    -> std::vector<transfer_task> {
    std::vector<transfer_task> tasks;
    for (std::size_t i = 0; i < n; ++i) {
        tasks.push_back(sized_task(probe, "file_" + std::to_string(i), 100 + i));
    }
    return tasks;
}

/**
 * @brief Yields a few tasks, then fails
 */
class failing_source : public transfer_task_source {
public:
    failing_source(std::shared_ptr<concurrency_probe> probe, std::size_t before_failure)
        : probe_(std::move(probe)), remaining_(before_failure) {}

    auto next() -> result<std::optional<transfer_task>> override {
        if (remaining_ == 0) {
            return unexpected{error{error_code::remote_error, "page fetch failed"}};
        }
        --remaining_;
        return std::optional<transfer_task>{
            sized_task(probe_, "file", 10, std::chrono::milliseconds(20))};
    }

private:
    std::shared_ptr<concurrency_probe> probe_;
    std::size_t remaining_;
};

/**
 * @brief Pool that refuses every submission
 */
class rejecting_pool : public adapters::transfer_worker_pool {
public:
    std::future<void> submit(std::function<void()>) override {
        throw std::runtime_error("pool is shut down");
    }
    size_t worker_count() const override { return 1; }
    size_t active_tasks() const override { return 0; }
    void shutdown() override {}
};

}  // namespace

class TransferExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        probe_ = std::make_shared<concurrency_probe>();
        events_ = std::make_shared<event_channel<transfer_event>>();
    }

    auto drain_events() -> std::vector<transfer_event> {
        std::vector<transfer_event> out;
        while (auto e = events_->try_receive()) {
            out.push_back(std::move(*e));
        }
        return out;
    }

    std::shared_ptr<concurrency_probe> probe_;
    std::shared_ptr<event_channel<transfer_event>> events_;
};

TEST_F(TransferExecutorTest, RespectsConcurrencyBound) {
    transfer_executor executor(executor_config{3}, events_);
    vector_task_source source(make_tasks(probe_, 10));

    auto summary = executor.run(source, 10);

    ASSERT_TRUE(summary) << summary.error().describe();
    EXPECT_EQ(summary.value().completed, 10u);
    EXPECT_EQ(summary.value().succeeded, 10u);
    EXPECT_TRUE(summary.value().all_succeeded());
    EXPECT_LE(probe_->peak.load(), 3);
    EXPECT_GE(probe_->peak.load(), 1);
}

TEST_F(TransferExecutorTest, BytesAreSummed) {
    transfer_executor executor(executor_config{2});
    vector_task_source source(make_tasks(probe_, 4));

    auto summary = executor.run(source, 4);

    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().bytes_transferred, 100u + 101u + 102u + 103u);
}

TEST_F(TransferExecutorTest, EmptySourceWithZeroDeclared) {
    transfer_executor executor(executor_config{2});
    vector_task_source source(std::vector<transfer_task>{});

    auto summary = executor.run(source, 0);

    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().completed, 0u);
}

TEST_F(TransferExecutorTest, MoreTasksThanDeclaredIsOverfull) {
    transfer_executor executor(executor_config{3});
    vector_task_source source(make_tasks(probe_, 10));

    auto summary = executor.run(source, 9);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, error_code::executor_overfull);
    EXPECT_EQ(probe_->running.load(), 0);
}

TEST_F(TransferExecutorTest, FewerTasksThanDeclaredIsUnderfull) {
    transfer_executor executor(executor_config{3});
    vector_task_source source(make_tasks(probe_, 10));

    auto summary = executor.run(source, 11);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, error_code::executor_underfull);
    EXPECT_EQ(probe_->started.load(), 10);
}

TEST_F(TransferExecutorTest, FileErrorIsIsolated) {
    std::vector<transfer_task> tasks = make_tasks(probe_, 5);
    tasks[2] = sized_task(probe_, "unreadable", 50, std::chrono::milliseconds(5),
                          error{error_code::file_read_error, "I/O error"});
    transfer_executor executor(executor_config{2});
    vector_task_source source(std::move(tasks));

    auto summary = executor.run(source, 5);

    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().completed, 5u);
    EXPECT_EQ(summary.value().succeeded, 4u);
    ASSERT_EQ(summary.value().failed(), 1u);
    EXPECT_EQ(summary.value().failures[0].name, "unreadable");
    EXPECT_EQ(summary.value().failures[0].err.code, error_code::file_read_error);
}

TEST_F(TransferExecutorTest, FailFastStopsOnFileError) {
    std::vector<transfer_task> tasks = make_tasks(probe_, 6);
    tasks[1] = sized_task(probe_, "unreadable", 50, std::chrono::milliseconds(5),
                          error{error_code::file_read_error, "I/O error"});
    transfer_executor executor(executor_config{1, failure_policy::fail_fast});
    vector_task_source source(std::move(tasks));

    auto summary = executor.run(source, 6);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, error_code::file_read_error);
    EXPECT_EQ(probe_->started.load(), 2);
}

TEST_F(TransferExecutorTest, RemoteErrorStopsDispatch) {
    std::vector<transfer_task> tasks = make_tasks(probe_, 10);
    tasks[1] = sized_task(probe_, "rejected", 50, std::chrono::milliseconds(5),
                          error::remote(403, "Forbidden", R"({"detail":"denied"})"));
    transfer_executor executor(executor_config{1});
    vector_task_source source(std::move(tasks));

    auto summary = executor.run(source, 10);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, error_code::remote_error);
    EXPECT_EQ(summary.error().body.value_or(""), R"({"detail":"denied"})");
    EXPECT_EQ(probe_->started.load(), 2);
}

TEST_F(TransferExecutorTest, InFlightTasksDrainBeforeFatalErrorReturns) {
    std::vector<transfer_task> tasks;
    tasks.push_back(sized_task(probe_, "fails", 1, std::chrono::milliseconds(1),
                               error{error_code::connection_failed, "reset"}));
    for (int i = 0; i < 3; ++i) {
        tasks.push_back(sized_task(probe_, "slow", 1, std::chrono::milliseconds(50)));
    }
    for (int i = 0; i < 6; ++i) {
        tasks.push_back(sized_task(probe_, "never", 1));
    }
    transfer_executor executor(executor_config{4}, events_);
    vector_task_source source(std::move(tasks));

    auto summary = executor.run(source, 10);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, error_code::connection_failed);
    EXPECT_EQ(probe_->running.load(), 0);
    EXPECT_EQ(probe_->started.load(), 4);

    std::size_t starts = 0;
    std::size_t dones = 0;
    for (const auto& e : drain_events()) {
        starts += std::holds_alternative<transfer_start>(e) ? 1 : 0;
        dones += std::holds_alternative<transfer_done>(e) ? 1 : 0;
    }
    EXPECT_EQ(starts, 4u);
    EXPECT_EQ(dones, 4u);
}

TEST_F(TransferExecutorTest, SourceErrorStopsDispatchAndDrains) {
    transfer_executor executor(executor_config{4});
    failing_source source(probe_, 3);

    auto summary = executor.run(source, 10);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, error_code::remote_error);
    EXPECT_EQ(probe_->started.load(), 3);
    EXPECT_EQ(probe_->running.load(), 0);
}

TEST_F(TransferExecutorTest, ThrowingTaskBecomesInternalError) {
    std::vector<transfer_task> tasks;
    transfer_task task;
    task.name = "throws";
    task.size = 1;
    task.work = [](const chunk_reporter&) -> result<uint64_t> {
        throw std::runtime_error("disk vanished");
    };
    tasks.push_back(std::move(task));
    transfer_executor executor(executor_config{2});
    vector_task_source source(std::move(tasks));

    auto summary = executor.run(source, 1);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, error_code::internal_error);
    EXPECT_NE(summary.error().message.find("disk vanished"), std::string::npos);
}

TEST_F(TransferExecutorTest, NonStandardThrowBecomesInternalError) {
    std::vector<transfer_task> tasks;
    transfer_task task;
    task.name = "throws int";
    task.size = 1;
    task.work = [](const chunk_reporter&) -> result<uint64_t> { throw 42; };
    tasks.push_back(std::move(task));
    transfer_executor executor(executor_config{2});
    vector_task_source source(std::move(tasks));

    auto summary = executor.run(source, 1);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, error_code::internal_error);
    EXPECT_NE(summary.error().message.find("non-standard"), std::string::npos);
}

TEST_F(TransferExecutorTest, EventsArriveStartChunkDonePerTask) {
    transfer_executor executor(executor_config{3}, events_);
    vector_task_source source(make_tasks(probe_, 6));

    auto summary = executor.run(source, 6);
    ASSERT_TRUE(summary);

    std::map<task_id, int> stage;
    std::map<task_id, uint64_t> bytes;
    for (const auto& e : drain_events()) {
        if (const auto* start = std::get_if<transfer_start>(&e)) {
            EXPECT_EQ(stage[start->id], 0);
            stage[start->id] = 1;
        } else if (const auto* chunk = std::get_if<transfer_chunk>(&e)) {
            EXPECT_EQ(stage[chunk->id], 1);
            bytes[chunk->id] += chunk->delta;
        } else {
            const auto& done = std::get<transfer_done>(e);
            EXPECT_EQ(stage[done.id], 1);
            stage[done.id] = 2;
        }
    }

    ASSERT_EQ(stage.size(), 6u);
    for (const auto& [id, s] : stage) {
        EXPECT_EQ(s, 2) << "task " << id;
        EXPECT_EQ(bytes[id], 100u + id);
    }
    EXPECT_FALSE(events_->is_closed());
}

TEST_F(TransferExecutorTest, ZeroConcurrencyIsClampedToOne) {
    transfer_executor executor(executor_config{0});

    EXPECT_EQ(executor.config().concurrency, 1u);
}

TEST_F(TransferExecutorTest, ExplicitPoolIsUsed) {
    auto pool = std::make_shared<adapters::async_worker_pool>();
    transfer_executor executor(executor_config{2}, nullptr, pool);
    vector_task_source source(make_tasks(probe_, 3));

    auto summary = executor.run(source, 3);

    ASSERT_TRUE(summary);
    EXPECT_EQ(pool->active_tasks(), 0u);
}

TEST_F(TransferExecutorTest, FailurePolicyToString) {
    EXPECT_STREQ(to_string(failure_policy::fail_fast), "fail_fast");
    EXPECT_STREQ(to_string(failure_policy::isolate_file_errors), "isolate_file_errors");
}

TEST_F(TransferExecutorTest, RunnerPropagatesPoolFailureAfterStoppingConsumer) {
    transfer_config config;
    config.hidden = true;
    config.concurrency = 2;
    vector_task_source source(make_tasks(probe_, 3));

    EXPECT_THROW(
        {
            auto summary = run_transfers(source, 3, config, nullptr,
                                         std::make_shared<rejecting_pool>());
            (void)summary;
        },
        std::runtime_error);
    EXPECT_EQ(probe_->started.load(), 0);
}

}  // namespace kcenon::cube::test
