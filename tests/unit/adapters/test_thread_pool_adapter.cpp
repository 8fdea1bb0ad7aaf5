/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the transfer worker pools
 */

#include <gtest/gtest.h>

#include <kcenon/cube/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::cube::test {

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override { pool_ = adapters::worker_pool_factory::create(2, "cube_test_pool"); }

    void TearDown() override { pool_->shutdown(); }

    std::shared_ptr<adapters::transfer_worker_pool> pool_;
};

TEST_F(WorkerPoolTest, RunsSubmittedTasks) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool_->submit([&counter] { ++counter; }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EXPECT_EQ(counter.load(), 20);
    EXPECT_EQ(pool_->active_tasks(), 0u);
}

TEST_F(WorkerPoolTest, ExceptionsReachTheFuture) {
    auto future = pool_->submit([] { throw std::runtime_error("boom"); });

    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(WorkerPoolTest, ActiveTasksWhileRunning) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<bool> entered{false};

    auto future = pool_->submit([gate, &entered] {
        entered = true;
        gate.wait();
    });
    while (!entered) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    EXPECT_EQ(pool_->active_tasks(), 1u);
    release.set_value();
    future.get();
    EXPECT_EQ(pool_->active_tasks(), 0u);
}

TEST_F(WorkerPoolTest, WorkerCountIsPositive) {
    EXPECT_GT(pool_->worker_count(), 0u);
}

TEST_F(WorkerPoolTest, FactoryMatchesBuildConfiguration) {
#if KCENON_WITH_THREAD_SYSTEM
    EXPECT_TRUE(adapters::worker_pool_factory::has_thread_system());
    EXPECT_EQ(pool_->worker_count(), 2u);
#else
    EXPECT_FALSE(adapters::worker_pool_factory::has_thread_system());
#endif
}

}  // namespace kcenon::cube::test
