/**
 * @file test_progress_aggregator.cpp
 * @brief Unit tests for transfer progress aggregation
 */

#include <gtest/gtest.h>

#include <kcenon/cube/transfer/progress_aggregator.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

namespace kcenon::cube::test {

namespace {

class recording_renderer : public progress_renderer {
public:
    void render(const progress_snapshot& snapshot) override { renders.push_back(snapshot); }
    void finish(const progress_snapshot& snapshot) override {
        finished = true;
        last = snapshot;
    }

    std::vector<progress_snapshot> renders;
    bool finished = false;
    progress_snapshot last;
};

constexpr uint64_t kThreshold = 1000;

}  // namespace

class ProgressAggregatorTest : public ::testing::Test {
protected:
    transfer_progress_aggregator aggregator_{kThreshold};
};

TEST_F(ProgressAggregatorTest, TotalSizeIsSumOfStartSizes) {
    aggregator_.update(transfer_start{0, "a.dcm", 300});
    aggregator_.update(transfer_start{1, "b.dcm", 4000});

    EXPECT_EQ(aggregator_.total_size(), 4300u);
}

TEST_F(ProgressAggregatorTest, BarOnlyAtOrAboveThreshold) {
    aggregator_.update(transfer_start{0, "small", kThreshold - 1});
    aggregator_.update(transfer_start{1, "exact", kThreshold});
    aggregator_.update(transfer_start{2, "large", kThreshold * 5});

    EXPECT_EQ(aggregator_.active_bars(), 2u);
    EXPECT_FALSE(aggregator_.bar(0).has_value());
    ASSERT_TRUE(aggregator_.bar(1).has_value());
    EXPECT_EQ(aggregator_.bar(1)->name, "exact");
    EXPECT_EQ(aggregator_.bar(2)->size, kThreshold * 5);
}

TEST_F(ProgressAggregatorTest, ChunksAdvanceOverallAndBar) {
    aggregator_.update(transfer_start{0, "small", 10});
    aggregator_.update(transfer_start{1, "large", 5000});

    aggregator_.update(transfer_chunk{0, 10});
    aggregator_.update(transfer_chunk{1, 2000});
    aggregator_.update(transfer_chunk{1, 500});

    EXPECT_EQ(aggregator_.bytes_transferred(), 2510u);
    EXPECT_EQ(aggregator_.bar(1)->position, 2500u);
}

TEST_F(ProgressAggregatorTest, DoneRemovesBarAndCounts) {
    aggregator_.update(transfer_start{0, "small", 10});
    aggregator_.update(transfer_start{1, "large", 5000});
    aggregator_.update(transfer_done{1});
    aggregator_.update(transfer_done{0});

    EXPECT_EQ(aggregator_.active_bars(), 0u);
    EXPECT_EQ(aggregator_.completed(), 2u);
    EXPECT_FALSE(aggregator_.bar(1).has_value());
}

TEST_F(ProgressAggregatorTest, ZeroThresholdGivesEveryFileABar) {
    transfer_progress_aggregator all(0);
    all.update(transfer_start{0, "empty", 0});

    EXPECT_EQ(all.active_bars(), 1u);
}

TEST_F(ProgressAggregatorTest, ConsumeUntilChannelCloses) {
    auto renderer = std::make_shared<recording_renderer>();
    transfer_progress_aggregator aggregator(kThreshold, 2, renderer);
    event_channel<transfer_event> channel;

    std::thread consumer([&] { aggregator.consume(channel); });
    channel.send(transfer_start{0, "a", 100});
    channel.send(transfer_start{1, "b", 2000});
    channel.send(transfer_chunk{0, 100});
    channel.send(transfer_chunk{1, 2000});
    channel.send(transfer_done{0});
    channel.send(transfer_done{1});
    channel.close();
    consumer.join();

    EXPECT_EQ(renderer->renders.size(), 6u);
    ASSERT_TRUE(renderer->finished);
    EXPECT_EQ(renderer->last.completed, 2u);
    EXPECT_EQ(renderer->last.total_files.value_or(0), 2u);
    EXPECT_EQ(renderer->last.total_size, 2100u);
    EXPECT_EQ(renderer->last.bytes_transferred, 2100u);
    EXPECT_TRUE(renderer->last.bars.empty());
}

TEST_F(ProgressAggregatorTest, SnapshotCopiesState) {
    aggregator_.update(transfer_start{3, "large", 4000});

    auto snapshot = aggregator_.snapshot();
    aggregator_.update(transfer_done{3});

    EXPECT_EQ(snapshot.bars.size(), 1u);
    EXPECT_EQ(aggregator_.snapshot().bars.size(), 0u);
}

// =============================================================================
// Rendering Tests
// =============================================================================

class ConsoleRendererTest : public ::testing::Test {};

TEST_F(ConsoleRendererTest, FinishDrawsStatusLine) {
    std::ostringstream out;
    console_progress_renderer renderer(out, std::chrono::milliseconds(0));

    progress_snapshot snapshot;
    snapshot.completed = 1;
    snapshot.total_files = 3;
    snapshot.bytes_transferred = 2048;
    snapshot.bars[1] = progress_bar_state{"large.nii", 4000, 1000};
    renderer.finish(snapshot);

    auto text = out.str();
    EXPECT_NE(text.find("[1/3 files]"), std::string::npos);
    EXPECT_NE(text.find("2.00 KB"), std::string::npos);
    EXPECT_NE(text.find("large.nii 25.0%"), std::string::npos);
}

TEST_F(ConsoleRendererTest, FormatBytes) {
    EXPECT_EQ(format_bytes(512), "512 bytes");
    EXPECT_EQ(format_bytes(1536), "1.50 KB");
    EXPECT_EQ(format_bytes(2 * 1024 * 1024), "2.00 MB");
    EXPECT_EQ(format_bytes(3ULL * 1024 * 1024 * 1024), "3.00 GB");
}

}  // namespace kcenon::cube::test
