/**
 * @file progress_aggregator.h
 * @brief Folds transfer events into per-file and overall progress
 */

#ifndef KCENON_CUBE_TRANSFER_PROGRESS_AGGREGATOR_H
#define KCENON_CUBE_TRANSFER_PROGRESS_AGGREGATOR_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kcenon/cube/transfer/event_channel.h"
#include "kcenon/cube/transfer/transfer_types.h"

namespace kcenon::cube {

/**
 * @brief Progress of a single large file
 */
struct progress_bar_state {
    std::string name;
    uint64_t size = 0;
    uint64_t position = 0;
};

/**
 * @brief Snapshot handed to a renderer after every event
 */
struct progress_snapshot {
    std::size_t completed = 0;
    std::optional<std::size_t> total_files;
    uint64_t total_size = 0;
    uint64_t bytes_transferred = 0;
    std::map<task_id, progress_bar_state> bars;
};

/**
 * @brief Draws progress; the aggregator itself performs no I/O
 */
class progress_renderer {
public:
    virtual ~progress_renderer() = default;

    virtual void render(const progress_snapshot& snapshot) = 0;

    /**
     * @brief Called once when the event stream ends
     */
    virtual void finish(const progress_snapshot& snapshot) = 0;
};

/**
 * @brief Transfer progress aggregator
 *
 * - transfer_start adds its size to total_size() and opens a bar when the
 *   size reaches the threshold.
 * - transfer_chunk advances bytes_transferred() and the task's bar, if any.
 * - transfer_done closes the task's bar, if any, and counts one file.
 *
 * @note Thread-safe: queries may run while another thread calls consume().
 */
class transfer_progress_aggregator {
public:
    /**
     * @param size_threshold Smallest size that gets a per-file bar
     * @param total_files Expected number of files, if known
     * @param renderer Optional renderer
     */
    explicit transfer_progress_aggregator(uint64_t size_threshold,
                                          std::optional<std::size_t> total_files = std::nullopt,
                                          std::shared_ptr<progress_renderer> renderer = nullptr);

    void update(const transfer_event& event);

    /**
     * @brief Apply events until the channel is closed and drained
     */
    void consume(event_channel<transfer_event>& channel);

    [[nodiscard]] auto total_size() const -> uint64_t;
    [[nodiscard]] auto bytes_transferred() const -> uint64_t;
    [[nodiscard]] auto completed() const -> std::size_t;
    [[nodiscard]] auto active_bars() const -> std::size_t;
    [[nodiscard]] auto bar(task_id id) const -> std::optional<progress_bar_state>;
    [[nodiscard]] auto snapshot() const -> progress_snapshot;

private:
    void on_start(const transfer_start& event);
    void on_chunk(const transfer_chunk& event);
    void on_done(const transfer_done& event);

    uint64_t size_threshold_;
    std::shared_ptr<progress_renderer> renderer_;

    mutable std::mutex mutex_;
    progress_snapshot state_;
};

/**
 * @brief Renders a single status line to a terminal stream
 *
 * Redraws at most every @c interval, and always on finish().
 */
class console_progress_renderer : public progress_renderer {
public:
    explicit console_progress_renderer(
        std::ostream& out,
        std::chrono::milliseconds interval = std::chrono::milliseconds(100));

    void render(const progress_snapshot& snapshot) override;
    void finish(const progress_snapshot& snapshot) override;

private:
    void draw(const progress_snapshot& snapshot);

    std::ostream& out_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_draw_{};
};

/**
 * @brief Format bytes into human-readable string
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_TRANSFER_PROGRESS_AGGREGATOR_H
