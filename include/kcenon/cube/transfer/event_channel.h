/**
 * @file event_channel.h
 * @brief Multi-producer single-consumer queue between transfer threads
 */

#ifndef KCENON_CUBE_TRANSFER_EVENT_CHANNEL_H
#define KCENON_CUBE_TRANSFER_EVENT_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace kcenon::cube {

/**
 * @brief Unbounded channel with close semantics
 *
 * Any number of threads may send; one thread receives. After close(),
 * send() is refused and receive() returns what is queued, then
 * std::nullopt.
 */
template <typename T>
class event_channel {
public:
    event_channel() = default;

    event_channel(const event_channel&) = delete;
    auto operator=(const event_channel&) -> event_channel& = delete;

    /**
     * @return false if the channel is closed
     */
    auto send(T value) -> bool {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Block until a value arrives or the channel is closed and empty
     */
    [[nodiscard]] auto receive() -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return pop_locked();
    }

    /**
     * @brief Like receive(), giving up after @p timeout
     */
    [[nodiscard]] auto receive_for(std::chrono::milliseconds timeout) -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        return pop_locked();
    }

    [[nodiscard]] auto try_receive() -> std::optional<T> {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto is_closed() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    auto pop_locked() -> std::optional<T> {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_TRANSFER_EVENT_CHANNEL_H
