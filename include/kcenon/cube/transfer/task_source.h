/**
 * @file task_source.h
 * @brief Lazy producers of transfer tasks
 */

#ifndef KCENON_CUBE_TRANSFER_TASK_SOURCE_H
#define KCENON_CUBE_TRANSFER_TASK_SOURCE_H

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "kcenon/cube/core/types.h"
#include "kcenon/cube/transfer/transfer_types.h"

namespace kcenon::cube {

/**
 * @brief Sequence of tasks whose length is not known up front
 *
 * The executor pulls from a source only when it has a free slot.
 */
class transfer_task_source {
public:
    virtual ~transfer_task_source() = default;

    /**
     * @brief Next task, std::nullopt once the source is exhausted
     */
    [[nodiscard]] virtual auto next() -> result<std::optional<transfer_task>> = 0;
};

class vector_task_source : public transfer_task_source {
public:
    explicit vector_task_source(std::vector<transfer_task> tasks)
        : tasks_(std::move(tasks)) {}

    [[nodiscard]] auto next() -> result<std::optional<transfer_task>> override {
        if (position_ >= tasks_.size()) {
            return std::optional<transfer_task>{};
        }
        return std::optional<transfer_task>{std::move(tasks_[position_++])};
    }

private:
    std::vector<transfer_task> tasks_;
    std::size_t position_ = 0;
};

/**
 * @brief Turns each item of a stream into a task
 *
 * Stream needs next() -> result<std::optional<T>>, like item_stream. A
 * failed fetch is returned from next() as is.
 */
template <typename Stream, typename Mapper>
class stream_task_source : public transfer_task_source {
public:
    stream_task_source(Stream stream, Mapper mapper)
        : stream_(std::move(stream)), mapper_(std::move(mapper)) {}

    [[nodiscard]] auto next() -> result<std::optional<transfer_task>> override {
        auto item = stream_.next();
        if (!item) {
            return unexpected{item.error()};
        }
        if (!item.value()) {
            return std::optional<transfer_task>{};
        }
        return std::optional<transfer_task>{mapper_(std::move(*item.value()))};
    }

private:
    Stream stream_;
    Mapper mapper_;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_TRANSFER_TASK_SOURCE_H
