/**
 * @file transfer_types.h
 * @brief Transfer task, event and configuration types
 */

#ifndef KCENON_CUBE_TRANSFER_TRANSFER_TYPES_H
#define KCENON_CUBE_TRANSFER_TRANSFER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "kcenon/cube/core/types.h"

namespace kcenon::cube {

/**
 * @brief Identifier the executor gives a task when it is dispatched
 */
using task_id = std::size_t;

// ============================================================================
// Progress events
// ============================================================================

/**
 * @brief A transfer of @c size bytes started
 */
struct transfer_start {
    task_id id = 0;
    std::string name;
    uint64_t size = 0;
};

/**
 * @brief @c delta more bytes of a transfer were moved
 */
struct transfer_chunk {
    task_id id = 0;
    uint64_t delta = 0;
};

/**
 * @brief A transfer finished, successfully or not
 */
struct transfer_done {
    task_id id = 0;
};

using transfer_event = std::variant<transfer_start, transfer_chunk, transfer_done>;

// ============================================================================
// Tasks
// ============================================================================

/**
 * @brief Callback a task uses to report bytes as it moves them
 */
using chunk_reporter = std::function<void(uint64_t delta)>;

/**
 * @brief One unit of work for the transfer executor
 *
 * work returns the number of bytes moved. It runs on a pool thread and may
 * call the reporter any number of times.
 */
struct transfer_task {
    std::string name;
    uint64_t size = 0;
    std::function<result<uint64_t>(const chunk_reporter&)> work;
};

/**
 * @brief A task that finished with an error
 */
struct task_failure {
    task_id id = 0;
    std::string name;
    error err;
};

/**
 * @brief What the executor does when a task fails
 */
enum class failure_policy {
    isolate_file_errors,  ///< Local file errors are recorded; others stop dispatch
    fail_fast,            ///< Any task error stops dispatch
};

[[nodiscard]] constexpr auto to_string(failure_policy policy) -> const char* {
    switch (policy) {
        case failure_policy::isolate_file_errors: return "isolate_file_errors";
        case failure_policy::fail_fast: return "fail_fast";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of a run in which no fatal error occurred
 */
struct executor_summary {
    std::size_t declared = 0;
    std::size_t completed = 0;
    std::size_t succeeded = 0;
    uint64_t bytes_transferred = 0;
    std::vector<task_failure> failures;

    [[nodiscard]] auto failed() const -> std::size_t { return failures.size(); }
    [[nodiscard]] auto all_succeeded() const -> bool { return failures.empty(); }
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Executor configuration
 */
struct executor_config {
    std::size_t concurrency = 4;
    failure_policy on_failure = failure_policy::isolate_file_errors;
};

/**
 * @brief Configuration of an upload or download
 */
struct transfer_config {
    /// Maximum number of files moved at the same time
    std::size_t concurrency = 4;

    /// Files at least this large get their own progress bar
    uint64_t size_threshold = 2 * 1024 * 1024;  // 2MB

    /// Do not render progress
    bool hidden = false;

    /// Overwrite existing local files when downloading
    bool clobber = false;

    /// Leading part of fname dropped from download destinations
    std::string strip_prefix;

    failure_policy on_failure = failure_policy::isolate_file_errors;

    [[nodiscard]] auto validate() const -> result<void> {
        if (concurrency == 0) {
            return unexpected{error{error_code::invalid_configuration,
                "concurrency must be at least 1"}};
        }
        return {};
    }

    [[nodiscard]] auto executor() const -> executor_config {
        return executor_config{concurrency, on_failure};
    }
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_TRANSFER_TRANSFER_TYPES_H
