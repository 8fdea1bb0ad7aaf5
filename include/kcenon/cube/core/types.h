/**
 * @file types.h
 * @brief Core type definitions for cube_client_system
 */

#ifndef KCENON_CUBE_CORE_TYPES_H
#define KCENON_CUBE_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::cube {

/**
 * @brief Error codes for CUBE client operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119), local to a single transfer task
    file_not_found = -100,
    file_access_denied = -101,
    file_already_exists = -102,
    invalid_file_path = -103,
    file_read_error = -104,
    file_write_error = -105,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,
    invalid_cube_url = -141,
    missing_link = -142,

    // Network errors (-160 to -179)
    connection_failed = -160,
    connection_timeout = -161,
    request_failed = -162,

    // Response errors (-180 to -199)
    remote_error = -180,
    decode_error = -181,

    // Collection errors (-220 to -239)
    empty_collection = -220,
    too_many_results = -221,

    // Executor errors (-240 to -259)
    executor_underfull = -240,
    executor_overfull = -241,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_already_exists:
            return "file already exists";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_cube_url:
            return "invalid CUBE url";
        case error_code::missing_link:
            return "missing collection link";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::request_failed:
            return "request failed";
        case error_code::remote_error:
            return "remote error";
        case error_code::decode_error:
            return "decode error";
        case error_code::empty_collection:
            return "empty collection";
        case error_code::too_many_results:
            return "too many results";
        case error_code::executor_underfull:
            return "fewer transfers completed than declared";
        case error_code::executor_overfull:
            return "more transfers completed than declared";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether an error code belongs to the local file range
 *
 * File errors affect only the transfer task that raised them.
 */
[[nodiscard]] constexpr auto is_file_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -100 && value >= -119;
}

/**
 * @brief Error type with code, message and optional remote detail
 *
 * For remote_error, status_code and body hold the HTTP status and the
 * response body exactly as the server sent it.
 */
struct error {
    error_code code;
    std::string message;
    std::optional<int> status_code;
    std::optional<std::string> body;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto is_task_local() const noexcept -> bool {
        return is_file_error(code);
    }

    /**
     * @brief Create a remote error carrying status and verbatim body
     */
    [[nodiscard]] static auto remote(int status, std::string reason, std::string response_body)
        -> error {
        error e(error_code::remote_error,
                "HTTP " + std::to_string(status) + (reason.empty() ? "" : " " + reason));
        e.status_code = status;
        e.body = std::move(response_body);
        return e;
    }

    /**
     * @brief Human readable text including the response body, if any
     */
    [[nodiscard]] auto describe() const -> std::string {
        std::string text = message;
        if (body && !body->empty()) {
            text += ": ";
            text += *body;
        }
        return text;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Numeric identifier of a remote resource
 *
 * The tag parameter keeps ids of different resource kinds apart.
 */
template <typename Tag>
struct resource_id {
    uint32_t value;

    resource_id() : value(0) {}
    explicit resource_id(uint32_t v) : value(v) {}

    [[nodiscard]] auto operator==(const resource_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const resource_id& other) const -> bool {
        return value < other.value;
    }
};

using plugin_id = resource_id<struct plugin_tag>;
using feed_id = resource_id<struct feed_tag>;
using plugin_instance_id = resource_id<struct plugin_instance_tag>;
using pipeline_id = resource_id<struct pipeline_tag>;
using workflow_id = resource_id<struct workflow_tag>;

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_CORE_TYPES_H
