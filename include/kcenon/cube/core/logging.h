// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/cube/config/feature_flags.h"

#if CUBE_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::cube {

/**
 * @brief Log categories for the CUBE client
 */
struct log_category {
    static constexpr std::string_view client = "cube.client";
    static constexpr std::string_view search = "cube.search";
    static constexpr std::string_view http = "cube.http";
    static constexpr std::string_view retry = "cube.retry";
    static constexpr std::string_view transfer = "cube.transfer";
    static constexpr std::string_view executor = "cube.executor";
};

/**
 * @brief Log levels for the CUBE client
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 *
 * Tokens are masked by default: an Authorization value must never reach a
 * log sink in clear text.
 */
struct masking_config {
    bool mask_tokens = true;
    bool mask_paths = false;
    bool mask_query_strings = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, false, "*", 4};
    }
};

/**
 * @brief Masks auth tokens, local paths and URL query strings
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string out = input;
        if (config_.mask_tokens) {
            out = mask_tokens(out);
        }
        if (config_.mask_query_strings) {
            out = mask_query_strings(out);
        }
        if (config_.mask_paths) {
            out = mask_local_paths(out);
        }
        return out;
    }

    /**
     * @brief Mask a secret, keeping only the first visible_chars characters
     */
    [[nodiscard]] auto mask_secret(const std::string& secret) const -> std::string {
        if (secret.size() <= config_.visible_chars) {
            return std::string(secret.size(), config_.mask_char[0]);
        }
        return secret.substr(0, config_.visible_chars) +
               std::string(secret.size() - config_.visible_chars, config_.mask_char[0]);
    }

    /**
     * @brief Mask the directory part of a local path
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char[0]) + path.substr(last_sep);
    }

    /**
     * @brief Drop the query string of a URL
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        if (!config_.mask_query_strings) {
            return url;
        }
        auto q = url.find('?');
        if (q == std::string::npos) {
            return url;
        }
        return url.substr(0, q + 1) + config_.mask_char;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_tokens(const std::string& input) const -> std::string {
        static const std::regex token_pattern(R"(([Tt]oken)(\s*[:=]?\s*)([A-Za-z0-9._\-]+))");

        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), token_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            const auto& m = *it;
            out += input.substr(last_pos, m.position() - last_pos);
            out += m[1].str() + m[2].str() + mask_secret(m[3].str());
            last_pos = m.position() + m.length();
        }
        out += input.substr(last_pos);
        return out;
    }

    [[nodiscard]] auto mask_query_strings(const std::string& input) const -> std::string {
        static const std::regex url_pattern(R"(https?://[^\s?]+\?[^\s]+)");

        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), url_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            out += input.substr(last_pos, it->position() - last_pos);
            out += mask_url(it->str());
            last_pos = it->position() + it->length();
        }
        out += input.substr(last_pos);
        return out;
    }

    [[nodiscard]] auto mask_local_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(R"((?:^|\s)((?:\/[a-zA-Z0-9._-]+){2,}))");

        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            const auto& m = *it;
            auto pos = static_cast<size_t>(m.position(1));
            out += input.substr(last_pos, pos - last_pos);
            out += mask_path(m[1].str());
            last_pos = pos + static_cast<size_t>(m.length(1));
        }
        out += input.substr(last_pos);
        return out;
    }

    masking_config config_;
};

namespace detail {

[[nodiscard]] inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for requests and transfers
 */
struct request_log_context {
    std::string method;
    std::string url;
    std::optional<int> status_code;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> delay_ms;
    std::optional<uint64_t> item_count;
    std::optional<uint64_t> task_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!method.empty()) add_field("method", method);
        if (!url.empty()) add_field("url", masker ? masker->mask_url(url) : url);
        if (status_code) add_uint("status", static_cast<uint64_t>(*status_code));
        if (attempt) add_uint("attempt", *attempt);
        if (delay_ms) add_uint("delay_ms", *delay_ms);
        if (item_count) add_uint("item_count", *item_count);
        if (task_id) add_uint("task_id", *task_id);
        if (!filename.empty()) add_field("filename", masker ? masker->mask_path(filename) : filename);
        if (file_size) add_uint("size", *file_size);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", masker ? masker->mask(*error_message) : *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<request_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }
        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::http)
 *     .with_message("GET finished")
 *     .with_url("https://cube.example.org/api/v1/plugins/")
 *     .with_status(200)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_url(std::string_view url) -> log_entry_builder& {
        ensure_context().url = std::string(url);
        return *this;
    }

    auto with_status(int status) -> log_entry_builder& {
        ensure_context().status_code = status;
        return *this;
    }

    auto with_task_id(uint64_t id) -> log_entry_builder& {
        ensure_context().task_id = id;
        return *this;
    }

    auto with_filename(std::string_view filename) -> log_entry_builder& {
        ensure_context().filename = std::string(filename);
        return *this;
    }

    auto with_error_message(std::string_view message) -> log_entry_builder& {
        ensure_context().error_message = std::string(message);
        return *this;
    }

    auto with_source_location(const char* file, int line) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        return *this;
    }

    auto with_context(const request_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

private:
    auto ensure_context() -> request_log_context& {
        if (!entry_.context) {
            entry_.context = request_log_context{};
        }
        return *entry_.context;
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Logger shared by every CUBE client component
 */
class cube_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const request_log_context*)>;

    cube_logger() = default;
    ~cube_logger() = default;

    cube_logger(const cube_logger&) = delete;
    cube_logger& operator=(const cube_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called by cube_client::builder::connect().
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if CUBE_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (built) {
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#if CUBE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if CUBE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Receive every enabled message in addition to the sink
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const request_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string masked = masker.mask(std::string(message));
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked, context);
            }
        }

        std::string line_text;
        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0) {
                builder.with_source_location(file, line);
            }
            if (context) {
                builder.with_context(*context);
            }
            line_text = builder.build().to_json_with_masking(&masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masked;
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            line_text = oss.str();
        }

        write(level, line_text, format == log_output_format::text);
    }

    void flush() {
#if CUBE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write(log_level level, const std::string& text, bool with_prefix) {
#if CUBE_USE_LOGGER_SYSTEM
        if (logger_) {
            (void)with_prefix;
            logger_->log(to_logger_level(level), text);
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        if (with_prefix) {
            std::cerr << get_timestamp() << " [" << log_level_to_string(level) << "] ";
        }
        std::cerr << text << "\n";
    }

#if CUBE_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::warn};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline cube_logger& get_logger() {
    static cube_logger instance;
    return instance;
}

#define CUBE_LOG(level, category, message) \
    kcenon::cube::get_logger().log(level, category, message, nullptr, __FILE__, __LINE__)

#define CUBE_LOG_CTX(level, category, message, context) \
    kcenon::cube::get_logger().log(level, category, message, &context, __FILE__, __LINE__)

#define CUBE_LOG_TRACE(category, message) \
    CUBE_LOG(kcenon::cube::log_level::trace, category, message)

#define CUBE_LOG_DEBUG(category, message) \
    CUBE_LOG(kcenon::cube::log_level::debug, category, message)

#define CUBE_LOG_INFO(category, message) \
    CUBE_LOG(kcenon::cube::log_level::info, category, message)

#define CUBE_LOG_WARN(category, message) \
    CUBE_LOG(kcenon::cube::log_level::warn, category, message)

#define CUBE_LOG_ERROR(category, message) \
    CUBE_LOG(kcenon::cube::log_level::error, category, message)

#define CUBE_LOG_FATAL(category, message) \
    CUBE_LOG(kcenon::cube::log_level::fatal, category, message)

#define CUBE_LOG_DEBUG_CTX(category, message, ctx) \
    CUBE_LOG_CTX(kcenon::cube::log_level::debug, category, message, ctx)

#define CUBE_LOG_INFO_CTX(category, message, ctx) \
    CUBE_LOG_CTX(kcenon::cube::log_level::info, category, message, ctx)

#define CUBE_LOG_WARN_CTX(category, message, ctx) \
    CUBE_LOG_CTX(kcenon::cube::log_level::warn, category, message, ctx)

#define CUBE_LOG_ERROR_CTX(category, message, ctx) \
    CUBE_LOG_CTX(kcenon::cube::log_level::error, category, message, ctx)

}  // namespace kcenon::cube
