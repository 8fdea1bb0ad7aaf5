/**
 * @file retry_policy.h
 * @brief Retry classification and the retrying transport decorator
 */

#ifndef KCENON_CUBE_HTTP_RETRY_POLICY_H
#define KCENON_CUBE_HTTP_RETRY_POLICY_H

#include "kcenon/cube/http/http_types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace kcenon::cube {

/**
 * @brief Exponential backoff configuration
 */
struct retry_policy {
    /// Retries after the first attempt; 0 disables retrying
    uint32_t max_retries = 3;

    /// Delay before the first retry
    std::chrono::milliseconds initial_delay{500};

    /// Upper bound for any single delay
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Scale each delay by a random factor in [0.5, 1.5)
    bool use_jitter = true;

    /**
     * @brief Policy that never retries
     */
    [[nodiscard]] static auto none() -> retry_policy {
        retry_policy policy;
        policy.max_retries = 0;
        return policy;
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (backoff_multiplier < 1.0) {
            return unexpected{error{error_code::invalid_configuration,
                "backoff_multiplier must be >= 1.0"}};
        }
        if (max_delay < initial_delay) {
            return unexpected{error{error_code::invalid_configuration,
                "max_delay must not be smaller than initial_delay"}};
        }
        return {};
    }
};

/**
 * @brief What to do with the raw outcome of one attempt
 */
enum class retry_classification {
    success,    ///< Hand the response to the caller
    transient,  ///< Retry after backoff
    fatal,      ///< Hand the response to the caller, never retry
};

[[nodiscard]] constexpr auto to_string(retry_classification c) -> const char* {
    switch (c) {
        case retry_classification::success: return "success";
        case retry_classification::transient: return "transient";
        case retry_classification::fatal: return "fatal";
        default: return "unknown";
    }
}

/**
 * @brief Classify an attempt
 *
 * No response and 5xx are transient, 4xx is fatal, anything else is success.
 */
[[nodiscard]] auto classify_outcome(const result<http_response>& outcome)
    -> retry_classification;

/**
 * @brief Delay before retry number @p attempt (1-based)
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy, uint32_t attempt)
    -> std::chrono::milliseconds;

/**
 * @brief Transport decorator that retries transient failures
 *
 * After max_retries retries the last outcome is returned unchanged: the
 * transport error, or the final 5xx response.
 */
class retrying_transport : public http_transport {
public:
    using sleep_function = std::function<void(std::chrono::milliseconds)>;

    retrying_transport(std::shared_ptr<http_transport> inner,
                       retry_policy policy,
                       sleep_function sleeper = {});

    [[nodiscard]] auto execute(const http_request& request) -> result<http_response> override;

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

private:
    std::shared_ptr<http_transport> inner_;
    retry_policy policy_;
    sleep_function sleeper_;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_HTTP_RETRY_POLICY_H
