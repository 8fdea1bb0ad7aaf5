/**
 * @file retry_policy.cpp
 * @brief Retry classification and the retrying transport decorator
 */

#include "kcenon/cube/http/retry_policy.h"

#include "kcenon/cube/core/logging.h"

#include <algorithm>
#include <random>
#include <thread>

namespace kcenon::cube {

auto classify_outcome(const result<http_response>& outcome) -> retry_classification {
    if (!outcome.has_value()) {
        return retry_classification::transient;
    }
    auto status = outcome.value().status_code;
    if (status >= 500 && status < 600) {
        return retry_classification::transient;
    }
    if (status >= 400 && status < 500) {
        return retry_classification::fatal;
    }
    return retry_classification::success;
}

auto calculate_retry_delay(const retry_policy& policy, uint32_t attempt)
    -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (uint32_t i = 1; i < attempt; ++i) {
        delay *= policy.backoff_multiplier;
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

retrying_transport::retrying_transport(std::shared_ptr<http_transport> inner,
                                       retry_policy policy,
                                       sleep_function sleeper)
    : inner_(std::move(inner)), policy_(std::move(policy)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

auto retrying_transport::execute(const http_request& request) -> result<http_response> {
    uint32_t retries = 0;

    while (true) {
        auto outcome = inner_->execute(request);
        auto classification = classify_outcome(outcome);

        if (classification != retry_classification::transient ||
            retries >= policy_.max_retries) {
            if (classification == retry_classification::transient && policy_.max_retries > 0) {
                request_log_context ctx;
                ctx.method = to_string(request.method);
                ctx.url = request.full_url();
                ctx.attempt = retries + 1;
                CUBE_LOG_WARN_CTX(log_category::retry, "Giving up after retries", ctx);
            }
            return outcome;
        }

        ++retries;
        auto delay = calculate_retry_delay(policy_, retries);

        request_log_context ctx;
        ctx.method = to_string(request.method);
        ctx.url = request.full_url();
        ctx.attempt = retries;
        ctx.delay_ms = static_cast<uint64_t>(delay.count());
        if (outcome.has_value()) {
            ctx.status_code = outcome.value().status_code;
        } else {
            ctx.error_message = outcome.error().message;
        }
        CUBE_LOG_INFO_CTX(log_category::retry, "Retrying transient failure", ctx);

        sleeper_(delay);
    }
}

}  // namespace kcenon::cube
