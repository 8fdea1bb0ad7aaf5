/**
 * @file client_types.h
 * @brief Client-related type definitions for cube_client_system
 */

#ifndef KCENON_CUBE_CLIENT_CLIENT_TYPES_H
#define KCENON_CUBE_CLIENT_CLIENT_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "kcenon/cube/core/types.h"
#include "kcenon/cube/http/retry_policy.h"

namespace kcenon::cube {

/**
 * @brief Client configuration
 */
struct client_config {
    /// API root, e.g. "https://cube.example.org/api/v1/"
    std::string url;
    std::optional<std::string> username;
    std::optional<std::string> token;
    retry_policy retry;
    std::chrono::milliseconds request_timeout{30000};

    /// Page size requested by the collections handed out by the client
    std::optional<uint32_t> page_limit;

    std::string user_agent = "cube_client_system/0.1.0";

    [[nodiscard]] auto validate() const -> result<void> {
        if (request_timeout.count() <= 0) {
            return unexpected{error{error_code::invalid_configuration,
                "request_timeout must be positive"}};
        }
        if (page_limit && *page_limit == 0) {
            return unexpected{error{error_code::invalid_configuration,
                "page_limit must be greater than zero"}};
        }
        if (token && !username) {
            return unexpected{error{error_code::invalid_configuration,
                "an authenticated client needs a username"}};
        }
        return retry.validate();
    }
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_CLIENT_CLIENT_TYPES_H
