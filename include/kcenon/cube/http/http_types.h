/**
 * @file http_types.h
 * @brief Request/response types and the transport abstraction
 */

#ifndef KCENON_CUBE_HTTP_HTTP_TYPES_H
#define KCENON_CUBE_HTTP_HTTP_TYPES_H

#include "kcenon/cube/core/types.h"
#include "kcenon/cube/core/url_utils.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::cube {

/**
 * @brief HTTP methods used by the CUBE API
 */
enum class http_method {
    get,
    post,
    put,
    del,
};

[[nodiscard]] constexpr auto to_string(http_method method) -> const char* {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::post: return "POST";
        case http_method::put: return "PUT";
        case http_method::del: return "DELETE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Reason phrase for common status codes, empty when unknown
 */
[[nodiscard]] constexpr auto reason_phrase(int status) -> const char* {
    switch (status) {
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

/**
 * @brief An outbound HTTP request
 */
struct http_request {
    http_method method = http_method::get;
    std::string url;
    url_utils::query_params query;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief URL including the encoded query parameters
     */
    [[nodiscard]] auto full_url() const -> std::string {
        return url_utils::append_query(url, query);
    }
};

/**
 * @brief A response as received from the server
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const -> std::optional<std::string> {
        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };
        auto wanted = lower(key);
        for (const auto& [name, value] : headers) {
            if (lower(name) == wanted) {
                return value;
            }
        }
        return std::nullopt;
    }
};

/**
 * @brief Executes HTTP requests
 *
 * A failed result means no response was obtained (connection error,
 * timeout). Any response, including 4xx and 5xx, is a successful result.
 * Implementations must be safe to call from several threads at once.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    [[nodiscard]] virtual auto execute(const http_request& request) -> result<http_response> = 0;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_HTTP_HTTP_TYPES_H
