/**
 * @file api_client.h
 * @brief Cheaply copyable handle for issuing CUBE API requests
 */

#ifndef KCENON_CUBE_HTTP_API_CLIENT_H
#define KCENON_CUBE_HTTP_API_CLIENT_H

#include "kcenon/cube/core/types.h"
#include "kcenon/cube/core/url_utils.h"
#include "kcenon/cube/http/http_types.h"
#include "kcenon/cube/http/multipart.h"

#include <json/json.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::cube {

/**
 * @brief Client handle shared by searches and linked models
 *
 * Copies share the same transport and the same immutable header set, so a
 * handle can be handed to any number of concurrent tasks without locking.
 * The Authorization header is computed once, when the handle is created.
 */
class api_client {
public:
    /**
     * @param transport Transport used for every request (normally a retrying_transport)
     * @param token Auth token; anonymous handles pass std::nullopt
     */
    explicit api_client(std::shared_ptr<http_transport> transport,
                        std::optional<std::string> token = std::nullopt);

    [[nodiscard]] auto get_json(const std::string& url,
                                const url_utils::query_params& query = {}) const
        -> result<Json::Value>;

    /**
     * @brief GET raw bytes, e.g. the contents of a file_resource
     */
    [[nodiscard]] auto get_bytes(const std::string& url) const -> result<std::vector<uint8_t>>;

    [[nodiscard]] auto post_json(const std::string& url, const Json::Value& body) const
        -> result<Json::Value>;

    [[nodiscard]] auto put_json(const std::string& url, const Json::Value& body) const
        -> result<Json::Value>;

    [[nodiscard]] auto delete_resource(const std::string& url) const -> result<void>;

    [[nodiscard]] auto post_multipart(const std::string& url, const multipart_form& form) const
        -> result<Json::Value>;

    [[nodiscard]] auto is_authenticated() const noexcept -> bool { return authenticated_; }

    [[nodiscard]] auto transport() const -> std::shared_ptr<http_transport> { return transport_; }

    /**
     * @brief Turn a non-2xx response into a remote_error carrying the body
     */
    [[nodiscard]] static auto check(const http_response& response) -> result<void>;

private:
    [[nodiscard]] auto send(http_request request) const -> result<http_response>;

    [[nodiscard]] auto send_json(http_request request) const -> result<Json::Value>;

    std::shared_ptr<http_transport> transport_;
    std::shared_ptr<const std::map<std::string, std::string>> headers_;
    bool authenticated_ = false;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_HTTP_API_CLIENT_H
