/**
 * @file network_http_transport.h
 * @brief http_transport backed by the network_system HTTP client
 */

#ifndef KCENON_CUBE_HTTP_NETWORK_HTTP_TRANSPORT_H
#define KCENON_CUBE_HTTP_NETWORK_HTTP_TRANSPORT_H

#include "kcenon/cube/http/http_types.h"

#include <chrono>
#include <memory>

namespace kcenon::cube {

/**
 * @brief Transport that wraps kcenon::network::core::http_client
 *
 * When the library is built without network_system every request fails
 * with connection_failed.
 *
 * @note This transport is thread-safe for concurrent requests.
 */
class network_http_transport : public http_transport {
public:
    explicit network_http_transport(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_transport() override;

    network_http_transport(const network_http_transport&) = delete;
    auto operator=(const network_http_transport&) -> network_http_transport& = delete;
    network_http_transport(network_http_transport&&) noexcept;
    auto operator=(network_http_transport&&) noexcept -> network_http_transport&;

    [[nodiscard]] auto execute(const http_request& request) -> result<http_response> override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if network_system is available, false otherwise
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory function to create the default transport
 */
[[nodiscard]] auto make_network_http_transport(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_transport>;

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_HTTP_NETWORK_HTTP_TRANSPORT_H
