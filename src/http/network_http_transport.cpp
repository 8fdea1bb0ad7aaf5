/**
 * @file network_http_transport.cpp
 * @brief http_transport backed by the network_system HTTP client
 */

#include "kcenon/cube/http/network_http_transport.h"

#include "kcenon/cube/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::cube {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_transport::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response converted;
        converted.status_code = resp.status_code;
        converted.headers = resp.headers;
        converted.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return converted;
    }

    static auto request_failed(const http_request& request) -> unexpected {
        return unexpected{error{error_code::connection_failed,
            std::string("HTTP ") + to_string(request.method) + " request failed: " +
            request.url}};
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_transport::network_http_transport(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_transport::~network_http_transport() = default;

network_http_transport::network_http_transport(network_http_transport&&) noexcept = default;
auto network_http_transport::operator=(network_http_transport&&) noexcept
    -> network_http_transport& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_http_transport::execute(const http_request& request) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::internal_error,
            "HTTP client not initialized"}};
    }

    // Query parameters are already encoded into the URL so that their order
    // matches the order they were added in.
    const auto url = request.full_url();

    switch (request.method) {
        case http_method::get: {
            auto response = impl_->client->get(url, {}, request.headers);
            if (response.is_err()) {
                return impl::request_failed(request);
            }
            return impl::convert_response(response.value());
        }
        case http_method::post: {
            auto response = impl_->client->post(url, request.body, request.headers);
            if (response.is_err()) {
                return impl::request_failed(request);
            }
            return impl::convert_response(response.value());
        }
        case http_method::put: {
            std::string body(request.body.begin(), request.body.end());
            auto response = impl_->client->put(url, body, request.headers);
            if (response.is_err()) {
                return impl::request_failed(request);
            }
            return impl::convert_response(response.value());
        }
        case http_method::del: {
            auto response = impl_->client->del(url, request.headers);
            if (response.is_err()) {
                return impl::request_failed(request);
            }
            return impl::convert_response(response.value());
        }
    }
    return unexpected{error{error_code::internal_error, "unsupported HTTP method"}};
#else
    (void)request;
    return unexpected{error{error_code::connection_failed,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto network_http_transport::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_network_http_transport(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_transport> {
    return std::make_shared<network_http_transport>(timeout);
}

}  // namespace kcenon::cube
