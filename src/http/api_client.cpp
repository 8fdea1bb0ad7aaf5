/**
 * @file api_client.cpp
 * @brief Cheaply copyable handle for issuing CUBE API requests
 */

#include "kcenon/cube/http/api_client.h"

#include "kcenon/cube/core/json_utils.h"
#include "kcenon/cube/core/logging.h"

namespace kcenon::cube {

namespace {

auto make_headers(const std::optional<std::string>& token)
    -> std::shared_ptr<const std::map<std::string, std::string>> {
    auto headers = std::make_shared<std::map<std::string, std::string>>();
    (*headers)["Accept"] = "application/json";
    if (token) {
        (*headers)["Authorization"] = "token " + *token;
    }
    return headers;
}

auto json_body(const Json::Value& body) -> std::vector<uint8_t> {
    auto text = json_utils::to_string(body);
    return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace

api_client::api_client(std::shared_ptr<http_transport> transport,
                       std::optional<std::string> token)
    : transport_(std::move(transport)),
      headers_(make_headers(token)),
      authenticated_(token.has_value()) {}

auto api_client::check(const http_response& response) -> result<void> {
    if (response.is_success()) {
        return {};
    }
    return unexpected{error::remote(response.status_code,
                                    reason_phrase(response.status_code),
                                    response.get_body_string())};
}

auto api_client::send(http_request request) const -> result<http_response> {
    for (const auto& [name, value] : *headers_) {
        request.headers.emplace(name, value);
    }

    auto response = transport_->execute(request);

    request_log_context ctx;
    ctx.method = to_string(request.method);
    ctx.url = request.full_url();
    if (!response) {
        ctx.error_message = response.error().message;
        CUBE_LOG_ERROR_CTX(log_category::http, "Request failed without response", ctx);
        return unexpected{response.error()};
    }

    ctx.status_code = response.value().status_code;
    CUBE_LOG_DEBUG_CTX(log_category::http, "Request finished", ctx);

    auto checked = check(response.value());
    if (!checked) {
        return unexpected{checked.error()};
    }
    return response;
}

auto api_client::send_json(http_request request) const -> result<Json::Value> {
    auto response = send(std::move(request));
    if (!response) {
        return unexpected{response.error()};
    }
    return json_utils::parse(response.value().get_body_string());
}

auto api_client::get_json(const std::string& url, const url_utils::query_params& query) const
    -> result<Json::Value> {
    http_request request;
    request.method = http_method::get;
    request.url = url;
    request.query = query;
    return send_json(std::move(request));
}

auto api_client::get_bytes(const std::string& url) const -> result<std::vector<uint8_t>> {
    http_request request;
    request.method = http_method::get;
    request.url = url;
    request.headers["Accept"] = "*/*";

    auto response = send(std::move(request));
    if (!response) {
        return unexpected{response.error()};
    }
    return std::move(response.value().body);
}

auto api_client::post_json(const std::string& url, const Json::Value& body) const
    -> result<Json::Value> {
    http_request request;
    request.method = http_method::post;
    request.url = url;
    request.headers["Content-Type"] = "application/json";
    request.body = json_body(body);
    return send_json(std::move(request));
}

auto api_client::put_json(const std::string& url, const Json::Value& body) const
    -> result<Json::Value> {
    http_request request;
    request.method = http_method::put;
    request.url = url;
    request.headers["Content-Type"] = "application/json";
    request.body = json_body(body);
    return send_json(std::move(request));
}

auto api_client::delete_resource(const std::string& url) const -> result<void> {
    http_request request;
    request.method = http_method::del;
    request.url = url;

    auto response = send(std::move(request));
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

auto api_client::post_multipart(const std::string& url, const multipart_form& form) const
    -> result<Json::Value> {
    http_request request;
    request.method = http_method::post;
    request.url = url;
    request.headers["Content-Type"] = form.content_type();
    request.body = form.build();
    return send_json(std::move(request));
}

}  // namespace kcenon::cube
