/**
 * @file cube_client.cpp
 * @brief Implementation of client connection and uploads
 */

#include "kcenon/cube/client/cube_client.h"

#include <fstream>
#include <iterator>
#include <system_error>

#include "kcenon/cube/core/json_utils.h"
#include "kcenon/cube/core/logging.h"
#include "kcenon/cube/core/url_utils.h"
#include "kcenon/cube/http/multipart.h"
#include "kcenon/cube/http/network_http_transport.h"

namespace kcenon::cube {

auto get_auth_token(std::shared_ptr<http_transport> transport,
                    const std::string& url,
                    const std::string& username,
                    const std::string& password) -> result<std::string> {
    auto validated = url_utils::validate_cube_url(url);
    if (!validated) {
        return unexpected{validated.error()};
    }

    Json::Value body(Json::objectValue);
    body["username"] = username;
    body["password"] = password;

    api_client client(std::move(transport));
    auto reply = client.post_json(validated.value() + "auth-token/", body);
    if (!reply) {
        CUBE_LOG_WARN(log_category::client, "Login failed for " + username + ": " +
                      reply.error().describe());
        return unexpected{reply.error()};
    }
    return json_utils::get_string(reply.value(), "token");
}

namespace detail {

auto fetch_links(const api_client& client, const std::string& url) -> result<cube_links> {
    auto root = client.get_json(url, {{"limit", "0"}});
    if (!root) {
        return unexpected{root.error()};
    }
    return cube_links::from_json(root.value());
}

auto upload_bytes(const api_client& client,
                  const cube_links& links,
                  const std::string& username,
                  std::vector<uint8_t> content,
                  const std::string& filename,
                  const std::string& upload_path) -> result<user_file_response> {
    if (!links.userfiles) {
        return unexpected{error{error_code::missing_link, "server has no userfiles link"}};
    }

    auto size = content.size();
    multipart_form form;
    form.add_text("upload_path", username + "/uploads/" + upload_path);
    form.add_file("fname", filename, std::move(content));

    auto reply = client.post_multipart(*links.userfiles, form);
    if (!reply) {
        return unexpected{reply.error()};
    }

    request_log_context ctx;
    ctx.filename = upload_path;
    ctx.file_size = size;
    CUBE_LOG_DEBUG_CTX(log_category::client, "Uploaded file", ctx);
    return user_file_response::from_json(reply.value());
}

auto read_local_file(const std::filesystem::path& path) -> result<std::vector<uint8_t>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_not_found, "File not found: " + path.string()}};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return unexpected{error{error_code::file_access_denied,
            "Cannot open file: " + path.string()}};
    }
    std::vector<uint8_t> content((std::istreambuf_iterator<char>(in)),
                                 std::istreambuf_iterator<char>());
    if (in.bad()) {
        return unexpected{error{error_code::file_read_error,
            "Failed to read file: " + path.string()}};
    }
    return content;
}

}  // namespace detail

// ============================================================================
// client_builder
// ============================================================================

client_builder::client_builder() = default;

auto client_builder::with_url(std::string url) -> client_builder& {
    config_.url = std::move(url);
    return *this;
}

auto client_builder::with_username(std::string username) -> client_builder& {
    config_.username = std::move(username);
    return *this;
}

auto client_builder::with_token(std::string token) -> client_builder& {
    config_.token = std::move(token);
    return *this;
}

auto client_builder::with_password(std::string password) -> client_builder& {
    password_ = std::move(password);
    return *this;
}

auto client_builder::with_retry_policy(const retry_policy& policy) -> client_builder& {
    config_.retry = policy;
    return *this;
}

auto client_builder::with_retries(uint32_t max_retries) -> client_builder& {
    config_.retry.max_retries = max_retries;
    return *this;
}

auto client_builder::with_timeout(std::chrono::milliseconds timeout) -> client_builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto client_builder::with_page_limit(uint32_t limit) -> client_builder& {
    config_.page_limit = limit;
    return *this;
}

auto client_builder::with_transport(std::shared_ptr<http_transport> transport)
    -> client_builder& {
    base_transport_ = std::move(transport);
    return *this;
}

auto client_builder::with_sleep_function(retrying_transport::sleep_function sleeper)
    -> client_builder& {
    sleeper_ = std::move(sleeper);
    return *this;
}

auto client_builder::make_transport() const -> std::shared_ptr<http_transport> {
    auto base = base_transport_ ? base_transport_
                                : make_network_http_transport(config_.request_timeout);
    return std::make_shared<retrying_transport>(std::move(base), config_.retry, sleeper_);
}

auto client_builder::connect() -> result<cube_client> {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    auto url = url_utils::validate_cube_url(config_.url);
    if (!url) {
        return unexpected{url.error()};
    }
    if (!config_.username) {
        return unexpected{error{error_code::invalid_configuration,
            "connect() needs a username; use connect_anonymous() otherwise"}};
    }

    auto transport = make_transport();
    if (!config_.token) {
        if (!password_) {
            return unexpected{error{error_code::invalid_configuration,
                "connect() needs a token or a password"}};
        }
        auto token = get_auth_token(transport, url.value(), *config_.username, *password_);
        if (!token) {
            return unexpected{token.error()};
        }
        config_.token = std::move(token.value());
    }

    auto validated = config_.validate();
    if (!validated) {
        return unexpected{validated.error()};
    }

    api_client client(transport, config_.token);
    auto links = detail::fetch_links(client, url.value());
    if (!links) {
        return unexpected{links.error()};
    }

    CUBE_LOG_INFO(log_category::client,
                  "Connected to " + url.value() + " as " + *config_.username);
    return cube_client(std::move(url.value()), config_.username, std::move(client),
                       std::move(links.value()), config_.page_limit);
}

auto client_builder::connect_anonymous() -> result<anonymous_client> {
    get_logger().initialize();

    auto url = url_utils::validate_cube_url(config_.url);
    if (!url) {
        return unexpected{url.error()};
    }

    auto anonymous = config_;
    anonymous.token.reset();
    auto validated = anonymous.validate();
    if (!validated) {
        return unexpected{validated.error()};
    }

    api_client client(make_transport());
    auto links = detail::fetch_links(client, url.value());
    if (!links) {
        return unexpected{links.error()};
    }

    CUBE_LOG_INFO(log_category::client, "Connected anonymously to " + url.value());
    return anonymous_client(std::move(url.value()), std::nullopt, std::move(client),
                            std::move(links.value()), config_.page_limit);
}

}  // namespace kcenon::cube
