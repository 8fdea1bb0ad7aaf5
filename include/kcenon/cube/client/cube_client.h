/**
 * @file cube_client.h
 * @brief Entry point: a connection to one CUBE API root
 */

#ifndef KCENON_CUBE_CLIENT_CUBE_CLIENT_H
#define KCENON_CUBE_CLIENT_CUBE_CLIENT_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "kcenon/cube/client/client_types.h"
#include "kcenon/cube/core/types.h"
#include "kcenon/cube/http/api_client.h"
#include "kcenon/cube/http/retry_policy.h"
#include "kcenon/cube/models/linked_model.h"
#include "kcenon/cube/models/resources.h"
#include "kcenon/cube/models/searches.h"
#include "kcenon/cube/search/access.h"
#include "kcenon/cube/search/search.h"

namespace kcenon::cube {

class client_builder;

/**
 * @brief Exchange a username and password for an auth token
 *
 * POSTs {"username", "password"} to "<url>auth-token/".
 */
[[nodiscard]] auto get_auth_token(std::shared_ptr<http_transport> transport,
                                  const std::string& url,
                                  const std::string& username,
                                  const std::string& password) -> result<std::string>;

namespace detail {

[[nodiscard]] auto fetch_links(const api_client& client, const std::string& url)
    -> result<cube_links>;

[[nodiscard]] auto upload_bytes(const api_client& client,
                                const cube_links& links,
                                const std::string& username,
                                std::vector<uint8_t> content,
                                const std::string& filename,
                                const std::string& upload_path) -> result<user_file_response>;

[[nodiscard]] auto read_local_file(const std::filesystem::path& path)
    -> result<std::vector<uint8_t>>;

}  // namespace detail

/**
 * @brief A connected CUBE client
 *
 * The access tag decides what the handles it gives out may do:
 * cube_client (rw_access) is logged in, anonymous_client (ro_access) can
 * only read public data. Copies are cheap and share one transport.
 *
 * @code
 * auto client = cube_client::builder()
 *     .with_url("https://cube.example.org/api/v1/")
 *     .with_username("chris")
 *     .with_token(token)
 *     .connect();
 * if (!client) { ... }
 * auto plugin = client.value().get_plugin("pl-dircopy", "2.1.1");
 * @endcode
 */
template <typename A>
class basic_client {
    static_assert(is_access_tag_v<A>, "A must be ro_access or rw_access");

public:
    using access_type = A;

    /**
     * @brief Create a builder for fluent configuration
     */
    [[nodiscard]] static auto builder() -> client_builder;

    [[nodiscard]] auto url() const -> const std::string& { return url_; }
    [[nodiscard]] auto links() const -> const cube_links& { return links_; }
    [[nodiscard]] auto api() const -> const api_client& { return client_; }

    [[nodiscard]] auto username() const -> const std::string&
        requires is_rw_v<A>
    {
        return *username_;
    }

    // ========================================================================
    // Collections
    // ========================================================================

    [[nodiscard]] auto plugins() const -> plugin_search_builder<A> {
        return plugin_search_builder<A>(client_, search_query(links_.plugins));
    }

    [[nodiscard]] auto pipelines() const -> pipeline_search_builder<A> {
        return pipeline_search_builder<A>(client_, search_query(links_.pipelines));
    }

    [[nodiscard]] auto plugin_instances() const -> plugin_instance_search_builder<A> {
        return plugin_instance_search_builder<A>(client_, search_query(links_.plugin_instances));
    }

    [[nodiscard]] auto public_feeds() const -> feed_search_builder<A> {
        return feed_search_builder<A>(client_, search_query(links_.public_feeds));
    }

    [[nodiscard]] auto files() const -> file_search_builder<A> {
        return file_search_builder<A>(client_, search_query(links_.files));
    }

    /**
     * @brief Feeds owned by the user; Empty for anonymous clients
     */
    [[nodiscard]] auto feeds() const -> search<feed_response, A> {
        if constexpr (is_rw_v<A>) {
            return search<feed_response, A>(client_, plain_query(url_));
        } else {
            return search<feed_response, A>::empty();
        }
    }

    /**
     * @brief Files uploaded by the user; Empty when the server has no such link
     */
    [[nodiscard]] auto userfiles() const -> search<file_response, A> {
        if (!links_.userfiles) {
            return search<file_response, A>::empty();
        }
        return search<file_response, A>(client_, plain_query(*links_.userfiles));
    }

    // ========================================================================
    // Single resources
    // ========================================================================

    [[nodiscard]] auto get_plugin_instance(plugin_instance_id id) const
        -> result<linked_model<plugin_instance_response, A>> {
        return fetch_linked_model<plugin_instance_response, A>(
            client_, links_.plugin_instances + std::to_string(id.value) + "/");
    }

    [[nodiscard]] auto get_feed(feed_id id) const -> result<linked_model<feed_response, A>> {
        return fetch_linked_model<feed_response, A>(client_, url_ + std::to_string(id.value) + "/");
    }

    /**
     * @brief The plugin with this exact name and version
     */
    [[nodiscard]] auto get_plugin(const std::string& name, const std::string& version) const
        -> result<linked_model<plugin_response, A>> {
        return plugins().name_exact(name).version(version).build().only();
    }

    /**
     * @brief Downgrade the capability tag; no request is made
     */
    [[nodiscard]] auto into_read_only() const -> basic_client<ro_access> {
        return basic_client<ro_access>(url_, std::nullopt, client_, links_, page_limit_);
    }

    // ========================================================================
    // Uploads
    // ========================================================================

    /**
     * @brief Upload bytes to "<username>/uploads/<upload_path>"
     */
    [[nodiscard]] auto upload_bytes(std::vector<uint8_t> content,
                                    const std::string& filename,
                                    const std::string& upload_path) const
        -> result<user_file_response>
        requires is_rw_v<A>
    {
        return detail::upload_bytes(client_, links_, *username_, std::move(content),
                                    filename, upload_path);
    }

    /**
     * @brief Upload a local file to "<username>/uploads/<upload_path>"
     */
    [[nodiscard]] auto upload_file(const std::filesystem::path& local_file,
                                   const std::string& upload_path) const
        -> result<user_file_response>
        requires is_rw_v<A>
    {
        auto content = detail::read_local_file(local_file);
        if (!content) {
            return unexpected{content.error()};
        }
        return upload_bytes(std::move(content.value()),
                            local_file.filename().string(), upload_path);
    }

private:
    friend class client_builder;
    template <typename> friend class basic_client;

    basic_client(std::string url,
                 std::optional<std::string> username,
                 api_client client,
                 cube_links links,
                 std::optional<uint32_t> page_limit)
        : url_(std::move(url)),
          username_(std::move(username)),
          client_(std::move(client)),
          links_(std::move(links)),
          page_limit_(page_limit) {}

    [[nodiscard]] auto search_query(const std::string& collection_url) const -> collection_query {
        return with_limit(collection_query::search(collection_url));
    }

    [[nodiscard]] auto plain_query(const std::string& collection_url) const -> collection_query {
        return with_limit(collection_query::collection(collection_url));
    }

    [[nodiscard]] auto with_limit(collection_query query) const -> collection_query {
        if (page_limit_) {
            return query.with_page_limit(*page_limit_);
        }
        return query;
    }

    std::string url_;
    std::optional<std::string> username_;
    api_client client_;
    cube_links links_;
    std::optional<uint32_t> page_limit_;
};

using cube_client = basic_client<rw_access>;
using anonymous_client = basic_client<ro_access>;

/**
 * @brief Builder for cube_client and anonymous_client
 *
 * Every request goes through a retrying_transport wrapping the base
 * transport, which defaults to network_http_transport.
 */
class client_builder {
public:
    client_builder();

    /**
     * @brief Set the API root; must end with "/api/v1/"
     * @return Reference to builder for chaining
     */
    auto with_url(std::string url) -> client_builder&;

    auto with_username(std::string username) -> client_builder&;

    auto with_token(std::string token) -> client_builder&;

    /**
     * @brief Log in with a password when no token is set
     * @return Reference to builder for chaining
     */
    auto with_password(std::string password) -> client_builder&;

    auto with_retry_policy(const retry_policy& policy) -> client_builder&;

    /**
     * @brief Shorthand for changing only max_retries
     * @return Reference to builder for chaining
     */
    auto with_retries(uint32_t max_retries) -> client_builder&;

    auto with_timeout(std::chrono::milliseconds timeout) -> client_builder&;

    auto with_page_limit(uint32_t limit) -> client_builder&;

    /**
     * @brief Replace the base transport (wrapped in the retry layer)
     * @return Reference to builder for chaining
     */
    auto with_transport(std::shared_ptr<http_transport> transport) -> client_builder&;

    /**
     * @brief Replace the function used to wait between retries
     * @return Reference to builder for chaining
     */
    auto with_sleep_function(retrying_transport::sleep_function sleeper) -> client_builder&;

    [[nodiscard]] auto config() const -> const client_config& { return config_; }

    /**
     * @brief Log in and fetch the API root
     * @return Result containing the client or an error
     */
    [[nodiscard]] auto connect() -> result<cube_client>;

    /**
     * @brief Fetch the API root without credentials
     * @return Result containing the client or an error
     */
    [[nodiscard]] auto connect_anonymous() -> result<anonymous_client>;

private:
    [[nodiscard]] auto make_transport() const -> std::shared_ptr<http_transport>;

    client_config config_;
    std::optional<std::string> password_;
    std::shared_ptr<http_transport> base_transport_;
    retrying_transport::sleep_function sleeper_;
};

template <typename A>
auto basic_client<A>::builder() -> client_builder {
    return client_builder();
}

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_CLIENT_CUBE_CLIENT_H
