/**
 * @file linked_model.h
 * @brief Resources bundled with the client handle needed to act on them
 */

#ifndef KCENON_CUBE_MODELS_LINKED_MODEL_H
#define KCENON_CUBE_MODELS_LINKED_MODEL_H

#include "kcenon/cube/core/types.h"
#include "kcenon/cube/http/api_client.h"
#include "kcenon/cube/search/access.h"

#include <json/json.h>

#include <string>
#include <utility>

namespace kcenon::cube {

/**
 * @brief A deserialized resource plus a capability-tagged client handle
 *
 * Mutating members exist only on linked_model<R, rw_access>.
 */
template <typename R, typename A>
class linked_model {
    static_assert(is_access_tag_v<A>, "A must be ro_access or rw_access");

public:
    using resource_type = R;
    using access_type = A;

    linked_model(api_client client, R object)
        : client_(std::move(client)), object_(std::move(object)) {}

    [[nodiscard]] auto object() const -> const R& { return object_; }
    [[nodiscard]] auto operator->() const -> const R* { return &object_; }
    [[nodiscard]] auto client() const -> const api_client& { return client_; }

    /**
     * @brief Downgrade to a read-only handle; no request is made
     */
    [[nodiscard]] auto into_read_only() const -> linked_model<R, ro_access> {
        return linked_model<R, ro_access>(client_, object_);
    }

    /**
     * @brief Fetch the current state of this resource from its url
     */
    [[nodiscard]] auto refresh() const -> result<linked_model> {
        auto body = client_.get_json(object_.url);
        if (!body) {
            return unexpected{body.error()};
        }
        auto decoded = R::from_json(body.value());
        if (!decoded) {
            return unexpected{decoded.error()};
        }
        return linked_model(client_, std::move(decoded.value()));
    }

    /**
     * @brief PUT fields to the resource url and return the updated resource
     */
    [[nodiscard]] auto put(const Json::Value& fields) const -> result<linked_model>
        requires is_rw_v<A>
    {
        auto body = client_.put_json(object_.url, fields);
        if (!body) {
            return unexpected{body.error()};
        }
        auto decoded = R::from_json(body.value());
        if (!decoded) {
            return unexpected{decoded.error()};
        }
        return linked_model(client_, std::move(decoded.value()));
    }

    /**
     * @brief POST a body to a link of this resource, decoding the reply as R2
     */
    template <typename R2>
    [[nodiscard]] auto post_to(const std::string& url, const Json::Value& body) const
        -> result<linked_model<R2, A>>
        requires is_rw_v<A>
    {
        auto reply = client_.post_json(url, body);
        if (!reply) {
            return unexpected{reply.error()};
        }
        auto decoded = R2::from_json(reply.value());
        if (!decoded) {
            return unexpected{decoded.error()};
        }
        return linked_model<R2, A>(client_, std::move(decoded.value()));
    }

    /**
     * @brief DELETE this resource
     */
    [[nodiscard]] auto delete_resource() const -> result<void>
        requires is_rw_v<A>
    {
        return client_.delete_resource(object_.url);
    }

private:
    api_client client_;
    R object_;
};

/**
 * @brief GET a single resource and wrap it
 */
template <typename R, typename A>
[[nodiscard]] auto fetch_linked_model(const api_client& client, const std::string& url)
    -> result<linked_model<R, A>> {
    auto body = client.get_json(url);
    if (!body) {
        return unexpected{body.error()};
    }
    auto decoded = R::from_json(body.value());
    if (!decoded) {
        return unexpected{decoded.error()};
    }
    return linked_model<R, A>(client, std::move(decoded.value()));
}

/**
 * @brief A link to a resource that has not been fetched yet
 */
template <typename R, typename A>
class lazy_linked_model {
    static_assert(is_access_tag_v<A>, "A must be ro_access or rw_access");

public:
    lazy_linked_model(api_client client, std::string url)
        : client_(std::move(client)), url_(std::move(url)) {}

    [[nodiscard]] auto url() const -> const std::string& { return url_; }

    [[nodiscard]] auto get() const -> result<linked_model<R, A>> {
        return fetch_linked_model<R, A>(client_, url_);
    }

private:
    api_client client_;
    std::string url_;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_MODELS_LINKED_MODEL_H
