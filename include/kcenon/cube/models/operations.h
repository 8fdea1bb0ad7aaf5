/**
 * @file operations.h
 * @brief Follow-up calls on linked resources
 *
 * Read operations work for either capability; the ones that create or
 * modify remote state accept only rw_access models.
 */

#ifndef KCENON_CUBE_MODELS_OPERATIONS_H
#define KCENON_CUBE_MODELS_OPERATIONS_H

#include "kcenon/cube/models/linked_model.h"
#include "kcenon/cube/models/resources.h"
#include "kcenon/cube/search/search.h"

#include <json/json.h>

#include <optional>
#include <string>

namespace kcenon::cube {

namespace detail {

template <typename R, typename A>
[[nodiscard]] auto linked_collection(const api_client& client, const std::string& url)
    -> search<R, A> {
    if (url.empty()) {
        return search<R, A>::empty();
    }
    return search<R, A>(client, collection_query::collection(url));
}

}  // namespace detail

// ============================================================================
// Feeds
// ============================================================================

[[nodiscard]] inline auto set_name(const linked_model<feed_response, rw_access>& feed,
                                   const std::string& name)
    -> result<linked_model<feed_response, rw_access>> {
    Json::Value fields(Json::objectValue);
    fields["name"] = name;
    return feed.put(fields);
}

template <typename A>
[[nodiscard]] auto plugin_instances(const linked_model<feed_response, A>& feed)
    -> search<plugin_instance_response, A> {
    return detail::linked_collection<plugin_instance_response, A>(
        feed.client(), feed->plugin_instances);
}

// ============================================================================
// Plugins
// ============================================================================

/**
 * @brief Run a plugin
 * @param params Body of the request, e.g. {"previous_id": 5, "title": "..."}
 */
[[nodiscard]] inline auto create_instance(const linked_model<plugin_response, rw_access>& plugin,
                                          const Json::Value& params)
    -> result<linked_model<plugin_instance_response, rw_access>> {
    if (plugin->instances.empty()) {
        return unexpected{error{error_code::missing_link,
            "plugin " + plugin->name + " has no instances link"}};
    }
    return plugin.post_to<plugin_instance_response>(plugin->instances, params);
}

template <typename A>
[[nodiscard]] auto parameters(const linked_model<plugin_response, A>& plugin)
    -> search<plugin_parameter, A> {
    return detail::linked_collection<plugin_parameter, A>(plugin.client(), plugin->parameters);
}

// ============================================================================
// Plugin instances
// ============================================================================

template <typename A>
[[nodiscard]] auto feed_of(const linked_model<plugin_instance_response, A>& instance)
    -> lazy_linked_model<feed_response, A> {
    return lazy_linked_model<feed_response, A>(instance.client(), instance->feed);
}

template <typename A>
[[nodiscard]] auto plugin_of(const linked_model<plugin_instance_response, A>& instance)
    -> lazy_linked_model<plugin_response, A> {
    return lazy_linked_model<plugin_response, A>(instance.client(), instance->plugin);
}

template <typename A>
[[nodiscard]] auto previous_of(const linked_model<plugin_instance_response, A>& instance)
    -> std::optional<lazy_linked_model<plugin_instance_response, A>> {
    if (!instance->previous) {
        return std::nullopt;
    }
    return lazy_linked_model<plugin_instance_response, A>(instance.client(), *instance->previous);
}

template <typename A>
[[nodiscard]] auto files(const linked_model<plugin_instance_response, A>& instance)
    -> search<file_response, A> {
    return detail::linked_collection<file_response, A>(instance.client(), instance->files);
}

template <typename A>
[[nodiscard]] auto parameters(const linked_model<plugin_instance_response, A>& instance)
    -> search<plugin_instance_parameter, A> {
    return detail::linked_collection<plugin_instance_parameter, A>(
        instance.client(), instance->parameters);
}

// ============================================================================
// Pipelines
// ============================================================================

template <typename A>
[[nodiscard]] auto workflows(const linked_model<pipeline_response, A>& pipeline)
    -> search<workflow_response, A> {
    return detail::linked_collection<workflow_response, A>(pipeline.client(), pipeline->workflows);
}

/**
 * @brief Run a pipeline after an existing plugin instance
 * @param nodes_info Per-node overrides; null sends none
 */
[[nodiscard]] auto create_workflow(const linked_model<pipeline_response, rw_access>& pipeline,
                                   plugin_instance_id previous,
                                   const Json::Value& nodes_info = Json::Value())
    -> result<linked_model<workflow_response, rw_access>>;

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_MODELS_OPERATIONS_H
