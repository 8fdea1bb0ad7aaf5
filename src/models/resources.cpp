/**
 * @file resources.cpp
 * @brief Decoding of CUBE API resources
 */

#include "kcenon/cube/models/resources.h"

#include "kcenon/cube/core/json_utils.h"

namespace kcenon::cube {

using json_utils::get_bool;
using json_utils::get_optional_string;
using json_utils::get_optional_u32;
using json_utils::get_string;
using json_utils::get_string_or_empty;
using json_utils::get_u32;
using json_utils::get_u64;

// Assigns a required field or returns its decode error from the caller.
#define CUBE_REQUIRE(target, expr)              \
    do {                                        \
        auto field_ = (expr);                   \
        if (!field_) {                          \
            return unexpected{field_.error()};  \
        }                                       \
        target = std::move(field_.value());     \
    } while (false)

// ============================================================================
// cube_links
// ============================================================================

auto cube_links::from_json(const Json::Value& json) -> result<cube_links> {
    if (!json.isObject() || !json.isMember("collection_links")) {
        return unexpected{error{error_code::decode_error,
            "response has no collection_links"}};
    }
    const auto& links_json = json["collection_links"];

    cube_links links;
    CUBE_REQUIRE(links.public_feeds, get_string(links_json, "public_feeds"));
    CUBE_REQUIRE(links.files, get_string(links_json, "files"));
    CUBE_REQUIRE(links.plugins, get_string(links_json, "plugins"));
    CUBE_REQUIRE(links.plugin_instances, get_string(links_json, "plugin_instances"));
    CUBE_REQUIRE(links.pipelines, get_string(links_json, "pipelines"));
    CUBE_REQUIRE(links.filebrowser, get_string(links_json, "filebrowser"));

    links.userfiles = get_optional_string(links_json, "userfiles");
    if (!links.userfiles) {
        links.userfiles = get_optional_string(links_json, "uploadedfiles");
    }
    links.user = get_optional_string(links_json, "user");
    return links;
}

// ============================================================================
// Plugins
// ============================================================================

auto plugin_response::from_json(const Json::Value& json) -> result<plugin_response> {
    plugin_response p;
    CUBE_REQUIRE(p.url, get_string(json, "url"));
    uint32_t id = 0;
    CUBE_REQUIRE(id, get_u32(json, "id"));
    p.id = plugin_id(id);
    CUBE_REQUIRE(p.name, get_string(json, "name"));
    CUBE_REQUIRE(p.version, get_string(json, "version"));
    p.dock_image = get_string_or_empty(json, "dock_image");
    p.plugin_type = get_string_or_empty(json, "type");
    p.title = get_string_or_empty(json, "title");
    p.description = get_string_or_empty(json, "description");
    p.parameters = get_string_or_empty(json, "parameters");
    p.instances = get_string_or_empty(json, "instances");
    return p;
}

auto plugin_parameter::from_json(const Json::Value& json) -> result<plugin_parameter> {
    plugin_parameter p;
    CUBE_REQUIRE(p.url, get_string(json, "url"));
    CUBE_REQUIRE(p.id, get_u32(json, "id"));
    CUBE_REQUIRE(p.name, get_string(json, "name"));
    p.parameter_type = get_string_or_empty(json, "type");
    auto optional_flag = get_bool(json, "optional");
    p.optional = optional_flag ? optional_flag.value() : false;
    p.flag = get_string_or_empty(json, "flag");
    p.help = get_string_or_empty(json, "help");
    if (json.isMember("default")) {
        p.default_value = json["default"];
    }
    return p;
}

// ============================================================================
// Feeds and plugin instances
// ============================================================================

auto feed_response::from_json(const Json::Value& json) -> result<feed_response> {
    feed_response f;
    CUBE_REQUIRE(f.url, get_string(json, "url"));
    uint32_t id = 0;
    CUBE_REQUIRE(id, get_u32(json, "id"));
    f.id = feed_id(id);
    CUBE_REQUIRE(f.name, get_string(json, "name"));
    f.creator_username = get_string_or_empty(json, "creator_username");
    f.creation_date = get_string_or_empty(json, "creation_date");
    f.plugin_instances = get_string_or_empty(json, "plugin_instances");
    return f;
}

auto plugin_instance_response::from_json(const Json::Value& json)
    -> result<plugin_instance_response> {
    plugin_instance_response p;
    CUBE_REQUIRE(p.url, get_string(json, "url"));
    uint32_t id = 0;
    CUBE_REQUIRE(id, get_u32(json, "id"));
    p.id = plugin_instance_id(id);
    p.title = get_string_or_empty(json, "title");
    CUBE_REQUIRE(p.plugin, get_string(json, "plugin"));
    uint32_t plugin = 0;
    CUBE_REQUIRE(plugin, get_u32(json, "plugin_id"));
    p.plugin_id_value = plugin_id(plugin);
    CUBE_REQUIRE(p.plugin_name, get_string(json, "plugin_name"));
    CUBE_REQUIRE(p.plugin_version, get_string(json, "plugin_version"));
    p.plugin_type = get_string_or_empty(json, "plugin_type");
    p.status = get_string_or_empty(json, "status");
    p.output_path = get_string_or_empty(json, "output_path");
    p.owner_username = get_string_or_empty(json, "owner_username");
    p.previous = get_optional_string(json, "previous");
    if (auto prev = get_optional_u32(json, "previous_id")) {
        p.previous_id = plugin_instance_id(*prev);
    }
    CUBE_REQUIRE(p.feed, get_string(json, "feed"));
    CUBE_REQUIRE(p.files, get_string(json, "files"));
    p.parameters = get_string_or_empty(json, "parameters");
    auto size = get_u64(json, "size");
    p.size = size ? size.value() : 0;
    return p;
}

auto plugin_instance_parameter::from_json(const Json::Value& json)
    -> result<plugin_instance_parameter> {
    plugin_instance_parameter p;
    CUBE_REQUIRE(p.url, get_string(json, "url"));
    CUBE_REQUIRE(p.id, get_u32(json, "id"));
    CUBE_REQUIRE(p.param_name, get_string(json, "param_name"));
    p.parameter_type = get_string_or_empty(json, "type");
    if (json.isMember("value")) {
        p.value = json["value"];
    }
    return p;
}

// ============================================================================
// Pipelines
// ============================================================================

auto pipeline_response::from_json(const Json::Value& json) -> result<pipeline_response> {
    pipeline_response p;
    CUBE_REQUIRE(p.url, get_string(json, "url"));
    uint32_t id = 0;
    CUBE_REQUIRE(id, get_u32(json, "id"));
    p.id = pipeline_id(id);
    CUBE_REQUIRE(p.name, get_string(json, "name"));
    p.authors = get_string_or_empty(json, "authors");
    p.category = get_string_or_empty(json, "category");
    p.description = get_string_or_empty(json, "description");
    p.owner_username = get_string_or_empty(json, "owner_username");
    auto locked = get_bool(json, "locked");
    p.locked = locked ? locked.value() : false;
    p.workflows = get_string_or_empty(json, "workflows");
    p.instances = get_string_or_empty(json, "instances");
    return p;
}

auto workflow_response::from_json(const Json::Value& json) -> result<workflow_response> {
    workflow_response w;
    CUBE_REQUIRE(w.url, get_string(json, "url"));
    uint32_t id = 0;
    CUBE_REQUIRE(id, get_u32(json, "id"));
    w.id = workflow_id(id);
    uint32_t pipeline = 0;
    CUBE_REQUIRE(pipeline, get_u32(json, "pipeline_id"));
    w.pipeline = pipeline_id(pipeline);
    w.pipeline_name = get_string_or_empty(json, "pipeline_name");
    w.owner_username = get_string_or_empty(json, "owner_username");
    w.creation_date = get_string_or_empty(json, "creation_date");
    return w;
}

// ============================================================================
// Files
// ============================================================================

auto file_response::basename() const -> std::string {
    auto slash = fname.find_last_of('/');
    if (slash == std::string::npos) {
        return fname;
    }
    return fname.substr(slash + 1);
}

auto file_response::from_json(const Json::Value& json) -> result<file_response> {
    file_response f;
    f.url = get_string_or_empty(json, "url");
    CUBE_REQUIRE(f.fname, get_string(json, "fname"));
    CUBE_REQUIRE(f.fsize, get_u64(json, "fsize"));
    CUBE_REQUIRE(f.file_resource, get_string(json, "file_resource"));
    f.id = get_optional_u32(json, "id");
    if (auto inst = get_optional_u32(json, "plugin_inst_id")) {
        f.plugin_inst_id = plugin_instance_id(*inst);
    }
    if (auto feed = get_optional_u32(json, "feed_id")) {
        f.feed = feed_id(*feed);
    }
    f.owner = get_optional_string(json, "owner");
    return f;
}

auto user_file_response::from_json(const Json::Value& json) -> result<user_file_response> {
    user_file_response f;
    CUBE_REQUIRE(f.url, get_string(json, "url"));
    CUBE_REQUIRE(f.id, get_u32(json, "id"));
    CUBE_REQUIRE(f.fname, get_string(json, "fname"));
    CUBE_REQUIRE(f.fsize, get_u64(json, "fsize"));
    CUBE_REQUIRE(f.file_resource, get_string(json, "file_resource"));
    f.owner = get_string_or_empty(json, "owner");
    f.creation_date = get_string_or_empty(json, "creation_date");
    return f;
}

#undef CUBE_REQUIRE

}  // namespace kcenon::cube
