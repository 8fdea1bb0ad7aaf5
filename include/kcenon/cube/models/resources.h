/**
 * @file resources.h
 * @brief Resources returned by the CUBE API
 *
 * Each resource decodes itself with a static from_json(); search and
 * linked_model templates rely on that member.
 */

#ifndef KCENON_CUBE_MODELS_RESOURCES_H
#define KCENON_CUBE_MODELS_RESOURCES_H

#include "kcenon/cube/core/types.h"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::cube {

/**
 * @brief Collection URLs advertised by the API root
 *
 * userfiles is optional; older servers call it "uploadedfiles".
 */
struct cube_links {
    std::string public_feeds;
    std::string files;
    std::string plugins;
    std::string plugin_instances;
    std::string pipelines;
    std::string filebrowser;
    std::optional<std::string> userfiles;
    std::optional<std::string> user;

    [[nodiscard]] static auto from_json(const Json::Value& json) -> result<cube_links>;
};

struct plugin_response {
    std::string url;
    plugin_id id;
    std::string name;
    std::string version;
    std::string dock_image;
    std::string plugin_type;
    std::string title;
    std::string description;
    std::string parameters;
    std::string instances;

    [[nodiscard]] static auto from_json(const Json::Value& json) -> result<plugin_response>;
};

struct plugin_parameter {
    std::string url;
    uint32_t id = 0;
    std::string name;
    std::string parameter_type;
    bool optional = false;
    std::string flag;
    std::string help;
    Json::Value default_value;

    [[nodiscard]] static auto from_json(const Json::Value& json) -> result<plugin_parameter>;
};

struct feed_response {
    std::string url;
    feed_id id;
    std::string name;
    std::string creator_username;
    std::string creation_date;
    std::string plugin_instances;

    [[nodiscard]] static auto from_json(const Json::Value& json) -> result<feed_response>;
};

struct plugin_instance_response {
    std::string url;
    plugin_instance_id id;
    std::string title;
    std::string plugin;
    plugin_id plugin_id_value;
    std::string plugin_name;
    std::string plugin_version;
    std::string plugin_type;
    std::string status;
    std::string output_path;
    std::string owner_username;
    std::optional<std::string> previous;
    std::optional<plugin_instance_id> previous_id;
    std::string feed;
    std::string files;
    std::string parameters;
    uint64_t size = 0;

    [[nodiscard]] static auto from_json(const Json::Value& json)
        -> result<plugin_instance_response>;
};

/**
 * @brief A parameter value a plugin instance was created with
 */
struct plugin_instance_parameter {
    std::string url;
    uint32_t id = 0;
    std::string param_name;
    std::string parameter_type;
    Json::Value value;

    [[nodiscard]] static auto from_json(const Json::Value& json)
        -> result<plugin_instance_parameter>;
};

struct pipeline_response {
    std::string url;
    pipeline_id id;
    std::string name;
    std::string authors;
    std::string category;
    std::string description;
    std::string owner_username;
    bool locked = false;
    std::string workflows;
    std::string instances;

    [[nodiscard]] static auto from_json(const Json::Value& json) -> result<pipeline_response>;
};

struct workflow_response {
    std::string url;
    workflow_id id;
    pipeline_id pipeline;
    std::string pipeline_name;
    std::string owner_username;
    std::string creation_date;

    [[nodiscard]] static auto from_json(const Json::Value& json) -> result<workflow_response>;
};

/**
 * @brief Any downloadable file: feed files, user files, filebrowser entries
 */
struct file_response {
    std::string url;
    std::string fname;
    uint64_t fsize = 0;
    std::string file_resource;
    std::optional<uint32_t> id;
    std::optional<plugin_instance_id> plugin_inst_id;
    std::optional<feed_id> feed;
    std::optional<std::string> owner;

    /**
     * @brief Last path component of fname
     */
    [[nodiscard]] auto basename() const -> std::string;

    [[nodiscard]] static auto from_json(const Json::Value& json) -> result<file_response>;
};

/**
 * @brief Reply to an upload to userfiles
 */
struct user_file_response {
    std::string url;
    uint32_t id = 0;
    std::string fname;
    uint64_t fsize = 0;
    std::string file_resource;
    std::string owner;
    std::string creation_date;

    [[nodiscard]] static auto from_json(const Json::Value& json) -> result<user_file_response>;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_MODELS_RESOURCES_H
