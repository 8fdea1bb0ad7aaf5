/**
 * @file operations.cpp
 * @brief Follow-up calls on linked resources
 */

#include "kcenon/cube/models/operations.h"

#include "kcenon/cube/core/json_utils.h"
#include "kcenon/cube/core/logging.h"

namespace kcenon::cube {

auto create_workflow(const linked_model<pipeline_response, rw_access>& pipeline,
                     plugin_instance_id previous,
                     const Json::Value& nodes_info)
    -> result<linked_model<workflow_response, rw_access>> {
    if (pipeline->workflows.empty()) {
        return unexpected{error{error_code::missing_link,
            "pipeline " + pipeline->name + " has no workflows link"}};
    }

    Json::Value body(Json::objectValue);
    body["previous_plugin_inst_id"] = previous.value;
    if (!nodes_info.isNull()) {
        // The server expects nodes_info as a JSON-encoded string.
        body["nodes_info"] = json_utils::to_string(nodes_info);
    }

    auto created = pipeline.post_to<workflow_response>(pipeline->workflows, body);
    if (created) {
        CUBE_LOG_INFO(log_category::client,
                      "Created workflow " + std::to_string(created.value()->id.value) +
                      " of pipeline " + pipeline->name);
    }
    return created;
}

}  // namespace kcenon::cube
