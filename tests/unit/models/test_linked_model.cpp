/**
 * @file test_linked_model.cpp
 * @brief Unit tests for linked models and the operations on them
 */

#include <gtest/gtest.h>

#include <kcenon/cube/models/operations.h>

#include "../fake_cube_server.h"

#include <memory>
#include <string>

namespace kcenon::cube::test {

class LinkedModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<fake_cube_server>();
        client_.emplace(server_, std::string("abc123"));
    }

    template <typename R, typename A = rw_access>
    auto model(const Json::Value& json) -> linked_model<R, A> {
        auto decoded = R::from_json(json);
        EXPECT_TRUE(decoded);
        return linked_model<R, A>(*client_, decoded.value());
    }

    std::shared_ptr<fake_cube_server> server_;
    std::optional<api_client> client_;
};

TEST_F(LinkedModelTest, RefreshFetchesCurrentState) {
    auto url = std::string(kBaseUrl) + "7/";
    server_->on_get(url, feed_json(7, "renamed elsewhere"));
    auto feed = model<feed_response>(feed_json(7, "old"));

    auto refreshed = feed.refresh();

    ASSERT_TRUE(refreshed);
    EXPECT_EQ(refreshed.value()->name, "renamed elsewhere");
    EXPECT_EQ(feed->name, "old");
}

TEST_F(LinkedModelTest, ReadOnlyModelCanRefresh) {
    auto url = std::string(kBaseUrl) + "7/";
    server_->on_get(url, feed_json(7, "renamed elsewhere"));
    auto feed = model<feed_response, ro_access>(feed_json(7, "old"));

    auto refreshed = feed.refresh();

    ASSERT_TRUE(refreshed);
    EXPECT_EQ(refreshed.value()->name, "renamed elsewhere");
}

TEST_F(LinkedModelTest, SetNamePutsNameField) {
    auto url = std::string(kBaseUrl) + "7/";
    std::string sent;
    server_->on(http_method::put, url, [&sent](const http_request& request) -> result<http_response> {
        sent.assign(request.body.begin(), request.body.end());
        return json_response(200, feed_json(7, "brain study"));
    });
    auto feed = model<feed_response>(feed_json(7, "old"));

    auto renamed = set_name(feed, "brain study");

    ASSERT_TRUE(renamed);
    EXPECT_EQ(renamed.value()->name, "brain study");
    EXPECT_EQ(sent, R"({"name":"brain study"})");
}

TEST_F(LinkedModelTest, FeedPluginInstances) {
    auto feed = model<feed_response>(feed_json(7, "study"));
    server_->serve_collection(feed->plugin_instances,
                              {plugin_instance_json(1, 7, std::nullopt), plugin_instance_json(2, 7, 1u)});

    auto instances = plugin_instances(feed).stream().collect();

    ASSERT_TRUE(instances);
    ASSERT_EQ(instances.value().size(), 2u);
    EXPECT_EQ(instances.value()[1].previous_id.value_or(plugin_instance_id()), plugin_instance_id(1));
}

TEST_F(LinkedModelTest, MissingLinkGivesEmptySearch) {
    auto json = feed_json(7, "study");
    json.removeMember("plugin_instances");
    auto feed = model<feed_response, ro_access>(json);

    auto instances = plugin_instances(feed);

    EXPECT_TRUE(instances.is_empty());
    EXPECT_EQ(server_->request_count(), 0u);
}

TEST_F(LinkedModelTest, CreateInstancePostsParameters) {
    auto plugin = model<plugin_response>(plugin_json(3, "pl-dircopy", "2.1.1"));
    Json::Value received;
    server_->on(http_method::post, plugin->instances,
                [&received](const http_request& request) -> result<http_response> {
                    received = json_utils::parse(
                        std::string(request.body.begin(), request.body.end())).value();
                    return json_response(201, plugin_instance_json(11, 4, 10u));
                });

    Json::Value params(Json::objectValue);
    params["previous_id"] = 10;
    params["dir"] = "chris/uploads";
    auto instance = create_instance(plugin, params);

    ASSERT_TRUE(instance);
    EXPECT_EQ(instance.value()->id, plugin_instance_id(11));
    EXPECT_EQ(received["dir"].asString(), "chris/uploads");
}

TEST_F(LinkedModelTest, CreateInstanceRejectionKeepsBody) {
    auto plugin = model<plugin_response>(plugin_json(3, "pl-dircopy", "2.1.1"));
    const std::string detail = R"({"previous_id":["This field is required."]})";
    server_->on(http_method::post, plugin->instances,
                [detail](const http_request&) -> result<http_response> {
                    return text_response(400, detail);
                });

    auto instance = create_instance(plugin, Json::Value(Json::objectValue));

    ASSERT_FALSE(instance);
    EXPECT_EQ(instance.error().body.value_or(""), detail);
}

TEST_F(LinkedModelTest, CreateInstanceWithoutLink) {
    auto json = plugin_json(3, "pl-dircopy", "2.1.1");
    json.removeMember("instances");
    auto plugin = model<plugin_response>(json);

    auto instance = create_instance(plugin, Json::Value(Json::objectValue));

    ASSERT_FALSE(instance);
    EXPECT_EQ(instance.error().code, error_code::missing_link);
    EXPECT_EQ(server_->request_count(), 0u);
}

TEST_F(LinkedModelTest, LazyLinksFetchOnDemand) {
    auto instance = model<plugin_instance_response, ro_access>(plugin_instance_json(2, 7, 1u));
    server_->on_get(std::string(kBaseUrl) + "7/", feed_json(7, "study"));
    server_->on_get(std::string(kBaseUrl) + "plugins/3/", plugin_json(3, "pl-dircopy", "2.1.1"));
    server_->on_get(std::string(kBaseUrl) + "plugins/instances/1/",
                    plugin_instance_json(1, 7, std::nullopt));

    auto feed = feed_of(instance);
    auto plugin = plugin_of(instance);
    auto previous = previous_of(instance);
    EXPECT_EQ(server_->request_count(), 0u);

    auto fetched_feed = feed.get();
    auto fetched_plugin = plugin.get();
    ASSERT_TRUE(previous.has_value());
    auto fetched_previous = previous->get();

    ASSERT_TRUE(fetched_feed);
    EXPECT_EQ(fetched_feed.value()->name, "study");
    ASSERT_TRUE(fetched_plugin);
    EXPECT_EQ(fetched_plugin.value()->name, "pl-dircopy");
    ASSERT_TRUE(fetched_previous);
    EXPECT_FALSE(previous_of(fetched_previous.value()).has_value());
    EXPECT_EQ(server_->request_count(), 3u);
}

TEST_F(LinkedModelTest, InstanceFilesAndParameters) {
    auto instance = model<plugin_instance_response>(plugin_instance_json(2, 7, std::nullopt));
    server_->serve_collection(instance->files, {file_json(1, "chris/feed_7/out.txt", 3)});

    Json::Value param(Json::objectValue);
    param["url"] = instance->parameters + "1/";
    param["id"] = 1;
    param["param_name"] = "dir";
    param["type"] = "string";
    param["value"] = "chris/uploads";
    server_->serve_collection(instance->parameters, {param});

    auto out = files(instance).only();
    auto params = parameters(instance).stream().collect();

    ASSERT_TRUE(out);
    EXPECT_EQ(out.value()->basename(), "out.txt");
    ASSERT_TRUE(params);
    ASSERT_EQ(params.value().size(), 1u);
    EXPECT_EQ(params.value()[0].value.asString(), "chris/uploads");
}

TEST_F(LinkedModelTest, IntoReadOnlyMakesNoRequest) {
    auto feed = model<feed_response>(feed_json(7, "study"));

    linked_model<feed_response, ro_access> ro = feed.into_read_only();

    EXPECT_EQ(ro->id, feed_id(7));
    EXPECT_EQ(server_->request_count(), 0u);
}

TEST_F(LinkedModelTest, DeleteResource) {
    auto feed = model<feed_response>(feed_json(7, "study"));
    server_->on(http_method::del, feed->url, [](const http_request&) -> result<http_response> {
        return text_response(204, "");
    });

    EXPECT_TRUE(feed.delete_resource());
}

TEST_F(LinkedModelTest, CreateWorkflowEncodesNodesInfo) {
    std::string base = kBaseUrl;
    Json::Value pipeline_json(Json::objectValue);
    pipeline_json["url"] = base + "pipelines/2/";
    pipeline_json["id"] = 2;
    pipeline_json["name"] = "fetal-brain";
    pipeline_json["workflows"] = base + "pipelines/2/workflows/";
    auto pipeline = model<pipeline_response>(pipeline_json);

    Json::Value received;
    server_->on(http_method::post, pipeline->workflows,
                [&received, base](const http_request& request) -> result<http_response> {
                    received = json_utils::parse(
                        std::string(request.body.begin(), request.body.end())).value();
                    Json::Value reply(Json::objectValue);
                    reply["url"] = base + "pipelines/workflows/5/";
                    reply["id"] = 5;
                    reply["pipeline_id"] = 2;
                    return json_response(201, reply);
                });

    Json::Value nodes(Json::arrayValue);
    Json::Value node(Json::objectValue);
    node["piping_id"] = 1;
    nodes.append(node);
    auto workflow = create_workflow(pipeline, plugin_instance_id(9), nodes);

    ASSERT_TRUE(workflow);
    EXPECT_EQ(workflow.value()->id, workflow_id(5));
    EXPECT_EQ(received["previous_plugin_inst_id"].asUInt(), 9u);
    ASSERT_TRUE(received["nodes_info"].isString());
    EXPECT_EQ(received["nodes_info"].asString(), R"([{"piping_id":1}])");
}

}  // namespace kcenon::cube::test
