/**
 * @file test_collection_query.cpp
 * @brief Unit tests for collection_query and the search builders
 */

#include <gtest/gtest.h>

#include <kcenon/cube/models/searches.h>
#include <kcenon/cube/search/collection_query.h>

#include "../fake_cube_server.h"

#include <memory>
#include <string>

namespace kcenon::cube::test {

class CollectionQueryTest : public ::testing::Test {};

TEST_F(CollectionQueryTest, PlainModeUsesBaseUrl) {
    auto query = collection_query::collection("https://h/api/v1/files/");

    EXPECT_EQ(query.mode(), query_mode::plain);
    EXPECT_EQ(query.request_url(), "https://h/api/v1/files/");
}

TEST_F(CollectionQueryTest, SearchModeAppendsSearchSegment) {
    auto query = collection_query::search("https://h/api/v1/plugins/");

    EXPECT_EQ(query.mode(), query_mode::search);
    EXPECT_EQ(query.request_url(), "https://h/api/v1/plugins/search/");
}

TEST_F(CollectionQueryTest, FiltersKeepInsertionOrder) {
    auto query = collection_query::search("https://h/plugins/")
                     .with_filter("name", std::string("pl-dircopy"))
                     .with_filter("id", 3u);

    auto params = query.request_params(std::nullopt);

    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params[0].first, "name");
    EXPECT_EQ(params[0].second, "pl-dircopy");
    EXPECT_EQ(params[1].first, "id");
    EXPECT_EQ(params[1].second, "3");
}

TEST_F(CollectionQueryTest, RepeatedKeyReplacesValue) {
    auto query = collection_query::search("https://h/plugins/")
                     .with_filter("name", std::string("a"))
                     .with_filter("name", std::string("b"));

    ASSERT_EQ(query.filters().size(), 1u);
    EXPECT_EQ(std::get<std::string>(query.filters()[0].second), "b");
}

TEST_F(CollectionQueryTest, WithMembersLeaveOriginalUntouched) {
    auto original = collection_query::collection("https://h/files/");
    auto limited = original.with_page_limit(25).with_max_items(7);

    EXPECT_FALSE(original.page_limit().has_value());
    EXPECT_FALSE(original.max_items().has_value());
    EXPECT_EQ(limited.page_limit().value_or(0), 25u);
    EXPECT_EQ(limited.max_items().value_or(0), 7u);
}

TEST_F(CollectionQueryTest, LimitAndOffsetFollowFilters) {
    auto query = collection_query::search("https://h/files/").with_filter("fname", std::string("chris/"));

    auto params = query.request_params(10, 20);

    ASSERT_EQ(params.size(), 3u);
    EXPECT_EQ(params[1], (std::pair<std::string, std::string>("limit", "10")));
    EXPECT_EQ(params[2], (std::pair<std::string, std::string>("offset", "20")));
}

// =============================================================================
// Search builder Tests
// =============================================================================

class SearchBuilderTest : public ::testing::Test {
protected:
    void SetUp() override { server_ = std::make_shared<fake_cube_server>(); }

    std::shared_ptr<fake_cube_server> server_;
};

TEST_F(SearchBuilderTest, PluginBuilderProducesFilterKeys) {
    api_client client(server_);
    plugin_search_builder<ro_access> builder(
        client, collection_query::search(std::string(kBaseUrl) + "plugins/"));

    auto search = builder.name_exact("pl-dircopy").version("2.1.1").page_limit(5).build();

    ASSERT_NE(search.query(), nullptr);
    auto params = search.query()->request_params(search.query()->page_limit());
    ASSERT_EQ(params.size(), 3u);
    EXPECT_EQ(params[0].first, "name_exact");
    EXPECT_EQ(params[1].first, "version");
    EXPECT_EQ(params[2].second, "5");
    EXPECT_EQ(server_->request_count(), 0u);
}

TEST_F(SearchBuilderTest, TypedIdsBecomeNumbers) {
    api_client client(server_);
    file_search_builder<ro_access> builder(
        client, collection_query::search(std::string(kBaseUrl) + "files/"));

    auto query = builder.plugin_instance(plugin_instance_id(12)).feed(feed_id(4)).query();

    auto params = query.request_params(std::nullopt);
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params[0], (std::pair<std::string, std::string>("plugin_inst_id", "12")));
    EXPECT_EQ(params[1], (std::pair<std::string, std::string>("feed_id", "4")));
}

TEST_F(SearchBuilderTest, BuildersAreImmutable) {
    api_client client(server_);
    feed_search_builder<rw_access> base(client, collection_query::search(kBaseUrl));

    auto named = base.name("brain");

    EXPECT_TRUE(base.query().filters().empty());
    EXPECT_EQ(named.query().filters().size(), 1u);
}

}  // namespace kcenon::cube::test
