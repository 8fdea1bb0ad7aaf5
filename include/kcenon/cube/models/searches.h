/**
 * @file searches.h
 * @brief Search builders with the filter keys each collection accepts
 */

#ifndef KCENON_CUBE_MODELS_SEARCHES_H
#define KCENON_CUBE_MODELS_SEARCHES_H

#include "kcenon/cube/models/resources.h"
#include "kcenon/cube/search/query_builder.h"

#include <string>

namespace kcenon::cube {

template <typename A>
class plugin_search_builder
    : public query_builder<plugin_search_builder<A>, plugin_response, A> {
    using base = query_builder<plugin_search_builder<A>, plugin_response, A>;

public:
    using base::base;

    [[nodiscard]] auto id(plugin_id value) const { return this->add_u32("id", value.value); }
    [[nodiscard]] auto name(std::string value) const { return this->add_string("name", std::move(value)); }
    [[nodiscard]] auto name_exact(std::string value) const { return this->add_string("name_exact", std::move(value)); }
    [[nodiscard]] auto version(std::string value) const { return this->add_string("version", std::move(value)); }

    /// Matches name, title or category
    [[nodiscard]] auto name_title_category(std::string value) const {
        return this->add_string("name_title_category", std::move(value));
    }
};

template <typename A>
class feed_search_builder
    : public query_builder<feed_search_builder<A>, feed_response, A> {
    using base = query_builder<feed_search_builder<A>, feed_response, A>;

public:
    using base::base;

    [[nodiscard]] auto id(feed_id value) const { return this->add_u32("id", value.value); }
    [[nodiscard]] auto name(std::string value) const { return this->add_string("name", std::move(value)); }
    [[nodiscard]] auto name_exact(std::string value) const { return this->add_string("name_exact", std::move(value)); }
};

template <typename A>
class plugin_instance_search_builder
    : public query_builder<plugin_instance_search_builder<A>, plugin_instance_response, A> {
    using base = query_builder<plugin_instance_search_builder<A>, plugin_instance_response, A>;

public:
    using base::base;

    [[nodiscard]] auto id(plugin_instance_id value) const { return this->add_u32("id", value.value); }
    [[nodiscard]] auto previous_id(plugin_instance_id value) const { return this->add_u32("previous_id", value.value); }
    [[nodiscard]] auto title(std::string value) const { return this->add_string("title", std::move(value)); }
    [[nodiscard]] auto feed(feed_id value) const { return this->add_u32("feed_id", value.value); }
    [[nodiscard]] auto plugin_name(std::string value) const { return this->add_string("plugin_name", std::move(value)); }
    [[nodiscard]] auto plugin_name_exact(std::string value) const { return this->add_string("plugin_name_exact", std::move(value)); }
    [[nodiscard]] auto plugin_version(std::string value) const { return this->add_string("plugin_version", std::move(value)); }
    [[nodiscard]] auto workflow(workflow_id value) const { return this->add_u32("workflow_id", value.value); }
};

template <typename A>
class pipeline_search_builder
    : public query_builder<pipeline_search_builder<A>, pipeline_response, A> {
    using base = query_builder<pipeline_search_builder<A>, pipeline_response, A>;

public:
    using base::base;

    [[nodiscard]] auto id(pipeline_id value) const { return this->add_u32("id", value.value); }
    [[nodiscard]] auto name(std::string value) const { return this->add_string("name", std::move(value)); }
    [[nodiscard]] auto description(std::string value) const { return this->add_string("description", std::move(value)); }
};

/**
 * @brief Files produced by plugin instances
 */
template <typename A>
class file_search_builder
    : public query_builder<file_search_builder<A>, file_response, A> {
    using base = query_builder<file_search_builder<A>, file_response, A>;

public:
    using base::base;

    /// fname starts with value
    [[nodiscard]] auto fname(std::string value) const { return this->add_string("fname", std::move(value)); }
    [[nodiscard]] auto fname_exact(std::string value) const { return this->add_string("fname_exact", std::move(value)); }
    /// fname contains value, case-insensitive
    [[nodiscard]] auto fname_icontains(std::string value) const { return this->add_string("fname_icontains", std::move(value)); }
    /// Number of slashes in fname
    [[nodiscard]] auto fname_nslashes(uint32_t value) const { return this->add_u32("fname_nslashes", value); }
    [[nodiscard]] auto plugin_instance(plugin_instance_id value) const { return this->add_u32("plugin_inst_id", value.value); }
    [[nodiscard]] auto feed(feed_id value) const { return this->add_u32("feed_id", value.value); }
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_MODELS_SEARCHES_H
