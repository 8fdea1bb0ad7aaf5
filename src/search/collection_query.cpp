/**
 * @file collection_query.cpp
 * @brief Immutable description of a request against a collection endpoint
 */

#include "kcenon/cube/search/collection_query.h"

#include <algorithm>

namespace kcenon::cube {

collection_query::collection_query(std::string base_url, query_mode mode)
    : base_url_(std::move(base_url)), mode_(mode) {}

auto collection_query::collection(std::string base_url) -> collection_query {
    return collection_query(std::move(base_url), query_mode::plain);
}

auto collection_query::search(std::string base_url) -> collection_query {
    return collection_query(std::move(base_url), query_mode::search);
}

auto collection_query::with_filter(const std::string& key, query_value value) const
    -> collection_query {
    collection_query copy = *this;
    auto it = std::find_if(copy.filters_.begin(), copy.filters_.end(),
                           [&key](const auto& f) { return f.first == key; });
    if (it != copy.filters_.end()) {
        it->second = std::move(value);
    } else {
        copy.filters_.emplace_back(key, std::move(value));
    }
    return copy;
}

auto collection_query::with_page_limit(uint32_t limit) const -> collection_query {
    collection_query copy = *this;
    copy.page_limit_ = limit;
    return copy;
}

auto collection_query::with_max_items(std::size_t max_items) const -> collection_query {
    collection_query copy = *this;
    copy.max_items_ = max_items;
    return copy;
}

auto collection_query::request_url() const -> std::string {
    if (mode_ == query_mode::search) {
        return url_utils::join(base_url_, "search/");
    }
    return base_url_;
}

auto collection_query::request_params(std::optional<uint32_t> limit,
                                      std::optional<uint32_t> offset) const
    -> url_utils::query_params {
    url_utils::query_params params;
    params.reserve(filters_.size() + 2);

    for (const auto& [key, value] : filters_) {
        if (const auto* number = std::get_if<uint32_t>(&value)) {
            params.emplace_back(key, std::to_string(*number));
        } else {
            params.emplace_back(key, std::get<std::string>(value));
        }
    }
    if (limit) {
        params.emplace_back("limit", std::to_string(*limit));
    }
    if (offset) {
        params.emplace_back("offset", std::to_string(*offset));
    }
    return params;
}

}  // namespace kcenon::cube
