/**
 * @file page.h
 * @brief One page of a paginated collection response
 */

#ifndef KCENON_CUBE_SEARCH_PAGE_H
#define KCENON_CUBE_SEARCH_PAGE_H

#include "kcenon/cube/core/json_utils.h"
#include "kcenon/cube/core/types.h"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::cube {

/**
 * @brief A page of results
 *
 * count is the total over all pages, not the size of results.
 */
template <typename R>
struct page {
    uint32_t count = 0;
    std::optional<std::string> next;
    std::optional<std::string> previous;
    std::vector<R> results;
};

/**
 * @brief Read the server-declared total of a collection response
 */
[[nodiscard]] inline auto parse_count(const Json::Value& body) -> result<uint32_t> {
    return json_utils::get_u32(body, "count");
}

/**
 * @brief Decode a page, converting each result with R::from_json
 */
template <typename R>
[[nodiscard]] auto parse_page(const Json::Value& body) -> result<page<R>> {
    auto count = parse_count(body);
    if (!count) {
        return unexpected{count.error()};
    }
    if (!body.isMember("results") || !body["results"].isArray()) {
        return unexpected{error{error_code::decode_error,
            "field 'results' is missing or not an array"}};
    }

    page<R> decoded;
    decoded.count = count.value();
    decoded.next = json_utils::get_optional_string(body, "next");
    decoded.previous = json_utils::get_optional_string(body, "previous");

    const auto& results = body["results"];
    decoded.results.reserve(results.size());
    for (const auto& item : results) {
        auto resource = R::from_json(item);
        if (!resource) {
            return unexpected{resource.error()};
        }
        decoded.results.push_back(std::move(resource.value()));
    }
    return decoded;
}

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_SEARCH_PAGE_H
