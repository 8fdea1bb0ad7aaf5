/**
 * @file collection_query.h
 * @brief Immutable description of a request against a collection endpoint
 */

#ifndef KCENON_CUBE_SEARCH_COLLECTION_QUERY_H
#define KCENON_CUBE_SEARCH_COLLECTION_QUERY_H

#include "kcenon/cube/core/url_utils.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kcenon::cube {

/// Value of a search filter
using query_value = std::variant<uint32_t, std::string>;

/**
 * @brief Plain mode lists the collection, search mode uses its "search/" endpoint
 */
enum class query_mode {
    plain,
    search,
};

/**
 * @brief Base address, mode, filters, page size hint and item cap
 *
 * Every with_* member returns a modified copy; a query never changes after
 * construction.
 */
class collection_query {
public:
    using filter_list = std::vector<std::pair<std::string, query_value>>;

    /**
     * @brief Query listing every item of a collection
     */
    [[nodiscard]] static auto collection(std::string base_url) -> collection_query;

    /**
     * @brief Query against "<base_url>search/"
     */
    [[nodiscard]] static auto search(std::string base_url) -> collection_query;

    /**
     * @brief Add a filter, replacing an earlier value for the same key
     */
    [[nodiscard]] auto with_filter(const std::string& key, query_value value) const
        -> collection_query;

    [[nodiscard]] auto with_page_limit(uint32_t limit) const -> collection_query;

    [[nodiscard]] auto with_max_items(std::size_t max_items) const -> collection_query;

    [[nodiscard]] auto base_url() const -> const std::string& { return base_url_; }
    [[nodiscard]] auto mode() const -> query_mode { return mode_; }
    [[nodiscard]] auto filters() const -> const filter_list& { return filters_; }
    [[nodiscard]] auto page_limit() const -> std::optional<uint32_t> { return page_limit_; }
    [[nodiscard]] auto max_items() const -> std::optional<std::size_t> { return max_items_; }

    /**
     * @brief URL of the first request: base_url or base_url + "search/"
     */
    [[nodiscard]] auto request_url() const -> std::string;

    /**
     * @brief Filters in insertion order followed by limit and offset
     * @param limit Page size; nullopt omits the parameter
     * @param offset Offset; nullopt omits the parameter
     */
    [[nodiscard]] auto request_params(std::optional<uint32_t> limit,
                                      std::optional<uint32_t> offset = std::nullopt) const
        -> url_utils::query_params;

private:
    collection_query(std::string base_url, query_mode mode);

    std::string base_url_;
    query_mode mode_;
    filter_list filters_;
    std::optional<uint32_t> page_limit_;
    std::optional<std::size_t> max_items_;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_SEARCH_COLLECTION_QUERY_H
