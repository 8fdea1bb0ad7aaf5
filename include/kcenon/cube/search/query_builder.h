/**
 * @file query_builder.h
 * @brief Base for resource-specific search builders
 */

#ifndef KCENON_CUBE_SEARCH_QUERY_BUILDER_H
#define KCENON_CUBE_SEARCH_QUERY_BUILDER_H

#include "kcenon/cube/http/api_client.h"
#include "kcenon/cube/search/collection_query.h"
#include "kcenon/cube/search/search.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace kcenon::cube {

/**
 * @brief Immutable builder of a search<R, A>
 *
 * Derived builders expose one member per filter key the resource supports;
 * keys cannot be added from outside. Each member returns a new builder.
 */
template <typename Derived, typename R, typename A>
class query_builder {
public:
    query_builder(api_client client, collection_query query)
        : client_(std::move(client)), query_(std::move(query)) {}

    /**
     * @brief Number of items requested per page
     */
    [[nodiscard]] auto page_limit(uint32_t limit) const -> Derived {
        return Derived(client_, query_.with_page_limit(limit));
    }

    /**
     * @brief Upper bound on the number of items a stream yields
     */
    [[nodiscard]] auto max_items(std::size_t max) const -> Derived {
        return Derived(client_, query_.with_max_items(max));
    }

    [[nodiscard]] auto build() const -> search<R, A> {
        return search<R, A>(client_, query_);
    }

    [[nodiscard]] auto query() const -> const collection_query& { return query_; }

protected:
    [[nodiscard]] auto add_u32(const std::string& key, uint32_t value) const -> Derived {
        return Derived(client_, query_.with_filter(key, value));
    }

    [[nodiscard]] auto add_string(const std::string& key, std::string value) const -> Derived {
        return Derived(client_, query_.with_filter(key, std::move(value)));
    }

private:
    api_client client_;
    collection_query query_;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_SEARCH_QUERY_BUILDER_H
