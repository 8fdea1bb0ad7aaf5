/**
 * @file search.h
 * @brief Lazy, cursor-driven traversal of paginated collections
 *
 * A search<R, A> is either Active (a client handle plus a collection_query)
 * or Empty. An Empty search answers every operation without touching the
 * network; it stands in for collections the current identity cannot browse.
 *
 * @code
 * auto plugins = client.plugins().name("pl-dcm2niix").build();
 * auto total = plugins.count();
 * auto stream = plugins.stream();
 * while (true) {
 *     auto item = stream.next();
 *     if (!item) { ... }                // page fetch failed, stream is over
 *     if (!item.value()) break;         // exhausted
 *     use(*item.value());
 * }
 * @endcode
 */

#ifndef KCENON_CUBE_SEARCH_SEARCH_H
#define KCENON_CUBE_SEARCH_SEARCH_H

#include "kcenon/cube/core/logging.h"
#include "kcenon/cube/core/types.h"
#include "kcenon/cube/http/api_client.h"
#include "kcenon/cube/models/linked_model.h"
#include "kcenon/cube/search/access.h"
#include "kcenon/cube/search/collection_query.h"
#include "kcenon/cube/search/page.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::cube {

/**
 * @brief Single-pass sequence of the items of a collection
 *
 * Pages are requested only when the previous one has been consumed. The
 * only state carried between pages is the server-provided cursor, so later
 * pages are fetched from the exact "next" URL rather than rebuilt from the
 * query. The stream ends early, without another request, once max_items
 * items have been yielded. A failed fetch ends the stream with that error.
 */
template <typename R>
class item_stream {
public:
    /**
     * @brief An exhausted stream
     */
    item_stream() = default;

    item_stream(api_client client,
                std::string url,
                url_utils::query_params params,
                std::optional<std::size_t> max_items)
        : client_(std::move(client)),
          cursor_(pending_request{std::move(url), std::move(params)}),
          max_items_(max_items) {}

    /**
     * @brief Next item, std::nullopt once the collection is exhausted
     */
    [[nodiscard]] auto next() -> result<std::optional<R>> {
        if (finished_) {
            return std::optional<R>{};
        }
        if (max_items_ && yielded_ >= *max_items_) {
            finish();
            return std::optional<R>{};
        }

        while (buffer_.empty()) {
            if (!cursor_) {
                finish();
                return std::optional<R>{};
            }
            auto fetched = fetch_page();
            if (!fetched) {
                finish();
                return unexpected{fetched.error()};
            }
        }

        R item = std::move(buffer_.front());
        buffer_.pop_front();
        ++yielded_;
        return std::optional<R>{std::move(item)};
    }

    /**
     * @brief Drain the remaining items into a vector
     */
    [[nodiscard]] auto collect() -> result<std::vector<R>> {
        std::vector<R> items;
        while (true) {
            auto item = next();
            if (!item) {
                return unexpected{item.error()};
            }
            if (!item.value()) {
                return items;
            }
            items.push_back(std::move(*item.value()));
        }
    }

    [[nodiscard]] auto yielded() const noexcept -> std::size_t { return yielded_; }
    [[nodiscard]] auto pages_fetched() const noexcept -> std::size_t { return pages_fetched_; }

private:
    struct pending_request {
        std::string url;
        url_utils::query_params params;
    };

    auto fetch_page() -> result<void> {
        auto request = std::move(*cursor_);
        cursor_.reset();

        auto body = client_->get_json(request.url, request.params);
        if (!body) {
            return unexpected{body.error()};
        }
        auto decoded = parse_page<R>(body.value());
        if (!decoded) {
            return unexpected{decoded.error()};
        }
        ++pages_fetched_;

        auto& pg = decoded.value();
        for (auto& item : pg.results) {
            buffer_.push_back(std::move(item));
        }
        if (pg.next) {
            cursor_ = pending_request{std::move(*pg.next), {}};
        }

        request_log_context ctx;
        ctx.url = request.url;
        ctx.item_count = pg.count;
        CUBE_LOG_DEBUG_CTX(log_category::search, "Fetched page", ctx);
        return {};
    }

    void finish() {
        finished_ = true;
        cursor_.reset();
        buffer_.clear();
    }

    std::optional<api_client> client_;
    std::optional<pending_request> cursor_;
    std::deque<R> buffer_;
    std::optional<std::size_t> max_items_;
    std::size_t yielded_ = 0;
    std::size_t pages_fetched_ = 0;
    bool finished_ = false;
};

/**
 * @brief item_stream whose items are wrapped into linked models
 */
template <typename R, typename A>
class connected_stream {
public:
    connected_stream() = default;

    connected_stream(api_client client, item_stream<R> inner)
        : client_(std::move(client)), inner_(std::move(inner)) {}

    [[nodiscard]] auto next() -> result<std::optional<linked_model<R, A>>> {
        auto item = inner_.next();
        if (!item) {
            return unexpected{item.error()};
        }
        if (!item.value()) {
            return std::optional<linked_model<R, A>>{};
        }
        return std::optional<linked_model<R, A>>{
            linked_model<R, A>(*client_, std::move(*item.value()))};
    }

    [[nodiscard]] auto collect() -> result<std::vector<linked_model<R, A>>> {
        std::vector<linked_model<R, A>> items;
        while (true) {
            auto item = next();
            if (!item) {
                return unexpected{item.error()};
            }
            if (!item.value()) {
                return items;
            }
            items.push_back(std::move(*item.value()));
        }
    }

private:
    std::optional<api_client> client_;
    item_stream<R> inner_;
};

/**
 * @brief Handle to a remote collection query
 */
template <typename R, typename A>
class search {
    static_assert(is_access_tag_v<A>, "A must be ro_access or rw_access");

public:
    using resource_type = R;
    using access_type = A;

    search(api_client client, collection_query query)
        : active_(active_state{std::move(client), std::move(query)}) {}

    /**
     * @brief A search that has no results and never issues requests
     */
    [[nodiscard]] static auto empty() -> search { return search(); }

    [[nodiscard]] auto is_empty() const noexcept -> bool { return !active_.has_value(); }

    /**
     * @brief The query of an Active search, nullptr when Empty
     */
    [[nodiscard]] auto query() const -> const collection_query* {
        return active_ ? &active_->query : nullptr;
    }

    /**
     * @brief Client handle of an Active search, nullptr when Empty
     */
    [[nodiscard]] auto client() const -> const api_client* {
        return active_ ? &active_->client : nullptr;
    }

    /**
     * @brief Server-declared total, requested with a page size of 0
     */
    [[nodiscard]] auto count() const -> result<uint32_t> {
        if (!active_) {
            return 0u;
        }
        auto body = active_->client.get_json(active_->query.request_url(),
                                             active_->query.request_params(0));
        if (!body) {
            return unexpected{body.error()};
        }
        return parse_count(body.value());
    }

    /**
     * @brief The first item, or std::nullopt for an empty collection
     */
    [[nodiscard]] auto first() const -> result<std::optional<linked_model<R, A>>> {
        if (!active_) {
            return std::optional<linked_model<R, A>>{};
        }
        auto pg = fetch_single_page();
        if (!pg) {
            return unexpected{pg.error()};
        }
        if (pg.value().results.empty()) {
            return std::optional<linked_model<R, A>>{};
        }
        return std::optional<linked_model<R, A>>{
            linked_model<R, A>(active_->client, std::move(pg.value().results.front()))};
    }

    /**
     * @brief Exactly one item
     *
     * Fails with empty_collection when there are no results and with
     * too_many_results when the server reports more than one.
     */
    [[nodiscard]] auto only() const -> result<linked_model<R, A>> {
        if (!active_) {
            return unexpected{error{error_code::empty_collection}};
        }
        auto pg = fetch_single_page();
        if (!pg) {
            return unexpected{pg.error()};
        }
        auto& decoded = pg.value();
        if (decoded.count > 1) {
            return unexpected{error{error_code::too_many_results,
                "expected one result, server reports " + std::to_string(decoded.count)}};
        }
        if (decoded.results.empty()) {
            return unexpected{error{error_code::empty_collection}};
        }
        return linked_model<R, A>(active_->client, std::move(decoded.results.front()));
    }

    /**
     * @brief Lazy traversal of every item; each call starts from the first page
     */
    [[nodiscard]] auto stream() const -> item_stream<R> {
        if (!active_) {
            return item_stream<R>();
        }
        const auto& q = active_->query;
        std::optional<uint32_t> offset;
        if (q.page_limit()) {
            offset = 0;
        }
        return item_stream<R>(active_->client,
                              q.request_url(),
                              q.request_params(q.page_limit(), offset),
                              q.max_items());
    }

    /**
     * @brief Same traversal as stream(), yielding linked models
     */
    [[nodiscard]] auto stream_connected() const -> connected_stream<R, A> {
        if (!active_) {
            return connected_stream<R, A>();
        }
        return connected_stream<R, A>(active_->client, stream());
    }

    /**
     * @brief Downgrade the capability tag; no request is made
     */
    [[nodiscard]] auto into_read_only() const -> search<R, ro_access> {
        if (!active_) {
            return search<R, ro_access>::empty();
        }
        return search<R, ro_access>(active_->client, active_->query);
    }

private:
    struct active_state {
        api_client client;
        collection_query query;
    };

    search() = default;

    auto fetch_single_page() const -> result<page<R>> {
        auto body = active_->client.get_json(active_->query.request_url(),
                                             active_->query.request_params(1));
        if (!body) {
            return unexpected{body.error()};
        }
        return parse_page<R>(body.value());
    }

    std::optional<active_state> active_;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_SEARCH_SEARCH_H
