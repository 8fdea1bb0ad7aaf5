/**
 * @file bench_search_paging.cpp
 * @brief Benchmarks for paginated collection traversal
 */

#include <benchmark/benchmark.h>

#include <kcenon/cube/http/api_client.h>
#include <kcenon/cube/models/resources.h>
#include <kcenon/cube/search/search.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::cube::benchmark {

namespace {

constexpr const char* kFilesUrl = "https://bench.local/api/v1/files/";

auto make_search(const std::shared_ptr<in_memory_collection>& transport,
                 std::size_t page_size) -> search<file_response, ro_access> {
    api_client client(transport, std::string("bench-token"));
    auto query = collection_query::collection(kFilesUrl)
                     .with_page_limit(static_cast<uint32_t>(page_size));
    return search<file_response, ro_access>(std::move(client), std::move(query));
}

}  // namespace

/**
 * @brief Stream every item of a collection, page by page
 */
static void BM_Search_StreamAll(::benchmark::State& state) {
    const auto item_count = static_cast<std::size_t>(state.range(0));
    const auto page_size = static_cast<std::size_t>(state.range(1));

    auto transport = std::make_shared<in_memory_collection>(kFilesUrl, item_count, page_size);
    auto files = make_search(transport, page_size);

    for (auto _ : state) {
        auto stream = files.stream();
        std::size_t seen = 0;
        while (true) {
            auto item = stream.next();
            if (!item) {
                state.SkipWithError("Failed to fetch page");
                return;
            }
            if (!item.value()) {
                break;
            }
            ::benchmark::DoNotOptimize(item.value()->fname);
            ++seen;
        }
        if (seen != item_count) {
            state.SkipWithError("Stream length differs from collection size");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(item_count) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["requests_per_stream"] = ::benchmark::Counter(
        static_cast<double>(transport->request_count()) /
        static_cast<double>(state.iterations()));
}
BENCHMARK(BM_Search_StreamAll)
    ->Args({100, 10})
    ->Args({100, 50})
    ->Args({1000, 20})
    ->Args({1000, 100})
    ->Args({5000, 500});

/**
 * @brief Stop after the first few items of a large collection
 */
static void BM_Search_StreamMaxItems(::benchmark::State& state) {
    const auto max_items = static_cast<std::size_t>(state.range(0));

    auto transport = std::make_shared<in_memory_collection>(kFilesUrl, 10000, 50);
    auto api = api_client(transport, std::string("bench-token"));
    auto query = collection_query::collection(kFilesUrl).with_page_limit(50).with_max_items(max_items);
    search<file_response, ro_access> files(std::move(api), std::move(query));

    for (auto _ : state) {
        auto collected = files.stream().collect();
        if (!collected) {
            state.SkipWithError("Failed to collect items");
            return;
        }
        ::benchmark::DoNotOptimize(collected.value().size());
    }

    state.SetItemsProcessed(static_cast<int64_t>(max_items) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Search_StreamMaxItems)->Arg(1)->Arg(50)->Arg(120);

/**
 * @brief count() issues a single limit=0 request regardless of size
 */
static void BM_Search_Count(::benchmark::State& state) {
    const auto item_count = static_cast<std::size_t>(state.range(0));

    auto transport = std::make_shared<in_memory_collection>(kFilesUrl, item_count, 20);
    auto files = make_search(transport, 20);

    for (auto _ : state) {
        auto count = files.count();
        if (!count) {
            state.SkipWithError("Failed to count items");
            return;
        }
        ::benchmark::DoNotOptimize(count.value());
    }
}
BENCHMARK(BM_Search_Count)->Arg(10)->Arg(10000);

/**
 * @brief Decode a single file item
 */
static void BM_FileResponse_Decode(::benchmark::State& state) {
    Json::Value item(Json::objectValue);
    item["url"] = std::string(kFilesUrl) + "7/";
    item["id"] = 7;
    item["fname"] = "chris/feed_1/pl-dircopy_1/data/brain.nii";
    item["fsize"] = static_cast<Json::UInt64>(sizes::large_file);
    item["file_resource"] = std::string(kFilesUrl) + "7/brain.nii";

    for (auto _ : state) {
        auto decoded = file_response::from_json(item);
        if (!decoded) {
            state.SkipWithError("Failed to decode file item");
            return;
        }
        ::benchmark::DoNotOptimize(decoded.value().fsize);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_FileResponse_Decode);

}  // namespace kcenon::cube::benchmark
