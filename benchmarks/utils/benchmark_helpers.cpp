/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <kcenon/cube/core/json_utils.h>

#include <json/json.h>

#include <map>
#include <string>
#include <utility>

namespace kcenon::cube::benchmark {

namespace {

auto file_item(const std::string& base_url, std::size_t id) -> Json::Value {
    Json::Value item(Json::objectValue);
    item["url"] = base_url + std::to_string(id) + "/";
    item["id"] = static_cast<Json::UInt>(id);
    item["fname"] = "chris/feed_1/pl-dircopy_1/data/slice_" + std::to_string(id) + ".dcm";
    item["fsize"] = static_cast<Json::UInt64>(sizes::medium_file);
    item["file_resource"] = base_url + std::to_string(id) + "/data";
    item["plugin_inst_id"] = 1;
    item["feed_id"] = 1;
    item["owner"] = "chris";
    return item;
}

auto empty_page(std::size_t count) -> Json::Value {
    Json::Value page(Json::objectValue);
    page["count"] = static_cast<Json::UInt>(count);
    page["next"] = Json::Value::null;
    page["previous"] = Json::Value::null;
    page["results"] = Json::Value(Json::arrayValue);
    return page;
}

auto query_of(const std::string& url) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> params;
    auto question = url.find('?');
    if (question == std::string::npos) {
        return params;
    }
    auto query = url.substr(question + 1);
    std::size_t start = 0;
    while (start < query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        auto pair = query.substr(start, end - start);
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            params[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
        start = end + 1;
    }
    return params;
}

auto response_of(int status, const std::string& body) -> http_response {
    http_response response;
    response.status_code = status;
    response.headers["Content-Type"] = "application/json";
    response.body.assign(body.begin(), body.end());
    return response;
}

}  // namespace

in_memory_collection::in_memory_collection(std::string base_url,
                                           std::size_t item_count,
                                           std::size_t page_size)
    : base_url_(std::move(base_url)), item_count_(item_count), page_size_(page_size) {
    std::size_t offset = 0;
    do {
        auto page = empty_page(item_count_);
        for (std::size_t i = offset; i < item_count_ && i < offset + page_size_; ++i) {
            page["results"].append(file_item(base_url_, i + 1));
        }
        if (offset + page_size_ < item_count_) {
            page["next"] = base_url_ + "?limit=" + std::to_string(page_size_) +
                           "&offset=" + std::to_string(offset + page_size_);
        }
        pages_.push_back(json_utils::to_string(page));
        offset += page_size_;
    } while (offset < item_count_);

    count_body_ = json_utils::to_string(empty_page(item_count_));
}

auto in_memory_collection::execute(const http_request& request) -> result<http_response> {
    ++requests_;
    auto params = query_of(request.full_url());

    auto limit = params.find("limit");
    if (limit != params.end() && limit->second == "0") {
        return response_of(200, count_body_);
    }
    if (limit != params.end() && limit->second != std::to_string(page_size_)) {
        return response_of(400, R"({"detail":"unexpected page size"})");
    }

    auto offset = params.find("offset");
    std::size_t index = offset == params.end() ? 0 : std::stoul(offset->second) / page_size_;
    if (index >= pages_.size()) {
        return response_of(404, R"({"detail":"Invalid page."})");
    }
    return response_of(200, pages_[index]);
}

}  // namespace kcenon::cube::benchmark
