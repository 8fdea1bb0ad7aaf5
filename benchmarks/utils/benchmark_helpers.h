/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_CUBE_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_CUBE_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/cube/http/http_types.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::cube::benchmark {

/**
 * @brief Transport that serves one paginated file collection from memory
 *
 * Page bodies are encoded up front so that a benchmark measures decoding
 * and traversal rather than fixture construction.
 */
class in_memory_collection : public http_transport {
public:
    /**
     * @param base_url Collection URL, e.g. "https://bench/api/v1/files/"
     * @param item_count Number of file items
     * @param page_size Items per page; other page sizes are answered with 400
     */
    in_memory_collection(std::string base_url, std::size_t item_count, std::size_t page_size);

    [[nodiscard]] auto execute(const http_request& request) -> result<http_response> override;

    [[nodiscard]] auto request_count() const -> std::size_t { return requests_.load(); }
    [[nodiscard]] auto base_url() const -> const std::string& { return base_url_; }

private:
    std::string base_url_;
    std::size_t item_count_;
    std::size_t page_size_;
    std::vector<std::string> pages_;
    std::string count_body_;
    std::atomic<std::size_t> requests_{0};
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 4 * KB;
constexpr std::size_t medium_file = 256 * KB;
constexpr std::size_t large_file = 4 * MB;
}  // namespace sizes

}  // namespace kcenon::cube::benchmark

#endif  // KCENON_CUBE_BENCHMARKS_BENCHMARK_HELPERS_H
