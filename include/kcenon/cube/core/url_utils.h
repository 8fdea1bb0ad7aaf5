/**
 * @file url_utils.h
 * @brief URL helpers shared by the HTTP and search layers
 */

#ifndef KCENON_CUBE_CORE_URL_UTILS_H
#define KCENON_CUBE_CORE_URL_UTILS_H

#include "kcenon/cube/core/types.h"

#include <string>
#include <utility>
#include <vector>

namespace kcenon::cube::url_utils {

/// Ordered list of query parameters; order is preserved in the encoded URL.
using query_params = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode '/' characters
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Encode parameters as "k1=v1&k2=v2"
 */
auto build_query_string(const query_params& params) -> std::string;

/**
 * @brief Append encoded parameters to a URL that may already have a query
 */
auto append_query(const std::string& url, const query_params& params) -> std::string;

/**
 * @brief Validate the base address of a CUBE
 *
 * The address must use http or https and end with "/api/v1/".
 */
auto validate_cube_url(const std::string& url) -> result<std::string>;

/**
 * @brief Join a collection URL and a path segment, keeping one '/' between them
 */
auto join(const std::string& base, const std::string& segment) -> std::string;

}  // namespace kcenon::cube::url_utils

#endif  // KCENON_CUBE_CORE_URL_UTILS_H
