/**
 * @file json_utils.h
 * @brief jsoncpp helpers returning result<T> instead of throwing
 */

#ifndef KCENON_CUBE_CORE_JSON_UTILS_H
#define KCENON_CUBE_CORE_JSON_UTILS_H

#include "kcenon/cube/core/types.h"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::cube::json_utils {

/**
 * @brief Parse a JSON document
 * @return Parsed value, or decode_error with the parser's message
 */
auto parse(const std::string& text) -> result<Json::Value>;

/**
 * @brief Serialize a value without indentation
 */
auto to_string(const Json::Value& value) -> std::string;

// Field accessors. A missing or mistyped field is a decode_error naming the key.
auto get_string(const Json::Value& obj, const char* key) -> result<std::string>;
auto get_u32(const Json::Value& obj, const char* key) -> result<uint32_t>;
auto get_u64(const Json::Value& obj, const char* key) -> result<uint64_t>;
auto get_bool(const Json::Value& obj, const char* key) -> result<bool>;

// null and absent both map to std::nullopt
auto get_optional_string(const Json::Value& obj, const char* key) -> std::optional<std::string>;
auto get_optional_u32(const Json::Value& obj, const char* key) -> std::optional<uint32_t>;

/**
 * @brief Read a string field, falling back to an empty string
 */
auto get_string_or_empty(const Json::Value& obj, const char* key) -> std::string;

}  // namespace kcenon::cube::json_utils

#endif  // KCENON_CUBE_CORE_JSON_UTILS_H
