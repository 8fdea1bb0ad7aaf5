/**
 * @file json_utils.cpp
 * @brief jsoncpp helpers returning result<T> instead of throwing
 */

#include "kcenon/cube/core/json_utils.h"

#include <memory>

namespace kcenon::cube::json_utils {

namespace {

auto missing(const char* key, const char* expected) -> unexpected {
    return unexpected{error{error_code::decode_error,
        std::string("field '") + key + "' is missing or not " + expected}};
}

}  // namespace

auto parse(const std::string& text) -> result<Json::Value> {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return unexpected{error{error_code::decode_error, "invalid JSON: " + errors}};
    }
    return root;
}

auto to_string(const Json::Value& value) -> std::string {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

auto get_string(const Json::Value& obj, const char* key) -> result<std::string> {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isString()) {
        return missing(key, "a string");
    }
    return obj[key].asString();
}

auto get_u32(const Json::Value& obj, const char* key) -> result<uint32_t> {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isUInt()) {
        return missing(key, "an unsigned integer");
    }
    return static_cast<uint32_t>(obj[key].asUInt());
}

auto get_u64(const Json::Value& obj, const char* key) -> result<uint64_t> {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isUInt64()) {
        return missing(key, "an unsigned integer");
    }
    return static_cast<uint64_t>(obj[key].asUInt64());
}

auto get_bool(const Json::Value& obj, const char* key) -> result<bool> {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isBool()) {
        return missing(key, "a boolean");
    }
    return obj[key].asBool();
}

auto get_optional_string(const Json::Value& obj, const char* key) -> std::optional<std::string> {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isString()) {
        return std::nullopt;
    }
    return obj[key].asString();
}

auto get_optional_u32(const Json::Value& obj, const char* key) -> std::optional<uint32_t> {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isUInt()) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(obj[key].asUInt());
}

auto get_string_or_empty(const Json::Value& obj, const char* key) -> std::string {
    return get_optional_string(obj, key).value_or(std::string{});
}

}  // namespace kcenon::cube::json_utils
