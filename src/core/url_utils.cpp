/**
 * @file url_utils.cpp
 * @brief URL helpers shared by the HTTP and search layers
 */

#include "kcenon/cube/core/url_utils.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace kcenon::cube::url_utils {

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto build_query_string(const query_params& params) -> std::string {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) {
            out += '&';
        }
        out += url_encode(key);
        out += '=';
        out += url_encode(value);
    }
    return out;
}

auto append_query(const std::string& url, const query_params& params) -> std::string {
    if (params.empty()) {
        return url;
    }
    auto separator = url.find('?') == std::string::npos ? '?' : '&';
    return url + separator + build_query_string(params);
}

auto validate_cube_url(const std::string& url) -> result<std::string> {
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        return unexpected{error{error_code::invalid_cube_url,
            "CUBE url must start with http:// or https://: " + url}};
    }

    const std::string suffix = "/api/v1/";
    if (url.size() < suffix.size() ||
        url.compare(url.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return unexpected{error{error_code::invalid_cube_url,
            "CUBE url must end with /api/v1/: " + url}};
    }

    return url;
}

auto join(const std::string& base, const std::string& segment) -> std::string {
    if (base.empty()) {
        return segment;
    }
    if (base.back() == '/') {
        if (!segment.empty() && segment.front() == '/') {
            return base + segment.substr(1);
        }
        return base + segment;
    }
    if (!segment.empty() && segment.front() == '/') {
        return base + segment;
    }
    return base + "/" + segment;
}

}  // namespace kcenon::cube::url_utils
