/**
 * @file multipart.cpp
 * @brief multipart/form-data body builder for file uploads
 */

#include "kcenon/cube/http/multipart.h"

#include <random>

namespace kcenon::cube {

namespace {

auto generate_boundary() -> std::string {
    static constexpr char alphabet[] =
        "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<std::size_t> dis(0, sizeof(alphabet) - 2);

    std::string boundary = "----cube-boundary-";
    for (int i = 0; i < 24; ++i) {
        boundary += alphabet[dis(gen)];
    }
    return boundary;
}

void append(std::vector<uint8_t>& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
}

}  // namespace

multipart_form::multipart_form() : boundary_(generate_boundary()) {}

multipart_form::multipart_form(std::string boundary) : boundary_(std::move(boundary)) {}

auto multipart_form::add_text(const std::string& name, const std::string& value)
    -> multipart_form& {
    part p;
    p.name = name;
    p.content.assign(value.begin(), value.end());
    parts_.push_back(std::move(p));
    return *this;
}

auto multipart_form::add_file(const std::string& name,
                              const std::string& filename,
                              std::vector<uint8_t> content,
                              const std::string& content_type) -> multipart_form& {
    part p;
    p.name = name;
    p.filename = filename;
    p.content_type = content_type;
    p.content = std::move(content);
    p.is_file = true;
    parts_.push_back(std::move(p));
    return *this;
}

auto multipart_form::content_type() const -> std::string {
    return "multipart/form-data; boundary=" + boundary_;
}

auto multipart_form::build() const -> std::vector<uint8_t> {
    std::vector<uint8_t> out;
    for (const auto& p : parts_) {
        append(out, "--" + boundary_ + "\r\n");
        append(out, "Content-Disposition: form-data; name=\"" + p.name + "\"");
        if (p.is_file) {
            append(out, "; filename=\"" + p.filename + "\"\r\n");
            append(out, "Content-Type: " + p.content_type + "\r\n");
        } else {
            append(out, "\r\n");
        }
        append(out, "\r\n");
        out.insert(out.end(), p.content.begin(), p.content.end());
        append(out, "\r\n");
    }
    append(out, "--" + boundary_ + "--\r\n");
    return out;
}

}  // namespace kcenon::cube
