/**
 * @file multipart.h
 * @brief multipart/form-data body builder for file uploads
 */

#ifndef KCENON_CUBE_HTTP_MULTIPART_H
#define KCENON_CUBE_HTTP_MULTIPART_H

#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::cube {

/**
 * @brief A multipart/form-data request body
 */
class multipart_form {
public:
    multipart_form();
    explicit multipart_form(std::string boundary);

    auto add_text(const std::string& name, const std::string& value) -> multipart_form&;

    auto add_file(const std::string& name,
                  const std::string& filename,
                  std::vector<uint8_t> content,
                  const std::string& content_type = "application/octet-stream")
        -> multipart_form&;

    /**
     * @brief Value for the Content-Type header
     */
    [[nodiscard]] auto content_type() const -> std::string;

    [[nodiscard]] auto boundary() const -> const std::string& { return boundary_; }

    /**
     * @brief Encode every part followed by the closing boundary
     */
    [[nodiscard]] auto build() const -> std::vector<uint8_t>;

private:
    struct part {
        std::string name;
        std::string filename;
        std::string content_type;
        std::vector<uint8_t> content;
        bool is_file = false;
    };

    std::string boundary_;
    std::vector<part> parts_;
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_HTTP_MULTIPART_H
