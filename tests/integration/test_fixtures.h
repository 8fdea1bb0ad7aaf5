/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_CUBE_TEST_FIXTURES_H
#define KCENON_CUBE_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/cube/cube.h>

#include "../unit/fake_cube_server.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace kcenon::cube::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("cube_client_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        upload_dir_ = test_dir_ / "to_upload";
        std::filesystem::create_directories(upload_dir_);
        download_dir_ = test_dir_ / "downloads";
        std::filesystem::create_directories(download_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_binary_file(const std::filesystem::path& relative, std::size_t size)
        -> std::filesystem::path {
        auto path = upload_dir_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);
        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir_;
    std::filesystem::path upload_dir_;
    std::filesystem::path download_dir_;
};

/**
 * @brief A fake CUBE that keeps uploaded files and serves them back
 *
 * Uploads land in a user file collection, so uploading a directory and then
 * downloading it by fname round-trips through the same paths a real server
 * would use.
 */
class CubeServerFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        server_ = std::make_shared<fake_cube_server>();
        server_->on_get(kBaseUrl, links_json());
        server_->on(http_method::post, std::string(kBaseUrl) + "auth-token/",
                    [](const http_request&) -> result<http_response> {
                        Json::Value reply(Json::objectValue);
                        reply["token"] = "integration-token";
                        return json_response(200, reply);
                    });
        server_->on(http_method::post, std::string(kBaseUrl) + "userfiles/",
                    [this](const http_request& request) { return store_upload(request); });
        refresh_userfiles();
    }

    auto connect(uint32_t retries = 0) -> cube_client {
        auto client = cube_client::builder()
                          .with_url(kBaseUrl)
                          .with_username("chris")
                          .with_password("chris1234")
                          .with_transport(server_)
                          .with_retries(retries)
                          .with_sleep_function([](std::chrono::milliseconds) {})
                          .connect();
        EXPECT_TRUE(client) << client.error().describe();
        return client.value();
    }

    auto quiet_config(std::size_t concurrency = 4) -> transfer_config {
        transfer_config config;
        config.concurrency = concurrency;
        config.hidden = true;
        return config;
    }

    [[nodiscard]] auto stored_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(store_mutex_);
        return stored_.size();
    }

    std::shared_ptr<fake_cube_server> server_;

private:
    struct stored_file {
        std::string fname;
        std::string content;
    };

    static auto part_value(const std::string& body,
                           const std::string& header,
                           const std::string& delimiter) -> std::string {
        auto marker = body.find(header);
        if (marker == std::string::npos) {
            return {};
        }
        auto start = body.find("\r\n\r\n", marker);
        if (start == std::string::npos) {
            return {};
        }
        start += 4;
        auto end = body.find(delimiter, start);
        return body.substr(start, end - start);
    }

    auto store_upload(const http_request& request) -> result<http_response> {
        std::string body(request.body.begin(), request.body.end());
        auto content_type = request.headers.count("Content-Type")
                                ? request.headers.at("Content-Type")
                                : std::string();
        auto at = content_type.find("boundary=");
        if (at == std::string::npos) {
            return text_response(415, R"({"detail":"Unsupported media type."})");
        }
        auto boundary = content_type.substr(at + 9);
        auto delimiter = "\r\n--" + boundary;
        stored_file file{part_value(body, "name=\"upload_path\"", delimiter),
                         part_value(body, "name=\"fname\"", delimiter)};
        if (file.fname.empty()) {
            return text_response(400, R"({"upload_path":["This field is required."]})");
        }

        uint32_t id = 0;
        {
            std::lock_guard<std::mutex> lock(store_mutex_);
            stored_.push_back(file);
            id = static_cast<uint32_t>(stored_.size());
        }
        serve_content(id, file.content);
        refresh_userfiles();
        return json_response(201, file_json(id, file.fname, file.content.size()));
    }

    void serve_content(uint32_t id, std::string content) {
        server_->on(http_method::get,
                    std::string(kBaseUrl) + "files/" + std::to_string(id) + "/data",
                    [content = std::move(content)](const http_request&) -> result<http_response> {
                        return text_response(200, content);
                    });
    }

    void refresh_userfiles() {
        std::vector<Json::Value> items;
        {
            std::lock_guard<std::mutex> lock(store_mutex_);
            for (std::size_t i = 0; i < stored_.size(); ++i) {
                items.push_back(file_json(static_cast<uint32_t>(i + 1), stored_[i].fname,
                                          stored_[i].content.size()));
            }
        }
        server_->serve_collection(std::string(kBaseUrl) + "userfiles/", items, 3);
    }

    mutable std::mutex store_mutex_;
    std::vector<stored_file> stored_;
};

}  // namespace kcenon::cube::test

#endif  // KCENON_CUBE_TEST_FIXTURES_H
