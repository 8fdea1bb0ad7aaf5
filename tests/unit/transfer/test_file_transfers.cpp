/**
 * @file test_file_transfers.cpp
 * @brief Unit tests for uploading local files and downloading search results
 */

#include <gtest/gtest.h>

#include <kcenon/cube/client/cube_client.h>
#include <kcenon/cube/transfer/file_downloader.h>
#include <kcenon/cube/transfer/file_uploader.h>

#include "../fake_cube_server.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace kcenon::cube::test {

namespace fs = std::filesystem;

namespace {

void write_text(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

auto read_text(const fs::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

class recording_renderer : public progress_renderer {
public:
    void render(const progress_snapshot&) override {}
    void finish(const progress_snapshot& snapshot) override { last = snapshot; }

    progress_snapshot last;
};

}  // namespace

class FileTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("cube_transfer_test_" + std::to_string(rd()));
        fs::create_directories(root_);

        server_ = std::make_shared<fake_cube_server>();
        server_->on_get(kBaseUrl, links_json());

        auto client = client_builder()
                          .with_url(kBaseUrl)
                          .with_username("chris")
                          .with_token("abc123")
                          .with_transport(server_)
                          .with_retries(0)
                          .connect();
        ASSERT_TRUE(client);
        client_.emplace(client.value());

        config_.hidden = true;
        config_.concurrency = 2;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    /**
     * @brief Accept uploads and remember the upload_path of each
     */
    void accept_uploads() {
        server_->on(http_method::post, std::string(kBaseUrl) + "userfiles/",
                    [this](const http_request& request) -> result<http_response> {
                        std::string body(request.body.begin(), request.body.end());
                        auto marker = body.find("name=\"upload_path\"\r\n\r\n");
                        std::string path;
                        if (marker != std::string::npos) {
                            auto start = marker + std::string("name=\"upload_path\"\r\n\r\n").size();
                            path = body.substr(start, body.find("\r\n", start) - start);
                        }
                        {
                            std::lock_guard<std::mutex> lock(uploads_mutex_);
                            uploaded_paths_.insert(path);
                        }
                        return json_response(201, file_json(1, path, 1));
                    });
    }

    /**
     * @brief Serve files as a search result with downloadable contents
     */
    void serve_files(const std::vector<std::pair<std::string, std::string>>& files) {
        std::vector<Json::Value> items;
        uint32_t id = 1;
        for (const auto& [fname, content] : files) {
            items.push_back(file_json(id, fname, content.size()));
            auto resource = std::string(kBaseUrl) + "files/" + std::to_string(id) + "/data";
            server_->on(http_method::get, resource,
                        [content = content](const http_request&) -> result<http_response> {
                            return text_response(200, content);
                        });
            ++id;
        }
        server_->serve_collection(std::string(kBaseUrl) + "files/search/", items, 2);
    }

    fs::path root_;
    std::shared_ptr<fake_cube_server> server_;
    std::optional<cube_client> client_;
    transfer_config config_;

    std::mutex uploads_mutex_;
    std::set<std::string> uploaded_paths_;
};

// =============================================================================
// Input discovery
// =============================================================================

TEST_F(FileTransferTest, DiscoverNamesRelativeToArgumentParent) {
    write_text(root_ / "study" / "a.txt", "aa");
    write_text(root_ / "study" / "series" / "b.txt", "bbb");
    write_text(root_ / "single.txt", "s");

    auto files = discover_input_files({root_ / "study", root_ / "single.txt"});

    ASSERT_TRUE(files);
    std::set<std::string> names;
    uint64_t total = 0;
    for (const auto& f : files.value()) {
        names.insert(f.name);
        total += f.size;
    }
    EXPECT_EQ(names, (std::set<std::string>{"study/a.txt", "study/series/b.txt", "single.txt"}));
    EXPECT_EQ(total, 6u);
}

TEST_F(FileTransferTest, DiscoverIgnoresTrailingSlash) {
    write_text(root_ / "study" / "a.txt", "aa");

    auto files = discover_input_files({fs::path((root_ / "study").string() + "/")});

    ASSERT_TRUE(files);
    ASSERT_EQ(files.value().size(), 1u);
    EXPECT_EQ(files.value()[0].name, "study/a.txt");
}

TEST_F(FileTransferTest, DiscoverMissingPath) {
    auto files = discover_input_files({root_ / "missing"});

    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, error_code::file_not_found);
}

// =============================================================================
// Upload
// =============================================================================

TEST_F(FileTransferTest, UploadDirectoryUnderUploadDir) {
    write_text(root_ / "study" / "a.txt", "aa");
    write_text(root_ / "study" / "series" / "b.txt", "bbb");
    accept_uploads();
    auto files = discover_input_files({root_ / "study"});
    ASSERT_TRUE(files);

    auto summary = upload_files(*client_, files.value(), "incoming", config_);

    ASSERT_TRUE(summary) << summary.error().describe();
    EXPECT_EQ(summary.value().total_size, 5u);
    EXPECT_EQ(summary.value().transfers.succeeded, 2u);
    EXPECT_EQ(summary.value().transfers.bytes_transferred, 5u);
    EXPECT_EQ(uploaded_paths_, (std::set<std::string>{
        "chris/uploads/incoming/study/a.txt",
        "chris/uploads/incoming/study/series/b.txt"}));
}

TEST_F(FileTransferTest, UploadReportsProgress) {
    write_text(root_ / "big.bin", std::string(3000, 'x'));
    write_text(root_ / "small.bin", "x");
    accept_uploads();
    auto files = discover_input_files({root_ / "big.bin", root_ / "small.bin"});
    ASSERT_TRUE(files);

    auto renderer = std::make_shared<recording_renderer>();
    config_.hidden = false;
    config_.size_threshold = 1000;
    auto summary = upload_files(*client_, files.value(), "", config_, renderer);

    ASSERT_TRUE(summary);
    EXPECT_EQ(renderer->last.total_size, 3001u);
    EXPECT_EQ(renderer->last.bytes_transferred, 3001u);
    EXPECT_EQ(renderer->last.completed, 2u);
}

TEST_F(FileTransferTest, RejectedUploadStopsTheRun) {
    write_text(root_ / "a.txt", "a");
    server_->on(http_method::post, std::string(kBaseUrl) + "userfiles/",
                [](const http_request&) -> result<http_response> {
                    return text_response(400, R"({"upload_path":["invalid"]})");
                });
    auto files = discover_input_files({root_ / "a.txt"});
    ASSERT_TRUE(files);

    auto summary = upload_files(*client_, files.value(), "", config_);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().body.value_or(""), R"({"upload_path":["invalid"]})");
}

TEST_F(FileTransferTest, VanishedLocalFileIsIsolated) {
    write_text(root_ / "a.txt", "a");
    write_text(root_ / "b.txt", "b");
    accept_uploads();
    auto files = discover_input_files({root_ / "a.txt", root_ / "b.txt"});
    ASSERT_TRUE(files);
    fs::remove(root_ / "b.txt");

    auto summary = upload_files(*client_, files.value(), "", config_);

    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().transfers.succeeded, 1u);
    ASSERT_EQ(summary.value().transfers.failed(), 1u);
    EXPECT_EQ(summary.value().transfers.failures[0].err.code, error_code::file_not_found);
}

// =============================================================================
// Download
// =============================================================================

TEST_F(FileTransferTest, DownloadRelativePath) {
    EXPECT_EQ(download_relative_path("chris/feed_1/a/b.txt", "chris/feed_1"), fs::path("a/b.txt"));
    EXPECT_EQ(download_relative_path("chris/feed_1/a/b.txt", ""), fs::path("chris/feed_1/a/b.txt"));
    EXPECT_EQ(download_relative_path("chris/x.txt", "other/"), fs::path("chris/x.txt"));
    EXPECT_EQ(download_relative_path("chris/x.txt", "chris/x.txt"), fs::path("x.txt"));
}

TEST_F(FileTransferTest, DownloadManyFilesKeepsTree) {
    serve_files({{"chris/feed_1/data/a.txt", "alpha"},
                 {"chris/feed_1/data/sub/b.txt", "beta"},
                 {"chris/feed_1/data/c.txt", "gamma"}});
    auto search = client_->files().fname("chris/feed_1/").build();
    config_.strip_prefix = "chris/feed_1/";

    auto summary = download_files(search, root_ / "out", config_);

    ASSERT_TRUE(summary) << summary.error().describe();
    EXPECT_EQ(summary.value().declared, 3u);
    EXPECT_EQ(summary.value().succeeded, 3u);
    EXPECT_EQ(read_text(root_ / "out" / "data" / "a.txt"), "alpha");
    EXPECT_EQ(read_text(root_ / "out" / "data" / "sub" / "b.txt"), "beta");
    EXPECT_EQ(read_text(root_ / "out" / "data" / "c.txt"), "gamma");
}

TEST_F(FileTransferTest, DownloadStopsAtMaxItems) {
    serve_files({{"a.txt", "alpha"}, {"b.txt", "beta"}, {"c.txt", "gamma"}, {"d.txt", "delta"}});

    auto summary = download_files(client_->files().max_items(2).build(), root_ / "out", config_);

    ASSERT_TRUE(summary) << summary.error().describe();
    EXPECT_EQ(summary.value().declared, 2u);
    EXPECT_EQ(summary.value().succeeded, 2u);
    std::size_t on_disk = 0;
    for (const auto& entry : fs::directory_iterator(root_ / "out")) {
        EXPECT_TRUE(entry.is_regular_file());
        ++on_disk;
    }
    EXPECT_EQ(on_disk, 2u);
}

TEST_F(FileTransferTest, DownloadWithMaxItemsOneWritesSingleFile) {
    serve_files({{"a.txt", "alpha"}, {"b.txt", "beta"}, {"c.txt", "gamma"}});

    auto summary =
        download_files(client_->files().max_items(1).build(), root_ / "first.txt", config_);

    ASSERT_TRUE(summary) << summary.error().describe();
    EXPECT_EQ(summary.value().declared, 1u);
    EXPECT_EQ(read_text(root_ / "first.txt"), "alpha");
}

TEST_F(FileTransferTest, DownloadSingleFileIntoDirectory) {
    serve_files({{"chris/feed_1/data/only.txt", "solo"}});
    fs::create_directories(root_ / "dir");

    auto summary = download_files(client_->files().build(), root_ / "dir", config_);

    ASSERT_TRUE(summary);
    EXPECT_EQ(read_text(root_ / "dir" / "only.txt"), "solo");
}

TEST_F(FileTransferTest, DownloadSingleFileToNewName) {
    serve_files({{"chris/feed_1/data/only.txt", "solo"}});

    auto summary = download_files(client_->files().build(), root_ / "renamed.txt", config_);

    ASSERT_TRUE(summary);
    EXPECT_EQ(read_text(root_ / "renamed.txt"), "solo");
}

TEST_F(FileTransferTest, DownloadEmptySearch) {
    serve_files({});

    auto summary = download_files(client_->files().build(), root_ / "out", config_);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, error_code::empty_collection);
}

TEST_F(FileTransferTest, ExistingFileIsKeptWithoutClobber) {
    serve_files({{"a.txt", "new"}, {"b.txt", "fresh"}});
    write_text(root_ / "out" / "a.txt", "old");

    auto summary = download_files(client_->files().build(), root_ / "out", config_);

    ASSERT_TRUE(summary);
    EXPECT_EQ(read_text(root_ / "out" / "a.txt"), "old");
    EXPECT_EQ(read_text(root_ / "out" / "b.txt"), "fresh");
    ASSERT_EQ(summary.value().failed(), 1u);
    EXPECT_EQ(summary.value().failures[0].err.code, error_code::file_already_exists);
}

TEST_F(FileTransferTest, ClobberOverwrites) {
    serve_files({{"a.txt", "new"}, {"b.txt", "fresh"}});
    write_text(root_ / "out" / "a.txt", "old");
    config_.clobber = true;

    auto summary = download_files(client_->files().build(), root_ / "out", config_);

    ASSERT_TRUE(summary);
    EXPECT_TRUE(summary.value().all_succeeded());
    EXPECT_EQ(read_text(root_ / "out" / "a.txt"), "new");
}

TEST_F(FileTransferTest, DownloadReportsChunks) {
    std::string big(download_chunk_size * 2 + 10, 'z');
    serve_files({{"big.bin", big}, {"small.bin", "s"}});
    auto renderer = std::make_shared<recording_renderer>();
    config_.hidden = false;

    auto summary = download_files(client_->files().build(), root_ / "out", config_, renderer);

    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().bytes_transferred, big.size() + 1);
    EXPECT_EQ(renderer->last.total_size, big.size() + 1);
    EXPECT_EQ(renderer->last.bytes_transferred, big.size() + 1);
}

TEST_F(FileTransferTest, ServerErrorDuringDownloadFails) {
    serve_files({{"a.txt", "a"}, {"b.txt", "b"}});
    server_->on(http_method::get, std::string(kBaseUrl) + "files/2/data",
                [](const http_request&) -> result<http_response> {
                    return text_response(403, "forbidden");
                });

    auto summary = download_files(client_->files().build(), root_ / "out", config_);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().status_code.value_or(0), 403);
}

TEST_F(FileTransferTest, ZeroConcurrencyIsRejected) {
    serve_files({{"a.txt", "a"}, {"b.txt", "b"}});
    config_.concurrency = 0;

    auto summary = download_files(client_->files().build(), root_ / "out", config_);

    ASSERT_FALSE(summary);
    EXPECT_EQ(summary.error().code, error_code::invalid_configuration);
}

}  // namespace kcenon::cube::test
