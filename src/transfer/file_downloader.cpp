/**
 * @file file_downloader.cpp
 * @brief Download of the files matched by a search
 */

#include "kcenon/cube/transfer/file_downloader.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>
#include <vector>

#include "kcenon/cube/core/logging.h"
#include "kcenon/cube/transfer/task_source.h"
#include "kcenon/cube/transfer/transfer_runner.h"

namespace kcenon::cube {

namespace fs = std::filesystem;

namespace {

auto write_file(const fs::path& target,
                const std::vector<uint8_t>& content,
                bool clobber,
                const chunk_reporter& report) -> result<uint64_t> {
    std::error_code ec;
    if (!clobber && fs::exists(target, ec)) {
        return unexpected{error{error_code::file_already_exists,
            "File already exists: " + target.string()}};
    }
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return unexpected{error{error_code::file_write_error,
                "Cannot create directory " + target.parent_path().string() + ": " + ec.message()}};
        }
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected{error{error_code::file_access_denied,
            "Cannot open file for writing: " + target.string()}};
    }

    std::size_t offset = 0;
    while (offset < content.size()) {
        auto length = std::min(download_chunk_size, content.size() - offset);
        out.write(reinterpret_cast<const char*>(content.data() + offset),
                  static_cast<std::streamsize>(length));
        if (!out) {
            return unexpected{error{error_code::file_write_error,
                "Failed to write file: " + target.string()}};
        }
        offset += length;
        report(length);
    }
    return static_cast<uint64_t>(content.size());
}

}  // namespace

auto download_relative_path(const std::string& fname, const std::string& strip_prefix)
    -> fs::path {
    std::string relative = fname;
    if (!strip_prefix.empty() && relative.compare(0, strip_prefix.size(), strip_prefix) == 0) {
        relative.erase(0, strip_prefix.size());
    }
    auto first = relative.find_first_not_of('/');
    if (first == std::string::npos) {
        return fs::path(fname).filename();
    }
    return fs::path(relative.substr(first));
}

auto make_download_task(const api_client& client,
                        const file_response& file,
                        fs::path target,
                        bool clobber) -> transfer_task {
    transfer_task task;
    task.name = file.basename();
    task.size = file.fsize;
    task.work = [client, resource = file.file_resource, target = std::move(target), clobber](
                    const chunk_reporter& report) -> result<uint64_t> {
        std::error_code ec;
        if (!clobber && fs::exists(target, ec)) {
            return unexpected{error{error_code::file_already_exists,
                "File already exists: " + target.string()}};
        }
        auto content = client.get_bytes(resource);
        if (!content) {
            return unexpected{content.error()};
        }
        return write_file(target, content.value(), clobber, report);
    };
    return task;
}

auto download_files(const search<file_response, ro_access>& files,
                    const fs::path& destination,
                    const transfer_config& config,
                    std::shared_ptr<progress_renderer> renderer)
    -> result<executor_summary> {
    auto count = files.count();
    if (!count) {
        return unexpected{count.error()};
    }
    // The stream stops at max_items, so the executor must not expect more.
    std::size_t expected = count.value();
    if (files.query() != nullptr) {
        expected = std::min(expected, files.query()->max_items().value_or(
                                          std::numeric_limits<std::size_t>::max()));
    }
    if (expected == 0 || files.client() == nullptr) {
        return unexpected{error{error_code::empty_collection, "no files to download"}};
    }
    const auto& client = *files.client();

    request_log_context ctx;
    ctx.item_count = expected;
    ctx.filename = destination.string();
    CUBE_LOG_INFO_CTX(log_category::transfer, "Downloading files", ctx);

    if (expected == 1) {
        auto file = files.first();
        if (!file) {
            return unexpected{file.error()};
        }
        if (!file.value()) {
            return unexpected{error{error_code::executor_underfull,
                "file disappeared before download"}};
        }
        const auto& object = file.value()->object();

        std::error_code ec;
        auto target = fs::is_directory(destination, ec) ? destination / object.basename()
                                                        : destination;
        std::vector<transfer_task> tasks;
        tasks.push_back(make_download_task(client, object, target, config.clobber));
        vector_task_source source(std::move(tasks));
        return run_transfers(source, 1, config, std::move(renderer));
    }

    auto mapper = [client, destination, prefix = config.strip_prefix,
                   clobber = config.clobber](file_response file) {
        auto target = destination / download_relative_path(file.fname, prefix);
        return make_download_task(client, file, std::move(target), clobber);
    };
    stream_task_source<item_stream<file_response>, decltype(mapper)> source(files.stream(),
                                                                            std::move(mapper));
    return run_transfers(source, expected, config, std::move(renderer));
}

}  // namespace kcenon::cube
