/**
 * @file file_uploader.cpp
 * @brief Upload of local files and directories to userfiles
 */

#include "kcenon/cube/transfer/file_uploader.h"

#include <system_error>

#include "kcenon/cube/core/logging.h"
#include "kcenon/cube/core/url_utils.h"
#include "kcenon/cube/transfer/task_source.h"
#include "kcenon/cube/transfer/transfer_runner.h"

namespace kcenon::cube {

namespace fs = std::filesystem;

namespace {

auto without_trailing_slash(fs::path path) -> fs::path {
    if (!path.has_filename() && path.has_parent_path()) {
        return path.parent_path();
    }
    return path;
}

}  // namespace

auto discover_input_files(const std::vector<fs::path>& paths)
    -> result<std::vector<input_file>> {
    std::vector<input_file> files;

    for (const auto& argument : paths) {
        auto path = without_trailing_slash(argument);
        std::error_code ec;
        auto status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            return unexpected{error{error_code::file_not_found,
                "No such file or directory: " + path.string()}};
        }

        if (fs::is_regular_file(status)) {
            files.push_back(input_file{path, path.filename().generic_string(),
                                       fs::file_size(path, ec)});
            continue;
        }
        if (!fs::is_directory(status)) {
            continue;
        }

        auto base = path.has_parent_path() ? path.parent_path() : fs::path(".");
        fs::recursive_directory_iterator it(path, ec);
        if (ec) {
            return unexpected{error{error_code::file_access_denied,
                "Cannot read directory " + path.string() + ": " + ec.message()}};
        }
        for (const auto& entry : it) {
            if (!entry.is_regular_file(ec)) {
                continue;
            }
            auto relative = fs::relative(entry.path(), base, ec);
            if (ec) {
                relative = entry.path().filename();
            }
            files.push_back(input_file{entry.path(), relative.generic_string(),
                                       entry.file_size(ec)});
        }
    }

    return files;
}

auto upload_files(const cube_client& client,
                  const std::vector<input_file>& files,
                  const std::string& upload_dir,
                  const transfer_config& config,
                  std::shared_ptr<progress_renderer> renderer)
    -> result<upload_summary> {
    upload_summary summary;
    std::vector<transfer_task> tasks;
    tasks.reserve(files.size());

    for (const auto& file : files) {
        summary.total_size += file.size;
        auto upload_path = upload_dir.empty() ? file.name : url_utils::join(upload_dir, file.name);

        transfer_task task;
        task.name = file.name;
        task.size = file.size;
        task.work = [client, file, upload_path](const chunk_reporter& report) -> result<uint64_t> {
            auto content = detail::read_local_file(file.local_path);
            if (!content) {
                return unexpected{content.error()};
            }
            auto size = static_cast<uint64_t>(content.value().size());
            auto uploaded = client.upload_bytes(std::move(content.value()),
                                                file.local_path.filename().string(),
                                                upload_path);
            if (!uploaded) {
                return unexpected{uploaded.error()};
            }
            report(size);
            return size;
        };
        tasks.push_back(std::move(task));
    }

    CUBE_LOG_INFO(log_category::transfer,
                  "Uploading " + std::to_string(files.size()) + " files (" +
                  format_bytes(summary.total_size) + ")");

    vector_task_source source(std::move(tasks));
    auto transfers = run_transfers(source, files.size(), config, std::move(renderer));
    if (!transfers) {
        return unexpected{transfers.error()};
    }
    summary.transfers = std::move(transfers.value());
    return summary;
}

}  // namespace kcenon::cube
