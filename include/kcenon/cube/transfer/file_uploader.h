/**
 * @file file_uploader.h
 * @brief Upload of local files and directories to userfiles
 */

#ifndef KCENON_CUBE_TRANSFER_FILE_UPLOADER_H
#define KCENON_CUBE_TRANSFER_FILE_UPLOADER_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/cube/client/cube_client.h"
#include "kcenon/cube/core/types.h"
#include "kcenon/cube/transfer/progress_aggregator.h"
#include "kcenon/cube/transfer/transfer_types.h"

namespace kcenon::cube {

/**
 * @brief A local file and the name it is uploaded under
 */
struct input_file {
    std::filesystem::path local_path;

    /// Path relative to the parent of the argument it was found under
    std::string name;
    uint64_t size = 0;
};

/**
 * @brief Expand files and directories into a list of regular files
 *
 * Directories are walked recursively. "data/scan" holding "a/b.dcm"
 * yields the name "scan/a/b.dcm"; a file argument keeps its filename.
 * A missing path fails with file_not_found.
 */
[[nodiscard]] auto discover_input_files(const std::vector<std::filesystem::path>& paths)
    -> result<std::vector<input_file>>;

struct upload_summary {
    executor_summary transfers;
    uint64_t total_size = 0;
};

/**
 * @brief Upload files to "<username>/uploads/<upload_dir>/<name>"
 *
 * Files are uploaded concurrently. A file that cannot be read is recorded as
 * a failure of its own task; request errors stop the upload.
 */
[[nodiscard]] auto upload_files(const cube_client& client,
                                const std::vector<input_file>& files,
                                const std::string& upload_dir,
                                const transfer_config& config = {},
                                std::shared_ptr<progress_renderer> renderer = nullptr)
    -> result<upload_summary>;

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_TRANSFER_FILE_UPLOADER_H
