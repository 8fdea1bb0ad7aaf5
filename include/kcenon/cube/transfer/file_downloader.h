/**
 * @file file_downloader.h
 * @brief Download of the files matched by a search
 */

#ifndef KCENON_CUBE_TRANSFER_FILE_DOWNLOADER_H
#define KCENON_CUBE_TRANSFER_FILE_DOWNLOADER_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "kcenon/cube/core/types.h"
#include "kcenon/cube/http/api_client.h"
#include "kcenon/cube/models/resources.h"
#include "kcenon/cube/search/access.h"
#include "kcenon/cube/search/search.h"
#include "kcenon/cube/transfer/progress_aggregator.h"
#include "kcenon/cube/transfer/transfer_types.h"

namespace kcenon::cube {

/// Size of the writes reported as transfer_chunk events
inline constexpr std::size_t download_chunk_size = 64 * 1024;

/**
 * @brief Where a file lands relative to the download destination
 *
 * Drops @p strip_prefix and any slashes after it from the front of fname.
 */
[[nodiscard]] auto download_relative_path(const std::string& fname, const std::string& strip_prefix)
    -> std::filesystem::path;

/**
 * @brief A task that fetches file_resource and writes it to @p target
 *
 * An existing target fails with file_already_exists unless clobber is set.
 */
[[nodiscard]] auto make_download_task(const api_client& client,
                                      const file_response& file,
                                      std::filesystem::path target,
                                      bool clobber) -> transfer_task;

/**
 * @brief Download every file of a search
 *
 * The collection is counted first; an empty one fails with
 * empty_collection. A single file is written to @p destination, or into it
 * when it is an existing directory. Several files are written under
 * @p destination at their fname relative to config.strip_prefix. The
 * declared length of the run is the count, capped by the query's max_items.
 */
[[nodiscard]] auto download_files(const search<file_response, ro_access>& files,
                                  const std::filesystem::path& destination,
                                  const transfer_config& config = {},
                                  std::shared_ptr<progress_renderer> renderer = nullptr)
    -> result<executor_summary>;

template <typename A>
[[nodiscard]] auto download_files(const search<file_response, A>& files,
                                  const std::filesystem::path& destination,
                                  const transfer_config& config = {},
                                  std::shared_ptr<progress_renderer> renderer = nullptr)
    -> result<executor_summary>
    requires is_rw_v<A>
{
    return download_files(files.into_read_only(), destination, config, std::move(renderer));
}

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_TRANSFER_FILE_DOWNLOADER_H
