/**
 * @file cube.h
 * @brief Main header for cube_client_system library
 * @version 0.1.0
 *
 * This is the primary include file for the cube_client_system library.
 * Include this header to access all CUBE client functionality.
 *
 * @code
 * #include <kcenon/cube/cube.h>
 *
 * using namespace kcenon::cube;
 *
 * auto client = cube_client::builder()
 *     .with_url("https://cube.example.org/api/v1/")
 *     .with_username("chris")
 *     .with_password("chris1234")
 *     .connect();
 *
 * auto feeds = client.value().feeds();
 * auto total = feeds.count();
 * @endcode
 */

#ifndef KCENON_CUBE_CUBE_H
#define KCENON_CUBE_CUBE_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/cube/core/types.h"
#include "kcenon/cube/core/logging.h"

// HTTP
#include "kcenon/cube/http/api_client.h"
#include "kcenon/cube/http/network_http_transport.h"
#include "kcenon/cube/http/retry_policy.h"

// Search and models
#include "kcenon/cube/search/search.h"
#include "kcenon/cube/models/resources.h"
#include "kcenon/cube/models/searches.h"
#include "kcenon/cube/models/operations.h"

// Client
#include "kcenon/cube/client/client_types.h"
#include "kcenon/cube/client/cube_client.h"

// Transfers
#include "kcenon/cube/transfer/transfer_executor.h"
#include "kcenon/cube/transfer/progress_aggregator.h"
#include "kcenon/cube/transfer/file_uploader.h"
#include "kcenon/cube/transfer/file_downloader.h"

namespace kcenon::cube {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::cube

#endif  // KCENON_CUBE_CUBE_H
