/**
 * @file upload.h
 * @brief Main header for the custody upload library
 * @version 0.1.0
 *
 * Include this header to access the upload session and its collaborators.
 *
 * @code
 * #include <custody/upload/upload.h>
 *
 * using namespace custody::upload;
 *
 * auto client = make_http_client();
 * auto session = upload_session::builder()
 *     .with_api(std::make_shared<rest_upload_api>(client, rest_api_config{base_url}))
 *     .with_transport(std::make_shared<http_part_transport>(client))
 *     .with_key_value_store(std::make_shared<file_key_value_store>())
 *     .build();
 * @endcode
 */

#ifndef CUSTODY_UPLOAD_UPLOAD_H
#define CUSTODY_UPLOAD_UPLOAD_H

#include <cstdint>
#include <string>

// Core
#include <custody/upload/core/types.h>
#include <custody/upload/core/checksum.h>
#include <custody/upload/core/chunk_chain.h>
#include <custody/upload/core/logging.h>
#include <custody/upload/core/retry_executor.h>

// Storage
#include <custody/upload/storage/key_value_store.h>
#include <custody/upload/storage/file_key_value_store.h>

// Transport
#include <custody/upload/transport/http_client.h>
#include <custody/upload/transport/http_part_transport.h>
#include <custody/upload/transport/rest_upload_api.h>
#include <custody/upload/transport/upload_api.h>

// Session
#include <custody/upload/session/upload_config.h>
#include <custody/upload/session/upload_session.h>
#include <custody/upload/session/upload_types.h>

namespace custody::upload {

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

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_UPLOAD_H
