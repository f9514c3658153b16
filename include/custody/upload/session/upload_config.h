/**
 * @file upload_config.h
 * @brief Configuration of an upload session
 */

#ifndef CUSTODY_UPLOAD_SESSION_UPLOAD_CONFIG_H
#define CUSTODY_UPLOAD_SESSION_UPLOAD_CONFIG_H

#include <custody/upload/core/retry_executor.h>
#include <custody/upload/session/part_uploader.h>
#include <custody/upload/session/session_state_store.h>
#include <custody/upload/session/upload_types.h>

#include <cstddef>
#include <string>

namespace custody::upload {

/**
 * @brief Upload session configuration
 */
struct upload_config {
    /// Retry policy for part transfers
    retry_policy retry;

    /// Buffered bytes that trigger an automatic flush; within [min_part_size, max_part_size]
    std::size_t part_size_threshold = min_part_size;

    /// Content type, checksum and confirmation header names of the part PUT
    part_transfer_config transfer;

    /// Prefix of the persisted snapshot key; the capture id is appended
    std::string state_key_prefix = session_state_store::default_key_prefix;

    /// Storage class requested when initiate() is called without one
    std::string default_storage_class = "STANDARD";
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_SESSION_UPLOAD_CONFIG_H
