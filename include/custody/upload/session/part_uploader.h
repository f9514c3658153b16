/**
 * @file part_uploader.h
 * @brief Negotiates and transfers a single part
 */

#ifndef CUSTODY_UPLOAD_SESSION_PART_UPLOADER_H
#define CUSTODY_UPLOAD_SESSION_PART_UPLOADER_H

#include <custody/upload/core/retry_executor.h>
#include <custody/upload/core/types.h>
#include <custody/upload/session/upload_types.h>
#include <custody/upload/transport/upload_api.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace custody::upload {

/**
 * @brief Settings for the binary transfer
 */
struct part_transfer_config {
    std::string content_type = "application/octet-stream";
    std::string checksum_header = "x-amz-checksum-sha256";
    std::string confirmation_header = "ETag";
};

/**
 * @brief Uploads one part of an active session
 *
 * Steps, in order:
 * 1. compute the base64 SHA-256 digest of the bytes
 * 2. request authorization from the api (never retried)
 * 3. validate the returned URL
 * 4. PUT the bytes with the checksum header, retried per the retry policy
 * 5. require a 2xx status and a non-empty confirmation token
 *
 * Recording the part in the session is left to the caller.
 */
class part_uploader {
public:
    part_uploader(std::shared_ptr<upload_api> api,
                  std::shared_ptr<part_transport> transport,
                  retry_executor executor,
                  part_transfer_config config = part_transfer_config{});

    /**
     * @brief Upload one part
     * @param identity Active session, or std::nullopt (fails with not_initiated)
     * @param part_number 1-based part number
     * @param data Part bytes
     * @param content_hash SHA-256 hex of data
     * @param previous_unit_hash Hash of the unit preceding this part's first unit
     */
    [[nodiscard]] auto upload(const std::optional<session_identity>& identity,
                              uint32_t part_number,
                              std::span<const std::byte> data,
                              const std::string& content_hash,
                              const std::optional<std::string>& previous_unit_hash) const
        -> result<upload_part_result>;

    /**
     * @brief Check that a URL is absolute, uses http or https, and has a host
     */
    [[nodiscard]] static auto is_valid_authorization_url(const std::string& url) -> bool;

    /**
     * @brief Remove surrounding double quotes from a confirmation token
     */
    [[nodiscard]] static auto strip_quotes(const std::string& token) -> std::string;

    [[nodiscard]] auto config() const -> const part_transfer_config& { return config_; }

private:
    std::shared_ptr<upload_api> api_;
    std::shared_ptr<part_transport> transport_;
    retry_executor executor_;
    part_transfer_config config_;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_SESSION_PART_UPLOADER_H
