/**
 * @file checksum.h
 * @brief SHA-256 digests and base64 encoding for chain-of-custody hashing
 */

#ifndef CUSTODY_UPLOAD_CORE_CHECKSUM_H
#define CUSTODY_UPLOAD_CORE_CHECKSUM_H

#include <custody/upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace custody::upload {

/**
 * @brief Checksum utilities
 *
 * Provides static methods for:
 * - SHA-256 as lowercase hex (unit and block content hashes)
 * - SHA-256 as base64 (the storage provider's checksum header)
 * - base64 encoding of arbitrary bytes
 */
class checksum {
public:
    static constexpr std::size_t sha256_digest_size = 32;

    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return 64-character lowercase hex string
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a string
     */
    [[nodiscard]] static auto sha256(std::string_view text) -> std::string;

    /**
     * @brief Calculate SHA-256 digest of data, base64 encoded
     */
    [[nodiscard]] static auto sha256_base64(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Calculate raw SHA-256 digest
     */
    [[nodiscard]] static auto sha256_digest(std::span<const std::byte> data)
        -> std::vector<uint8_t>;

    /**
     * @brief Encode bytes as standard base64 with padding
     */
    [[nodiscard]] static auto base64_encode(std::span<const uint8_t> data) -> std::string;

    /**
     * @brief Encode bytes as lowercase hex
     */
    [[nodiscard]] static auto to_hex(std::span<const uint8_t> data) -> std::string;

    /**
     * @brief Check whether a string is a 64-character hex SHA-256 value
     */
    [[nodiscard]] static auto is_sha256_hex(std::string_view value) -> bool;
};

/**
 * @brief Incremental SHA-256 hasher
 *
 * Hashes a sequence of buffers as if they were concatenated, without
 * materializing the concatenation.
 */
class sha256_hasher {
public:
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(sha256_hasher&&) noexcept;
    auto operator=(sha256_hasher&&) noexcept -> sha256_hasher&;

    sha256_hasher(const sha256_hasher&) = delete;
    auto operator=(const sha256_hasher&) -> sha256_hasher& = delete;

    /**
     * @brief Feed more bytes
     * @return error if the digest context failed
     */
    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finish hashing and return the hex digest
     *
     * The hasher is reset and may be reused afterwards.
     */
    [[nodiscard]] auto finalize() -> result<std::string>;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_CORE_CHECKSUM_H
