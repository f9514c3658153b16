/**
 * @file upload_types.h
 * @brief Value types shared by the upload session components
 */

#ifndef CUSTODY_UPLOAD_SESSION_UPLOAD_TYPES_H
#define CUSTODY_UPLOAD_SESSION_UPLOAD_TYPES_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace custody::upload {

/**
 * @brief Minimum part size accepted by the storage provider (5 MiB)
 */
inline constexpr std::size_t min_part_size = 5 * 1024 * 1024;

/**
 * @brief Maximum part size accepted by the storage provider (5 GiB)
 */
inline constexpr std::size_t max_part_size = static_cast<std::size_t>(5) * 1024 * 1024 * 1024;

/**
 * @brief A confirmed part of the remote object
 */
struct upload_part {
    uint32_t part_number = 0;
    std::string confirmation_token;

    [[nodiscard]] auto operator==(const upload_part& other) const -> bool = default;
};

/**
 * @brief A captured unit waiting in the accumulator
 */
struct pending_unit {
    std::vector<std::byte> data;
    std::string content_hash;
    std::optional<std::string> previous_unit_hash;
};

/**
 * @brief Result of a single part upload
 */
struct upload_part_result {
    uint32_t part_number = 0;
    std::string confirmation_token;
    std::size_t attempts = 0;
};

/**
 * @brief Upload session status
 */
enum class upload_status {
    idle,
    uploading,
    completing,
    completed,
    failed
};

[[nodiscard]] constexpr auto to_string(upload_status status) -> const char* {
    switch (status) {
        case upload_status::idle: return "idle";
        case upload_status::uploading: return "uploading";
        case upload_status::completing: return "completing";
        case upload_status::completed: return "completed";
        case upload_status::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Progress snapshot reported to the progress callback
 */
struct upload_progress {
    std::size_t units_uploaded = 0;
    /// units_uploaded plus one while the buffer holds data
    std::size_t units_total_estimate = 0;
    uint64_t bytes_uploaded = 0;
    uint64_t bytes_total_received = 0;
    upload_status status = upload_status::idle;

    [[nodiscard]] auto completion_percentage() const -> double {
        if (bytes_total_received == 0) return 0.0;
        return static_cast<double>(bytes_uploaded) /
               static_cast<double>(bytes_total_received) * 100.0;
    }
};

/**
 * @brief Identity of an active remote session
 */
struct session_identity {
    std::string session_id;
    std::string capture_id;
    std::string object_key;
};

/**
 * @brief Frame dimensions of a capture
 */
struct capture_dimensions {
    uint32_t width = 0;
    uint32_t height = 0;
};

/**
 * @brief Optional preview fields submitted with completion
 */
struct preview_metadata {
    std::optional<std::string> original_url;
    std::optional<std::string> page_title;
    /// Typically the Merkle root of all unit hashes
    std::optional<std::string> content_hash;
    std::optional<capture_dimensions> dimensions;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> duration_ms;
    std::map<std::string, std::string> metadata;
};

/**
 * @brief Result of a successful completion
 */
struct completion_result {
    std::string url;
    std::string object_key;
    std::size_t total_parts = 0;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_SESSION_UPLOAD_TYPES_H
