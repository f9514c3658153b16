/**
 * @file session_state_store.h
 * @brief Persists upload session snapshots for resumption after restart
 */

#ifndef CUSTODY_UPLOAD_SESSION_SESSION_STATE_STORE_H
#define CUSTODY_UPLOAD_SESSION_SESSION_STATE_STORE_H

#include <custody/upload/core/types.h>
#include <custody/upload/session/upload_types.h>
#include <custody/upload/storage/key_value_store.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace custody::upload {

/**
 * @brief Persisted form of an upload session
 *
 * Buffered units are not part of the snapshot; they are lost on restart.
 */
struct session_snapshot {
    std::string session_id;
    std::string object_key;
    std::vector<upload_part> parts;
    std::string capture_id;
    uint32_t next_part_number = 1;

    /**
     * @brief Serialize to JSON
     *
     * Field names follow the backend protocol:
     * {"uploadId","s3Key","parts":[{"partNumber","etag"}],"captureId","nextPartNumber"}
     */
    [[nodiscard]] auto to_json() const -> std::string;

    /**
     * @brief Parse a snapshot
     *
     * A missing nextPartNumber defaults to parts.size() + 1.
     * @return state_corrupted if required fields are missing or malformed
     */
    [[nodiscard]] static auto from_json(const std::string& json) -> result<session_snapshot>;
};

/**
 * @brief Saves, loads and clears snapshots keyed by capture id
 *
 * Thread-safe as long as the underlying store is.
 */
class session_state_store {
public:
    static constexpr const char* default_key_prefix = "upload_state_";

    explicit session_state_store(std::shared_ptr<key_value_store> store,
                                 std::string key_prefix = default_key_prefix);

    /**
     * @brief Persist a snapshot under its capture id
     */
    [[nodiscard]] auto save(const session_snapshot& snapshot) -> result<void>;

    /**
     * @brief Load the snapshot of a capture
     * @return std::nullopt when nothing is stored
     */
    [[nodiscard]] auto load(const std::string& capture_id)
        -> result<std::optional<session_snapshot>>;

    /**
     * @brief Remove the snapshot of a capture
     */
    [[nodiscard]] auto clear(const std::string& capture_id) -> result<void>;

    /**
     * @brief Storage key for a capture id
     */
    [[nodiscard]] auto key_for(const std::string& capture_id) const -> std::string;

private:
    std::shared_ptr<key_value_store> store_;
    std::string key_prefix_;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_SESSION_SESSION_STATE_STORE_H
