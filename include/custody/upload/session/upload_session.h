/**
 * @file upload_session.h
 * @brief Chunked, resumable upload of one capture
 */

#ifndef CUSTODY_UPLOAD_SESSION_UPLOAD_SESSION_H
#define CUSTODY_UPLOAD_SESSION_UPLOAD_SESSION_H

#include <custody/upload/core/retry_executor.h>
#include <custody/upload/core/types.h>
#include <custody/upload/session/upload_config.h>
#include <custody/upload/session/upload_types.h>
#include <custody/upload/storage/key_value_store.h>
#include <custody/upload/transport/upload_api.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace custody::upload {

/**
 * @brief Upload session orchestrator
 *
 * Drives one capture through initiate, add_unit, flush, complete and abort.
 * Units are buffered until the part size threshold is reached, then flushed
 * as one part. Part numbers are claimed in order and never reused, even when
 * several threads add units concurrently. State is persisted after every
 * change so a restarted process can resume the session.
 *
 * Status transitions: idle -> uploading -> completing -> completed | failed.
 *
 * @code
 * auto session_result = upload_session::builder()
 *     .with_api(api)
 *     .with_transport(transport)
 *     .with_key_value_store(store)
 *     .build();
 *
 * if (session_result.has_value()) {
 *     auto& session = session_result.value();
 *     session.initiate("cap-1", "STANDARD");
 *     session.add_unit(bytes, hash, previous_hash);
 *     auto completed = session.complete();
 * }
 * @endcode
 */
class upload_session {
public:
    using progress_callback = std::function<void(const upload_progress&)>;

    /**
     * @brief Builder for upload_session
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the backend api (required)
         */
        auto with_api(std::shared_ptr<upload_api> api) -> builder&;

        /**
         * @brief Set the binary part transport (required)
         */
        auto with_transport(std::shared_ptr<part_transport> transport) -> builder&;

        /**
         * @brief Set the persistent store (default: in-memory store)
         */
        auto with_key_value_store(std::shared_ptr<key_value_store> store) -> builder&;

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(upload_config config) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;

        /**
         * @brief Set the automatic flush threshold in bytes (default: 5 MiB)
         */
        auto with_part_size_threshold(std::size_t bytes) -> builder&;

        auto with_content_type(std::string content_type) -> builder&;

        auto with_state_key_prefix(std::string prefix) -> builder&;

        /**
         * @brief Bind the session to a capture so persisted state can be
         *        resumed without calling initiate()
         */
        auto for_capture(std::string capture_id) -> builder&;

        /**
         * @brief Replace the sleep used between retry attempts
         */
        auto with_sleep_function(retry_executor::sleep_function sleeper) -> builder&;

        /**
         * @brief Build the session
         * @return The session, or config_invalid
         */
        [[nodiscard]] auto build() -> result<upload_session>;

    private:
        upload_config config_;
        std::shared_ptr<upload_api> api_;
        std::shared_ptr<part_transport> transport_;
        std::shared_ptr<key_value_store> store_;
        std::optional<std::string> capture_id_;
        retry_executor::sleep_function sleeper_;
    };

    // Non-copyable, movable
    upload_session(const upload_session&) = delete;
    auto operator=(const upload_session&) -> upload_session& = delete;
    upload_session(upload_session&&) noexcept;
    auto operator=(upload_session&&) noexcept -> upload_session&;
    ~upload_session();

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start a new remote session
     *
     * Resets every counter and discards buffered data of a previous session.
     * @param capture_id Non-empty capture identifier
     * @param storage_class Storage class requested from the backend
     * @return The new session identity
     */
    [[nodiscard]] auto initiate(const std::string& capture_id,
                                const std::string& storage_class)
        -> result<session_identity>;

    /**
     * @brief Start a new remote session with the configured storage class
     */
    [[nodiscard]] auto initiate(const std::string& capture_id) -> result<session_identity>;

    /**
     * @brief Buffer a captured unit
     *
     * Reaching the part size threshold flushes the buffer synchronously
     * unless another flush is running. The unit is always buffered; an
     * error reports a failed transfer of the flushed block, which complete()
     * retries.
     */
    [[nodiscard]] auto add_unit(std::span<const std::byte> data,
                                std::string content_hash,
                                std::optional<std::string> previous_unit_hash) -> result<void>;

    /**
     * @brief Flush the buffer now, whatever its size
     *
     * Waits for earlier flushes. Succeeds without a transfer when the
     * buffer is empty.
     */
    [[nodiscard]] auto flush() -> result<void>;

    /**
     * @brief Upload caller-supplied bytes as a specific part and record it
     *
     * Recording a part number that already exists replaces its token.
     */
    [[nodiscard]] auto upload_part(std::span<const std::byte> data,
                                   uint32_t part_number,
                                   const std::string& content_hash,
                                   const std::optional<std::string>& previous_unit_hash)
        -> result<upload_part_result>;

    /**
     * @brief Flush, wait for transfers, and assemble the remote object
     *
     * Parts are submitted sorted by part number and must form 1..N.
     * May be called again after a failure.
     */
    [[nodiscard]] auto complete(std::optional<preview_metadata> preview = std::nullopt)
        -> result<completion_result>;

    /**
     * @brief Cancel the session
     *
     * Notifies the backend (ignoring failures), then clears persisted and
     * in-memory state. Never fails. Transfers still running complete
     * without being recorded.
     */
    void abort();

    /**
     * @brief Load persisted state of the bound capture
     * @return true if a snapshot was found
     */
    [[nodiscard]] auto resume() -> result<bool>;

    // ========================================================================
    // Observation
    // ========================================================================

    /**
     * @brief Set the progress callback, invoked after every state change
     */
    void on_progress(progress_callback callback);

    [[nodiscard]] auto progress() const -> upload_progress;
    [[nodiscard]] auto status() const -> upload_status;

    /**
     * @brief Recorded parts in recording order
     */
    [[nodiscard]] auto parts() const -> std::vector<custody::upload::upload_part>;

    [[nodiscard]] auto identity() const -> std::optional<session_identity>;
    [[nodiscard]] auto session_id() const -> std::optional<std::string>;
    [[nodiscard]] auto object_key() const -> std::optional<std::string>;
    [[nodiscard]] auto capture_id() const -> std::optional<std::string>;
    [[nodiscard]] auto next_part_number() const -> uint32_t;
    [[nodiscard]] auto buffered_bytes() const -> std::size_t;
    [[nodiscard]] auto buffered_units() const -> std::size_t;

    /**
     * @brief Check whether a session is active and not yet completed
     */
    [[nodiscard]] auto is_in_progress() const -> bool;

    [[nodiscard]] auto config() const -> const upload_config&;

private:
    class impl;

    explicit upload_session(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_SESSION_UPLOAD_SESSION_H
