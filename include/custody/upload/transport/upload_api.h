/**
 * @file upload_api.h
 * @brief Collaborator interfaces for session negotiation and part transfer
 */

#ifndef CUSTODY_UPLOAD_TRANSPORT_UPLOAD_API_H
#define CUSTODY_UPLOAD_TRANSPORT_UPLOAD_API_H

#include <custody/upload/core/types.h>
#include <custody/upload/session/upload_types.h>
#include <custody/upload/transport/http_types.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace custody::upload {

// ============================================================================
// Request / response types
// ============================================================================

/**
 * @brief Response of a session start request
 */
struct start_response {
    std::string session_id;
    std::string capture_id;
    std::string object_key;
};

/**
 * @brief Per-part authorization request
 */
struct negotiate_request {
    std::string capture_id;
    std::string session_id;
    uint32_t part_number = 0;
    std::string unit_hash;
    uint64_t size_bytes = 0;
    std::string content_digest;
    std::optional<std::string> previous_unit_hash;
};

/**
 * @brief Per-part authorization granted by the backend
 */
struct negotiate_response {
    /// Absolute URL accepting the part bytes
    std::string authorization_url;

    /// Digest the backend bound into the authorization, if any
    std::optional<std::string> confirmed_digest;
};

/**
 * @brief Completion request
 */
struct complete_request {
    std::string capture_id;
    std::string session_id;
    /// Sorted ascending by part number
    std::vector<upload_part> parts;
    std::optional<preview_metadata> preview;
};

/**
 * @brief Completion response
 */
struct complete_response {
    std::string url;
    std::string object_key;
};

// ============================================================================
// Interfaces
// ============================================================================

/**
 * @brief Backend api driving the multi-part upload protocol
 *
 * Errors carry the HTTP status when a response was received.
 */
class upload_api {
public:
    virtual ~upload_api() = default;

    /**
     * @brief Start a remote session for a capture
     */
    virtual auto start(const std::string& capture_id, const std::string& storage_class)
        -> result<start_response> = 0;

    /**
     * @brief Obtain authorization to upload one part
     */
    virtual auto negotiate_part(const negotiate_request& request)
        -> result<negotiate_response> = 0;

    /**
     * @brief Assemble the uploaded parts into the final object
     */
    virtual auto complete(const complete_request& request) -> result<complete_response> = 0;

    /**
     * @brief Cancel the remote session (best effort)
     */
    virtual auto cancel(const std::string& capture_id, const std::string& session_id)
        -> result<void> = 0;
};

/**
 * @brief Binary transfer of a part to an authorization URL
 *
 * Returns the raw response; status and confirmation-token checks belong
 * to the caller.
 */
class part_transport {
public:
    virtual ~part_transport() = default;

    virtual auto put(const std::string& url,
                     std::span<const std::byte> body,
                     const http_headers& headers) -> result<http_response> = 0;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_TRANSPORT_UPLOAD_API_H
