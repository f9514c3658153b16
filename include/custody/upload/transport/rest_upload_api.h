/**
 * @file rest_upload_api.h
 * @brief upload_api over the backend's JSON REST endpoints
 */

#ifndef CUSTODY_UPLOAD_TRANSPORT_REST_UPLOAD_API_H
#define CUSTODY_UPLOAD_TRANSPORT_REST_UPLOAD_API_H

#include <custody/upload/transport/http_types.h>
#include <custody/upload/transport/upload_api.h>

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace custody::upload {

/**
 * @brief Endpoint configuration for rest_upload_api
 */
struct rest_api_config {
    /// Base URL without trailing slash, e.g. "https://api.example.com"
    std::string base_url;

    std::string start_path = "/video/start";
    std::string chunk_path = "/video/chunk";
    std::string complete_path = "/video/complete";
    std::string cancel_path = "/video/cancel";

    /// Sent with every request (e.g. an externally issued Authorization header)
    http_headers headers;
};

/**
 * @brief JSON REST implementation of upload_api
 *
 * Responses may wrap their fields in a "data" envelope; fields are looked up
 * inside the envelope first, then at the top level. A 2xx response whose
 * body carries "success": false is treated as an error.
 */
class rest_upload_api : public upload_api {
public:
    rest_upload_api(std::shared_ptr<http_client_interface> client, rest_api_config config);

    [[nodiscard]] auto start(const std::string& capture_id, const std::string& storage_class)
        -> result<start_response> override;

    [[nodiscard]] auto negotiate_part(const negotiate_request& request)
        -> result<negotiate_response> override;

    [[nodiscard]] auto complete(const complete_request& request)
        -> result<complete_response> override;

    [[nodiscard]] auto cancel(const std::string& capture_id, const std::string& session_id)
        -> result<void> override;

    [[nodiscard]] auto config() const -> const rest_api_config& { return config_; }

    /**
     * @brief Look up a string field in a response body
     *
     * Each name is tried inside the "data" envelope, then at the top level;
     * the first non-null match wins.
     */
    [[nodiscard]] static auto response_field(const std::string& body,
                                             std::initializer_list<std::string_view> names)
        -> std::optional<std::string>;

    /**
     * @brief Build the /video/complete request body
     */
    [[nodiscard]] static auto complete_body(const complete_request& request) -> std::string;

private:
    [[nodiscard]] auto post_json(const std::string& path,
                                 const std::string& body,
                                 error_code failure_code) -> result<std::string>;

    std::shared_ptr<http_client_interface> client_;
    rest_api_config config_;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_TRANSPORT_REST_UPLOAD_API_H
