/**
 * @file http_client.h
 * @brief HTTP client adapter over network_system
 *
 * Wraps the network_system HTTP client. Without network_system every
 * request fails with error_code::network_error, so callers must supply
 * their own http_client_interface in that configuration.
 */

#ifndef CUSTODY_UPLOAD_TRANSPORT_HTTP_CLIENT_H
#define CUSTODY_UPLOAD_TRANSPORT_HTTP_CLIENT_H

#include <custody/upload/transport/http_types.h>

#include <chrono>
#include <memory>
#include <string>

namespace custody::upload {

/**
 * @brief HTTP client used by the REST api and the part transport
 *
 * @note Thread-safe for concurrent requests.
 */
class http_client : public http_client_interface {
public:
    /**
     * @brief Construct HTTP client with timeout
     * @param timeout Request timeout duration
     */
    explicit http_client(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~http_client() override;

    http_client(const http_client&) = delete;
    auto operator=(const http_client&) -> http_client& = delete;
    http_client(http_client&&) noexcept;
    auto operator=(http_client&&) noexcept -> http_client&;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           std::span<const std::byte> body,
                           const http_headers& headers) -> result<http_response> override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if network_system is available
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory function to create an HTTP client
 */
[[nodiscard]] auto make_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_client>;

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_TRANSPORT_HTTP_CLIENT_H
