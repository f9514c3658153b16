/**
 * @file http_types.h
 * @brief HTTP response type and client interface used by the transports
 */

#ifndef CUSTODY_UPLOAD_TRANSPORT_HTTP_TYPES_H
#define CUSTODY_UPLOAD_TRANSPORT_HTTP_TYPES_H

#include <custody/upload/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace custody::upload {

using http_headers = std::map<std::string, std::string>;

/**
 * @brief HTTP response
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    http_headers headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        };

        const auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_client_error() const noexcept -> bool {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] auto is_server_error() const noexcept -> bool {
        return status_code >= 500 && status_code < 600;
    }
};

/**
 * @brief Minimal HTTP client contract
 *
 * A returned error means no response was received (connection failure,
 * timeout). Any received response, including 4xx and 5xx, is a value.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    /**
     * @brief Execute POST request with a text body
     */
    virtual auto post(const std::string& url,
                      const std::string& body,
                      const http_headers& headers) -> result<http_response> = 0;

    /**
     * @brief Execute PUT request with a binary body
     */
    virtual auto put(const std::string& url,
                     std::span<const std::byte> body,
                     const http_headers& headers) -> result<http_response> = 0;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_TRANSPORT_HTTP_TYPES_H
