/**
 * @file http_part_transport.h
 * @brief part_transport over an HTTP client
 */

#ifndef CUSTODY_UPLOAD_TRANSPORT_HTTP_PART_TRANSPORT_H
#define CUSTODY_UPLOAD_TRANSPORT_HTTP_PART_TRANSPORT_H

#include <custody/upload/transport/http_types.h>
#include <custody/upload/transport/upload_api.h>

#include <memory>
#include <string>

namespace custody::upload {

/**
 * @brief PUTs part bytes to the authorization URL
 *
 * The authorization URL is pre-signed, so the static api headers are not
 * forwarded here.
 */
class http_part_transport : public part_transport {
public:
    explicit http_part_transport(std::shared_ptr<http_client_interface> client);

    [[nodiscard]] auto put(const std::string& url,
                           std::span<const std::byte> body,
                           const http_headers& headers) -> result<http_response> override;

private:
    std::shared_ptr<http_client_interface> client_;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_TRANSPORT_HTTP_PART_TRANSPORT_H
