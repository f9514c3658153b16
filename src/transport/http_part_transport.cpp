/**
 * @file http_part_transport.cpp
 * @brief Implementation of the HTTP part transport
 */

#include <custody/upload/transport/http_part_transport.h>

#include <custody/upload/core/logging.h>

#include <utility>

namespace custody::upload {

http_part_transport::http_part_transport(std::shared_ptr<http_client_interface> client)
    : client_(std::move(client)) {}

auto http_part_transport::put(const std::string& url,
                              std::span<const std::byte> body,
                              const http_headers& headers) -> result<http_response> {
    upload_log_context ctx;
    ctx.url = url;
    ctx.bytes = body.size();
    CU_LOG_DEBUG_CTX(log_category::uploader, "Sending part bytes", ctx);

    auto response = client_->put(url, body, headers);
    if (!response) {
        return unexpected{response.error()};
    }

    ctx.http_status = response.value().status_code;
    CU_LOG_DEBUG_CTX(log_category::uploader, "Part transfer response received", ctx);
    return response;
}

}  // namespace custody::upload
