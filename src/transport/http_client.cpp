/**
 * @file http_client.cpp
 * @brief HTTP client adapter implementation
 */

#include <custody/upload/transport/http_client.h>

#include <custody/upload/config/feature_flags.h>
#include <custody/upload/core/logging.h>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace custody::upload {

// ============================================================================
// Implementation
// ============================================================================

struct http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response converted;
        converted.status_code = resp.status_code;
        converted.headers = resp.headers;
        converted.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return converted;
    }
#endif
};

namespace {

auto unavailable_error() -> error {
    return error{error_code::network_error,
                 "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"};
}

}  // namespace

http_client::http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
auto http_client::operator=(http_client&&) noexcept -> http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto http_client::post(const std::string& url,
                       const std::string& body,
                       const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::internal_error, "HTTP client not initialized"}};
    }

    auto response = impl_->client->post(url, body, headers);
    if (response.is_err()) {
        CU_LOG_DEBUG(log_category::api, "HTTP POST request failed: " + url);
        return unexpected{error{error_code::network_error, "HTTP POST request failed"}};
    }
    return impl::convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{unavailable_error()};
#endif
}

auto http_client::put(const std::string& url,
                      std::span<const std::byte> body,
                      const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::internal_error, "HTTP client not initialized"}};
    }

    std::string body_str(reinterpret_cast<const char*>(body.data()), body.size());
    auto response = impl_->client->put(url, body_str, headers);
    if (response.is_err()) {
        CU_LOG_DEBUG(log_category::uploader, "HTTP PUT request failed: " + url);
        return unexpected{error{error_code::network_error, "HTTP PUT request failed"}};
    }
    return impl::convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{unavailable_error()};
#endif
}

auto http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_http_client(std::chrono::milliseconds timeout) -> std::shared_ptr<http_client> {
    return std::make_shared<http_client>(timeout);
}

}  // namespace custody::upload
