/**
 * @file part_uploader.cpp
 * @brief Implementation of single part negotiation and transfer
 */

#include <custody/upload/session/part_uploader.h>

#include <custody/upload/core/checksum.h>
#include <custody/upload/core/logging.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace custody::upload {

part_uploader::part_uploader(std::shared_ptr<upload_api> api,
                             std::shared_ptr<part_transport> transport,
                             retry_executor executor,
                             part_transfer_config config)
    : api_(std::move(api)),
      transport_(std::move(transport)),
      executor_(std::move(executor)),
      config_(std::move(config)) {}

auto part_uploader::upload(const std::optional<session_identity>& identity,
                           uint32_t part_number,
                           std::span<const std::byte> data,
                           const std::string& content_hash,
                           const std::optional<std::string>& previous_unit_hash) const
    -> result<upload_part_result> {
    if (!identity) {
        return unexpected{error{error_code::not_initiated,
                                "Upload not initiated. Call initiate() first."}};
    }
    if (part_number < 1) {
        return unexpected{error{error_code::invalid_part_number,
                                "Part number must be >= 1, got " + std::to_string(part_number)}};
    }

    upload_log_context ctx;
    ctx.capture_id = identity->capture_id;
    ctx.session_id = identity->session_id;
    ctx.part_number = part_number;
    ctx.bytes = data.size();

    auto digest = checksum::sha256_base64(data);

    // Negotiation

    negotiate_request request;
    request.capture_id = identity->capture_id;
    request.session_id = identity->session_id;
    request.part_number = part_number;
    request.unit_hash = content_hash;
    request.size_bytes = data.size();
    request.content_digest = digest;
    request.previous_unit_hash = previous_unit_hash;

    auto negotiated = api_->negotiate_part(request);
    if (!negotiated) {
        const auto& cause = negotiated.error();
        ctx.http_status = cause.http_status;
        ctx.error_message = cause.message;
        CU_LOG_ERROR_CTX(log_category::uploader, "Part authorization failed", ctx);

        error err(error_code::negotiation_failure,
                  "Failed to obtain authorization for part " + std::to_string(part_number) +
                      ": " + cause.message,
                  cause.http_status);
        err.with_recoverable(false).with_attempts(0);
        return unexpected{std::move(err)};
    }

    const auto& authorization = negotiated.value();
    if (!is_valid_authorization_url(authorization.authorization_url)) {
        ctx.url = authorization.authorization_url;
        CU_LOG_ERROR_CTX(log_category::uploader, "Invalid authorization URL", ctx);

        error err(error_code::invalid_authorization_url,
                  "Invalid authorization URL for part " + std::to_string(part_number));
        err.with_recoverable(false).with_attempts(0);
        return unexpected{std::move(err)};
    }

    http_headers headers;
    headers["Content-Type"] = config_.content_type;
    headers[config_.checksum_header] =
        authorization.confirmed_digest.value_or(digest);

    // Transfer

    std::size_t attempts = 0;
    const auto label = "part " + std::to_string(part_number) + " transfer";

    auto transferred = executor_.execute(
        [&](std::size_t attempt) -> result<std::string> {
            attempts = attempt;

            auto response = transport_->put(authorization.authorization_url, data, headers);
            if (!response) {
                return unexpected{response.error()};
            }

            const auto& resp = response.value();
            if (!resp.is_success()) {
                return unexpected{error{error_code::transfer_failure,
                                        "Part " + std::to_string(part_number) +
                                            " upload failed with HTTP " +
                                            std::to_string(resp.status_code),
                                        resp.status_code}};
            }

            auto token = strip_quotes(resp.get_header(config_.confirmation_header).value_or(""));
            if (token.empty()) {
                return unexpected{error{error_code::confirmation_missing,
                                        "No confirmation token returned for part " +
                                            std::to_string(part_number),
                                        resp.status_code}};
            }
            return token;
        },
        label);

    ctx.attempt = static_cast<uint32_t>(attempts);
    if (!transferred) {
        ctx.http_status = transferred.error().http_status;
        ctx.error_message = transferred.error().message;
        CU_LOG_ERROR_CTX(log_category::uploader, "Part upload failed", ctx);
        return unexpected{transferred.error()};
    }

    CU_LOG_DEBUG_CTX(log_category::uploader, "Part uploaded", ctx);

    upload_part_result uploaded;
    uploaded.part_number = part_number;
    uploaded.confirmation_token = std::move(transferred.value());
    uploaded.attempts = attempts;
    return uploaded;
}

auto part_uploader::is_valid_authorization_url(const std::string& url) -> bool {
    if (url.empty()) {
        return false;
    }
    for (unsigned char c : url) {
        if (std::isspace(c) || std::iscntrl(c)) {
            return false;
        }
    }

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return false;
    }

    std::string scheme = url.substr(0, scheme_end);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http" && scheme != "https") {
        return false;
    }

    auto authority_start = scheme_end + 3;
    auto authority_end = url.find_first_of("/?#", authority_start);
    auto authority = url.substr(authority_start, authority_end == std::string::npos
                                                     ? std::string::npos
                                                     : authority_end - authority_start);

    if (auto at = authority.rfind('@'); at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string host;
    std::string port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return false;
        }
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return false;
            }
            port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.find(':');
        host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port = authority.substr(colon + 1);
        }
    }

    if (host.empty()) {
        return false;
    }
    return std::all_of(port.begin(), port.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

auto part_uploader::strip_quotes(const std::string& token) -> std::string {
    std::string stripped;
    stripped.reserve(token.size());
    for (char c : token) {
        if (c != '"') {
            stripped += c;
        }
    }
    return stripped;
}

}  // namespace custody::upload
