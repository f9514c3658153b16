/**
 * @file rest_upload_api.cpp
 * @brief Implementation of the JSON REST upload api
 */

#include <custody/upload/transport/rest_upload_api.h>

#include <custody/upload/core/json_utils.h>
#include <custody/upload/core/logging.h>

#include <sstream>
#include <utility>

namespace custody::upload {

namespace {

auto strip_trailing_slash(std::string url) -> std::string {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

auto optional_string(const std::optional<std::string>& value) -> std::string {
    return value ? json_utils::quote(*value) : "null";
}

}  // namespace

rest_upload_api::rest_upload_api(std::shared_ptr<http_client_interface> client,
                                 rest_api_config config)
    : client_(std::move(client)), config_(std::move(config)) {
    config_.base_url = strip_trailing_slash(config_.base_url);
}

// ============================================================================
// Operations
// ============================================================================

auto rest_upload_api::start(const std::string& capture_id, const std::string& storage_class)
    -> result<start_response> {
    std::ostringstream body;
    body << "{\"captureId\":" << json_utils::quote(capture_id)
         << ",\"storageType\":" << json_utils::quote(storage_class) << "}";

    auto response = post_json(config_.start_path, body.str(), error_code::session_start_failed);
    if (!response) {
        return unexpected{response.error()};
    }

    start_response started;
    started.session_id = response_field(response.value(), {"uploadId"}).value_or("");
    started.capture_id = response_field(response.value(), {"captureId"}).value_or(capture_id);
    started.object_key = response_field(response.value(), {"s3Key"}).value_or("");
    return started;
}

auto rest_upload_api::negotiate_part(const negotiate_request& request)
    -> result<negotiate_response> {
    std::ostringstream body;
    body << "{\"captureId\":" << json_utils::quote(request.capture_id)
         << ",\"uploadId\":" << json_utils::quote(request.session_id)
         << ",\"partNumber\":" << request.part_number
         << ",\"chunkHash\":" << json_utils::quote(request.unit_hash)
         << ",\"sizeBytes\":" << request.size_bytes
         << ",\"checksumSha256\":" << json_utils::quote(request.content_digest)
         << ",\"previousChunkHash\":" << optional_string(request.previous_unit_hash)
         << "}";

    auto response = post_json(config_.chunk_path, body.str(), error_code::negotiation_failure);
    if (!response) {
        return unexpected{response.error()};
    }

    auto url = response_field(response.value(), {"presignedUrl"});
    if (!url || url->empty()) {
        return unexpected{error{error_code::negotiation_failure,
                                "Response did not include an authorization URL"}};
    }

    negotiate_response negotiated;
    negotiated.authorization_url = std::move(*url);
    if (auto digest = response_field(response.value(), {"checksumSha256"});
        digest && !digest->empty()) {
        negotiated.confirmed_digest = std::move(*digest);
    }
    return negotiated;
}

auto rest_upload_api::complete(const complete_request& request) -> result<complete_response> {
    auto response = post_json(config_.complete_path, complete_body(request),
                              error_code::completion_failure);
    if (!response) {
        return unexpected{response.error()};
    }

    complete_response completed;
    completed.url = response_field(response.value(), {"url"}).value_or("");
    completed.object_key = response_field(response.value(), {"key", "s3Key"}).value_or("");
    return completed;
}

auto rest_upload_api::cancel(const std::string& capture_id, const std::string& session_id)
    -> result<void> {
    std::ostringstream body;
    body << "{\"captureId\":" << json_utils::quote(capture_id)
         << ",\"uploadId\":" << json_utils::quote(session_id) << "}";

    auto response = post_json(config_.cancel_path, body.str(), error_code::cancel_failure);
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

// ============================================================================
// Helpers
// ============================================================================

auto rest_upload_api::complete_body(const complete_request& request) -> std::string {
    std::ostringstream body;
    body << "{\"captureId\":" << json_utils::quote(request.capture_id)
         << ",\"uploadId\":" << json_utils::quote(request.session_id)
         << ",\"parts\":[";
    for (std::size_t i = 0; i < request.parts.size(); ++i) {
        if (i > 0) body << ",";
        body << "{\"partNumber\":" << request.parts[i].part_number
             << ",\"etag\":" << json_utils::quote(request.parts[i].confirmation_token) << "}";
    }
    body << "]";

    if (request.preview) {
        const auto& preview = *request.preview;
        if (preview.original_url) {
            body << ",\"originalUrl\":" << json_utils::quote(*preview.original_url);
        }
        if (preview.page_title) {
            body << ",\"pageTitle\":" << json_utils::quote(*preview.page_title);
        }
        if (preview.content_hash) {
            body << ",\"contentHash\":" << json_utils::quote(*preview.content_hash);
        }
        if (preview.dimensions) {
            body << ",\"dimensions\":{\"width\":" << preview.dimensions->width
                 << ",\"height\":" << preview.dimensions->height << "}";
        }
        if (preview.file_size) {
            body << ",\"fileSize\":" << *preview.file_size;
        }
        if (preview.duration_ms) {
            body << ",\"durationMs\":" << *preview.duration_ms;
        }
        if (!preview.metadata.empty()) {
            body << ",\"metadata\":{";
            bool first = true;
            for (const auto& [key, value] : preview.metadata) {
                if (!first) body << ",";
                body << json_utils::quote(key) << ":" << json_utils::quote(value);
                first = false;
            }
            body << "}";
        }
    }

    body << "}";
    return body.str();
}

auto rest_upload_api::response_field(const std::string& body,
                                     std::initializer_list<std::string_view> names)
    -> std::optional<std::string> {
    auto envelope = json_utils::member(body, "data");
    const bool nested = envelope && json_utils::is_object(*envelope);

    for (auto name : names) {
        if (nested) {
            if (auto value = json_utils::string_member(*envelope, name)) {
                return value;
            }
        }
        if (auto value = json_utils::string_member(body, name)) {
            return value;
        }
    }
    return std::nullopt;
}

auto rest_upload_api::post_json(const std::string& path,
                                const std::string& body,
                                error_code failure_code) -> result<std::string> {
    auto headers = config_.headers;
    headers["Content-Type"] = "application/json";
    headers["Accept"] = "application/json";

    const auto url = config_.base_url + path;
    auto response = client_->post(url, body, headers);
    if (!response) {
        upload_log_context ctx;
        ctx.url = url;
        ctx.error_message = response.error().message;
        CU_LOG_WARN_CTX(log_category::api, "Request failed without a response", ctx);
        return unexpected{response.error()};
    }

    const auto& resp = response.value();
    auto text = resp.get_body_string();
    auto reported_error = json_utils::string_member(text, "error");
    if (!reported_error) {
        reported_error = json_utils::string_member(text, "message");
    }

    const bool rejected = json_utils::member(text, "success").value_or("") == "false";
    if (!resp.is_success() || rejected) {
        upload_log_context ctx;
        ctx.url = url;
        ctx.http_status = resp.status_code;
        ctx.error_message = reported_error.value_or("");
        CU_LOG_WARN_CTX(log_category::api, "Request rejected by backend", ctx);

        std::string message = path + " failed with HTTP " + std::to_string(resp.status_code);
        if (reported_error) {
            message += ": " + *reported_error;
        }
        return unexpected{error{failure_code, std::move(message), resp.status_code}};
    }

    CU_LOG_TRACE(log_category::api, path + " succeeded");
    return text;
}

}  // namespace custody::upload
