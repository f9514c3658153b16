/**
 * @file session_state_store.cpp
 * @brief Implementation of session snapshot persistence
 */

#include <custody/upload/session/session_state_store.h>

#include <custody/upload/core/json_utils.h>
#include <custody/upload/core/logging.h>

#include <sstream>
#include <utility>

namespace custody::upload {

// ============================================================================
// session_snapshot
// ============================================================================

auto session_snapshot::to_json() const -> std::string {
    std::ostringstream oss;
    oss << "{";
    oss << "\"uploadId\":" << json_utils::quote(session_id);
    oss << ",\"s3Key\":" << json_utils::quote(object_key);
    oss << ",\"parts\":[";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "{\"partNumber\":" << parts[i].part_number
            << ",\"etag\":" << json_utils::quote(parts[i].confirmation_token) << "}";
    }
    oss << "]";
    oss << ",\"captureId\":" << json_utils::quote(capture_id);
    oss << ",\"nextPartNumber\":" << next_part_number;
    oss << "}";
    return oss.str();
}

auto session_snapshot::from_json(const std::string& json) -> result<session_snapshot> {
    auto corrupted = [](const std::string& what) {
        return unexpected{error{error_code::state_corrupted, "invalid session snapshot: " + what}};
    };

    if (!json_utils::is_object(json)) {
        return corrupted("not a JSON object");
    }

    session_snapshot snapshot;

    auto session_id = json_utils::string_member(json, "uploadId");
    if (!session_id || session_id->empty()) {
        return corrupted("missing uploadId");
    }
    snapshot.session_id = std::move(*session_id);

    auto object_key = json_utils::string_member(json, "s3Key");
    if (!object_key) {
        return corrupted("missing s3Key");
    }
    snapshot.object_key = std::move(*object_key);

    auto capture_id = json_utils::string_member(json, "captureId");
    if (!capture_id || capture_id->empty()) {
        return corrupted("missing captureId");
    }
    snapshot.capture_id = std::move(*capture_id);

    auto parts_raw = json_utils::member(json, "parts");
    if (!parts_raw) {
        return corrupted("missing parts");
    }
    auto elements = json_utils::array_elements(*parts_raw);
    if (!elements) {
        return corrupted("parts is not an array");
    }
    for (const auto& element : *elements) {
        auto number = json_utils::uint_member(element, "partNumber");
        auto etag = json_utils::string_member(element, "etag");
        if (!number || *number == 0 || !etag) {
            return corrupted("malformed part entry");
        }
        snapshot.parts.push_back(upload_part{static_cast<uint32_t>(*number), std::move(*etag)});
    }

    if (auto next = json_utils::uint_member(json, "nextPartNumber"); next && *next > 0) {
        snapshot.next_part_number = static_cast<uint32_t>(*next);
    } else {
        snapshot.next_part_number = static_cast<uint32_t>(snapshot.parts.size() + 1);
    }

    return snapshot;
}

// ============================================================================
// session_state_store
// ============================================================================

session_state_store::session_state_store(std::shared_ptr<key_value_store> store,
                                         std::string key_prefix)
    : store_(std::move(store)), key_prefix_(std::move(key_prefix)) {}

auto session_state_store::key_for(const std::string& capture_id) const -> std::string {
    return key_prefix_ + capture_id;
}

auto session_state_store::save(const session_snapshot& snapshot) -> result<void> {
    auto saved = store_->set(key_for(snapshot.capture_id), snapshot.to_json());
    if (!saved) {
        upload_log_context ctx;
        ctx.capture_id = snapshot.capture_id;
        ctx.session_id = snapshot.session_id;
        ctx.error_message = saved.error().message;
        CU_LOG_WARN_CTX(log_category::state, "Failed to save session snapshot", ctx);
        return unexpected{error{error_code::state_store_failure, saved.error().message}};
    }

    CU_LOG_TRACE(log_category::state,
                 "Saved snapshot for " + snapshot.capture_id + " (" +
                     std::to_string(snapshot.parts.size()) + " parts, next " +
                     std::to_string(snapshot.next_part_number) + ")");
    return {};
}

auto session_state_store::load(const std::string& capture_id)
    -> result<std::optional<session_snapshot>> {
    auto stored = store_->get(key_for(capture_id));
    if (!stored) {
        return unexpected{error{error_code::state_store_failure, stored.error().message}};
    }
    if (!stored.value()) {
        return std::optional<session_snapshot>{};
    }

    auto snapshot = session_snapshot::from_json(*stored.value());
    if (!snapshot) {
        upload_log_context ctx;
        ctx.capture_id = capture_id;
        ctx.error_message = snapshot.error().message;
        CU_LOG_ERROR_CTX(log_category::state, "Persisted session snapshot is corrupted", ctx);
        return unexpected{snapshot.error()};
    }

    upload_log_context ctx;
    ctx.capture_id = capture_id;
    ctx.session_id = snapshot.value().session_id;
    ctx.part_number = snapshot.value().next_part_number;
    CU_LOG_DEBUG_CTX(log_category::state, "Session snapshot recovered", ctx);
    return std::optional<session_snapshot>{std::move(snapshot.value())};
}

auto session_state_store::clear(const std::string& capture_id) -> result<void> {
    auto removed = store_->remove(key_for(capture_id));
    if (!removed) {
        return unexpected{error{error_code::state_store_failure, removed.error().message}};
    }
    CU_LOG_TRACE(log_category::state, "Cleared snapshot for " + capture_id);
    return {};
}

}  // namespace custody::upload
