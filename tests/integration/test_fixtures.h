/**
 * @file test_fixtures.h
 * @brief Fakes and fixtures for upload session tests
 */

#ifndef CUSTODY_UPLOAD_TEST_FIXTURES_H
#define CUSTODY_UPLOAD_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <custody/upload/upload.h>

#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace custody::upload::test {

inline constexpr std::size_t mib = 1024 * 1024;

// ============================================================================
// Byte helpers
// ============================================================================

inline auto make_bytes(std::size_t size, uint32_t seed = 42) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    std::mt19937 gen(seed);  // Fixed seed for reproducibility
    std::uniform_int_distribution<> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }
    return data;
}

inline auto to_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

// ============================================================================
// fake_upload_api
// ============================================================================

/**
 * @brief In-memory backend recording every call
 *
 * Authorization URLs have the form https://storage.example.com/<session>/part-<n>?sig=...
 */
class fake_upload_api : public upload_api {
public:
    auto start(const std::string& capture_id, const std::string& storage_class)
        -> result<start_response> override {
        std::lock_guard lock(mutex_);
        start_calls.push_back({capture_id, storage_class});
        if (start_error) {
            return unexpected{*start_error};
        }
        start_response response;
        if (!omit_session_id) {
            response.session_id = "upload-" + std::to_string(start_calls.size());
        }
        response.capture_id = capture_id;
        response.object_key = "captures/" + capture_id + ".webm";
        return response;
    }

    auto negotiate_part(const negotiate_request& request) -> result<negotiate_response> override {
        std::lock_guard lock(mutex_);
        negotiate_calls.push_back(request);
        if (auto it = negotiate_errors.find(request.part_number); it != negotiate_errors.end()) {
            return unexpected{it->second};
        }
        negotiate_response response;
        response.authorization_url = url_override.value_or(
            "https://storage.example.com/" + request.session_id + "/part-" +
            std::to_string(request.part_number) + "?sig=secret");
        return response;
    }

    auto complete(const complete_request& request) -> result<complete_response> override {
        std::lock_guard lock(mutex_);
        complete_calls.push_back(request);
        if (!complete_errors.empty()) {
            auto err = complete_errors.front();
            complete_errors.pop_front();
            return unexpected{err};
        }
        complete_response response;
        response.url = "https://cdn.example.com/" + request.capture_id + ".webm";
        response.object_key = "captures/" + request.capture_id + ".webm";
        return response;
    }

    auto cancel(const std::string& capture_id, const std::string& session_id)
        -> result<void> override {
        std::lock_guard lock(mutex_);
        cancel_calls.push_back({capture_id, session_id});
        if (cancel_error) {
            return unexpected{*cancel_error};
        }
        return {};
    }

    auto negotiate_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return negotiate_calls.size();
    }

    std::vector<std::pair<std::string, std::string>> start_calls;
    std::vector<negotiate_request> negotiate_calls;
    std::vector<complete_request> complete_calls;
    std::vector<std::pair<std::string, std::string>> cancel_calls;

    std::optional<error> start_error;
    bool omit_session_id = false;
    std::map<uint32_t, error> negotiate_errors;
    std::deque<error> complete_errors;
    std::optional<error> cancel_error;
    std::optional<std::string> url_override;

private:
    mutable std::mutex mutex_;
};

// ============================================================================
// scripted_part_transport
// ============================================================================

/**
 * @brief Part transport answering from a script, then with 200 and an ETag
 *        derived from the part number in the URL
 */
class scripted_part_transport : public part_transport {
public:
    struct put_call {
        std::string url;
        std::size_t size = 0;
        http_headers headers;
    };

    auto put(const std::string& url,
             std::span<const std::byte> body,
             const http_headers& headers) -> result<http_response> override {
        std::function<void(const std::string&)> hook;
        {
            std::lock_guard lock(mutex_);
            calls.push_back({url, body.size(), headers});
            hook = before_response;
        }
        if (hook) {
            hook(url);
        }

        std::lock_guard lock(mutex_);
        if (!script.empty()) {
            auto scripted = script.front();
            script.pop_front();
            if (!scripted) {
                return unexpected{error{error_code::network_error, "connection reset"}};
            }
            if (*scripted != 200) {
                http_response failed;
                failed.status_code = *scripted;
                return failed;
            }
        }

        http_response response;
        response.status_code = 200;
        if (!omit_etag) {
            response.headers["ETag"] = "\"etag-" + part_of(url) + "\"";
        }
        return response;
    }

    /// Queue a status code; std::nullopt queues a network error
    void enqueue(std::optional<int> status) {
        std::lock_guard lock(mutex_);
        script.push_back(status);
    }

    auto call_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return calls.size();
    }

    static auto part_of(const std::string& url) -> std::string {
        auto pos = url.find("part-");
        if (pos == std::string::npos) return "0";
        auto end = url.find('?', pos);
        return url.substr(pos + 5, end == std::string::npos ? std::string::npos : end - pos - 5);
    }

    std::vector<put_call> calls;
    std::deque<std::optional<int>> script;
    bool omit_etag = false;
    std::function<void(const std::string&)> before_response;

private:
    mutable std::mutex mutex_;
};

// ============================================================================
// recording_http_client
// ============================================================================

/**
 * @brief http_client_interface returning queued responses
 */
class recording_http_client : public http_client_interface {
public:
    struct request {
        std::string method;
        std::string url;
        std::string body;
        http_headers headers;
    };

    auto post(const std::string& url,
              const std::string& body,
              const http_headers& headers) -> result<http_response> override {
        requests.push_back({"POST", url, body, headers});
        return next();
    }

    auto put(const std::string& url,
             std::span<const std::byte> body,
             const http_headers& headers) -> result<http_response> override {
        std::string text(reinterpret_cast<const char*>(body.data()), body.size());
        requests.push_back({"PUT", url, text, headers});
        return next();
    }

    void respond(int status, std::string body, http_headers headers = {}) {
        http_response response;
        response.status_code = status;
        response.headers = std::move(headers);
        response.body.assign(body.begin(), body.end());
        responses.push_back(std::move(response));
    }

    void fail_next(error err) { failures.push_back(std::move(err)); }

    std::vector<request> requests;
    std::deque<http_response> responses;
    std::deque<error> failures;

private:
    auto next() -> result<http_response> {
        if (!failures.empty()) {
            auto err = failures.front();
            failures.pop_front();
            return unexpected{err};
        }
        if (responses.empty()) {
            return unexpected{error{error_code::network_error, "no scripted response"}};
        }
        auto response = responses.front();
        responses.pop_front();
        return response;
    }
};

// ============================================================================
// Fixtures
// ============================================================================

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("custody_upload_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Test fixture wiring an upload_session to the fakes
 */
class UploadSessionFixture : public ::testing::Test {
protected:
    void SetUp() override {
        api_ = std::make_shared<fake_upload_api>();
        transport_ = std::make_shared<scripted_part_transport>();
        store_ = std::make_shared<memory_key_value_store>();
    }

    auto fast_retry() const -> retry_policy {
        retry_policy policy;
        policy.max_attempts = 3;
        policy.base_delay = std::chrono::milliseconds(1);
        policy.max_delay = std::chrono::milliseconds(4);
        return policy;
    }

    auto make_builder() -> upload_session::builder {
        upload_session::builder builder;
        builder.with_api(api_)
            .with_transport(transport_)
            .with_key_value_store(store_)
            .with_retry_policy(fast_retry())
            .with_sleep_function([this](std::chrono::milliseconds delay) {
                std::lock_guard lock(sleep_mutex_);
                sleeps_.push_back(delay);
            });
        return builder;
    }

    auto make_session() -> upload_session {
        auto built = make_builder().build();
        EXPECT_TRUE(built.has_value()) << "Failed to build session";
        return std::move(built.value());
    }

    static auto add(upload_session& session, std::size_t size, uint32_t seed,
                    std::optional<std::string> previous = std::nullopt) -> result<void> {
        auto bytes = make_bytes(size, seed);
        auto hash = checksum::sha256(std::span<const std::byte>(bytes));
        return session.add_unit(bytes, hash, std::move(previous));
    }

    auto persisted(const std::string& capture_id) -> std::optional<std::string> {
        auto value = store_->get(session_state_store::default_key_prefix + capture_id);
        if (!value) return std::nullopt;
        return value.value();
    }

    std::shared_ptr<fake_upload_api> api_;
    std::shared_ptr<scripted_part_transport> transport_;
    std::shared_ptr<memory_key_value_store> store_;
    std::mutex sleep_mutex_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

}  // namespace custody::upload::test

#endif  // CUSTODY_UPLOAD_TEST_FIXTURES_H
