/**
 * @file test_part_uploader.cpp
 * @brief Unit tests for part negotiation and transfer
 */

#include "integration/test_fixtures.h"

#include <custody/upload/session/part_uploader.h>

namespace custody::upload::test {

using namespace std::chrono_literals;

class PartUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        api_ = std::make_shared<fake_upload_api>();
        transport_ = std::make_shared<scripted_part_transport>();
        identity_ = session_identity{"upload-1", "cap-1", "captures/cap-1.webm"};
        data_ = make_bytes(4096);
        hash_ = checksum::sha256(std::span<const std::byte>(data_));
    }

    auto make_uploader(std::size_t max_attempts = 3) -> part_uploader {
        retry_policy policy;
        policy.max_attempts = max_attempts;
        policy.base_delay = 10ms;
        policy.max_delay = 100ms;
        policy.jitter_ratio = 0.0;
        return part_uploader(api_, transport_,
                             retry_executor(policy, [this](std::chrono::milliseconds delay) {
                                 sleeps_.push_back(delay);
                             }));
    }

    std::shared_ptr<fake_upload_api> api_;
    std::shared_ptr<scripted_part_transport> transport_;
    std::optional<session_identity> identity_;
    std::vector<std::byte> data_;
    std::string hash_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

// =============================================================================
// Success Path
// =============================================================================

TEST_F(PartUploaderTest, UploadsAndReturnsStrippedToken) {
    auto uploader = make_uploader();

    auto uploaded = uploader.upload(identity_, 1, data_, hash_, std::nullopt);
    ASSERT_TRUE(uploaded.has_value()) << uploaded.error().message;

    EXPECT_EQ(uploaded.value().part_number, 1u);
    EXPECT_EQ(uploaded.value().confirmation_token, "etag-1");
    EXPECT_EQ(uploaded.value().attempts, 1u);
}

TEST_F(PartUploaderTest, NegotiationCarriesPartMetadata) {
    auto uploader = make_uploader();

    auto uploaded = uploader.upload(identity_, 3, data_, hash_, std::string("prev"));
    ASSERT_TRUE(uploaded.has_value());

    ASSERT_EQ(api_->negotiate_calls.size(), 1u);
    const auto& request = api_->negotiate_calls[0];
    EXPECT_EQ(request.capture_id, "cap-1");
    EXPECT_EQ(request.session_id, "upload-1");
    EXPECT_EQ(request.part_number, 3u);
    EXPECT_EQ(request.unit_hash, hash_);
    EXPECT_EQ(request.size_bytes, data_.size());
    EXPECT_EQ(request.content_digest, checksum::sha256_base64(data_));
    EXPECT_EQ(request.previous_unit_hash, "prev");
}

TEST_F(PartUploaderTest, TransferSendsChecksumAndContentType) {
    auto uploader = make_uploader();

    ASSERT_TRUE(uploader.upload(identity_, 1, data_, hash_, std::nullopt).has_value());

    ASSERT_EQ(transport_->calls.size(), 1u);
    const auto& call = transport_->calls[0];
    EXPECT_EQ(call.url, "https://storage.example.com/upload-1/part-1?sig=secret");
    EXPECT_EQ(call.size, data_.size());
    EXPECT_EQ(call.headers.at("Content-Type"), "application/octet-stream");
    EXPECT_EQ(call.headers.at("x-amz-checksum-sha256"), checksum::sha256_base64(data_));
}

// =============================================================================
// Preconditions
// =============================================================================

TEST_F(PartUploaderTest, RequiresIdentity) {
    auto uploader = make_uploader();

    auto uploaded = uploader.upload(std::nullopt, 1, data_, hash_, std::nullopt);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::not_initiated);
    EXPECT_EQ(api_->negotiate_count(), 0u);
}

TEST_F(PartUploaderTest, RejectsPartNumberZero) {
    auto uploader = make_uploader();

    auto uploaded = uploader.upload(identity_, 0, data_, hash_, std::nullopt);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::invalid_part_number);
    EXPECT_EQ(api_->negotiate_count(), 0u);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(PartUploaderTest, NegotiationFailureNotRetried) {
    api_->negotiate_errors[1] = error{error_code::negotiation_failure, "forbidden", 403};
    auto uploader = make_uploader();

    auto uploaded = uploader.upload(identity_, 1, data_, hash_, std::nullopt);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::negotiation_failure);
    EXPECT_EQ(uploaded.error().http_status, 403);
    EXPECT_FALSE(uploaded.error().recoverable);
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(PartUploaderTest, InvalidAuthorizationUrlRejected) {
    api_->url_override = "ftp://storage.example.com/part";
    auto uploader = make_uploader();

    auto uploaded = uploader.upload(identity_, 1, data_, hash_, std::nullopt);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::invalid_authorization_url);
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(PartUploaderTest, ServerErrorsRetriedWithBackoff) {
    transport_->enqueue(503);
    transport_->enqueue(503);
    auto uploader = make_uploader();

    auto uploaded = uploader.upload(identity_, 2, data_, hash_, std::nullopt);
    ASSERT_TRUE(uploaded.has_value());
    EXPECT_EQ(uploaded.value().attempts, 3u);
    EXPECT_EQ(transport_->call_count(), 3u);
    EXPECT_EQ(sleeps_, (std::vector<std::chrono::milliseconds>{10ms, 20ms}));
}

TEST_F(PartUploaderTest, NetworkErrorRetried) {
    transport_->enqueue(std::nullopt);
    auto uploader = make_uploader();

    auto uploaded = uploader.upload(identity_, 1, data_, hash_, std::nullopt);
    ASSERT_TRUE(uploaded.has_value());
    EXPECT_EQ(uploaded.value().attempts, 2u);
}

TEST_F(PartUploaderTest, ClientErrorFailsImmediately) {
    transport_->enqueue(404);
    auto uploader = make_uploader();

    auto uploaded = uploader.upload(identity_, 1, data_, hash_, std::nullopt);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::transfer_failure);
    EXPECT_EQ(uploaded.error().attempts, 1u);
    EXPECT_EQ(uploaded.error().http_status, 404);
    EXPECT_FALSE(uploaded.error().recoverable);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(PartUploaderTest, ExhaustedRetriesReported) {
    for (int i = 0; i < 3; ++i) {
        transport_->enqueue(500);
    }
    auto uploader = make_uploader();

    auto uploaded = uploader.upload(identity_, 1, data_, hash_, std::nullopt);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::retries_exhausted);
    EXPECT_EQ(uploaded.error().attempts, 3u);
    EXPECT_EQ(uploaded.error().http_status, 500);
}

TEST_F(PartUploaderTest, MissingConfirmationTokenRetried) {
    transport_->omit_etag = true;
    auto uploader = make_uploader(2);

    auto uploaded = uploader.upload(identity_, 1, data_, hash_, std::nullopt);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::retries_exhausted);
    EXPECT_EQ(transport_->call_count(), 2u);
}

// =============================================================================
// Helpers
// =============================================================================

TEST_F(PartUploaderTest, AuthorizationUrlValidation) {
    EXPECT_TRUE(part_uploader::is_valid_authorization_url("https://s3.example.com/k?sig=1"));
    EXPECT_TRUE(part_uploader::is_valid_authorization_url("http://localhost:9000/bucket/key"));
    EXPECT_TRUE(part_uploader::is_valid_authorization_url("https://[::1]:8443/key"));
    EXPECT_FALSE(part_uploader::is_valid_authorization_url(""));
    EXPECT_FALSE(part_uploader::is_valid_authorization_url("not a url"));
    EXPECT_FALSE(part_uploader::is_valid_authorization_url("ftp://host/key"));
    EXPECT_FALSE(part_uploader::is_valid_authorization_url("https:///key"));
    EXPECT_FALSE(part_uploader::is_valid_authorization_url("https://host:port/key"));
}

TEST_F(PartUploaderTest, StripQuotes) {
    EXPECT_EQ(part_uploader::strip_quotes("\"abc\""), "abc");
    EXPECT_EQ(part_uploader::strip_quotes("abc"), "abc");
    EXPECT_EQ(part_uploader::strip_quotes("\"\""), "");
}

}  // namespace custody::upload::test
