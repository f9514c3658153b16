/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, result and upload value types
 */

#include <gtest/gtest.h>

#include <custody/upload/core/types.h>
#include <custody/upload/session/upload_types.h>

#include <string>
#include <unordered_set>

namespace custody::upload::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Session errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::not_initiated), -100);
    EXPECT_EQ(static_cast<int>(error_code::cancel_failure), -107);

    // Part errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::invalid_part_number), -120);
    EXPECT_EQ(static_cast<int>(error_code::retries_exhausted), -125);

    // Network errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::network_error), -140);

    // State errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::state_corrupted), -161);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::not_initiated), "upload not initiated");
    EXPECT_STREQ(to_string(error_code::confirmation_missing), "confirmation token missing");
    EXPECT_STREQ(to_string(error_code::retries_exhausted), "retries exhausted");
}

TEST_F(ErrorCodeTest, ToStringIsDistinct) {
    std::unordered_set<std::string> names;
    for (auto code : {error_code::not_initiated, error_code::invalid_capture_id,
                      error_code::session_start_failed, error_code::no_parts_uploaded,
                      error_code::incomplete_parts, error_code::invalid_state,
                      error_code::completion_failure, error_code::cancel_failure,
                      error_code::invalid_part_number, error_code::negotiation_failure,
                      error_code::invalid_authorization_url, error_code::transfer_failure,
                      error_code::confirmation_missing, error_code::retries_exhausted,
                      error_code::network_error, error_code::transfer_timeout,
                      error_code::state_store_failure, error_code::state_corrupted,
                      error_code::config_invalid, error_code::chain_sequence_error,
                      error_code::invalid_hash, error_code::empty_chain,
                      error_code::internal_error}) {
        EXPECT_TRUE(names.insert(to_string(code)).second) << to_string(code);
    }
}

TEST_F(ErrorCodeTest, Categories) {
    EXPECT_TRUE(is_part_error(error_code::transfer_failure));
    EXPECT_FALSE(is_part_error(error_code::not_initiated));
    EXPECT_TRUE(is_network_error(error_code::transfer_timeout));
    EXPECT_FALSE(is_network_error(error_code::transfer_failure));
}

// =============================================================================
// error / result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, ErrorCarriesDetails) {
    error err(error_code::transfer_failure, "HTTP 503", 503);
    err.with_attempts(3).with_recoverable(true);

    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.http_status, 503);
    EXPECT_EQ(err.attempts, 3u);
    EXPECT_TRUE(err.recoverable);
    EXPECT_EQ(error(error_code::invalid_hash).message, "invalid hash");
    EXPECT_FALSE(static_cast<bool>(error{}));
}

TEST_F(ResultTest, ValueAndError) {
    result<int> ok = 5;
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), 5);

    result<int> failed = unexpected{error{error_code::network_error, "down"}};
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::network_error);

    result<void> done;
    EXPECT_TRUE(done.has_value());
}

// =============================================================================
// Upload value type Tests
// =============================================================================

class UploadTypesTest : public ::testing::Test {};

TEST_F(UploadTypesTest, PartSizeLimits) {
    EXPECT_EQ(min_part_size, 5u * 1024 * 1024);
    EXPECT_EQ(max_part_size, 5ull * 1024 * 1024 * 1024);
}

TEST_F(UploadTypesTest, StatusToString) {
    EXPECT_STREQ(to_string(upload_status::idle), "idle");
    EXPECT_STREQ(to_string(upload_status::uploading), "uploading");
    EXPECT_STREQ(to_string(upload_status::completing), "completing");
    EXPECT_STREQ(to_string(upload_status::completed), "completed");
    EXPECT_STREQ(to_string(upload_status::failed), "failed");
}

TEST_F(UploadTypesTest, CompletionPercentage) {
    upload_progress progress;
    EXPECT_DOUBLE_EQ(progress.completion_percentage(), 0.0);

    progress.bytes_total_received = 200;
    progress.bytes_uploaded = 50;
    EXPECT_DOUBLE_EQ(progress.completion_percentage(), 25.0);
}

TEST_F(UploadTypesTest, PartEquality) {
    EXPECT_EQ((upload_part{1, "a"}), (upload_part{1, "a"}));
    EXPECT_NE((upload_part{1, "a"}), (upload_part{2, "a"}));
}

}  // namespace custody::upload::test
