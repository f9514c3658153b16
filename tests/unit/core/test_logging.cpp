/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <custody/upload/core/logging.h>

#include <string>
#include <tuple>
#include <vector>

namespace custody::upload::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_TRUE(config.mask_url_queries);
    EXPECT_FALSE(config.mask_capture_ids);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, Presets) {
    auto all = masking_config::all_masked();
    EXPECT_TRUE(all.mask_url_queries);
    EXPECT_TRUE(all.mask_capture_ids);

    auto none = masking_config::none();
    EXPECT_FALSE(none.mask_url_queries);
    EXPECT_FALSE(none.mask_capture_ids);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, MaskUrlQuery) {
    sensitive_info_masker masker;

    auto masked = masker.mask_url("https://bucket.example.com/key?X-Amz-Signature=abc123");
    EXPECT_EQ(masked, "https://bucket.example.com/key?********");
}

TEST_F(SensitiveInfoMaskerTest, UrlWithoutQueryUnchanged) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask_url("https://bucket.example.com/key"),
              "https://bucket.example.com/key");
}

TEST_F(SensitiveInfoMaskerTest, MaskUrlsInText) {
    sensitive_info_masker masker;

    auto masked = masker.mask("PUT to https://s3.example.com/a?sig=secret failed");
    EXPECT_EQ(masked.find("secret"), std::string::npos);
    EXPECT_NE(masked.find("https://s3.example.com/a?"), std::string::npos);
    EXPECT_NE(masked.find(" failed"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, NoMaskingWhenDisabled) {
    sensitive_info_masker masker(masking_config::none());
    std::string input = "https://s3.example.com/a?sig=secret";

    EXPECT_EQ(masker.mask(input), input);
    EXPECT_EQ(masker.mask_capture_id("capture-123456"), "capture-123456");
}

TEST_F(SensitiveInfoMaskerTest, MaskCaptureId) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask_capture_id("capture-42"), "capt******");
    EXPECT_EQ(masker.mask_capture_id("abc"), "abc");
}

// =============================================================================
// Log Context Tests
// =============================================================================

class UploadLogContextTest : public ::testing::Test {};

TEST_F(UploadLogContextTest, EmptyContextToJson) {
    upload_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(UploadLogContextTest, FieldsToJson) {
    upload_log_context ctx;
    ctx.capture_id = "cap-1";
    ctx.session_id = "upload-1";
    ctx.part_number = 3;
    ctx.attempt = 2;
    ctx.http_status = 503;

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"capture_id\":\"cap-1\""), std::string::npos);
    EXPECT_NE(json.find("\"session_id\":\"upload-1\""), std::string::npos);
    EXPECT_NE(json.find("\"part_number\":3"), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"http_status\":503"), std::string::npos);
}

TEST_F(UploadLogContextTest, JsonWithMasking) {
    upload_log_context ctx;
    ctx.url = "https://s3.example.com/part?sig=secret";
    ctx.error_message = "rejected https://s3.example.com/part?sig=secret";

    sensitive_info_masker masker;
    auto json = ctx.to_json_with_masking(&masker);
    EXPECT_EQ(json.find("secret"), std::string::npos);
}

TEST_F(UploadLogContextTest, JsonEscaping) {
    upload_log_context ctx;
    ctx.error_message = "bad \"quote\"\nnewline";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("bad \\\"quote\\\"\\nnewline"), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BuildJson) {
    auto json = log_entry_builder()
        .with_level(log_level::warn)
        .with_category(log_category::uploader)
        .with_message("Part transfer failed")
        .with_capture_id("cap-9")
        .with_part_number(4)
        .build_json();

    EXPECT_NE(json.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"custody_upload.uploader\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"Part transfer failed\""), std::string::npos);
    EXPECT_NE(json.find("\"capture_id\":\"cap-9\""), std::string::npos);
    EXPECT_NE(json.find("\"part_number\":4"), std::string::npos);
}

TEST_F(LogEntryBuilderTest, TimestampFormat) {
    auto entry = log_entry_builder().with_message("x").build();

    // 2024-01-01T00:00:00.000Z
    ASSERT_EQ(entry.timestamp.size(), 24u);
    EXPECT_EQ(entry.timestamp[10], 'T');
    EXPECT_EQ(entry.timestamp.back(), 'Z');
}

TEST_F(LogEntryBuilderTest, SourceLocation) {
    auto json = log_entry_builder()
        .with_message("x")
        .with_source_location("upload_session.cpp", 42, "flush")
        .build_json();

    EXPECT_NE(json.find("\"source\":{\"file\":\"upload_session.cpp\",\"line\":42"),
              std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class UploadLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config{});
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_level(log_level::info);
    }
};

TEST_F(UploadLoggerTest, SetOutputFormat) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(UploadLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const upload_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    CU_LOG_INFO(log_category::session, "Test message");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::session);
    EXPECT_EQ(std::get<2>(captured[0]), "Test message");
}

TEST_F(UploadLoggerTest, ContextPassedToCallback) {
    std::optional<uint32_t> part;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const upload_log_context* ctx) {
        if (ctx) part = ctx->part_number;
    });

    upload_log_context ctx;
    ctx.part_number = 5;
    CU_LOG_WARN_CTX(log_category::uploader, "Retrying", ctx);

    EXPECT_EQ(part, 5u);
}

TEST_F(UploadLoggerTest, JsonCallbackMasksUrls) {
    std::vector<std::string> captured_json;

    get_logger().set_output_format(log_output_format::json);
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    upload_log_context ctx;
    ctx.url = "https://s3.example.com/part?X-Amz-Signature=topsecret";
    CU_LOG_INFO_CTX(log_category::uploader, "Sending part bytes", ctx);

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_NE(captured_json[0].find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_EQ(captured_json[0].find("topsecret"), std::string::npos);
}

TEST_F(UploadLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view,
                                  std::string_view message, const upload_log_context*) {
        captured.push_back(std::string(message));
    });

    get_logger().set_level(log_level::warn);

    CU_LOG_DEBUG(log_category::session, "Debug message");
    CU_LOG_INFO(log_category::session, "Info message");
    CU_LOG_WARN(log_category::session, "Warn message");
    CU_LOG_ERROR(log_category::session, "Error message");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "Warn message");
    EXPECT_EQ(captured[1], "Error message");
}

}  // namespace custody::upload::test
