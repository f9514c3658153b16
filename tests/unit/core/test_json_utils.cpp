/**
 * @file test_json_utils.cpp
 * @brief Unit tests for the JSON helpers
 */

#include <gtest/gtest.h>

#include <custody/upload/core/json_utils.h>

#include <string>

namespace custody::upload::test {

class JsonUtilsTest : public ::testing::Test {};

// Escaping

TEST_F(JsonUtilsTest, EscapeControlCharacters) {
    EXPECT_EQ(json_utils::escape("a\"b\\c\n\t"), "a\\\"b\\\\c\\n\\t");
    EXPECT_EQ(json_utils::quote("x"), "\"x\"");
}

TEST_F(JsonUtilsTest, UnescapeReversesEscape) {
    std::string original = "line1\nline2 \"quoted\" back\\slash";
    EXPECT_EQ(json_utils::unescape(json_utils::escape(original)), original);
}

TEST_F(JsonUtilsTest, UnescapeUnicode) {
    EXPECT_EQ(json_utils::unescape("caf\\u00e9"), "caf\xC3\xA9");
    EXPECT_EQ(json_utils::unescape("\\u0041"), "A");
}

// Member lookup

TEST_F(JsonUtilsTest, StringMember) {
    std::string json = R"({"uploadId":"u-1","s3Key":"captures/a.webm"})";
    EXPECT_EQ(json_utils::string_member(json, "uploadId"), "u-1");
    EXPECT_EQ(json_utils::string_member(json, "s3Key"), "captures/a.webm");
    EXPECT_FALSE(json_utils::string_member(json, "missing").has_value());
}

TEST_F(JsonUtilsTest, MemberIgnoresNestedKeys) {
    std::string json = R"({"data":{"url":"inner"},"note":"has \"url\" inside"})";
    EXPECT_FALSE(json_utils::member(json, "url").has_value());

    auto data = json_utils::member(json, "data");
    ASSERT_TRUE(data.has_value());
    EXPECT_TRUE(json_utils::is_object(*data));
    EXPECT_EQ(json_utils::string_member(*data, "url"), "inner");
}

TEST_F(JsonUtilsTest, MemberToleratesWhitespace) {
    std::string json = "{ \"a\" : 1 ,\n \"b\" : \"two\" }";
    EXPECT_EQ(json_utils::member(json, "a"), "1");
    EXPECT_EQ(json_utils::string_member(json, "b"), "two");
}

TEST_F(JsonUtilsTest, UintMember) {
    std::string json = R"({"nextPartNumber":7,"negative":-1,"text":"3"})";
    EXPECT_EQ(json_utils::uint_member(json, "nextPartNumber"), 7u);
    EXPECT_FALSE(json_utils::uint_member(json, "negative").has_value());
    EXPECT_FALSE(json_utils::uint_member(json, "text").has_value());
}

TEST_F(JsonUtilsTest, StringMemberRejectsNonString) {
    std::string json = R"({"n":12,"z":null})";
    EXPECT_FALSE(json_utils::string_member(json, "n").has_value());
    EXPECT_FALSE(json_utils::string_member(json, "z").has_value());
    EXPECT_TRUE(json_utils::is_null(*json_utils::member(json, "z")));
}

// Arrays

TEST_F(JsonUtilsTest, ArrayElements) {
    auto elements = json_utils::array_elements(R"([{"partNumber":1},{"partNumber":2}])");
    ASSERT_TRUE(elements.has_value());
    ASSERT_EQ(elements->size(), 2u);
    EXPECT_EQ(json_utils::uint_member((*elements)[1], "partNumber"), 2u);

    auto empty = json_utils::array_elements("[ ]");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST_F(JsonUtilsTest, MalformedInputRejected) {
    EXPECT_FALSE(json_utils::array_elements("[1,2").has_value());
    EXPECT_FALSE(json_utils::array_elements("{}").has_value());
    EXPECT_FALSE(json_utils::member("not json", "a").has_value());
    EXPECT_FALSE(json_utils::is_object("{\"a\":1"));
    EXPECT_FALSE(json_utils::is_object("{} trailing"));
}

}  // namespace custody::upload::test
