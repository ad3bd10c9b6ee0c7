#include <gtest/gtest.h>
#include "input_validator.hpp"
#include <vector>
#include <string>

using namespace parley;

TEST(InputValidatorTest, ValidUsername) {
    EXPECT_TRUE(InputValidator::is_valid_username("alice", 32));
    EXPECT_TRUE(InputValidator::is_valid_username("user_123", 32));
    EXPECT_TRUE(InputValidator::is_valid_username("A", 1));
    EXPECT_FALSE(InputValidator::is_valid_username("", 32));
    EXPECT_FALSE(InputValidator::is_valid_username("bad-name", 32));
    EXPECT_FALSE(InputValidator::is_valid_username("white space", 32));
    EXPECT_FALSE(InputValidator::is_valid_username("ünicode", 32));
    EXPECT_FALSE(InputValidator::is_valid_username("toolong", 6));
}

TEST(InputValidatorTest, Blank) {
    EXPECT_TRUE(InputValidator::is_blank(""));
    EXPECT_TRUE(InputValidator::is_blank(" \t\n"));
    EXPECT_FALSE(InputValidator::is_blank(" x "));
}

TEST(InputValidatorTest, WithinSizeLimit) {
    EXPECT_TRUE(InputValidator::is_within_size_limit(100, 200));
    EXPECT_TRUE(InputValidator::is_within_size_limit(200, 200));
    EXPECT_FALSE(InputValidator::is_within_size_limit(201, 200));
}

TEST(InputValidatorTest, NormalizeTags) {
    auto tags = InputValidator::normalize_tags({"Work, URGENT", "  later\tmaybe ", "work", ",,"});
    EXPECT_EQ(tags, (std::vector<std::string>{"work", "urgent", "later", "maybe"}));
    EXPECT_TRUE(InputValidator::normalize_tags({}).empty());
    EXPECT_TRUE(InputValidator::normalize_tags({" ", ""}).empty());
}

TEST(InputValidatorTest, SafeParseJson) {
    std::string json_str = "{\"key\": \"value\", \"number\": 123}";
    auto val = InputValidator::safe_parse_json(json_str);
    EXPECT_TRUE(val.is_object());
    EXPECT_EQ(val.as_object()["key"].as_string(), "value");
    EXPECT_EQ(val.as_object()["number"].as_int64(), 123);
}

TEST(InputValidatorTest, SafeParseJsonInvalid) {
    EXPECT_THROW(InputValidator::safe_parse_json("{invalid}"), boost::system::system_error);
}

TEST(InputValidatorTest, SafeParseJsonDepthLimit) {
    std::string shallow(InputValidator::MAX_JSON_DEPTH, '[');
    shallow += std::string(InputValidator::MAX_JSON_DEPTH, ']');
    EXPECT_NO_THROW(InputValidator::safe_parse_json(shallow));

    std::string deep(InputValidator::MAX_JSON_DEPTH + 1, '[');
    deep += std::string(InputValidator::MAX_JSON_DEPTH + 1, ']');
    EXPECT_THROW(InputValidator::safe_parse_json(deep), boost::system::system_error);
}
