#include <gtest/gtest.h>
#include "media/validate.hpp"
#include "error/Error.hpp"

using namespace mv;
using mv::types::MediaType;

class ValidateTest : public ::testing::Test {
protected:
    config::MediaConfig cfg;
};

TEST_F(ValidateTest, Classify_MappingTable) {
    for (const auto* t : {"image/jpeg", "image/png", "image/gif", "image/webp"})
        EXPECT_EQ(media::classify(t, cfg), MediaType::Image) << t;
    for (const auto* t : {"video/mp4", "video/mpeg", "video/quicktime", "video/webm"})
        EXPECT_EQ(media::classify(t, cfg), MediaType::Video) << t;
}

TEST_F(ValidateTest, Classify_IgnoresCaseAndParameters) {
    EXPECT_EQ(media::classify("Image/JPEG", cfg), MediaType::Image);
    EXPECT_EQ(media::classify(" video/mp4 ; codecs=avc1", cfg), MediaType::Video);
    EXPECT_EQ(media::normalizeContentType("Image/PNG; q=1"), "image/png");
}

TEST_F(ValidateTest, Classify_RejectsUnlisted) {
    EXPECT_THROW(media::classify("text/plain", cfg), error::UnsupportedType);
    EXPECT_THROW(media::classify("image/svg+xml", cfg), error::UnsupportedType);
    try {
        media::classify("", cfg);
        FAIL();
    } catch (const error::UnsupportedType& e) {
        EXPECT_EQ(e.contentType(), "(none)");
        EXPECT_EQ(e.code(), error::Code::UnsupportedType);
    }
}

TEST_F(ValidateTest, UnsupportedType_IsAValidationError) {
    EXPECT_THROW(media::classify("text/plain", cfg), error::ValidationError);
}

TEST_F(ValidateTest, CheckSize) {
    EXPECT_NO_THROW(media::checkSize(100, 100));
    EXPECT_THROW(media::checkSize(101, 100), error::PayloadTooLarge);
    EXPECT_THROW(media::checkSize(0, 100), error::ValidationError);
}

TEST_F(ValidateTest, ParseTags_TrimsDropsEmptiesAndDeduplicates) {
    EXPECT_EQ(media::parseTags(R"([" beach ", "sun", "", "beach", "  "])"),
              (std::vector<std::string>{"beach", "sun"}));
    EXPECT_TRUE(media::parseTags("[]").empty());
}

TEST_F(ValidateTest, ParseTags_RejectsNonArrays) {
    EXPECT_THROW(media::parseTags("beach,sun"), error::ValidationError);
    EXPECT_THROW(media::parseTags(R"({"a":1})"), error::ValidationError);
    EXPECT_THROW(media::parseTags("[1, 2]"), error::ValidationError);
    EXPECT_THROW(media::parseTags("[\"a\""), error::ValidationError);
}

TEST_F(ValidateTest, CheckDescription_CountsCharactersNotBytes) {
    EXPECT_NO_THROW(media::checkDescription(std::nullopt, 3));
    EXPECT_NO_THROW(media::checkDescription(std::string("\xC3\xA9\xC3\xA9\xC3\xA9"), 3));  // three e-acute
    EXPECT_THROW(media::checkDescription(std::string("abcd"), 3), error::ValidationError);
}

TEST_F(ValidateTest, ValidatePageRequest) {
    EXPECT_NO_THROW(media::validatePageRequest({1, 1}, 100));
    EXPECT_NO_THROW(media::validatePageRequest({7, 100}, 100));
    EXPECT_THROW(media::validatePageRequest({0, 20}, 100), error::ValidationError);
    EXPECT_THROW(media::validatePageRequest({1, 0}, 100), error::ValidationError);
    EXPECT_THROW(media::validatePageRequest({1, 101}, 100), error::ValidationError);
}
