#include <gtest/gtest.h>
#include "protocols/http/multipart.hpp"
#include "error/Error.hpp"

using namespace mv::protocols::http;

namespace {
const std::string BOUNDARY = "----mvBoundary7MA4YWxk";

std::string formBody() {
    return "--" + BOUNDARY + "\r\n"
           "Content-Disposition: form-data; name=\"file\"; filename=\"beach photo.jpg\"\r\n"
           "Content-Type: image/jpeg\r\n"
           "\r\n"
           "\xFF\xD8\r\n--not-a-boundary\xFF\xD9\r\n"
           "--" + BOUNDARY + "\r\n"
           "Content-Disposition: form-data; name=\"description\"\r\n"
           "\r\n"
           "Sunny day\r\n"
           "--" + BOUNDARY + "\r\n"
           "content-disposition: form-data; name=tags\r\n"
           "\r\n"
           "[\"beach\"]\r\n"
           "--" + BOUNDARY + "--\r\n";
}
}

TEST(MultipartTest, BoundaryFromContentType) {
    EXPECT_EQ(multipart::boundaryFrom("multipart/form-data; boundary=" + BOUNDARY), BOUNDARY);
    EXPECT_EQ(multipart::boundaryFrom("Multipart/Form-Data; charset=utf-8; boundary=\"a b\""), "a b");
    EXPECT_THROW(multipart::boundaryFrom("application/json"), mv::error::ValidationError);
    EXPECT_THROW(multipart::boundaryFrom("multipart/form-data"), mv::error::ValidationError);
}

TEST(MultipartTest, Parse_FieldsAndFile) {
    const auto body = formBody();
    const auto parts = multipart::parse(body, BOUNDARY);
    ASSERT_EQ(parts.size(), 3u);

    const auto* file = multipart::find(parts, "file");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->filename, "beach photo.jpg");
    EXPECT_EQ(file->content_type, "image/jpeg");
    EXPECT_EQ(file->body, std::string_view("\xFF\xD8\r\n--not-a-boundary\xFF\xD9"));

    const auto* description = multipart::find(parts, "description");
    ASSERT_NE(description, nullptr);
    EXPECT_FALSE(description->filename.has_value());
    EXPECT_EQ(description->body, "Sunny day");

    const auto* tags = multipart::find(parts, "tags");
    ASSERT_NE(tags, nullptr);
    EXPECT_EQ(tags->body, "[\"beach\"]");

    EXPECT_EQ(multipart::find(parts, "missing"), nullptr);
}

TEST(MultipartTest, Parse_BodyViewsPointIntoRequest) {
    const auto body = formBody();
    const auto parts = multipart::parse(body, BOUNDARY);
    const auto* file = multipart::find(parts, "file");
    ASSERT_NE(file, nullptr);
    EXPECT_GE(file->body.data(), body.data());
    EXPECT_LE(file->body.data() + file->body.size(), body.data() + body.size());
}

TEST(MultipartTest, Parse_AllowsPreamble) {
    const auto body = "preamble text\r\n" + formBody();
    EXPECT_EQ(multipart::parse(body, BOUNDARY).size(), 3u);
}

TEST(MultipartTest, Parse_RejectsMalformedBodies) {
    EXPECT_THROW(multipart::parse("no boundary here", BOUNDARY), mv::error::ValidationError);

    const auto unterminated = "--" + BOUNDARY + "\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nvalue";
    EXPECT_THROW(multipart::parse(unterminated, BOUNDARY), mv::error::ValidationError);

    const auto nameless = "--" + BOUNDARY + "\r\nContent-Type: text/plain\r\n\r\nvalue\r\n--" + BOUNDARY + "--";
    EXPECT_THROW(multipart::parse(nameless, BOUNDARY), mv::error::ValidationError);

    EXPECT_THROW(multipart::parse(formBody(), ""), mv::error::ValidationError);
}
