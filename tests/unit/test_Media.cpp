#include <gtest/gtest.h>
#include "types/Media.hpp"
#include "types/Page.hpp"
#include "error/Error.hpp"
#include "util/fileSize.hpp"

#include <nlohmann/json.hpp>

using namespace mv;
using namespace mv::types;

namespace {
MediaRecord sample() {
    MediaRecord m;
    m.id = "m1";
    m.owner_id = "u1";
    m.stored_name = "u1/20240501120000_0000000a.jpg";
    m.original_name = "beach.jpg";
    m.media_type = MediaType::Image;
    m.size_bytes = 2048;
    m.mime_type = "image/jpeg";
    m.object_url = "https://example/obj";
    m.uploaded_at = m.updated_at = util::Timestamp{std::chrono::seconds(1714564800)};
    return m;
}
}

TEST(MediaJsonTest, Record_UsesCamelCaseWireShape) {
    auto m = sample();
    m.tags = std::vector<std::string>{"beach"};
    const nlohmann::json j = m;

    EXPECT_EQ(j.at("id"), "m1");
    EXPECT_EQ(j.at("userId"), "u1");
    EXPECT_EQ(j.at("fileName"), m.stored_name);
    EXPECT_EQ(j.at("originalFileName"), "beach.jpg");
    EXPECT_EQ(j.at("mediaType"), "image");
    EXPECT_EQ(j.at("fileSize"), 2048);
    EXPECT_EQ(j.at("mimeType"), "image/jpeg");
    EXPECT_EQ(j.at("blobUrl"), "https://example/obj");
    EXPECT_TRUE(j.at("thumbnailUrl").is_null());
    EXPECT_TRUE(j.at("description").is_null());
    EXPECT_EQ(j.at("tags"), nlohmann::json::array({"beach"}));
    EXPECT_EQ(j.at("uploadedAt"), "2024-05-01T12:00:00.000000Z");
    EXPECT_EQ(j.at("updatedAt"), j.at("uploadedAt"));
    EXPECT_FALSE(j.contains("thumbnailName"));
}

TEST(MediaJsonTest, Page_CarriesTotalAndWindow) {
    MediaPage p;
    p.items.push_back(std::make_shared<MediaRecord>(sample()));
    p.total = 41;
    p.page = 3;
    p.page_size = 20;
    const nlohmann::json j = p;

    EXPECT_EQ(j.at("items").size(), 1u);
    EXPECT_EQ(j.at("total"), 41);
    EXPECT_EQ(j.at("page"), 3);
    EXPECT_EQ(j.at("pageSize"), 20);
}

TEST(MediaPatchTest, FromJson_NullMeansNotSupplied) {
    MediaPatch p;
    from_json(nlohmann::json::parse(R"({"description": null, "tags": ["a"]})"), p);
    EXPECT_FALSE(p.description.has_value());
    ASSERT_TRUE(p.tags.has_value());
    EXPECT_EQ(p.tags->size(), 1u);
}

TEST(MediaPatchTest, FromJson_RejectsWrongTypes) {
    MediaPatch p;
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"description": 5})"), p), error::ValidationError);
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"tags": "a,b"})"), p), error::ValidationError);
    EXPECT_THROW(from_json(nlohmann::json::parse(R"([1])"), p), error::ValidationError);
}

TEST(MediaPatchTest, ApplyTo_OnlyTouchesSuppliedFields) {
    auto m = sample();
    m.description = "keep me";
    m.tags = std::vector<std::string>{"old"};

    MediaPatch p;
    p.tags = std::vector<std::string>{"new"};
    p.updated_at = m.updated_at + std::chrono::seconds(5);
    p.applyTo(m);

    EXPECT_EQ(m.description, "keep me");
    EXPECT_EQ(m.tags, (std::vector<std::string>{"new"}));
    EXPECT_EQ(m.updated_at, p.updated_at);
}

TEST(MediaPatchTest, ApplyTo_UpdatedAtStrictlyIncreasesWithStaleClock) {
    auto m = sample();
    const auto before = m.updated_at;

    MediaPatch p;
    p.updated_at = before;  // clock did not move
    p.applyTo(m);

    EXPECT_GT(m.updated_at, before);
}

TEST(MediaTypeTest, StringRoundTrip) {
    EXPECT_EQ(media_type_from_string("image"), MediaType::Image);
    EXPECT_EQ(media_type_from_string("video"), MediaType::Video);
    EXPECT_FALSE(media_type_from_string("audio").has_value());
    EXPECT_EQ(to_string(MediaType::Video), "video");
}

TEST(FileSizeTest, FormatsWithUnits) {
    EXPECT_EQ(util::formatFileSize(512), "512.00 B");
    EXPECT_EQ(util::formatFileSize(1536), "1.50 KB");
    EXPECT_EQ(util::formatFileSize(100ull * 1024 * 1024), "100.00 MB");
}
