#include <gtest/gtest.h>
#include "preview/image.hpp"
#include "preview/thumbnail.hpp"
#include "TestImages.hpp"

using namespace mv;
using namespace mv::preview;

class ThumbnailTest : public ::testing::Test {
protected:
    config::ThumbnailConfig cfg;

    static image::Dimensions sizeOf(const std::vector<uint8_t>& jpeg) {
        return image::decode_flattened(jpeg.data(), jpeg.size()).size;
    }
};

TEST_F(ThumbnailTest, FitWithin_PreservesAspectRatio) {
    const auto landscape = image::fit_within({600, 400}, {300, 300});
    EXPECT_EQ(landscape.width, 300);
    EXPECT_EQ(landscape.height, 200);

    const auto portrait = image::fit_within({400, 1000}, {300, 300});
    EXPECT_EQ(portrait.width, 120);
    EXPECT_EQ(portrait.height, 300);
}

TEST_F(ThumbnailTest, FitWithin_NeverUpscalesOrCollapses) {
    const auto small = image::fit_within({100, 50}, {300, 300});
    EXPECT_EQ(small.width, 100);
    EXPECT_EQ(small.height, 50);

    const auto sliver = image::fit_within({3000, 2}, {300, 300});
    EXPECT_EQ(sliver.width, 300);
    EXPECT_EQ(sliver.height, 1);
}

TEST_F(ThumbnailTest, MakeThumbnail_FitsIntoBox) {
    const auto thumb = thumbnail::makeThumbnail(test::makeJpeg(600, 400), cfg);
    ASSERT_TRUE(thumb.has_value());

    const auto size = sizeOf(*thumb);
    EXPECT_EQ(size.width, 300);
    EXPECT_EQ(size.height, 200);
}

TEST_F(ThumbnailTest, MakeThumbnail_SmallImageKeepsSize) {
    const auto thumb = thumbnail::makeThumbnail(test::makeJpeg(64, 48), cfg);
    ASSERT_TRUE(thumb.has_value());

    const auto size = sizeOf(*thumb);
    EXPECT_EQ(size.width, 64);
    EXPECT_EQ(size.height, 48);
}

TEST_F(ThumbnailTest, MakeThumbnail_CorruptBytesYieldNothing) {
    auto jpeg = test::makeJpeg(64, 48);
    for (size_t i = 0; i < jpeg.size(); ++i) jpeg[i] = static_cast<uint8_t>(i * 31 + 7);
    EXPECT_FALSE(thumbnail::makeThumbnail(jpeg, cfg).has_value());
    EXPECT_FALSE(thumbnail::makeThumbnail({}, cfg).has_value());
}

TEST_F(ThumbnailTest, DecodeFlattened_TransparencyBecomesWhite) {
    const auto gif = test::transparentGif();
    const auto decoded = image::decode_flattened(gif.data(), gif.size());

    ASSERT_EQ(decoded.size.width, 1);
    ASSERT_EQ(decoded.size.height, 1);
    ASSERT_EQ(decoded.pixels.size(), 3u);
    EXPECT_EQ(decoded.pixels[0], 255);
    EXPECT_EQ(decoded.pixels[1], 255);
    EXPECT_EQ(decoded.pixels[2], 255);
}

TEST_F(ThumbnailTest, MakeThumbnail_AcceptsPaletteImages) {
    EXPECT_TRUE(thumbnail::makeThumbnail(test::transparentGif(), cfg).has_value());
}

TEST_F(ThumbnailTest, MakeThumbnail_DecodesWebp) {
    const auto thumb = thumbnail::makeThumbnail(test::makeWebp(600, 400), cfg);
    ASSERT_TRUE(thumb.has_value());

    const auto size = sizeOf(*thumb);
    EXPECT_EQ(size.width, 300);
    EXPECT_EQ(size.height, 200);
}

TEST_F(ThumbnailTest, DecodeFlattened_TransparentWebpBecomesWhite) {
    const auto webp = test::makeWebp(4, 4, 0);
    const auto decoded = image::decode_flattened(webp.data(), webp.size());

    ASSERT_EQ(decoded.size.width, 4);
    ASSERT_EQ(decoded.size.height, 4);
    for (const auto v : decoded.pixels) EXPECT_EQ(v, 255);
}

TEST_F(ThumbnailTest, MakeThumbnail_TruncatedWebpYieldsNothing) {
    auto webp = test::makeWebp(64, 48);
    webp.resize(20);
    EXPECT_FALSE(thumbnail::makeThumbnail(webp, cfg).has_value());
}
