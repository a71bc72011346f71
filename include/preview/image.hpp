#pragma once

#include <cstdint>
#include <vector>

namespace mv::preview::image {

struct Dimensions {
    int width = 0;
    int height = 0;
};

struct RgbImage {
    Dimensions size;
    std::vector<uint8_t> pixels;  // packed RGB, row-major
};

// Decodes any stb_image format or WebP and composites alpha over a white canvas
RgbImage decode_flattened(const uint8_t* data, size_t size);

// Largest size inside the box that keeps the aspect ratio; never upscales, never below 1px
Dimensions fit_within(Dimensions src, Dimensions box);

RgbImage resize(const RgbImage& src, Dimensions target);

void compress_to_jpeg(const uint8_t* rgb_data, int width, int height, std::vector<uint8_t>& out_buf, int quality = 85);

}
