#pragma once

#include "preview/image.hpp"

#include <webp/encode.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace mv::test {

// Gradient JPEG of the given size
inline std::vector<uint8_t> makeJpeg(const int width, const int height) {
    std::vector<uint8_t> rgb(static_cast<size_t>(width) * height * 3);
    for (int y = 0; y < height; ++y)
        for (int x = 0; x < width; ++x) {
            auto* px = &rgb[(static_cast<size_t>(y) * width + x) * 3];
            px[0] = static_cast<uint8_t>(x * 255 / (width > 1 ? width - 1 : 1));
            px[1] = static_cast<uint8_t>(y * 255 / (height > 1 ? height - 1 : 1));
            px[2] = 128;
        }

    std::vector<uint8_t> jpeg;
    preview::image::compress_to_jpeg(rgb.data(), width, height, jpeg, 90);
    return jpeg;
}

// Lossless WebP; alpha applies to every pixel of the gradient
inline std::vector<uint8_t> makeWebp(const int width, const int height, const uint8_t alpha = 255) {
    std::vector<uint8_t> rgba(static_cast<size_t>(width) * height * 4);
    for (int y = 0; y < height; ++y)
        for (int x = 0; x < width; ++x) {
            auto* px = &rgba[(static_cast<size_t>(y) * width + x) * 4];
            px[0] = static_cast<uint8_t>(x * 255 / (width > 1 ? width - 1 : 1));
            px[1] = static_cast<uint8_t>(y * 255 / (height > 1 ? height - 1 : 1));
            px[2] = 128;
            px[3] = alpha;
        }

    uint8_t* encoded = nullptr;
    const size_t size = WebPEncodeLosslessRGBA(rgba.data(), width, height, width * 4, &encoded);
    if (size == 0) throw std::runtime_error("WebP encoding failed");
    std::vector<uint8_t> out(encoded, encoded + size);
    WebPFree(encoded);
    return out;
}

// 1x1 GIF whose only pixel is fully transparent
inline std::vector<uint8_t> transparentGif() {
    return {0x47, 0x49, 0x46, 0x38, 0x39, 0x61, 0x01, 0x00, 0x01, 0x00, 0x80, 0x00, 0x00, 0x00, 0x00,
            0x00, 0xFF, 0xFF, 0xFF, 0x21, 0xF9, 0x04, 0x01, 0x00, 0x00, 0x00, 0x00, 0x2C, 0x00, 0x00,
            0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x02, 0x02, 0x44, 0x01, 0x00, 0x3B};
}

}
