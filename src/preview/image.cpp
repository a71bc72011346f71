#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include "preview/image.hpp"

#include <stb/stb_image.h>
#include <stb/stb_image_resize.h>
#include <turbojpeg.h>
#include <webp/decode.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

namespace mv::preview::image {

namespace {

using RgbaPixels = std::unique_ptr<uint8_t, void (*)(void*)>;

bool is_webp(const uint8_t* data, const size_t size) {
    return size >= 12 && std::memcmp(data, "RIFF", 4) == 0 && std::memcmp(data + 8, "WEBP", 4) == 0;
}

// 4 bytes per pixel; stb_image has no WebP decoder
RgbaPixels decode_rgba(const uint8_t* data, const size_t size, int& width, int& height) {
    if (is_webp(data, size)) {
        RgbaPixels pixels(WebPDecodeRGBA(data, size, &width, &height), &WebPFree);
        if (!pixels) throw std::runtime_error("Failed to decode WebP image from memory");
        return pixels;
    }

    int channels = 0;
    RgbaPixels pixels(stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels, 4),
                      &stbi_image_free);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        throw std::runtime_error(
            std::string("Failed to decode image from memory: ") + (reason ? reason : "unknown error"));
    }
    return pixels;
}

}

RgbImage decode_flattened(const uint8_t* data, const size_t size) {
    if (size < 4) throw std::runtime_error("Buffer too small to be a valid image");
    if (size > static_cast<size_t>(std::numeric_limits<int>::max()))
        throw std::runtime_error("Image buffer too large to decode");

    int width = 0, height = 0;
    const auto decoded = decode_rgba(data, size, width, height);

    RgbImage out{{width, height}, std::vector<uint8_t>(static_cast<size_t>(width) * height * 3)};
    const unsigned char* src = decoded.get();
    for (size_t i = 0, n = static_cast<size_t>(width) * height; i < n; ++i) {
        const unsigned alpha = src[i * 4 + 3];
        for (size_t c = 0; c < 3; ++c) {
            // src * a + 255 * (1 - a), rounded
            const unsigned v = src[i * 4 + c] * alpha + 255u * (255u - alpha);
            out.pixels[i * 3 + c] = static_cast<uint8_t>((v + 127u) / 255u);
        }
    }
    return out;
}

Dimensions fit_within(const Dimensions src, const Dimensions box) {
    if (src.width <= 0 || src.height <= 0) throw std::invalid_argument("Image has no pixels");
    if (src.width <= box.width && src.height <= box.height) return src;

    const double ratio = std::min(static_cast<double>(box.width) / src.width,
                                  static_cast<double>(box.height) / src.height);
    return {
        std::max(1, static_cast<int>(std::floor(src.width * ratio))),
        std::max(1, static_cast<int>(std::floor(src.height * ratio)))
    };
}

RgbImage resize(const RgbImage& src, const Dimensions target) {
    if (target.width == src.size.width && target.height == src.size.height) return src;

    RgbImage out{target, std::vector<uint8_t>(static_cast<size_t>(target.width) * target.height * 3)};
    if (!stbir_resize_uint8(src.pixels.data(), src.size.width, src.size.height, 0,
                            out.pixels.data(), target.width, target.height, 0, 3))
        throw std::runtime_error("Image resize failed");
    return out;
}

void compress_to_jpeg(const uint8_t* rgb_data, const int width, const int height, std::vector<uint8_t>& out_buf,
                      const int quality) {
    tjhandle tj = tjInitCompress();
    if (!tj) throw std::runtime_error("Failed to initialize TurboJPEG compressor");

    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;

    if (tjCompress2(
            tj,
            rgb_data,
            width,
            0, // pitch (0 = auto)
            height,
            TJPF_RGB,
            &jpeg_buf,
            &jpeg_size,
            TJSAMP_444, // no chroma subsampling
            quality,
            0) != 0) {
        const std::string err = tjGetErrorStr();
        if (jpeg_buf) tjFree(jpeg_buf);
        tjDestroy(tj);
        throw std::runtime_error("JPEG compression failed: " + err);
    }

    out_buf.assign(jpeg_buf, jpeg_buf + jpeg_size);
    tjFree(jpeg_buf);
    tjDestroy(tj);
}

}
