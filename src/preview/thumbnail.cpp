#include "preview/thumbnail.hpp"
#include "preview/image.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

namespace mv::preview::thumbnail {

std::optional<std::vector<uint8_t>> makeThumbnail(const std::vector<uint8_t>& source,
                                                  const config::ThumbnailConfig& cfg) {
    try {
        const auto decoded = image::decode_flattened(source.data(), source.size());
        const auto target = image::fit_within(decoded.size, {static_cast<int>(cfg.max_width),
                                                             static_cast<int>(cfg.max_height)});
        const auto resized = image::resize(decoded, target);

        std::vector<uint8_t> jpeg;
        image::compress_to_jpeg(resized.pixels.data(), resized.size.width, resized.size.height, jpeg, cfg.quality);
        if (jpeg.empty()) throw std::runtime_error("Thumbnail JPEG buffer is empty after processing");

        log::Registry::thumb()->debug("[Thumbnail] {}x{} -> {}x{} ({} bytes)", decoded.size.width,
                                      decoded.size.height, target.width, target.height, jpeg.size());
        return jpeg;
    } catch (const std::exception& e) {
        log::Registry::thumb()->warn("[Thumbnail] Failed to generate thumbnail: {}", e.what());
        return std::nullopt;
    }
}

}
