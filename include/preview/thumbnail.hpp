#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace mv::preview::thumbnail {

// JPEG bytes fitted into the configured box, or nullopt when the source cannot be decoded.
// Failures are logged, never thrown.
std::optional<std::vector<uint8_t>> makeThumbnail(const std::vector<uint8_t>& source,
                                                  const config::ThumbnailConfig& cfg);

}
