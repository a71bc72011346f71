#pragma once

#include "config/Config.hpp"
#include "types/Media.hpp"
#include "types/Page.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mv::media {

// Lowercased type/subtype without parameters: "Image/JPEG; q=1" -> "image/jpeg"
std::string normalizeContentType(const std::string& contentType);

// Throws error::UnsupportedType when the type is on neither allow-list
types::MediaType classify(const std::string& contentType, const config::MediaConfig& cfg);

// Throws error::PayloadTooLarge above limit, error::ValidationError for empty content
void checkSize(uintmax_t bytes, uintmax_t limit);

// Upload form field: JSON array of strings
std::vector<std::string> parseTags(const std::string& payload);

// Trimmed, non-empty, first occurrence wins
std::vector<std::string> normalizeTags(const std::vector<std::string>& tags);

void checkDescription(const std::optional<std::string>& description, size_t maxLength);

// Surrounding whitespace dropped; throws error::ValidationError when nothing is left
std::string normalizeSearchQuery(const std::string& query);

void validatePageRequest(const types::PageRequest& page, unsigned int maxPageSize);

}
