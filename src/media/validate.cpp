#include "media/validate.hpp"
#include "error/Error.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <unordered_set>

namespace mv::media {

static std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

static std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalizeContentType(const std::string& contentType) {
    return toLower(trim(contentType.substr(0, contentType.find(';'))));
}

static bool listed(const std::vector<std::string>& allowed, const std::string& type) {
    return std::ranges::any_of(allowed, [&](const std::string& a) { return normalizeContentType(a) == type; });
}

types::MediaType classify(const std::string& contentType, const config::MediaConfig& cfg) {
    const auto type = normalizeContentType(contentType);
    if (!type.empty()) {
        if (listed(cfg.allowed_image_types, type)) return types::MediaType::Image;
        if (listed(cfg.allowed_video_types, type)) return types::MediaType::Video;
    }
    throw error::UnsupportedType(type.empty() ? "(none)" : type);
}

void checkSize(const uintmax_t bytes, const uintmax_t limit) {
    if (bytes == 0) throw error::ValidationError("File is empty");
    if (bytes > limit) throw error::PayloadTooLarge(bytes, limit);
}

std::vector<std::string> parseTags(const std::string& payload) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error&) {
        throw error::ValidationError("Invalid tags format. Must be a JSON array.");
    }

    if (!j.is_array()) throw error::ValidationError("Invalid tags format. Must be a JSON array.");

    std::vector<std::string> tags;
    tags.reserve(j.size());
    for (const auto& t : j) {
        if (!t.is_string()) throw error::ValidationError("Invalid tags format. Tags must be strings.");
        tags.push_back(t.get<std::string>());
    }
    return normalizeTags(tags);
}

std::vector<std::string> normalizeTags(const std::vector<std::string>& tags) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& raw : tags) {
        auto tag = trim(raw);
        if (tag.empty() || !seen.insert(tag).second) continue;
        out.push_back(std::move(tag));
    }
    return out;
}

// UTF-8 code points
static size_t characterCount(const std::string& s) {
    return static_cast<size_t>(std::ranges::count_if(s, [](const unsigned char c) { return (c & 0xC0) != 0x80; }));
}

void checkDescription(const std::optional<std::string>& description, const size_t maxLength) {
    if (description && characterCount(*description) > maxLength)
        throw error::ValidationError(fmt::format("Description must be at most {} characters", maxLength));
}

void validatePageRequest(const types::PageRequest& page, const unsigned int maxPageSize) {
    if (page.page < 1) throw error::ValidationError("page must be at least 1");
    if (page.page_size < 1 || page.page_size > maxPageSize)
        throw error::ValidationError(fmt::format("pageSize must be between 1 and {}", maxPageSize));
}

std::string normalizeSearchQuery(const std::string& query) {
    auto trimmed = trim(query);
    if (trimmed.empty()) throw error::ValidationError("query must not be empty");
    return trimmed;
}

}
