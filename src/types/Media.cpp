#include "types/Media.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>
#include <pqxx/row>
#include <pqxx/result>

namespace mv::types {

std::string to_string(const MediaType type) {
    switch (type) {
    case MediaType::Image: return "image";
    case MediaType::Video: return "video";
    default: throw std::invalid_argument("Unknown MediaType");
    }
}

std::optional<MediaType> media_type_from_string(const std::string_view s) {
    if (s == "image") return MediaType::Image;
    if (s == "video") return MediaType::Video;
    return std::nullopt;
}

static std::optional<std::vector<std::string>> parseStoredTags(const std::optional<std::string>& raw) {
    if (!raw) return std::nullopt;
    const auto j = nlohmann::json::parse(*raw, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        log::Registry::types()->error("[MediaRecord] Stored tags column is not a JSON array: {}", *raw);
        return std::nullopt;
    }
    std::vector<std::string> tags;
    for (const auto& t : j)
        if (t.is_string()) tags.push_back(t.get<std::string>());
    return tags;
}

MediaRecord::MediaRecord(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      owner_id(row["owner_id"].as<std::string>()),
      stored_name(row["stored_name"].as<std::string>()),
      original_name(row["original_name"].as<std::string>()),
      mime_type(row["mime_type"].as<std::string>()),
      object_url(row["object_url"].as<std::string>()),
      size_bytes(row["size_bytes"].as<uint64_t>()),
      thumbnail_name(row["thumbnail_name"].as<std::optional<std::string>>()),
      thumbnail_url(row["thumbnail_url"].as<std::optional<std::string>>()),
      description(row["description"].as<std::optional<std::string>>()),
      tags(parseStoredTags(row["tags"].as<std::optional<std::string>>())),
      uploaded_at(util::parsePostgresTimestamp(row["uploaded_at"].as<std::string>())),
      updated_at(util::parsePostgresTimestamp(row["updated_at"].as<std::string>())) {
    const auto type = row["media_type"].as<std::string>();
    const auto parsed = media_type_from_string(type);
    if (!parsed) throw std::runtime_error("Unknown media_type in media row: " + type);
    media_type = *parsed;
}

void MediaPatch::applyTo(MediaRecord& record) const {
    if (description) record.description = description;
    if (tags) record.tags = tags;
    // strictly increasing, even with a coarse clock
    record.updated_at = std::max(updated_at, record.updated_at + std::chrono::microseconds(1));
}

void to_json(nlohmann::json& j, const MediaRecord& m) {
    j = {
        {"id", m.id},
        {"userId", m.owner_id},
        {"fileName", m.stored_name},
        {"originalFileName", m.original_name},
        {"mediaType", to_string(m.media_type)},
        {"fileSize", m.size_bytes},
        {"mimeType", m.mime_type},
        {"blobUrl", m.object_url},
        {"uploadedAt", util::timestampToString(m.uploaded_at)},
        {"updatedAt", util::timestampToString(m.updated_at)}
    };

    if (m.thumbnail_url) j["thumbnailUrl"] = *m.thumbnail_url;
    else j["thumbnailUrl"] = nullptr;

    if (m.description) j["description"] = *m.description;
    else j["description"] = nullptr;

    if (m.tags) j["tags"] = *m.tags;
    else j["tags"] = nullptr;
}

void to_json(nlohmann::json& j, const std::vector<std::shared_ptr<MediaRecord>>& media) {
    j = nlohmann::json::array();
    for (const auto& m : media) j.push_back(*m);
}

void from_json(const nlohmann::json& j, MediaPatch& p) {
    if (!j.is_object()) throw error::ValidationError("Request body must be a JSON object");

    if (j.contains("description") && !j.at("description").is_null()) {
        if (!j.at("description").is_string()) throw error::ValidationError("description must be a string");
        p.description = j.at("description").get<std::string>();
    }

    if (j.contains("tags") && !j.at("tags").is_null()) {
        const auto& tags = j.at("tags");
        if (!tags.is_array()) throw error::ValidationError("tags must be an array of strings");
        std::vector<std::string> out;
        for (const auto& t : tags) {
            if (!t.is_string()) throw error::ValidationError("tags must be an array of strings");
            out.push_back(t.get<std::string>());
        }
        p.tags = std::move(out);
    }
}

std::optional<std::string> tags_to_json_string(const std::optional<std::vector<std::string>>& tags) {
    if (!tags) return std::nullopt;
    return nlohmann::json(*tags).dump();
}

std::vector<std::shared_ptr<MediaRecord>> media_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<MediaRecord>> media;
    media.reserve(res.size());
    for (const auto& row : res) media.push_back(std::make_shared<MediaRecord>(row));
    return media;
}

}
