#pragma once

#include "util/timestamp.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace mv::types {

enum class MediaType { Image, Video };

std::string to_string(MediaType type);
std::optional<MediaType> media_type_from_string(std::string_view s);

struct MediaRecord {
    std::string id{}, owner_id{}, stored_name{}, original_name{}, mime_type{}, object_url{};
    MediaType media_type{MediaType::Image};
    uint64_t size_bytes{};
    std::optional<std::string> thumbnail_name{std::nullopt}, thumbnail_url{std::nullopt}, description{std::nullopt};
    std::optional<std::vector<std::string>> tags{std::nullopt};
    util::Timestamp uploaded_at{}, updated_at{};

    MediaRecord() = default;
    explicit MediaRecord(const pqxx::row& row);
};

// Partial update: only engaged fields change
struct MediaPatch {
    std::optional<std::string> description{std::nullopt};
    std::optional<std::vector<std::string>> tags{std::nullopt};
    util::Timestamp updated_at{};

    void applyTo(MediaRecord& record) const;
};

// camelCase wire shape
void to_json(nlohmann::json& j, const MediaRecord& m);
void to_json(nlohmann::json& j, const std::vector<std::shared_ptr<MediaRecord>>& media);

// Accepts {"description"?: string|null, "tags"?: [string]|null}; null means "not supplied"
void from_json(const nlohmann::json& j, MediaPatch& p);

std::optional<std::string> tags_to_json_string(const std::optional<std::vector<std::string>>& tags);

std::vector<std::shared_ptr<MediaRecord>> media_from_pq_res(const pqxx::result& res);

} // namespace mv::types
