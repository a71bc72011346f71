#include "media/MediaManager.hpp"
#include "media/validate.hpp"
#include "db/MediaStore.hpp"
#include "storage/ObjectName.hpp"
#include "preview/thumbnail.hpp"
#include "crypto/uuid.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/fileSize.hpp"

#include <iterator>
#include <sstream>
#include <stdexcept>

using namespace mv::media;
using namespace mv::types;

MediaManager::MediaManager(std::shared_ptr<db::MediaStore> store,
                           std::shared_ptr<storage::ObjectStore> objects,
                           config::MediaConfig cfg,
                           util::Clock clock,
                           IdGenerator newId)
    : store_(std::move(store)),
      objects_(std::move(objects)),
      cfg_(std::move(cfg)),
      clock_(std::move(clock)),
      newId_(newId ? std::move(newId) : IdGenerator([] { return ids::uuid4_hex(); })) {
    if (!store_ || !objects_) throw std::invalid_argument("MediaManager requires a media store and an object store");
}

MediaManager::MediaPtr MediaManager::upload(const UploadRequest& req, std::istream& content) {
    // Everything that can reject the request runs before the first side effect
    const auto mediaType = classify(req.content_type, cfg_);
    checkSize(req.size, cfg_.max_upload_size_bytes);

    std::optional<std::vector<std::string>> tags;
    if (req.tags && !req.tags->empty()) tags = parseTags(*req.tags);

    std::optional<std::string> description;
    if (req.description && !req.description->empty()) description = req.description;
    checkDescription(description, cfg_.max_description_length);

    const auto original = objects_->upload(content, req.size, req.owner_id, req.filename, req.content_type);

    std::optional<storage::StoredObject> thumbnail;
    if (mediaType == MediaType::Image) thumbnail = storeThumbnail(req, original.name, content);

    auto record = std::make_shared<MediaRecord>();
    record->id = newId_();
    record->owner_id = req.owner_id;
    record->stored_name = original.name;
    record->original_name = req.filename;
    record->media_type = mediaType;
    record->size_bytes = req.size;
    record->mime_type = req.content_type;
    record->object_url = original.url;
    if (thumbnail) {
        record->thumbnail_name = thumbnail->name;
        record->thumbnail_url = thumbnail->url;
    }
    record->description = std::move(description);
    record->tags = std::move(tags);
    record->uploaded_at = record->updated_at = clock_();

    try {
        const auto created = store_->create(*record);
        if (!created.created()) throw error::Error(error::Code::Internal, "Media id collision: " + record->id);

        log::Registry::media()->info("[MediaManager] {} uploaded {} ({}, {})", req.owner_id, original.name,
                                     to_string(mediaType), util::formatFileSize(req.size));
        return created.record;
    } catch (const std::exception& e) {
        log::Registry::media()->error("[MediaManager] Failed to persist media record for {}: {}", original.name, e.what());
        discardObject(original.name);
        if (thumbnail) discardObject(thumbnail->name);
        throw;
    }
}

std::optional<mv::storage::StoredObject> MediaManager::storeThumbnail(const UploadRequest& req,
                                                                     const std::string& originalName,
                                                                     std::istream& content) {
    content.clear();
    if (!content.seekg(0, std::ios::beg)) {
        log::Registry::media()->warn("[MediaManager] Content stream for {} is not seekable, skipping thumbnail", req.filename);
        return std::nullopt;
    }

    const std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(content), std::istreambuf_iterator<char>()};
    const auto jpeg = preview::thumbnail::makeThumbnail(bytes, cfg_.thumbnails);
    if (!jpeg) return std::nullopt;

    try {
        std::istringstream in(std::string(jpeg->begin(), jpeg->end()));
        return objects_->uploadAs(in, jpeg->size(), storage::thumbnailObjectName(originalName), "image/jpeg");
    } catch (const std::exception& e) {
        log::Registry::media()->warn("[MediaManager] Failed to upload thumbnail for {}: {}", req.filename, e.what());
        return std::nullopt;
    }
}

void MediaManager::discardObject(const std::string& name) const {
    try {
        if (!objects_->remove(name))
            log::Registry::media()->debug("[MediaManager] Object {} was already gone", name);
    } catch (const std::exception& e) {
        log::Registry::media()->warn("[MediaManager] Failed to delete object {}: {}", name, e.what());
    }
}

// Stored URLs outlive the signing window, so every read hands out a fresh signature
MediaManager::MediaPtr MediaManager::withFreshUrls(MediaPtr record) const {
    const auto ttl = objects_->defaultTtl();
    record->object_url = objects_->signUrl(record->stored_name, ttl);
    if (record->thumbnail_name) record->thumbnail_url = objects_->signUrl(*record->thumbnail_name, ttl);
    return record;
}

MediaPage MediaManager::withFreshUrls(MediaPage page) const {
    for (auto& item : page.items) item = withFreshUrls(std::move(item));
    return page;
}

MediaManager::MediaPtr MediaManager::fetchOwned(const std::string& id, const std::string& callerId) const {
    auto record = store_->getById(id);
    if (!record) throw error::NotFound("Media not found");
    if (record->owner_id != callerId) {
        log::Registry::media()->warn("[MediaManager] {} denied access to media {}", callerId, id);
        throw error::Forbidden("You don't have permission to access this media");
    }
    return record;
}

MediaManager::MediaPtr MediaManager::get(const std::string& id, const std::string& callerId) const {
    return withFreshUrls(fetchOwned(id, callerId));
}

MediaManager::MediaPtr MediaManager::update(const std::string& id, const std::string& callerId, MediaPatch patch) {
    checkDescription(patch.description, cfg_.max_description_length);
    if (patch.tags) patch.tags = normalizeTags(*patch.tags);

    const auto existing = fetchOwned(id, callerId);

    const auto now = clock_();
    const auto floor = existing->updated_at + std::chrono::microseconds(1);
    patch.updated_at = now > floor ? now : floor;

    auto updated = store_->update(id, callerId, patch);
    if (!updated) throw error::NotFound("Media not found");  // removed concurrently

    log::Registry::media()->debug("[MediaManager] {} updated media {}", callerId, id);
    return withFreshUrls(std::move(updated));
}

bool MediaManager::remove(const std::string& id, const std::string& callerId) {
    const auto existing = store_->getById(id);
    if (!existing) return false;
    if (existing->owner_id != callerId) {
        log::Registry::media()->warn("[MediaManager] {} denied deletion of media {}", callerId, id);
        throw error::Forbidden("You don't have permission to access this media");
    }

    discardObject(existing->stored_name);
    if (existing->thumbnail_name) discardObject(*existing->thumbnail_name);

    const bool removed = store_->remove(id, callerId);
    if (removed) log::Registry::media()->info("[MediaManager] {} deleted media {}", callerId, id);
    return removed;
}

MediaPage MediaManager::list(const std::string& callerId, const PageRequest& page,
                             const std::optional<std::string>& mediaType) const {
    validatePageRequest(page, cfg_.max_page_size);

    std::optional<MediaType> filter;
    if (mediaType) {
        filter = media_type_from_string(*mediaType);
        if (!filter) throw error::ValidationError("mediaType must be 'image' or 'video'");
    }

    return withFreshUrls(store_->list(callerId, page, filter));
}

MediaPage MediaManager::search(const std::string& callerId, const std::string& query,
                               const PageRequest& page) const {
    validatePageRequest(page, cfg_.max_page_size);
    return withFreshUrls(store_->search(callerId, normalizeSearchQuery(query), page));
}
