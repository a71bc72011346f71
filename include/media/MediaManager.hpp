#pragma once

#include "config/Config.hpp"
#include "storage/ObjectStore.hpp"
#include "types/Media.hpp"
#include "types/Page.hpp"
#include "util/timestamp.hpp"

#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace mv::db { class MediaStore; }


namespace mv::media {

struct UploadRequest {
    std::string owner_id;
    std::string filename;
    std::string content_type;
    uint64_t size = 0;
    std::optional<std::string> description;
    std::optional<std::string> tags;  // raw JSON array payload
};

// Owns the media lifecycle: every read, update and delete re-checks that the caller owns the record.
class MediaManager {
public:
    using MediaPtr = std::shared_ptr<types::MediaRecord>;
    using IdGenerator = std::function<std::string()>;

    MediaManager(std::shared_ptr<db::MediaStore> store,
                 std::shared_ptr<storage::ObjectStore> objects,
                 config::MediaConfig cfg,
                 util::Clock clock = util::systemNow,
                 IdGenerator newId = nullptr);

    // content must yield req.size bytes; it is rewound for thumbnail derivation when seekable
    MediaPtr upload(const UploadRequest& req, std::istream& content);

    MediaPtr get(const std::string& id, const std::string& callerId) const;

    MediaPtr update(const std::string& id, const std::string& callerId, types::MediaPatch patch);

    // false when no such record exists
    bool remove(const std::string& id, const std::string& callerId);

    types::MediaPage list(const std::string& callerId, const types::PageRequest& page,
                          const std::optional<std::string>& mediaType) const;

    types::MediaPage search(const std::string& callerId, const std::string& query,
                            const types::PageRequest& page) const;

private:
    std::shared_ptr<db::MediaStore> store_;
    std::shared_ptr<storage::ObjectStore> objects_;
    config::MediaConfig cfg_;
    util::Clock clock_;
    IdGenerator newId_;

    MediaPtr fetchOwned(const std::string& id, const std::string& callerId) const;

    MediaPtr withFreshUrls(MediaPtr record) const;
    types::MediaPage withFreshUrls(types::MediaPage page) const;

    std::optional<storage::StoredObject> storeThumbnail(const UploadRequest& req, const std::string& originalName,
                                                        std::istream& content);

    void discardObject(const std::string& name) const;
};

}
