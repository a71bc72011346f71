#pragma once

#include "db/StoreResult.hpp"
#include "types/Media.hpp"
#include "types/Page.hpp"

#include <memory>
#include <optional>
#include <string>

namespace mv::db {

// Media records collection, partitioned by owner.
// Listing and search order by uploaded_at descending (ties by id descending);
// Page::total counts every match regardless of the window.
class MediaStore {
public:
    using MediaPtr = std::shared_ptr<types::MediaRecord>;

    virtual ~MediaStore() = default;

    virtual CreateResult<types::MediaRecord> create(const types::MediaRecord& record) = 0;

    // Point lookup by id across partitions; nullptr when absent. Ownership is checked by the caller.
    virtual MediaPtr getById(const std::string& id) = 0;

    virtual types::MediaPage list(const std::string& ownerId,
                                  const types::PageRequest& page,
                                  std::optional<types::MediaType> typeFilter) = 0;

    // Case-insensitive substring match on original_name or description, or exact
    // case-insensitive tag membership
    virtual types::MediaPage search(const std::string& ownerId,
                                    const std::string& query,
                                    const types::PageRequest& page) = 0;

    // nullptr when no record with this id exists in the owner's partition
    virtual MediaPtr update(const std::string& id, const std::string& ownerId, const types::MediaPatch& patch) = 0;

    // false when absent
    virtual bool remove(const std::string& id, const std::string& ownerId) = 0;
};

}
