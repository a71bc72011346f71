#pragma once

#include "db/MediaStore.hpp"

#include <memory>

namespace mv::db {
class Transactions;
}

namespace mv::db::query {

// PostgreSQL-backed MediaStore
class MediaQueries final : public MediaStore {
public:
    explicit MediaQueries(std::shared_ptr<Transactions> txns);

    CreateResult<types::MediaRecord> create(const types::MediaRecord& record) override;
    MediaPtr getById(const std::string& id) override;
    types::MediaPage list(const std::string& ownerId, const types::PageRequest& page,
                          std::optional<types::MediaType> typeFilter) override;
    types::MediaPage search(const std::string& ownerId, const std::string& query,
                            const types::PageRequest& page) override;
    MediaPtr update(const std::string& id, const std::string& ownerId, const types::MediaPatch& patch) override;
    bool remove(const std::string& id, const std::string& ownerId) override;

private:
    std::shared_ptr<Transactions> txns_;
};

}
