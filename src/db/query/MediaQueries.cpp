#include "db/query/MediaQueries.hpp"
#include "db/Transactions.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <pqxx/pqxx>

using namespace mv::db;
using namespace mv::db::query;
using namespace mv::types;

MediaQueries::MediaQueries(std::shared_ptr<Transactions> txns) : txns_(std::move(txns)) {}

CreateResult<MediaRecord> MediaQueries::create(const MediaRecord& r) {
    return txns_->exec("MediaQueries::create", [&](pqxx::work& txn) -> CreateResult<MediaRecord> {
        pqxx::params p{r.id, r.owner_id, r.stored_name, r.original_name, to_string(r.media_type)};
        p.append(static_cast<int64_t>(r.size_bytes));
        p.append(r.mime_type);
        p.append(r.object_url);
        p.append(r.thumbnail_name);
        p.append(r.thumbnail_url);
        p.append(r.description);
        p.append(tags_to_json_string(r.tags));
        p.append(util::timestampToString(r.uploaded_at));
        p.append(util::timestampToString(r.updated_at));

        const auto res = txn.exec(pqxx::prepped{"insert_media"}, p);
        if (res.empty()) {
            log::Registry::db()->debug("[MediaQueries] Media record {} already exists", r.id);
            return CreateResult<MediaRecord>::AlreadyExists();
        }
        return CreateResult<MediaRecord>::Created(std::make_shared<MediaRecord>(res.one_row()));
    });
}

MediaStore::MediaPtr MediaQueries::getById(const std::string& id) {
    return txns_->exec("MediaQueries::getById", [&](pqxx::work& txn) -> MediaPtr {
        const auto res = txn.exec(pqxx::prepped{"get_media"}, pqxx::params{id});
        if (res.empty()) {
            log::Registry::db()->trace("[MediaQueries] No media found with id: {}", id);
            return nullptr;
        }
        return std::make_shared<MediaRecord>(res.one_row());
    });
}

MediaPage MediaQueries::list(const std::string& ownerId, const PageRequest& page,
                             const std::optional<MediaType> typeFilter) {
    std::optional<std::string> type;
    if (typeFilter) type = to_string(*typeFilter);

    return txns_->exec("MediaQueries::list", [&](pqxx::work& txn) {
        MediaPage out;
        out.page = page.page;
        out.page_size = page.page_size;
        out.total = txn.exec(pqxx::prepped{"count_media"}, pqxx::params{ownerId, type}).one_row()[0].as<uint64_t>();
        out.items = media_from_pq_res(txn.exec(pqxx::prepped{"list_media"},
                                               pqxx::params{ownerId, type, static_cast<int64_t>(page.page_size),
                                                            static_cast<int64_t>(page.offset())}));
        return out;
    });
}

MediaPage MediaQueries::search(const std::string& ownerId, const std::string& query, const PageRequest& page) {
    return txns_->exec("MediaQueries::search", [&](pqxx::work& txn) {
        MediaPage out;
        out.page = page.page;
        out.page_size = page.page_size;
        out.total = txn.exec(pqxx::prepped{"count_search_media"}, pqxx::params{ownerId, query}).one_row()[0].as<uint64_t>();
        out.items = media_from_pq_res(txn.exec(pqxx::prepped{"search_media"},
                                               pqxx::params{ownerId, query, static_cast<int64_t>(page.page_size),
                                                            static_cast<int64_t>(page.offset())}));
        return out;
    });
}

MediaStore::MediaPtr MediaQueries::update(const std::string& id, const std::string& ownerId, const MediaPatch& patch) {
    return txns_->exec("MediaQueries::update", [&](pqxx::work& txn) -> MediaPtr {
        const auto res = txn.exec(pqxx::prepped{"update_media"},
                                  pqxx::params{id, ownerId, patch.description, tags_to_json_string(patch.tags),
                                               util::timestampToString(patch.updated_at)});
        if (res.empty()) return nullptr;
        return std::make_shared<MediaRecord>(res.one_row());
    });
}

bool MediaQueries::remove(const std::string& id, const std::string& ownerId) {
    return txns_->exec("MediaQueries::remove", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"delete_media"}, pqxx::params{id, ownerId});
        return res.affected_rows() > 0;
    });
}
