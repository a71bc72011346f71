#include "db/DBConnection.hpp"

#include <fmt/format.h>

void mv::db::DBConnection::initPreparedMedia() const {
    const auto media = conn_->quote_name(cfg_.media_table);

    conn_->prepare("insert_media",
                   fmt::format("INSERT INTO {} (id, owner_id, stored_name, original_name, media_type, size_bytes, "
                               "mime_type, object_url, thumbnail_name, thumbnail_url, description, tags, "
                               "uploaded_at, updated_at) "
                               "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12::jsonb, "
                               "$13::timestamptz, $14::timestamptz) "
                               "ON CONFLICT (id) DO NOTHING RETURNING *", media));

    conn_->prepare("get_media", fmt::format("SELECT * FROM {} WHERE id = $1", media));

    // $2 is a media_type filter or NULL
    conn_->prepare("list_media",
                   fmt::format("SELECT * FROM {} WHERE owner_id = $1 AND ($2::text IS NULL OR media_type = $2) "
                               "ORDER BY uploaded_at DESC, id DESC LIMIT $3 OFFSET $4", media));

    conn_->prepare("count_media",
                   fmt::format("SELECT COUNT(*) FROM {} WHERE owner_id = $1 "
                               "AND ($2::text IS NULL OR media_type = $2)", media));

    const std::string searchPredicate =
        "owner_id = $1 AND ("
        "strpos(lower(original_name), lower($2)) > 0 "
        "OR strpos(lower(coalesce(description, '')), lower($2)) > 0 "
        "OR EXISTS (SELECT 1 FROM jsonb_array_elements_text(coalesce(tags, '[]'::jsonb)) AS t(tag) "
        "WHERE lower(t.tag) = lower($2)))";

    conn_->prepare("search_media",
                   fmt::format("SELECT * FROM {} WHERE {} ORDER BY uploaded_at DESC, id DESC LIMIT $3 OFFSET $4",
                               media, searchPredicate));

    conn_->prepare("count_search_media", fmt::format("SELECT COUNT(*) FROM {} WHERE {}", media, searchPredicate));

    // NULL leaves the column untouched
    conn_->prepare("update_media",
                   fmt::format("UPDATE {} SET description = COALESCE($3, description), "
                               "tags = COALESCE($4::jsonb, tags), updated_at = GREATEST($5::timestamptz, updated_at + INTERVAL '1 microsecond') "
                               "WHERE id = $1 AND owner_id = $2 RETURNING *", media));

    conn_->prepare("delete_media", fmt::format("DELETE FROM {} WHERE id = $1 AND owner_id = $2", media));
}
