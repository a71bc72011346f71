#include "db/Schema.hpp"
#include "db/Transactions.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

namespace mv::db {

void initTables(Transactions& txns, const config::DatabaseConfig& cfg) {
    txns.exec("Schema::initTables", [&](pqxx::work& txn) {
        const auto users = txn.quote_name(cfg.users_table);
        const auto media = txn.quote_name(cfg.media_table);

        txn.exec(fmt::format(R"(
            CREATE TABLE IF NOT EXISTS {} (
                id            TEXT PRIMARY KEY,
                username      VARCHAR(50) NOT NULL,
                email         TEXT NOT NULL UNIQUE,
                password_hash TEXT NOT NULL,
                created_at    TIMESTAMPTZ NOT NULL DEFAULT NOW()
            ))", users));

        txn.exec(fmt::format(R"(
            CREATE TABLE IF NOT EXISTS {} (
                id             TEXT PRIMARY KEY,
                owner_id       TEXT NOT NULL,
                stored_name    TEXT NOT NULL,
                original_name  TEXT NOT NULL,
                media_type     TEXT NOT NULL CHECK (media_type IN ('image', 'video')),
                size_bytes     BIGINT NOT NULL CHECK (size_bytes > 0),
                mime_type      TEXT NOT NULL,
                object_url     TEXT NOT NULL,
                thumbnail_name TEXT,
                thumbnail_url  TEXT,
                description    TEXT,
                tags           JSONB,
                uploaded_at    TIMESTAMPTZ NOT NULL,
                updated_at     TIMESTAMPTZ NOT NULL
            ))", media));

        txn.exec(fmt::format("CREATE INDEX IF NOT EXISTS {} ON {} (owner_id, uploaded_at DESC, id DESC)",
                             txn.quote_name(cfg.media_table + "_owner_uploaded_idx"), media));
    });

    log::Registry::db()->info("[Schema] Tables ready: {}, {}", cfg.users_table, cfg.media_table);
}

}
