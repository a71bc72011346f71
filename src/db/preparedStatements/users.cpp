#include "db/DBConnection.hpp"

#include <fmt/format.h>

void mv::db::DBConnection::initPreparedUsers() const {
    const auto users = conn_->quote_name(cfg_.users_table);

    conn_->prepare("insert_user",
                   fmt::format("INSERT INTO {} (id, username, email, password_hash, created_at) "
                               "VALUES ($1, $2, $3, $4, $5::timestamptz) "
                               "ON CONFLICT DO NOTHING RETURNING *", users));

    conn_->prepare("get_user", fmt::format("SELECT * FROM {} WHERE id = $1", users));

    conn_->prepare("get_user_by_email", fmt::format("SELECT * FROM {} WHERE email = $1", users));

    conn_->prepare("update_user_password",
                   fmt::format("UPDATE {} SET password_hash = $2 WHERE id = $1", users));

    conn_->prepare("list_users", fmt::format("SELECT * FROM {} ORDER BY created_at, id", users));
}
