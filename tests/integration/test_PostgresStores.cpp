#include <gtest/gtest.h>
#include "db/DBPool.hpp"
#include "db/Transactions.hpp"
#include "db/Schema.hpp"
#include "db/query/MediaQueries.hpp"
#include "db/query/UserQueries.hpp"
#include "types/Media.hpp"
#include "types/User.hpp"

#include <fmt/format.h>
#include <unistd.h>

using namespace mv;
using namespace std::chrono_literals;

// Runs against a live PostgreSQL only when MEDIAVAULT_TEST_DB=1
class PostgresStoresTest : public ::testing::Test {
protected:
    config::DatabaseConfig cfg;
    std::shared_ptr<db::DBPool> pool;
    std::shared_ptr<db::Transactions> txns;
    std::unique_ptr<db::query::UserQueries> users;
    std::unique_ptr<db::query::MediaQueries> media;

    void SetUp() override {
        if (config::processEnv("MEDIAVAULT_TEST_DB") != "1") GTEST_SKIP() << "MEDIAVAULT_TEST_DB not set";

        config::Config all;
        config::applyEnvOverrides(all, config::processEnv);
        cfg = all.database;
        cfg.pool_size = 2;
        cfg.users_table = fmt::format("users_test_{}", ::getpid());
        cfg.media_table = fmt::format("media_test_{}", ::getpid());

        pool = std::make_shared<db::DBPool>(cfg);
        txns = std::make_shared<db::Transactions>(pool);
        db::initTables(*txns, cfg);
        pool->initPreparedStatements();

        users = std::make_unique<db::query::UserQueries>(txns);
        media = std::make_unique<db::query::MediaQueries>(txns);
    }

    void TearDown() override {
        if (!txns) return;
        txns->exec("PostgresStoresTest::TearDown", [&](pqxx::work& txn) {
            txn.exec("DROP TABLE IF EXISTS " + txn.quote_name(cfg.media_table));
            txn.exec("DROP TABLE IF EXISTS " + txn.quote_name(cfg.users_table));
        });
    }

    static types::MediaRecord record(const std::string& id, const std::string& owner, const util::Timestamp at) {
        types::MediaRecord r;
        r.id = id;
        r.owner_id = owner;
        r.stored_name = owner + "/" + id + ".mp4";
        r.original_name = id + ".mp4";
        r.media_type = types::MediaType::Video;
        r.size_bytes = 3;
        r.mime_type = "video/mp4";
        r.object_url = "https://example/" + id;
        r.uploaded_at = r.updated_at = at;
        return r;
    }

    static util::Timestamp t0() {
        return std::chrono::time_point_cast<std::chrono::microseconds>(
            util::Timestamp{std::chrono::seconds(1714564800)} + 123456us);
    }
};

TEST_F(PostgresStoresTest, Users_CreateLookupAndDuplicate) {
    const types::User u("u1", "tester", "a@x.com", "$argon2id$placeholder", t0());
    const auto created = users->create(u);
    ASSERT_TRUE(created.created());
    EXPECT_EQ(created.record->created_at, t0());

    EXPECT_FALSE(users->create(types::User("u2", "other", "a@x.com", "h", t0())).created());
    EXPECT_FALSE(users->create(types::User("u1", "other", "b@x.com", "h", t0())).created());

    ASSERT_NE(users->getByEmail("a@x.com"), nullptr);
    EXPECT_EQ(users->getById("u1")->username, "tester");
    EXPECT_EQ(users->getById("missing"), nullptr);

    EXPECT_TRUE(users->updatePasswordHash("u1", "new-hash"));
    EXPECT_FALSE(users->updatePasswordHash("missing", "new-hash"));
    EXPECT_EQ(users->getById("u1")->password_hash, "new-hash");
    EXPECT_EQ(users->list().size(), 1u);
}

TEST_F(PostgresStoresTest, Media_RoundTripsOptionalFields) {
    auto r = record("m1", "u1", t0());
    r.description = "Sunny";
    r.tags = std::vector<std::string>{"beach", "sun"};
    r.thumbnail_name = "u1/thumb.jpg";
    r.thumbnail_url = "https://example/thumb";
    ASSERT_TRUE(media->create(r).created());
    EXPECT_FALSE(media->create(r).created());

    const auto got = media->getById("m1");
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->description, "Sunny");
    EXPECT_EQ(got->tags, r.tags);
    EXPECT_EQ(got->thumbnail_name, r.thumbnail_name);
    EXPECT_EQ(got->uploaded_at, t0());

    ASSERT_TRUE(media->create(record("m2", "u1", t0())).created());
    const auto bare = media->getById("m2");
    EXPECT_FALSE(bare->description.has_value());
    EXPECT_FALSE(bare->tags.has_value());
}

TEST_F(PostgresStoresTest, Media_ListOrdersAndCounts) {
    for (int i = 0; i < 5; ++i) ASSERT_TRUE(media->create(record(fmt::format("m{}", i), "u1", t0() + (i / 2) * 1s)).created());
    ASSERT_TRUE(media->create(record("other", "u2", t0())).created());

    const auto first = media->list("u1", {1, 3}, std::nullopt);
    EXPECT_EQ(first.total, 5u);
    ASSERT_EQ(first.items.size(), 3u);
    EXPECT_EQ(first.items[0]->id, "m4");
    EXPECT_EQ(first.items[1]->id, "m3");
    EXPECT_EQ(first.items[2]->id, "m2");

    const auto second = media->list("u1", {2, 3}, std::nullopt);
    EXPECT_EQ(second.total, 5u);
    ASSERT_EQ(second.items.size(), 2u);
    EXPECT_EQ(second.items[1]->id, "m0");

    EXPECT_EQ(media->list("u1", {1, 10}, types::MediaType::Image).total, 0u);
}

TEST_F(PostgresStoresTest, Media_SearchUpdateRemove) {
    auto a = record("m1", "u1", t0());
    a.original_name = "Beach.mp4";
    auto b = record("m2", "u1", t0() + 1s);
    b.tags = std::vector<std::string>{"BEACH"};
    auto c = record("m3", "u1", t0() + 2s);
    c.description = "no match here";
    for (const auto& r : {a, b, c}) ASSERT_TRUE(media->create(r).created());

    const auto found = media->search("u1", "beach", {1, 20});
    EXPECT_EQ(found.total, 2u);
    ASSERT_EQ(found.items.size(), 2u);
    EXPECT_EQ(found.items[0]->id, "m2");

    types::MediaPatch patch;
    patch.description = "updated";
    patch.updated_at = t0();  // stale on purpose
    const auto updated = media->update("m2", "u1", patch);
    ASSERT_NE(updated, nullptr);
    EXPECT_EQ(updated->description, "updated");
    EXPECT_EQ(updated->tags, b.tags);
    EXPECT_GT(updated->updated_at, b.updated_at);

    EXPECT_EQ(media->update("m2", "u2", patch), nullptr);
    EXPECT_FALSE(media->remove("m2", "u2"));
    EXPECT_TRUE(media->remove("m2", "u1"));
    EXPECT_FALSE(media->remove("m2", "u1"));
}
