#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "storage/database.hpp"
#include <filesystem>
#include <thread>

using namespace stark_sync;
using namespace stark_sync::storage;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("stark_sync_db_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                  "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".sqlite")).string();
        remove_files();
    }

    void TearDown() override {
        remove_files();
    }

    void remove_files() {
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(path_ + suffix);
        }
    }

    static std::vector<std::string> keys(Database& db, const std::string& prefix) {
        std::vector<std::string> out;
        auto it = db.new_iterator(to_key(prefix));
        for (; it->valid(); it->next()) {
            out.push_back(key_to_string(it->key()));
        }
        return out;
    }

    std::string path_;
};

TEST_F(DatabaseTest, MemoryPutGetDelete) {
    MemoryDatabase db;
    EXPECT_FALSE(db.get(to_key("a")).has_value());
    EXPECT_TRUE(db.put(to_key("a"), to_key("1")));
    EXPECT_TRUE(db.exists(to_key("a")));
    EXPECT_EQ(key_to_string(*db.get(to_key("a"))), "1");
    EXPECT_TRUE(db.del(to_key("a")));
    EXPECT_FALSE(db.del(to_key("a")));
    EXPECT_EQ(db.size(), 0u);
}

TEST_F(DatabaseTest, BatchIsAppliedTogether) {
    MemoryDatabase db;
    db.put(to_key("old"), to_key("x"));

    Database::WriteBatch batch;
    batch.put(to_key("a"), to_key("1"));
    batch.put(to_key("b"), to_key("2"));
    batch.del(to_key("old"));
    EXPECT_EQ(batch.size(), 3u);
    EXPECT_TRUE(db.write_batch(batch));

    EXPECT_EQ(keys(db, ""), (std::vector<std::string>{"a", "b"}));
}

TEST_F(DatabaseTest, IteratorHonoursPrefix) {
    MemoryDatabase db;
    db.put(to_key("state/1"), to_key("a"));
    db.put(to_key("state/2"), to_key("b"));
    db.put(to_key("storage/1"), to_key("c"));
    db.put(to_key("stat"), to_key("d"));

    EXPECT_EQ(keys(db, "state/"), (std::vector<std::string>{"state/1", "state/2"}));
    EXPECT_EQ(keys(db, "st").size(), 4u);
}

TEST_F(DatabaseTest, PrefixedViewIsolatesKeySpaces) {
    auto base = std::make_shared<MemoryDatabase>();
    PrefixedDatabase left(base, "left/");
    PrefixedDatabase right(base, "right/");

    left.put(to_key("k"), to_key("L"));
    right.put(to_key("k"), to_key("R"));

    EXPECT_EQ(key_to_string(*left.get(to_key("k"))), "L");
    EXPECT_EQ(key_to_string(*right.get(to_key("k"))), "R");
    EXPECT_EQ(key_to_string(*base->get(to_key("left/k"))), "L");
    EXPECT_EQ(keys(left, ""), (std::vector<std::string>{"k"}));
    EXPECT_EQ(key_to_string(left.full_key(to_key("k"))), "left/k");
}

TEST_F(DatabaseTest, PrefixedBatch) {
    auto base = std::make_shared<MemoryDatabase>();
    PrefixedDatabase view(base, "p/");
    Database::WriteBatch batch;
    batch.put(to_key("x"), to_key("1"));
    EXPECT_TRUE(view.write_batch(batch));
    EXPECT_TRUE(base->exists(to_key("p/x")));
    EXPECT_FALSE(base->exists(to_key("x")));
}

TEST_F(DatabaseTest, SqliteDatabaseSurvivesReopen) {
    {
        SqliteDatabase db(path_);
        EXPECT_TRUE(db.put(to_key("a"), to_key("1")));
        EXPECT_TRUE(db.put(to_key("b"), to_key("2")));
        EXPECT_TRUE(db.del(to_key("a")));
        EXPECT_FALSE(db.del(to_key("a")));
        Database::WriteBatch batch;
        batch.put(to_key("c"), to_key("3"));
        batch.put(to_key("b"), to_key("22"));
        batch.del(to_key("missing"));
        ASSERT_TRUE(db.write_batch(batch));
    }
    SqliteDatabase db(path_);
    EXPECT_FALSE(db.exists(to_key("a")));
    EXPECT_EQ(key_to_string(*db.get(to_key("b"))), "22");
    EXPECT_EQ(key_to_string(*db.get(to_key("c"))), "3");
    EXPECT_FALSE(db.get(to_key("a")).has_value());
}

TEST_F(DatabaseTest, SqliteDatabaseScansInByteOrder) {
    SqliteDatabase db(path_);
    db.put(Bytes{'p', 0xff}, to_key("high"));
    db.put(Bytes{'p', 0x00}, to_key("low"));
    db.put(Bytes{'p'}, Bytes{});
    db.put(Bytes{'q', 0x00}, to_key("other"));
    db.put(Bytes{'o', 0xff}, to_key("before"));

    std::vector<Bytes> seen;
    auto it = db.new_iterator(Bytes{'p'});
    for (; it->valid(); it->next()) {
        seen.push_back(it->key());
    }
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], (Bytes{'p'}));
    EXPECT_EQ(seen[1], (Bytes{'p', 0x00}));
    EXPECT_EQ(seen[2], (Bytes{'p', 0xff}));

    auto empty = db.get(Bytes{'p'});
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST_F(DatabaseTest, SqliteDatabaseBacksPrefixedStores) {
    {
        auto base = std::make_shared<SqliteDatabase>(path_);
        PrefixedDatabase view(base, "trie/");
        Database::WriteBatch batch;
        batch.put(to_key("x"), to_key("1"));
        batch.put(to_key("y"), to_key("2"));
        ASSERT_TRUE(view.write_batch(batch));
    }
    auto base = std::make_shared<SqliteDatabase>(path_);
    PrefixedDatabase view(base, "trie/");
    EXPECT_EQ(keys(view, ""), (std::vector<std::string>{"x", "y"}));
    EXPECT_TRUE(base->exists(to_key("trie/x")));
}

TEST_F(DatabaseTest, SqliteDatabaseRejectsUnopenablePath) {
    EXPECT_THROW(SqliteDatabase("/nonexistent_stark_sync_dir/state.sqlite"), PersistenceError);
}

TEST_F(DatabaseTest, ConcurrentWriters) {
    MemoryDatabase db;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&db, t] {
            for (int i = 0; i < 100; ++i) {
                db.put(to_key(std::to_string(t) + "/" + std::to_string(i)), to_key("v"));
            }
        });
    }
    for (auto& thread : threads) thread.join();
    EXPECT_EQ(db.size(), 400u);
}
