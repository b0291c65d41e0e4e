#include <wsdb/database_leveldb.hpp>

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "wsdb_unit_tests_environment.hpp"

class DatabaseLevelDBTest : public ::testing::Test {
protected:
    void SetUp() override final {
        path_to_db_ = ::wsdb::test::fresh_db_path(database_name_);

        auto db = std::make_shared<::wsdb::DatabaseLevelDB>();
        ASSERT_TRUE(db->open(path_to_db_, ::wsdb::DatabaseLevelDB::kDefaultCacheSize));
        db_ = db;
    }

    void TearDown() override final {
        db_.reset();
        ::wsdb::test::destroy_db(path_to_db_);
    }

protected:
    std::shared_ptr<::wsdb::Database> db_;
    std::string path_to_db_;
    static constexpr const char* database_name_ = "wsdb_leveldb_unittests";
};

class DatabaseLevelDBTestNotOpen : public ::testing::Test {};

TEST_F(DatabaseLevelDBTestNotOpen, FailedCreation) {
    ::wsdb::DatabaseLevelDB db;
    EXPECT_FALSE(db.open("/dev/null", ::wsdb::DatabaseLevelDB::kDefaultCacheSize));
    EXPECT_EQ(db.last_error(), ::wsdb::Database::IOError);
}

TEST_F(DatabaseLevelDBTestNotOpen, FailedOperations) {
    std::unique_ptr<::wsdb::Database> db{new ::wsdb::DatabaseLevelDB};
    EXPECT_FALSE(db->is_open());

    EXPECT_FALSE(db->put({1, 1, 1}, {2, 2, 2}));
    EXPECT_EQ(db->last_error(), ::wsdb::Database::NotOpen);

    ws::Bytes result;
    EXPECT_FALSE(db->get({1, 1, 1}, &result));
    EXPECT_EQ(db->last_error(), ::wsdb::Database::NotOpen);

    EXPECT_FALSE(db->remove({1, 1, 1}));
    EXPECT_EQ(db->last_error(), ::wsdb::Database::NotOpen);

    ::wsdb::Database::Batch batch;
    batch.put({0, 0, 0}, {0xFF});
    EXPECT_FALSE(db->write_batch(batch));
    EXPECT_EQ(db->last_error(), ::wsdb::Database::NotOpen);

    EXPECT_FALSE(db->new_snapshot());
    EXPECT_EQ(db->last_error(), ::wsdb::Database::NotOpen);

    EXPECT_FALSE(db->new_iterator());
    EXPECT_EQ(db->last_error(), ::wsdb::Database::NotOpen);
}

TEST_F(DatabaseLevelDBTest, Create) {
    EXPECT_TRUE(db_->is_open());
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NoError);
}

TEST_F(DatabaseLevelDBTest, GetPut) {
    EXPECT_TRUE(db_->put({1, 1, 1}, {2, 2, 2}));
    EXPECT_TRUE(db_->put({2, 2, 2}, {3, 3, 3}));
    EXPECT_TRUE(db_->put({0, 0, 0}, {0xFF, 0xFF, 0xFF}));
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NoError);

    EXPECT_TRUE(db_->get({0, 0, 0}));
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NoError);

    EXPECT_FALSE(db_->get({3, 3, 3}));
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NotFound);

    ws::Bytes result;
    EXPECT_TRUE(db_->get({0, 0, 0}, &result));
    EXPECT_EQ(result, ws::Bytes({0xFF, 0xFF, 0xFF}));
    EXPECT_TRUE(db_->get({1, 1, 1}, &result));
    EXPECT_EQ(result, ws::Bytes({2, 2, 2}));

    EXPECT_FALSE(db_->get({3, 3, 3}, &result));
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NotFound);
}

TEST_F(DatabaseLevelDBTest, Remove) {
    EXPECT_TRUE(db_->put({1, 1, 1}, {2, 2, 2}));
    EXPECT_TRUE(db_->put({2, 2, 2}, {3, 3, 3}));

    EXPECT_TRUE(db_->remove({2, 2, 2}));
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NoError);
    // removing a missing key is not an error
    EXPECT_TRUE(db_->remove({3, 3, 3}));
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NoError);

    EXPECT_TRUE(db_->get({1, 1, 1}));
    EXPECT_FALSE(db_->get({2, 2, 2}));
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NotFound);
}

TEST_F(DatabaseLevelDBTest, WriteBatch) {
    EXPECT_TRUE(db_->write_batch(::wsdb::Database::Batch{}));
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NoError);

    EXPECT_TRUE(db_->put({9, 9, 9}, {9}));

    ::wsdb::Database::Batch batch;
    batch.put({1, 1, 1}, {2, 2, 2});
    batch.put({2, 2, 2}, {3, 3, 3});
    batch.remove({9, 9, 9});
    // later operations win
    batch.put({4, 4, 4}, {4});
    batch.remove({4, 4, 4});
    batch.remove({5, 5, 5});
    batch.put({5, 5, 5}, {5});
    EXPECT_EQ(batch.size(), 7u);

    EXPECT_TRUE(db_->write_batch(batch));
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NoError);

    ws::Bytes result;
    EXPECT_TRUE(db_->get({1, 1, 1}, &result));
    EXPECT_EQ(result, ws::Bytes({2, 2, 2}));
    EXPECT_TRUE(db_->get({2, 2, 2}, &result));
    EXPECT_EQ(result, ws::Bytes({3, 3, 3}));
    EXPECT_FALSE(db_->get({9, 9, 9}));
    EXPECT_FALSE(db_->get({4, 4, 4}));
    EXPECT_TRUE(db_->get({5, 5, 5}, &result));
    EXPECT_EQ(result, ws::Bytes({5}));
}

TEST_F(DatabaseLevelDBTest, Iterator) {
    std::vector<std::pair<ws::Bytes, ws::Bytes>> list{
        {{3, 3, 3}, {4, 4, 4}}, {{4, 4, 4}, {5, 5, 5}}, {{2, 2, 2}, {3, 3, 3}}, {{0, 0, 0}, {1, 1, 1}}, {{1, 1, 1}, {2, 2, 2}}};

    ::wsdb::Database::Batch batch;
    for (const auto& item : list) {
        batch.put(item.first, item.second);
    }
    EXPECT_TRUE(db_->write_batch(batch));

    auto db_it = db_->new_iterator();
    ASSERT_TRUE(db_it);
    EXPECT_FALSE(db_it->is_valid());

    std::sort(list.begin(), list.end());

    // Forward
    auto it = list.begin();
    db_it->seek_to_first();
    for (; it != list.end(); ++it, db_it->next()) {
        ASSERT_TRUE(db_it->is_valid());
        EXPECT_EQ(it->first, db_it->key());
        EXPECT_EQ(it->second, db_it->value());
    }
    EXPECT_FALSE(db_it->is_valid());

    // Reverse
    it = list.end() - 1;
    db_it->seek_to_last();
    while (true) {
        ASSERT_TRUE(db_it->is_valid());
        EXPECT_EQ(it->first, db_it->key());
        if (list.begin() == it) {
            break;
        }
        --it;
        db_it->prev();
    }

    // Seek between keys lands on the next one
    db_it->seek({1, 1, 2});
    ASSERT_TRUE(db_it->is_valid());
    EXPECT_EQ(db_it->key(), ws::Bytes({2, 2, 2}));
}

TEST_F(DatabaseLevelDBTest, SnapshotIsolation) {
    EXPECT_TRUE(db_->put({1}, {1}));

    auto snapshot = db_->new_snapshot();
    ASSERT_TRUE(snapshot);

    EXPECT_TRUE(db_->put({1}, {2}));
    EXPECT_TRUE(db_->put({2}, {2}));

    ws::Bytes result;
    EXPECT_TRUE(db_->get({1}, &result, snapshot));
    EXPECT_EQ(result, ws::Bytes({1}));
    EXPECT_FALSE(db_->get({2}, &result, snapshot));
    EXPECT_EQ(db_->last_error(), ::wsdb::Database::NotFound);

    auto it = db_->new_iterator(snapshot);
    ASSERT_TRUE(it);
    size_t count = 0;
    for (it->seek_to_first(); it->is_valid(); it->next()) {
        ++count;
    }
    EXPECT_EQ(count, 1u);

    EXPECT_TRUE(db_->get({1}, &result));
    EXPECT_EQ(result, ws::Bytes({2}));
}

TEST_F(DatabaseLevelDBTest, IteratorOutlivesHandle) {
    EXPECT_TRUE(db_->put({7}, {7}));
    auto it = db_->new_iterator();
    ASSERT_TRUE(it);

    db_.reset();
    it->seek_to_first();
    ASSERT_TRUE(it->is_valid());
    EXPECT_EQ(it->value(), ws::Bytes({7}));
    it.reset();
}

TEST_F(DatabaseLevelDBTest, Reopen) {
    EXPECT_TRUE(db_->put({1, 2, 3}, {4}));
    db_.reset();

    auto db = std::make_shared<::wsdb::DatabaseLevelDB>();
    ASSERT_TRUE(db->open(path_to_db_, ::wsdb::DatabaseLevelDB::kDefaultCacheSize));
    db_ = db;

    ws::Bytes result;
    EXPECT_TRUE(db_->get({1, 2, 3}, &result));
    EXPECT_EQ(result, ws::Bytes({4}));

    db->close();
    EXPECT_FALSE(db_->is_open());
}
