#include <wsdb/storage.hpp>

#include <memory>
#include <thread>

#include <boost/property_tree/ptree.hpp>

#include <gtest/gtest.h>

#include <wsdb/config.hpp>
#include <wsdb/database_leveldb.hpp>
#include <wsdb/keys.hpp>

#include "wsdb_unit_tests_environment.hpp"

using namespace wsdb;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = test::fresh_db_path("wsdb_storage_unittests");
    }

    void TearDown() override {
        test::destroy_db(path_);
    }

    std::string path_;
};

TEST_F(StorageTest, NotOpen) {
    Storage s;
    EXPECT_FALSE(s.isOpen());
    EXPECT_EQ(s.last_error(), NoError);
    EXPECT_EQ(s.db_last_error(), Database::NotOpen);
    EXPECT_FALSE(s.db_last_error_message().empty());
    EXPECT_FALSE(s.database());
    EXPECT_EQ(s.schemaVersion(), 0u);
}

TEST_F(StorageTest, FailedOpen) {
    Storage s;
    EXPECT_FALSE(s.open("/dev/null"));
    EXPECT_FALSE(s.isOpen());
    EXPECT_EQ(s.last_error(), DatabaseError);

    EXPECT_FALSE(s.open(std::string{}));
    EXPECT_EQ(s.last_error(), InvalidParameter);
}

TEST_F(StorageTest, FailedOpenWithEmptyOptions) {
    Storage s;
    EXPECT_FALSE(s.open(Storage::OpenOptions{}));
    EXPECT_FALSE(s.isOpen());
    EXPECT_EQ(s.last_error(), DatabaseError);
    EXPECT_EQ(s.db_last_error(), Database::NotOpen);
}

TEST_F(StorageTest, InconsistentOptions) {
    auto db = std::make_shared<DatabaseLevelDB>();
    ASSERT_TRUE(db->open(path_, DatabaseLevelDB::kDefaultCacheSize));

    Storage s;
    Storage::OpenOptions options;
    options.db = db;
    options.page_size = 0;
    EXPECT_FALSE(s.open(options));
    EXPECT_EQ(s.last_error(), InvalidParameter);

    options.page_size = 10;
    options.allowance_max_ttl = options.allowance_default_ttl - 1;
    EXPECT_FALSE(s.open(options));
    EXPECT_EQ(s.last_error(), InvalidParameter);
}

TEST_F(StorageTest, OpenClose) {
    Storage s;
    ASSERT_TRUE(s.open(path_));
    EXPECT_TRUE(s.isOpen());
    EXPECT_EQ(s.last_error(), NoError);
    EXPECT_EQ(s.db_last_error(), Database::NoError);
    EXPECT_EQ(s.schemaVersion(), Storage::kSchemaVersion);
    EXPECT_EQ(s.pageSize(), Storage::kDefaultPageSize);

    ws::Bytes marker;
    ASSERT_TRUE(s.database()->get(KeyCodec::versionKey(), &marker));
    EXPECT_EQ(marker, ws::Bytes({0, 0, 0, 1}));

    s.close();
    EXPECT_FALSE(s.isOpen());
    EXPECT_EQ(s.db_last_error(), Database::NotOpen);

    // reopen an existing database
    ASSERT_TRUE(s.open(path_));
    EXPECT_EQ(s.schemaVersion(), Storage::kSchemaVersion);
}

TEST_F(StorageTest, NewerSchemaRefused) {
    {
        auto db = std::make_shared<DatabaseLevelDB>();
        ASSERT_TRUE(db->open(path_, DatabaseLevelDB::kDefaultCacheSize));
        std::shared_ptr<Database> handle = db;
        ASSERT_TRUE(handle->put(KeyCodec::versionKey(), ws::Bytes({0, 0, 0, 2})));
    }

    Storage s;
    EXPECT_FALSE(s.open(path_));
    EXPECT_EQ(s.last_error(), DatabaseError);
    EXPECT_FALSE(s.isOpen());
}

TEST_F(StorageTest, DamagedSchemaMarker) {
    {
        auto db = std::make_shared<DatabaseLevelDB>();
        ASSERT_TRUE(db->open(path_, DatabaseLevelDB::kDefaultCacheSize));
        std::shared_ptr<Database> handle = db;
        ASSERT_TRUE(handle->put(KeyCodec::versionKey(), ws::Bytes({1})));
    }

    Storage s;
    EXPECT_FALSE(s.open(path_));
    EXPECT_EQ(s.last_error(), MalformedValue);
}

TEST_F(StorageTest, OpenFromConfig) {
    boost::property_tree::ptree tree;
    tree.put("storage.path", path_);
    tree.put("storage.page_size", 7);
    tree.put("storage.cursor_lifetime", 30);
    const Config config = Config::readFromTree(tree);
    ASSERT_TRUE(config.isGood());

    Storage s;
    ASSERT_TRUE(s.open(config, []() { return ws::Timestamp{42}; }));
    EXPECT_EQ(s.pageSize(), 7u);
    EXPECT_EQ(s.cursorLifetime(), 30u * 1000);
    EXPECT_EQ(s.now(), 42u);

    EXPECT_FALSE(s.open(Config{}));
    EXPECT_EQ(s.last_error(), InvalidParameter);
}

TEST_F(StorageTest, StripeLocks) {
    Storage s;
    const ws::Bytes a{1, 2, 3};
    const ws::Bytes b{4, 5, 6};
    EXPECT_EQ(&s.stripe(a), &s.stripe(a));

    // duplicates and shared stripes are locked once
    auto locks = s.lockStripes({a, b, a});
    EXPECT_LE(locks.size(), 2u);
    for (const auto& lock : locks) {
        EXPECT_TRUE(lock.owns_lock());
    }

    bool locked = true;
    std::thread other([&]() { locked = s.stripe(a).try_lock(); });
    other.join();
    EXPECT_FALSE(locked);

    locks.clear();
    std::thread again([&]() {
        locked = s.stripe(a).try_lock();
        if (locked) {
            s.stripe(a).unlock();
        }
    });
    again.join();
    EXPECT_TRUE(locked);
}
