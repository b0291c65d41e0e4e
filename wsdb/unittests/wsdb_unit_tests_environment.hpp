/**
 * @file wsdb_unit_tests_environment.hpp
 */

#ifndef _WSDB_UNIT_TESTS_ENVIRONMENT_HPP_INCLUDED_
#define _WSDB_UNIT_TESTS_ENVIRONMENT_HPP_INCLUDED_

#include <atomic>
#include <memory>
#include <string>

#include <wsdb/database_leveldb.hpp>
#include <wsdb/storage.hpp>
#include <wsdb/transaction.hpp>

#include <gtest/gtest.h>

namespace wsdb {
namespace test {

/// Directory under the LevelDB test directory, removed if it exists.
std::string fresh_db_path(const std::string& name);

void destroy_db(const std::string& path);

Change change(const std::string& wallet_id, const std::string& address, const std::string& amount,
              Direction direction = Direction::Receive);

Transaction transaction(const std::string& tx_id, State state, Blockchain blockchain = Blockchain::Ethereum);

BlockRef block(uint64_t height, const std::string& block_id);

}  // namespace test

/**
 * @brief Storage opened over a scratch LevelDB directory with a manual clock.
 */
class StorageTestBase : public ::testing::Test {
protected:
    explicit StorageTestBase(const char* name)
    : name_(name) {
    }

    void SetUp() override {
        path_ = test::fresh_db_path(name_);

        auto db = std::make_shared<DatabaseLevelDB>();
        ASSERT_TRUE(db->open(path_, DatabaseLevelDB::kDefaultCacheSize));

        Storage::OpenOptions options;
        options.db = db;
        options.clock = [this]() { return now_.load(); };
        options.cursor_lifetime = 60 * 1000;
        ASSERT_TRUE(storage_.open(options));
    }

    void TearDown() override {
        storage_.close();
        test::destroy_db(path_);
    }

    void advance(ws::Duration ms) {
        now_ += ms;
    }

    Storage storage_;
    std::atomic<ws::Timestamp> now_{1600000000000ull};

private:
    std::string name_;
    std::string path_;
};

}  // namespace wsdb

#endif  // _WSDB_UNIT_TESTS_ENVIRONMENT_HPP_INCLUDED_
