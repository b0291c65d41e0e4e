#include <wsdb/database.hpp>

#include <map>
#include <memory>
#include <optional>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <wsdb/allowance_store.hpp>
#include <wsdb/balance_store.hpp>
#include <wsdb/keys.hpp>
#include <wsdb/storage.hpp>
#include <wsdb/transaction_store.hpp>

#include "mock/database_mock.hpp"
#include "wsdb_unit_tests_environment.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Truly;

class DatabaseTest : public ::testing::Test {};

TEST_F(DatabaseTest, LastError) {
    NiceMock<::wsdb::MockDatabase> db;
    EXPECT_EQ(db.last_error(), ::wsdb::Database::NoError);
    EXPECT_FALSE(db.last_error_message().empty());

    db.set_last_error(::wsdb::Database::NotFound);
    EXPECT_EQ(db.last_error(), ::wsdb::Database::NotFound);
    EXPECT_FALSE(db.last_error_message().empty());

    db.set_last_error(::wsdb::Database::NotSupported, std::string("Test"));
    EXPECT_EQ(db.last_error(), ::wsdb::Database::NotSupported);
    EXPECT_EQ(db.last_error_message(), "Test");

    db.set_last_error(::wsdb::Database::IOError, "%s%04u", "Test", 100);
    EXPECT_EQ(db.last_error(), ::wsdb::Database::IOError);
    EXPECT_EQ(db.last_error_message(), "Test0100");

    db.set_last_error();
    EXPECT_EQ(db.last_error(), ::wsdb::Database::NoError);
    EXPECT_FALSE(db.last_error_message().empty());
}

TEST_F(DatabaseTest, BatchKeepsOrder) {
    ::wsdb::Database::Batch batch;
    EXPECT_TRUE(batch.empty());

    batch.put({1}, {10});
    batch.remove({2});
    batch.put({1}, {11});

    ASSERT_EQ(batch.size(), 3u);
    const auto& ops = batch.operations();
    EXPECT_EQ(ops[0].type, ::wsdb::Database::Batch::Operation::Put);
    EXPECT_EQ(ops[1].type, ::wsdb::Database::Batch::Operation::Remove);
    EXPECT_EQ(ops[1].key, ws::Bytes({2}));
    EXPECT_EQ(ops[2].value, ws::Bytes({11}));
}

class DatabaseErrorTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_shared<NiceMock<::wsdb::MockDatabase>>();
        ON_CALL(*db_, is_open()).WillByDefault(Return(true));
        ON_CALL(*db_, get(_, _, _)).WillByDefault(db_->fail(::wsdb::Database::NotFound));
        ON_CALL(*db_, put(_, _)).WillByDefault(db_->succeed());
        ON_CALL(*db_, write_batch(_)).WillByDefault(db_->succeed());
    }

    bool open() {
        ::wsdb::Storage::OpenOptions options;
        options.db = db_;
        options.clock = []() { return kNow; };
        return storage_.open(options);
    }

    /// The scan sees \p entries, later reads of one key return \p current.
    void scanThenRead(std::map<ws::Bytes, ws::Bytes> entries, const ws::Bytes& key, const ws::Bytes& current) {
        EXPECT_CALL(*db_, new_iterator(_)).WillOnce(Return(std::make_shared<::wsdb::FakeIterator>(std::move(entries))));
        auto read = [this, current](const ws::Bytes&, ws::Bytes* value, const ::wsdb::Database::SnapshotPtr&) {
            *value = current;
            db_->set_last_error();
            return true;
        };
        EXPECT_CALL(*db_, get(key, _, _)).WillOnce(Invoke(read));
    }

    static ::wsdb::Allowance allowance(ws::Timestamp timestamp) {
        ::wsdb::Allowance a;
        a.timestamp = timestamp;
        a.ttl = 1000;
        a.wallet_id = "w1";
        a.blockchain = ::wsdb::Blockchain::Ethereum;
        a.token = "0xdac17f958d2ee523a2206206994597c13d831ec7";
        a.owner = "0x1111111111111111111111111111111111111111";
        a.spender = "0x2222222222222222222222222222222222222222";
        a.amount = "1";
        return a;
    }

    static ws::Bytes key_of(const ::wsdb::Allowance& a) {
        return ::wsdb::KeyCodec::allowanceKey(a.blockchain, a.token, a.owner, a.spender);
    }

    static constexpr ws::Timestamp kNow = 1000000;

    std::shared_ptr<NiceMock<::wsdb::MockDatabase>> db_;
    ::wsdb::Storage storage_;
};

TEST_F(DatabaseErrorTest, DriverNotOpen) {
    EXPECT_CALL(*db_, is_open()).WillOnce(Return(false));
    EXPECT_FALSE(open());
    EXPECT_EQ(storage_.last_error(), ::wsdb::DatabaseError);
    EXPECT_FALSE(storage_.isOpen());
}

TEST_F(DatabaseErrorTest, SchemaReadFails) {
    EXPECT_CALL(*db_, get(_, _, _)).WillOnce(db_->fail(::wsdb::Database::Corruption));
    EXPECT_FALSE(open());
    EXPECT_EQ(storage_.last_error(), ::wsdb::DatabaseError);
    EXPECT_FALSE(storage_.isOpen());
}

TEST_F(DatabaseErrorTest, SchemaMarkerWrittenOnce) {
    EXPECT_CALL(*db_, put(_, ws::Bytes({0, 0, 0, 1}))).Times(1);
    ASSERT_TRUE(open());
    EXPECT_EQ(storage_.schemaVersion(), ::wsdb::Storage::kSchemaVersion);
}

TEST_F(DatabaseErrorTest, WriteFailureIsDatabaseError) {
    ASSERT_TRUE(open());

    ::wsdb::TransactionStore store(storage_);
    EXPECT_CALL(*db_, write_batch(_)).WillOnce(db_->fail(::wsdb::Database::IOError));

    EXPECT_FALSE(store.insert(::wsdb::test::transaction("0xabc", ::wsdb::State::Prepared)));
    EXPECT_EQ(store.last_error(), ::wsdb::DatabaseError);
    EXPECT_EQ(storage_.db_last_error(), ::wsdb::Database::IOError);
}

TEST_F(DatabaseErrorTest, ReadFailureIsDatabaseError) {
    ASSERT_TRUE(open());

    ::wsdb::TransactionStore transactions(storage_);
    ::wsdb::BalanceStore balances(storage_);
    ON_CALL(*db_, get(_, _, _)).WillByDefault(db_->fail(::wsdb::Database::IOError));

    EXPECT_FALSE(transactions.getByTxId(::wsdb::Blockchain::Ethereum, "0xabc", nullptr));
    EXPECT_EQ(transactions.last_error(), ::wsdb::DatabaseError);

    EXPECT_FALSE(balances.get("addr", ::wsdb::Blockchain::Ethereum, "ETH", nullptr));
    EXPECT_EQ(balances.last_error(), ::wsdb::DatabaseError);
}

TEST_F(DatabaseErrorTest, NotFoundIsNotAnError) {
    ASSERT_TRUE(open());

    ::wsdb::TransactionStore store(storage_);
    EXPECT_FALSE(store.getByTxId(::wsdb::Blockchain::Ethereum, "0xabc", nullptr));
    EXPECT_EQ(store.last_error(), ::wsdb::NotFound);
}

TEST_F(DatabaseErrorTest, IteratorUnavailable) {
    ASSERT_TRUE(open());

    ::wsdb::BalanceStore balances(storage_);
    EXPECT_CALL(*db_, new_iterator(_)).WillOnce(Return(nullptr));
    EXPECT_FALSE(balances.list("addr", nullptr));
    EXPECT_EQ(balances.last_error(), ::wsdb::DatabaseError);
}

TEST_F(DatabaseErrorTest, PurgeRechecksUnderLock) {
    ASSERT_TRUE(open());

    // renewed by an upsert between the scan and the removal
    const ::wsdb::Allowance expired = allowance(1);
    const ::wsdb::Allowance renewed = allowance(kNow);
    scanThenRead({{key_of(expired), expired.to_binary()}}, key_of(expired), renewed.to_binary());
    EXPECT_CALL(*db_, write_batch(Truly([](const ::wsdb::Database::Batch& batch) { return batch.empty(); })))
        .WillOnce(db_->succeed());

    ::wsdb::AllowanceStore allowances(storage_);
    size_t removed = 1;
    ASSERT_TRUE(allowances.purge(&removed));
    EXPECT_EQ(removed, 0u);
}

TEST_F(DatabaseErrorTest, RemoveRechecksUnderLock) {
    ASSERT_TRUE(open());

    const ::wsdb::Allowance old = allowance(5);
    const ::wsdb::Allowance fresh = allowance(200);
    scanThenRead({{key_of(old), old.to_binary()}}, key_of(old), fresh.to_binary());
    EXPECT_CALL(*db_, write_batch(Truly([](const ::wsdb::Database::Batch& batch) { return batch.empty(); })))
        .WillOnce(db_->succeed());

    ::wsdb::AllowanceStore allowances(storage_);
    size_t removed = 1;
    ASSERT_TRUE(allowances.remove("w1", std::nullopt, ws::Timestamp(100), &removed));
    EXPECT_EQ(removed, 0u);
}

TEST_F(DatabaseErrorTest, ClearRechecksUnderLock) {
    ASSERT_TRUE(open());

    // gone by the time the stripe is held; reads default to NotFound
    const ws::Bytes key = ::wsdb::KeyCodec::balanceKey("addr", ::wsdb::Blockchain::Ethereum, "ETH");
    EXPECT_CALL(*db_, new_iterator(_))
        .WillOnce(Return(std::make_shared<::wsdb::FakeIterator>(std::map<ws::Bytes, ws::Bytes>{{key, ws::Bytes{1}}})));
    EXPECT_CALL(*db_, write_batch(Truly([](const ::wsdb::Database::Batch& batch) { return batch.empty(); })))
        .WillOnce(db_->succeed());

    ::wsdb::BalanceStore balances(storage_);
    size_t removed = 1;
    ASSERT_TRUE(balances.clear("addr", &removed));
    EXPECT_EQ(removed, 0u);
}

TEST_F(DatabaseErrorTest, RecheckReadFailure) {
    ASSERT_TRUE(open());

    const ::wsdb::Allowance expired = allowance(1);
    EXPECT_CALL(*db_, new_iterator(_))
        .WillOnce(Return(std::make_shared<::wsdb::FakeIterator>(std::map<ws::Bytes, ws::Bytes>{{key_of(expired), expired.to_binary()}})));
    EXPECT_CALL(*db_, get(key_of(expired), _, _)).WillOnce(db_->fail(::wsdb::Database::IOError));
    EXPECT_CALL(*db_, write_batch(_)).Times(0);

    ::wsdb::AllowanceStore allowances(storage_);
    EXPECT_FALSE(allowances.purge());
    EXPECT_EQ(allowances.last_error(), ::wsdb::DatabaseError);
}
