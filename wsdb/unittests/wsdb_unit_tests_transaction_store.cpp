#include <wsdb/transaction_store.hpp>

#include <set>
#include <string>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include <wsdb/keys.hpp>
#include <wsdb/storage.hpp>

#include "wsdb_unit_tests_environment.hpp"

using namespace wsdb;

class TransactionStoreTest : public StorageTestBase {
protected:
    TransactionStoreTest()
    : StorageTestBase("wsdb_transaction_store_unittests") {
    }

    Transaction stored(const std::string& tx_id, Blockchain blockchain = Blockchain::Ethereum) {
        Transaction tx;
        EXPECT_TRUE(store_.getByTxId(blockchain, tx_id, &tx)) << store_.last_error_message();
        return tx;
    }

    Transaction confirmed(const std::string& tx_id, uint64_t height, const std::string& block_id) {
        Transaction tx = test::transaction(tx_id, State::Confirmed);
        tx.block = test::block(height, block_id);
        tx.confirm_timestamp = 2000 + height;
        return tx;
    }

    TransactionStore store_{storage_};
};

TEST_F(TransactionStoreTest, InsertAndGet) {
    Transaction tx = test::transaction("0xabc", State::Prepared);
    tx.changes.push_back(test::change("w1", "0x01", "10"));
    ASSERT_TRUE(store_.insert(tx));
    EXPECT_EQ(store_.last_error(), NoError);

    const Transaction read = stored("0xabc");
    EXPECT_EQ(read, tx);
    EXPECT_EQ(read.version, 0u);
}

TEST_F(TransactionStoreTest, GetMissing) {
    EXPECT_FALSE(store_.getByTxId(Blockchain::Ethereum, "0xabc", nullptr));
    EXPECT_EQ(store_.last_error(), NotFound);

    // same id on another chain is another transaction
    ASSERT_TRUE(store_.insert(test::transaction("0xabc", State::Prepared, Blockchain::Goerli)));
    EXPECT_FALSE(store_.getByTxId(Blockchain::Ethereum, "0xabc", nullptr));
    EXPECT_EQ(store_.last_error(), NotFound);
}

TEST_F(TransactionStoreTest, InsertTwice) {
    ASSERT_TRUE(store_.insert(test::transaction("0xabc", State::Prepared)));
    EXPECT_FALSE(store_.insert(test::transaction("0xabc", State::Submitted)));
    EXPECT_EQ(store_.last_error(), VersionConflict);
    EXPECT_EQ(stored("0xabc").state, State::Prepared);
}

TEST_F(TransactionStoreTest, OptimisticVersioning) {
    ASSERT_TRUE(store_.insert(test::transaction("0xabc", State::Prepared)));

    uint64_t version = 0;
    ASSERT_TRUE(store_.upsert(test::transaction("0xabc", State::Submitted), 0, &version));
    EXPECT_EQ(version, 1u);

    EXPECT_FALSE(store_.upsert(test::transaction("0xabc", State::Submitted), 0, &version));
    EXPECT_EQ(store_.last_error(), VersionConflict);

    const Transaction tx = stored("0xabc");
    EXPECT_EQ(tx.state, State::Submitted);
    EXPECT_EQ(tx.version, 1u);
}

TEST_F(TransactionStoreTest, ChainedVersions) {
    ASSERT_TRUE(store_.upsert(test::transaction("0xabc", State::Prepared), 0));

    uint64_t version = stored("0xabc").version;
    EXPECT_EQ(version, 1u);

    for (int i = 0; i < 5; ++i) {
        Transaction tx = test::transaction("0xabc", State::Submitted);
        tx.sync_timestamp = 1000 + i;
        ASSERT_TRUE(store_.upsert(tx, version, &version)) << store_.last_error_message();
    }

    const Transaction tx = stored("0xabc");
    EXPECT_EQ(tx.version, 6u);
    EXPECT_EQ(tx.sync_timestamp, 1004u);
}

TEST_F(TransactionStoreTest, UpsertMissingWithOtherVersion) {
    EXPECT_FALSE(store_.upsert(test::transaction("0xabc", State::Prepared), 3));
    EXPECT_EQ(store_.last_error(), VersionConflict);
}

TEST_F(TransactionStoreTest, LifecyclePath) {
    uint64_t version = 0;
    ASSERT_TRUE(store_.insert(test::transaction("0xabc", State::Prepared)));
    ASSERT_TRUE(store_.upsert(test::transaction("0xabc", State::Submitted), version, &version));
    ASSERT_TRUE(store_.upsert(confirmed("0xabc", 10, "b10"), version, &version));
    ASSERT_TRUE(store_.upsert(test::transaction("0xabc", State::Submitted), version, &version));
    ASSERT_TRUE(store_.upsert(confirmed("0xabc", 11, "b11"), version, &version));
    EXPECT_EQ(version, 4u);
    EXPECT_EQ(stored("0xabc").block->block_id, "b11");
}

TEST_F(TransactionStoreTest, IllegalTransitionRejected) {
    ASSERT_TRUE(store_.insert(test::transaction("0xabc", State::Prepared)));

    EXPECT_FALSE(store_.upsert(confirmed("0xabc", 10, "b10"), 0));
    EXPECT_EQ(store_.last_error(), InvalidTransition);

    ASSERT_TRUE(store_.upsert(test::transaction("0xabc", State::Submitted), 0));
    ASSERT_TRUE(store_.upsert(test::transaction("0xabc", State::Dropped), 1));
    EXPECT_FALSE(store_.upsert(test::transaction("0xabc", State::Submitted), 2));
    EXPECT_EQ(store_.last_error(), InvalidTransition);

    const Transaction tx = stored("0xabc");
    EXPECT_EQ(tx.state, State::Dropped);
    EXPECT_EQ(tx.version, 2u);
}

TEST_F(TransactionStoreTest, InvalidRecords) {
    EXPECT_FALSE(store_.insert(test::transaction("", State::Prepared)));
    EXPECT_EQ(store_.last_error(), InvalidParameter);

    Transaction tx = test::transaction("0xabc", State::Prepared);
    tx.changes.push_back(test::change("w1", "0x01", "1.5"));
    EXPECT_FALSE(store_.insert(tx));
    EXPECT_EQ(store_.last_error(), InvalidParameter);

    Transaction no_block = test::transaction("0xabc", State::Confirmed);
    EXPECT_FALSE(store_.insert(no_block));
    EXPECT_EQ(store_.last_error(), InvalidTransition);

    EXPECT_FALSE(store_.getByTxId(Blockchain::Ethereum, "0xabc", nullptr));
}

TEST_F(TransactionStoreTest, WalletPagination) {
    // 7 changes of w1 over 4 transactions, one change of w2
    for (int i = 0; i < 4; ++i) {
        Transaction tx = test::transaction("tx" + std::to_string(i), State::Submitted);
        tx.changes.push_back(test::change("w1", "a" + std::to_string(i), "1"));
        if (i != 3) {
            tx.changes.push_back(test::change("w1", "b" + std::to_string(i), "2", Direction::Send));
        }
        if (i == 0) {
            tx.changes.push_back(test::change("w2", "c", "3"));
        }
        ASSERT_TRUE(store_.insert(tx));
    }

    const size_t page_size = 3;
    std::vector<std::tuple<uint32_t, std::string, uint32_t>> seen;
    std::string cursor;
    size_t pages = 0;
    do {
        Page<WalletEntry> page;
        ASSERT_TRUE(store_.listByWallet("w1", cursor, page_size, &page)) << store_.last_error_message();
        ++pages;
        ASSERT_LE(page.items.size(), page_size);
        for (const auto& entry : page.items) {
            EXPECT_EQ(entry.change_ref().wallet_id, "w1");
            auto position = std::make_tuple(entry.change_ref().entry_id, entry.transaction.tx_id, entry.change);
            // index order across page boundaries, no repeats
            if (!seen.empty()) {
                EXPECT_LT(seen.back(), position);
            }
            seen.push_back(std::move(position));
        }
        if (page.has_more()) {
            EXPECT_EQ(page.items.size(), page_size);
        }
        cursor = page.cursor;
    } while (!cursor.empty());

    EXPECT_EQ(seen.size(), 7u);
    EXPECT_EQ(pages, 3u);
}

TEST_F(TransactionStoreTest, ExactPageHasNoCursor) {
    for (int i = 0; i < 4; ++i) {
        Transaction tx = test::transaction("tx" + std::to_string(i), State::Submitted);
        tx.changes.push_back(test::change("w1", "a", "1"));
        ASSERT_TRUE(store_.insert(tx));
    }

    Page<WalletEntry> page;
    ASSERT_TRUE(store_.listByWallet("w1", "", 2, &page));
    ASSERT_TRUE(page.has_more());
    ASSERT_TRUE(store_.listByWallet("w1", page.cursor, 2, &page));
    EXPECT_EQ(page.items.size(), 2u);
    EXPECT_FALSE(page.has_more());

    ASSERT_TRUE(store_.listByWallet("nobody", "", 2, &page));
    EXPECT_TRUE(page.items.empty());
    EXPECT_FALSE(page.has_more());

    EXPECT_FALSE(store_.listByWallet("w1", "", 0, &page));
    EXPECT_EQ(store_.last_error(), InvalidParameter);
}

TEST_F(TransactionStoreTest, AddressListingOrderedByTime) {
    for (int i = 0; i < 3; ++i) {
        Transaction tx = test::transaction("tx" + std::to_string(i), State::Submitted);
        tx.since_timestamp = 3000 - i * 1000;
        tx.changes.push_back(test::change("w1", "0xaddr", "1"));
        // the same address twice gives one entry
        tx.changes.push_back(test::change("w2", "0xaddr", "1"));
        ASSERT_TRUE(store_.insert(tx));
    }

    Page<Transaction> page;
    ASSERT_TRUE(store_.listByAddress("0xaddr", "", 10, &page));
    ASSERT_EQ(page.items.size(), 3u);
    EXPECT_EQ(page.items[0].tx_id, "tx2");
    EXPECT_EQ(page.items[1].tx_id, "tx1");
    EXPECT_EQ(page.items[2].tx_id, "tx0");
    EXPECT_FALSE(page.has_more());
}

TEST_F(TransactionStoreTest, StaleIndexEntriesRemoved) {
    Transaction tx = test::transaction("0xabc", State::Submitted);
    tx.changes.push_back(test::change("w1", "0xold", "1"));
    tx.block = test::block(5, "b5");
    ASSERT_TRUE(store_.insert(tx));

    tx.changes[0].address = "0xnew";
    tx.changes[0].wallet_id = "w2";
    tx.block = test::block(6, "b6");
    ASSERT_TRUE(store_.upsert(tx, 0));

    Page<Transaction> by_address;
    ASSERT_TRUE(store_.listByAddress("0xold", "", 10, &by_address));
    EXPECT_TRUE(by_address.items.empty());
    ASSERT_TRUE(store_.listByAddress("0xnew", "", 10, &by_address));
    EXPECT_EQ(by_address.items.size(), 1u);

    Page<WalletEntry> by_wallet;
    ASSERT_TRUE(store_.listByWallet("w1", "", 10, &by_wallet));
    EXPECT_TRUE(by_wallet.items.empty());
    ASSERT_TRUE(store_.listByWallet("w2", "", 10, &by_wallet));
    EXPECT_EQ(by_wallet.items.size(), 1u);

    std::vector<Transaction> by_height;
    ASSERT_TRUE(store_.listByHeight(Blockchain::Ethereum, 5, 5, &by_height));
    EXPECT_TRUE(by_height.empty());
    ASSERT_TRUE(store_.listByHeight(Blockchain::Ethereum, 6, 6, &by_height));
    EXPECT_EQ(by_height.size(), 1u);

    EXPECT_TRUE(store_.verify()) << store_.last_error_message();
}

TEST_F(TransactionStoreTest, CursorRejections) {
    for (int i = 0; i < 3; ++i) {
        Transaction tx = test::transaction("tx" + std::to_string(i), State::Submitted);
        tx.changes.push_back(test::change("w1", "0xaddr", "1"));
        ASSERT_TRUE(store_.insert(tx));
    }

    Page<WalletEntry> page;
    ASSERT_TRUE(store_.listByWallet("w1", "", 1, &page));
    const std::string cursor = page.cursor;
    ASSERT_FALSE(cursor.empty());

    // another wallet
    EXPECT_FALSE(store_.listByWallet("w2", cursor, 1, &page));
    EXPECT_EQ(store_.last_error(), MalformedCursor);

    // another listing
    Page<Transaction> by_address;
    EXPECT_FALSE(store_.listByAddress("0xaddr", cursor, 1, &by_address));
    EXPECT_EQ(store_.last_error(), MalformedCursor);

    // tampered
    std::string tampered = cursor;
    tampered[4] = (tampered[4] == 'a') ? 'b' : 'a';
    EXPECT_FALSE(store_.listByWallet("w1", tampered, 1, &page));
    EXPECT_EQ(store_.last_error(), MalformedCursor);

    // still fresh
    ASSERT_TRUE(store_.listByWallet("w1", cursor, 1, &page));

    // older than the horizon
    advance(storage_.cursorLifetime() + 1);
    EXPECT_FALSE(store_.listByWallet("w1", cursor, 1, &page));
    EXPECT_EQ(store_.last_error(), StaleCursor);
}

TEST_F(TransactionStoreTest, CursorSurvivesRemovedPosition) {
    for (int i = 0; i < 3; ++i) {
        Transaction tx = test::transaction("tx" + std::to_string(i), State::Submitted);
        tx.changes.push_back(test::change("w1", "a", "1"));
        ASSERT_TRUE(store_.insert(tx));
    }

    Page<WalletEntry> page;
    ASSERT_TRUE(store_.listByWallet("w1", "", 1, &page));
    ASSERT_EQ(page.items.size(), 1u);
    EXPECT_EQ(page.items[0].transaction.tx_id, "tx0");

    ASSERT_TRUE(store_.prune(Blockchain::Ethereum, "tx0"));

    ASSERT_TRUE(store_.listByWallet("w1", page.cursor, 10, &page));
    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.items[0].transaction.tx_id, "tx1");
}

TEST_F(TransactionStoreTest, ListSince) {
    Transaction a = test::transaction("a", State::Submitted);
    a.since_timestamp = 100;
    Transaction b = confirmed("b", 1, "b1");
    b.since_timestamp = 50;
    b.confirm_timestamp = 200;
    Transaction c = test::transaction("c", State::Submitted);
    c.since_timestamp = 300;
    ASSERT_TRUE(store_.insert(a));
    ASSERT_TRUE(store_.insert(b));
    ASSERT_TRUE(store_.insert(c));

    std::vector<Transaction> result;
    ASSERT_TRUE(store_.listSince(100, &result));
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0].tx_id, "a");
    EXPECT_EQ(result[1].tx_id, "b");
    EXPECT_EQ(result[2].tx_id, "c");

    ASSERT_TRUE(store_.listSince(0, &result));
    // b appears once although indexed twice
    EXPECT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0].tx_id, "b");

    ASSERT_TRUE(store_.listSince(301, &result));
    EXPECT_TRUE(result.empty());
}

TEST_F(TransactionStoreTest, ListByHeight) {
    ASSERT_TRUE(store_.insert(confirmed("t10", 10, "b10")));
    ASSERT_TRUE(store_.insert(confirmed("t11", 11, "b11")));
    ASSERT_TRUE(store_.insert(confirmed("t12", 12, "b12")));
    Transaction other = confirmed("x11", 11, "x11");
    other.blockchain = Blockchain::EthereumClassic;
    ASSERT_TRUE(store_.insert(other));

    std::vector<Transaction> result;
    ASSERT_TRUE(store_.listByHeight(Blockchain::Ethereum, 11, 12, &result));
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].tx_id, "t11");
    EXPECT_EQ(result[1].tx_id, "t12");

    EXPECT_FALSE(store_.listByHeight(Blockchain::Ethereum, 12, 11, &result));
    EXPECT_EQ(store_.last_error(), InvalidParameter);
}

TEST_F(TransactionStoreTest, Prune) {
    Transaction tx = confirmed("0xabc", 3, "b3");
    tx.changes.push_back(test::change("w1", "0xaddr", "1"));
    ASSERT_TRUE(store_.insert(tx));

    TransactionMeta meta;
    meta.timestamp = 1;
    meta.blockchain = Blockchain::Ethereum;
    meta.tx_id = "0xabc";
    ASSERT_TRUE(store_.setMeta(meta));

    ASSERT_TRUE(store_.prune(Blockchain::Ethereum, "0xabc"));
    EXPECT_FALSE(store_.getByTxId(Blockchain::Ethereum, "0xabc", nullptr));
    EXPECT_FALSE(store_.getMeta(Blockchain::Ethereum, "0xabc", nullptr));
    EXPECT_EQ(store_.last_error(), NotFound);

    Page<WalletEntry> page;
    ASSERT_TRUE(store_.listByWallet("w1", "", 10, &page));
    EXPECT_TRUE(page.items.empty());
    EXPECT_TRUE(store_.verify());

    EXPECT_FALSE(store_.prune(Blockchain::Ethereum, "0xabc"));
    EXPECT_EQ(store_.last_error(), NotFound);
}

TEST_F(TransactionStoreTest, MetaLatestWins) {
    TransactionMeta meta;
    meta.timestamp = 10;
    meta.blockchain = Blockchain::Ethereum;
    meta.tx_id = "0xabc";
    meta.label = "first";
    ASSERT_TRUE(store_.setMeta(meta));

    meta.timestamp = 5;
    meta.label = "older";
    ASSERT_TRUE(store_.setMeta(meta));

    meta.timestamp = 10;
    meta.label = "same time";
    ASSERT_TRUE(store_.setMeta(meta));

    TransactionMeta read;
    ASSERT_TRUE(store_.getMeta(Blockchain::Ethereum, "0xabc", &read));
    EXPECT_EQ(read.label, "first");

    meta.timestamp = 11;
    meta.label = "newer";
    ASSERT_TRUE(store_.setMeta(meta));
    ASSERT_TRUE(store_.getMeta(Blockchain::Ethereum, "0xabc", &read));
    EXPECT_EQ(read.label, "newer");
}

TEST_F(TransactionStoreTest, RemoteCursor) {
    Cursor cursor;
    EXPECT_FALSE(store_.getRemoteCursor("0xaddr", &cursor));
    EXPECT_EQ(store_.last_error(), NotFound);

    ASSERT_TRUE(store_.setRemoteCursor("0xaddr", "page-7"));
    ASSERT_TRUE(store_.getRemoteCursor("0xaddr", &cursor));
    EXPECT_EQ(cursor.address, "0xaddr");
    EXPECT_EQ(cursor.value, "page-7");
    EXPECT_EQ(cursor.timestamp, now_.load());

    ASSERT_TRUE(store_.setRemoteCursor("0xaddr", ""));
    EXPECT_FALSE(store_.getRemoteCursor("0xaddr", &cursor));
    EXPECT_EQ(store_.last_error(), NotFound);

    EXPECT_FALSE(store_.setRemoteCursor("", "x"));
    EXPECT_EQ(store_.last_error(), InvalidParameter);
}

TEST_F(TransactionStoreTest, Reorg) {
    ASSERT_TRUE(store_.insert(confirmed("t9", 9, "b9")));
    ASSERT_TRUE(store_.insert(confirmed("t10", 10, "b10")));
    ASSERT_TRUE(store_.insert(confirmed("t10x", 10, "b10x")));
    ASSERT_TRUE(store_.insert(confirmed("t11", 11, "b11")));
    Transaction pending = test::transaction("t12", State::Submitted);
    pending.block = test::block(12, "b12");
    ASSERT_TRUE(store_.insert(pending));
    Transaction other = confirmed("x11", 11, "x11");
    other.blockchain = Blockchain::EthereumClassic;
    ASSERT_TRUE(store_.insert(other));

    size_t reverted = 0;
    ASSERT_TRUE(store_.applyReorg(Blockchain::Ethereum, 10, "b10", &reverted));
    EXPECT_EQ(reverted, 3u);

    EXPECT_EQ(stored("t9").state, State::Confirmed);
    EXPECT_EQ(stored("t10").state, State::Confirmed);
    EXPECT_EQ(stored("x11", Blockchain::EthereumClassic).state, State::Confirmed);

    for (const char* id : {"t10x", "t11", "t12"}) {
        const Transaction tx = stored(id);
        EXPECT_EQ(tx.state, State::Submitted) << id;
        EXPECT_FALSE(tx.block.has_value()) << id;
        EXPECT_EQ(tx.confirm_timestamp, 0u) << id;
        EXPECT_EQ(tx.version, 1u) << id;
    }

    std::vector<Transaction> by_height;
    ASSERT_TRUE(store_.listByHeight(Blockchain::Ethereum, 0, 100, &by_height));
    EXPECT_EQ(by_height.size(), 2u);
    EXPECT_TRUE(store_.verify()) << store_.last_error_message();

    // same best chain again changes nothing
    ASSERT_TRUE(store_.applyReorg(Blockchain::Ethereum, 10, "b10", &reverted));
    EXPECT_EQ(reverted, 0u);

    EXPECT_FALSE(store_.applyReorg(Blockchain::Ethereum, 10, "", &reverted));
    EXPECT_EQ(store_.last_error(), InvalidParameter);
}

TEST_F(TransactionStoreTest, VerifyDetectsMissingPrimary) {
    Transaction tx = test::transaction("0xabc", State::Submitted);
    tx.changes.push_back(test::change("w1", "0xaddr", "1"));
    ASSERT_TRUE(store_.insert(tx));
    ASSERT_TRUE(store_.verify());

    ASSERT_TRUE(storage_.database()->remove(KeyCodec::primaryKey(Blockchain::Ethereum, "0xabc")));
    EXPECT_FALSE(store_.verify());
    EXPECT_EQ(store_.last_error(), ConsistencyViolation);
}

TEST_F(TransactionStoreTest, VerifyDetectsMissingIndex) {
    Transaction tx = test::transaction("0xabc", State::Submitted);
    tx.changes.push_back(test::change("w1", "0xaddr", "1"));
    ASSERT_TRUE(store_.insert(tx));

    ASSERT_TRUE(storage_.database()->remove(KeyCodec::walletIndexKey("w1", 0, Blockchain::Ethereum, "0xabc", 0)));
    EXPECT_FALSE(store_.verify());
    EXPECT_EQ(store_.last_error(), ConsistencyViolation);
}

TEST_F(TransactionStoreTest, UndecodableRecord) {
    ASSERT_TRUE(storage_.database()->put(KeyCodec::primaryKey(Blockchain::Ethereum, "0xabc"), ws::Bytes{0xFF}));
    EXPECT_FALSE(store_.getByTxId(Blockchain::Ethereum, "0xabc", nullptr));
    EXPECT_EQ(store_.last_error(), MalformedValue);
    EXPECT_FALSE(store_.verify());
    EXPECT_EQ(store_.last_error(), MalformedValue);
}

TEST_F(TransactionStoreTest, IndexKeys) {
    Transaction tx = confirmed("0xabc", 7, "b7");
    tx.changes.push_back(test::change("w1", "0xaddr", "1"));
    tx.changes.push_back(test::change("w1", "0xaddr", "2"));
    tx.changes.push_back(test::change("", "0xother", "3"));

    const auto keys = index_keys(tx);
    // two wallet entries, two addresses, one height, since and confirm times
    EXPECT_EQ(keys.size(), 7u);
    EXPECT_EQ(keys.count(KeyCodec::heightIndexKey(Blockchain::Ethereum, 7, "0xabc")), 1u);
    EXPECT_EQ(keys.count(KeyCodec::walletIndexKey("w1", 0, Blockchain::Ethereum, "0xabc", 1)), 1u);
}

TEST_F(TransactionStoreTest, ClosedStorage) {
    storage_.close();
    EXPECT_FALSE(store_.insert(test::transaction("0xabc", State::Prepared)));
    EXPECT_EQ(store_.last_error(), NotOpen);
    EXPECT_FALSE(store_.getByTxId(Blockchain::Ethereum, "0xabc", nullptr));
    EXPECT_EQ(store_.last_error(), NotOpen);
    EXPECT_FALSE(store_.verify());
    EXPECT_EQ(store_.last_error(), NotOpen);
}

TEST_F(TransactionStoreTest, UpsertWithoutWalletKeepsListings) {
    Transaction tx = test::transaction("0xabc", State::Submitted);
    tx.changes.push_back(test::change("w1", "0xaddr", "10"));
    tx.changes.back().entry_id = 2;
    ASSERT_TRUE(store_.insert(tx));

    // a chain sync knows neither the wallet nor the first sight time
    Transaction update = test::transaction("0xabc", State::Submitted);
    update.since_timestamp = 0;
    update.sync_timestamp = 1500;
    update.changes.push_back(test::change("", "0xaddr", "10"));
    ASSERT_TRUE(store_.upsert(update, 0)) << store_.last_error_message();

    const Transaction merged = stored("0xabc");
    EXPECT_EQ(merged.since_timestamp, 1000u);
    EXPECT_EQ(merged.sync_timestamp, 1500u);
    ASSERT_EQ(merged.changes.size(), 1u);
    EXPECT_EQ(merged.changes[0].wallet_id, "w1");
    EXPECT_EQ(merged.changes[0].entry_id, 2u);

    Page<WalletEntry> by_wallet;
    ASSERT_TRUE(store_.listByWallet("w1", "", 10, &by_wallet));
    EXPECT_EQ(by_wallet.items.size(), 1u);

    std::vector<Transaction> since;
    ASSERT_TRUE(store_.listSince(1000, &since));
    EXPECT_EQ(since.size(), 1u);
    EXPECT_TRUE(store_.verify()) << store_.last_error_message();
}

TEST_F(TransactionStoreTest, UpsertKeepsLaterConfirmation) {
    ASSERT_TRUE(store_.insert(confirmed("0xabc", 10, "b10")));

    Transaction late = confirmed("0xabc", 10, "b10");
    late.confirm_timestamp = 1;
    ASSERT_TRUE(store_.upsert(late, 0));
    EXPECT_EQ(stored("0xabc").confirm_timestamp, 2010u);
}

TEST_F(TransactionStoreTest, QueryTimeWindow) {
    Transaction a = test::transaction("a", State::Submitted);
    a.since_timestamp = 100;
    Transaction b = test::transaction("b", State::Submitted);
    b.since_timestamp = 200;
    // first seen long ago, confirmed inside the window
    Transaction c = confirmed("c", 5, "b5");
    c.since_timestamp = 50;
    c.confirm_timestamp = 300;
    Transaction d = test::transaction("d", State::Submitted);
    d.since_timestamp = 400;
    for (const auto& tx : {a, b, c, d}) {
        ASSERT_TRUE(store_.insert(tx));
    }

    auto ids = [this](const TransactionFilter& filter) {
        Page<Transaction> page;
        EXPECT_TRUE(store_.query(filter, "", 10, &page)) << store_.last_error_message();
        EXPECT_FALSE(page.has_more());
        std::vector<std::string> result;
        for (const auto& tx : page.items) {
            result.push_back(tx.tx_id);
        }
        return result;
    };

    TransactionFilter filter;
    filter.after = 150;
    filter.before = 350;
    EXPECT_EQ(ids(filter), (std::vector<std::string>{"b", "c"}));

    filter.before.reset();
    EXPECT_EQ(ids(filter), (std::vector<std::string>{"b", "c", "d"}));

    filter.after.reset();
    filter.before = 150;
    EXPECT_EQ(ids(filter), (std::vector<std::string>{"c", "a"}));

    size_t count = 0;
    ASSERT_TRUE(store_.count(filter, &count));
    EXPECT_EQ(count, 2u);
}

TEST_F(TransactionStoreTest, QueryByWalletEntry) {
    Transaction tx1 = test::transaction("tx1", State::Submitted);
    tx1.changes.push_back(test::change("w1", "0x01", "1"));
    tx1.changes.back().entry_id = 1;
    tx1.changes.push_back(test::change("w1", "0x02", "2"));
    tx1.changes.back().entry_id = 2;
    Transaction tx2 = test::transaction("tx2", State::Submitted);
    tx2.changes.push_back(test::change("w1", "0x03", "3"));
    tx2.changes.back().entry_id = 2;
    Transaction tx3 = test::transaction("tx3", State::Submitted);
    tx3.changes.push_back(test::change("w2", "0x01", "4"));
    for (const auto& tx : {tx1, tx2, tx3}) {
        ASSERT_TRUE(store_.insert(tx));
    }

    TransactionFilter filter;
    filter.wallet_id = "w1";
    size_t count = 0;
    ASSERT_TRUE(store_.count(filter, &count));
    // tx1 has two entries of w1 and is counted once
    EXPECT_EQ(count, 2u);

    filter.entry_id = 2;
    Page<Transaction> page;
    ASSERT_TRUE(store_.query(filter, "", 10, &page));
    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.items[0].tx_id, "tx1");
    EXPECT_EQ(page.items[1].tx_id, "tx2");

    filter.entry_id = 1;
    ASSERT_TRUE(store_.count(filter, &count));
    EXPECT_EQ(count, 1u);

    filter.addresses = {"0x03"};
    ASSERT_TRUE(store_.count(filter, &count));
    EXPECT_EQ(count, 0u);

    filter.blockchains = {Blockchain::Goerli};
    filter.entry_id.reset();
    filter.addresses.clear();
    ASSERT_TRUE(store_.count(filter, &count));
    EXPECT_EQ(count, 0u);

    TransactionFilter entry_only;
    entry_only.entry_id = 1;
    EXPECT_FALSE(store_.query(entry_only, "", 10, &page));
    EXPECT_EQ(store_.last_error(), InvalidParameter);
}

TEST_F(TransactionStoreTest, QueryByAddresses) {
    for (int i = 0; i < 4; ++i) {
        Transaction tx = test::transaction("tx" + std::to_string(i), State::Submitted);
        tx.since_timestamp = 1000 + i;
        tx.changes.push_back(test::change("w1", "0x" + std::to_string(i), "1"));
        ASSERT_TRUE(store_.insert(tx));
    }

    TransactionFilter filter;
    filter.addresses = {"0x2"};
    Page<Transaction> page;
    ASSERT_TRUE(store_.query(filter, "", 10, &page));
    ASSERT_EQ(page.items.size(), 1u);
    EXPECT_EQ(page.items[0].tx_id, "tx2");

    filter.addresses = {"0x1", "0x3", "0xnone"};
    size_t count = 0;
    ASSERT_TRUE(store_.count(filter, &count));
    EXPECT_EQ(count, 2u);
}

TEST_F(TransactionStoreTest, QueryPages) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store_.insert(test::transaction("eth" + std::to_string(i), State::Submitted)));
    }
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(store_.insert(test::transaction("goerli" + std::to_string(i), State::Submitted, Blockchain::Goerli)));
    }
    ASSERT_TRUE(store_.insert(test::transaction("sepolia", State::Submitted, Blockchain::Sepolia)));

    TransactionFilter filter;
    filter.blockchains = {Blockchain::Goerli, Blockchain::Sepolia};

    std::vector<std::string> ids;
    std::string cursor;
    do {
        Page<Transaction> page;
        ASSERT_TRUE(store_.query(filter, cursor, 2, &page)) << store_.last_error_message();
        ASSERT_LE(page.items.size(), 2u);
        for (const auto& tx : page.items) {
            EXPECT_NE(tx.blockchain, Blockchain::Ethereum);
            ids.push_back(tx.tx_id);
        }
        cursor = page.cursor;
    } while (!cursor.empty());

    EXPECT_EQ(ids, (std::vector<std::string>{"goerli0", "goerli1", "goerli2", "sepolia"}));

    size_t count = 0;
    ASSERT_TRUE(store_.count(filter, &count));
    EXPECT_EQ(count, 4u);
    ASSERT_TRUE(store_.count(TransactionFilter(), &count));
    EXPECT_EQ(count, 9u);

    // a cursor only continues the query that issued it
    Page<Transaction> page;
    ASSERT_TRUE(store_.query(filter, "", 2, &page));
    ASSERT_TRUE(page.has_more());
    TransactionFilter other = filter;
    other.blockchains = {Blockchain::Goerli};
    EXPECT_FALSE(store_.query(other, page.cursor, 2, &page));
    EXPECT_EQ(store_.last_error(), MalformedCursor);

    EXPECT_FALSE(store_.query(filter, "", 0, &page));
    EXPECT_EQ(store_.last_error(), InvalidParameter);
}
