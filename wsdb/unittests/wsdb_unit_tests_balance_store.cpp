#include <wsdb/balance_store.hpp>

#include <gtest/gtest.h>

#include <wsdb/keys.hpp>
#include <wsdb/storage.hpp>

#include "wsdb_unit_tests_environment.hpp"

using namespace wsdb;

class BalanceStoreTest : public StorageTestBase {
protected:
    BalanceStoreTest()
    : StorageTestBase("wsdb_balance_store_unittests") {
    }

    static Balance balance(const std::string& address, const std::string& asset, const std::string& amount, ws::Timestamp timestamp) {
        Balance b;
        b.address = address;
        b.blockchain = Blockchain::Ethereum;
        b.asset = asset;
        b.amount = amount;
        b.timestamp = timestamp;
        return b;
    }

    BalanceStore store_{storage_};
};

TEST_F(BalanceStoreTest, UpsertAndGet) {
    bool replaced = false;
    ASSERT_TRUE(store_.upsert(balance("0xaddr", "ETH", "100", 10), &replaced));
    EXPECT_TRUE(replaced);

    Balance read;
    ASSERT_TRUE(store_.get("0xaddr", Blockchain::Ethereum, "ETH", &read));
    EXPECT_EQ(read, balance("0xaddr", "ETH", "100", 10));

    EXPECT_FALSE(store_.get("0xaddr", Blockchain::Ethereum, "USDT", &read));
    EXPECT_EQ(store_.last_error(), NotFound);
    EXPECT_FALSE(store_.get("0xaddr", Blockchain::EthereumClassic, "ETH", &read));
    EXPECT_EQ(store_.last_error(), NotFound);
}

TEST_F(BalanceStoreTest, LatestWins) {
    ASSERT_TRUE(store_.upsert(balance("0xaddr", "ETH", "100", 10)));

    bool replaced = true;
    ASSERT_TRUE(store_.upsert(balance("0xaddr", "ETH", "50", 9), &replaced));
    EXPECT_FALSE(replaced);
    ASSERT_TRUE(store_.upsert(balance("0xaddr", "ETH", "60", 10), &replaced));
    EXPECT_FALSE(replaced);

    Balance read;
    ASSERT_TRUE(store_.get("0xaddr", Blockchain::Ethereum, "ETH", &read));
    EXPECT_EQ(read.amount, "100");

    ASSERT_TRUE(store_.upsert(balance("0xaddr", "ETH", "70", 11), &replaced));
    EXPECT_TRUE(replaced);
    ASSERT_TRUE(store_.get("0xaddr", Blockchain::Ethereum, "ETH", &read));
    EXPECT_EQ(read.amount, "70");
}

TEST_F(BalanceStoreTest, UtxoMustSumToAmount) {
    Balance b = balance("1BitcoinAddr", "BTC", "150", 10);
    b.blockchain = Blockchain::Bitcoin;
    b.utxo.push_back(Utxo{"tx1", 0, 100});
    b.utxo.push_back(Utxo{"tx2", 1, 40});

    EXPECT_FALSE(store_.upsert(b));
    EXPECT_EQ(store_.last_error(), ConsistencyViolation);
    EXPECT_FALSE(store_.get("1BitcoinAddr", Blockchain::Bitcoin, "BTC", nullptr));

    b.utxo.back().amount = 50;
    ASSERT_TRUE(store_.upsert(b)) << store_.last_error_message();

    Balance read;
    ASSERT_TRUE(store_.get("1BitcoinAddr", Blockchain::Bitcoin, "BTC", &read));
    ASSERT_EQ(read.utxo.size(), 2u);
    EXPECT_EQ(read.utxo[1], (Utxo{"tx2", 1, 50}));
}

TEST_F(BalanceStoreTest, InvalidParameters) {
    EXPECT_FALSE(store_.upsert(balance("", "ETH", "1", 1)));
    EXPECT_EQ(store_.last_error(), InvalidParameter);

    EXPECT_FALSE(store_.upsert(balance("addr\xC3\xA9", "ETH", "1", 1)));
    EXPECT_EQ(store_.last_error(), InvalidParameter);

    EXPECT_FALSE(store_.upsert(balance("0xaddr", "ETH", "-1", 1)));
    EXPECT_EQ(store_.last_error(), InvalidParameter);

    EXPECT_FALSE(store_.upsert(balance("0xaddr", "ETH", "", 1)));
    EXPECT_EQ(store_.last_error(), InvalidParameter);
}

TEST_F(BalanceStoreTest, ListAndClear) {
    ASSERT_TRUE(store_.upsert(balance("0xaddr", "USDT", "5", 1)));
    ASSERT_TRUE(store_.upsert(balance("0xaddr", "ETH", "1", 1)));
    ASSERT_TRUE(store_.upsert(balance("0xaddr2", "ETH", "2", 1)));

    std::vector<Balance> balances;
    ASSERT_TRUE(store_.list("0xaddr", &balances));
    ASSERT_EQ(balances.size(), 2u);
    EXPECT_EQ(balances[0].asset, "ETH");
    EXPECT_EQ(balances[1].asset, "USDT");

    size_t removed = 0;
    ASSERT_TRUE(store_.clear("0xaddr", &removed));
    EXPECT_EQ(removed, 2u);
    ASSERT_TRUE(store_.list("0xaddr", &balances));
    EXPECT_TRUE(balances.empty());

    ASSERT_TRUE(store_.list("0xaddr2", &balances));
    EXPECT_EQ(balances.size(), 1u);
}

TEST_F(BalanceStoreTest, UndecodableValue) {
    ASSERT_TRUE(storage_.database()->put(KeyCodec::balanceKey("0xaddr", Blockchain::Ethereum, "ETH"), ws::Bytes{0xFF}));
    EXPECT_FALSE(store_.get("0xaddr", Blockchain::Ethereum, "ETH", nullptr));
    EXPECT_EQ(store_.last_error(), MalformedValue);
    EXPECT_FALSE(store_.upsert(balance("0xaddr", "ETH", "1", 100)));
    EXPECT_EQ(store_.last_error(), MalformedValue);
}

TEST_F(BalanceStoreTest, ClosedStorage) {
    storage_.close();
    EXPECT_FALSE(store_.upsert(balance("0xaddr", "ETH", "1", 1)));
    EXPECT_EQ(store_.last_error(), NotOpen);
}
