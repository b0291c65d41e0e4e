#include <wsdb/allowance_store.hpp>

#include <gtest/gtest.h>

#include <wsdb/keys.hpp>
#include <wsdb/storage.hpp>

#include "wsdb_unit_tests_environment.hpp"

using namespace wsdb;

namespace {
const std::string kToken = "0xdac17f958d2ee523a2206206994597c13d831ec7";
const std::string kOwner = "0x1111111111111111111111111111111111111111";
const std::string kSpender = "0x2222222222222222222222222222222222222222";
const std::string kSpender2 = "0x3333333333333333333333333333333333333333";
}  // namespace

class AllowanceStoreTest : public StorageTestBase {
protected:
    AllowanceStoreTest()
    : StorageTestBase("wsdb_allowance_store_unittests") {
    }

    Allowance allowance(const std::string& spender, ws::Duration ttl, const std::string& wallet_id = "w1") {
        Allowance a;
        a.timestamp = now_.load();
        a.ttl = ttl;
        a.wallet_id = wallet_id;
        a.blockchain = Blockchain::Ethereum;
        a.token = kToken;
        a.owner = kOwner;
        a.spender = spender;
        a.amount = "1000";
        return a;
    }

    AllowanceStore store_{storage_};
};

TEST_F(AllowanceStoreTest, UpsertAndGet) {
    bool stored = false;
    ASSERT_TRUE(store_.upsert(allowance(kSpender, 60000), &stored));
    EXPECT_TRUE(stored);

    Allowance read;
    ASSERT_TRUE(store_.get(Blockchain::Ethereum, kToken, kOwner, kSpender, &read));
    EXPECT_EQ(read, allowance(kSpender, 60000));

    EXPECT_FALSE(store_.get(Blockchain::Ethereum, kToken, kOwner, kSpender2, &read));
    EXPECT_EQ(store_.last_error(), NotFound);
}

TEST_F(AllowanceStoreTest, ExpiresOnRead) {
    ASSERT_TRUE(store_.upsert(allowance(kSpender, 1000)));

    advance(1000);
    EXPECT_TRUE(store_.get(Blockchain::Ethereum, kToken, kOwner, kSpender, nullptr));

    advance(1);
    EXPECT_FALSE(store_.get(Blockchain::Ethereum, kToken, kOwner, kSpender, nullptr));
    EXPECT_EQ(store_.last_error(), NotFound);

    // still physically present until purged
    EXPECT_TRUE(storage_.database()->get(KeyCodec::allowanceKey(Blockchain::Ethereum, kToken, kOwner, kSpender)));
}

TEST_F(AllowanceStoreTest, ExpiredUpsertIsSkipped) {
    Allowance stale = allowance(kSpender, 1000);
    stale.timestamp = now_.load() - 2000;

    bool stored = true;
    ASSERT_TRUE(store_.upsert(stale, &stored));
    EXPECT_FALSE(stored);
    EXPECT_FALSE(store_.get(Blockchain::Ethereum, kToken, kOwner, kSpender, nullptr));
    EXPECT_EQ(store_.last_error(), NotFound);
}

TEST_F(AllowanceStoreTest, DefaultsAndCap) {
    Allowance a = allowance(kSpender, 0);
    a.timestamp = 0;
    ASSERT_TRUE(store_.upsert(a));

    Allowance read;
    ASSERT_TRUE(store_.get(Blockchain::Ethereum, kToken, kOwner, kSpender, &read));
    EXPECT_EQ(read.timestamp, now_.load());
    EXPECT_EQ(read.ttl, Storage::kDefaultAllowanceTtl);

    ASSERT_TRUE(store_.upsert(allowance(kSpender2, 365ull * 24 * 60 * 60 * 1000)));
    ASSERT_TRUE(store_.get(Blockchain::Ethereum, kToken, kOwner, kSpender2, &read));
    EXPECT_EQ(read.ttl, Storage::kMaxAllowanceTtl);
}

TEST_F(AllowanceStoreTest, InvalidParameters) {
    Allowance a = allowance(kSpender, 1000);
    a.token = "0x123";
    EXPECT_FALSE(store_.upsert(a));
    EXPECT_EQ(store_.last_error(), InvalidParameter);

    a = allowance("2222222222222222222222222222222222222222xx", 1000);
    EXPECT_FALSE(store_.upsert(a));
    EXPECT_EQ(store_.last_error(), InvalidParameter);

    a = allowance(kSpender, 1000);
    a.owner[5] = 'g';
    EXPECT_FALSE(store_.upsert(a));
    EXPECT_EQ(store_.last_error(), InvalidParameter);

    a = allowance(kSpender, 1000, "");
    EXPECT_FALSE(store_.upsert(a));
    EXPECT_EQ(store_.last_error(), InvalidParameter);
}

TEST_F(AllowanceStoreTest, ListByWallet) {
    ASSERT_TRUE(store_.upsert(allowance(kSpender, 1000, "w1")));
    ASSERT_TRUE(store_.upsert(allowance(kSpender2, 5000, "w2")));

    std::vector<Allowance> result;
    ASSERT_TRUE(store_.list("w1", &result));
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].spender, kSpender);

    ASSERT_TRUE(store_.list("", &result));
    EXPECT_EQ(result.size(), 2u);

    advance(2000);
    ASSERT_TRUE(store_.list("", &result));
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].wallet_id, "w2");
}

TEST_F(AllowanceStoreTest, RemoveFiltered) {
    ASSERT_TRUE(store_.upsert(allowance(kSpender, 60000, "w1")));
    advance(10);
    ASSERT_TRUE(store_.upsert(allowance(kSpender2, 60000, "w1")));
    Allowance classic = allowance(kSpender, 60000, "w1");
    classic.blockchain = Blockchain::EthereumClassic;
    ASSERT_TRUE(store_.upsert(classic));
    ASSERT_TRUE(store_.upsert(allowance(kOwner, 60000, "w2")));

    size_t removed = 0;
    // only entries persisted before the second upsert
    ASSERT_TRUE(store_.remove("w1", Blockchain::Ethereum, now_.load(), &removed));
    EXPECT_EQ(removed, 1u);
    EXPECT_TRUE(store_.get(Blockchain::Ethereum, kToken, kOwner, kSpender2, nullptr));

    ASSERT_TRUE(store_.remove("w1", std::nullopt, std::nullopt, &removed));
    EXPECT_EQ(removed, 2u);

    std::vector<Allowance> result;
    ASSERT_TRUE(store_.list("", &result));
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].wallet_id, "w2");

    EXPECT_FALSE(store_.remove("", std::nullopt, std::nullopt, &removed));
    EXPECT_EQ(store_.last_error(), InvalidParameter);
}

TEST_F(AllowanceStoreTest, Purge) {
    ASSERT_TRUE(store_.upsert(allowance(kSpender, 1000)));
    ASSERT_TRUE(store_.upsert(allowance(kSpender2, 60000)));
    ASSERT_TRUE(storage_.database()->put(KeyCodec::allowanceKey(Blockchain::Ethereum, kToken, kOwner, kOwner), ws::Bytes{0xFF}));

    advance(2000);
    size_t removed = 0;
    ASSERT_TRUE(store_.purge(&removed));
    EXPECT_EQ(removed, 2u);

    ASSERT_TRUE(store_.purge(&removed));
    EXPECT_EQ(removed, 0u);
    EXPECT_TRUE(store_.get(Blockchain::Ethereum, kToken, kOwner, kSpender2, nullptr));
}

TEST_F(AllowanceStoreTest, ExpiryNearEndOfRange) {
    Allowance a = allowance(kSpender, 60000);
    a.timestamp = UINT64_MAX - 10;
    EXPECT_FALSE(a.is_expired(now_.load()));
    EXPECT_FALSE(a.is_expired(UINT64_MAX));

    a.timestamp = 0;
    a.ttl = UINT64_MAX;
    EXPECT_FALSE(a.is_expired(UINT64_MAX));
    a.ttl = 5;
    EXPECT_FALSE(a.is_expired(5));
    EXPECT_TRUE(a.is_expired(6));

    // a clock skewed far ahead must not make the record look expired
    bool stored = false;
    Allowance skewed = allowance(kSpender, 60000);
    skewed.timestamp = UINT64_MAX - 10;
    ASSERT_TRUE(store_.upsert(skewed, &stored));
    EXPECT_TRUE(stored);
    EXPECT_TRUE(store_.get(Blockchain::Ethereum, kToken, kOwner, kSpender, nullptr));

    size_t removed = 1;
    ASSERT_TRUE(store_.purge(&removed));
    EXPECT_EQ(removed, 0u);
}
