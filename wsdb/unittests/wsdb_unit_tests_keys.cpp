#include <wsdb/keys.hpp>

#include <algorithm>
#include <vector>

#include <gtest/gtest.h>

using namespace wsdb;

class KeyCodecTest : public ::testing::Test {};

TEST_F(KeyCodecTest, PrimaryKeyParse) {
    const ws::Bytes key = KeyCodec::primaryKey(Blockchain::Ethereum, "0xabc");
    PrimaryKeyParts parts;
    ASSERT_TRUE(KeyCodec::parsePrimaryKey(key, &parts));
    EXPECT_EQ(parts.blockchain, Blockchain::Ethereum);
    EXPECT_EQ(parts.tx_id, "0xabc");
    EXPECT_TRUE(KeyCodec::hasPrefix(key, KeyCodec::primaryPrefix()));
}

TEST_F(KeyCodecTest, EmbeddedZeroBytes) {
    const std::string id("a\0b\0", 4);
    const ws::Bytes key = KeyCodec::primaryKey(Blockchain::Bitcoin, id);
    PrimaryKeyParts parts;
    ASSERT_TRUE(KeyCodec::parsePrimaryKey(key, &parts));
    EXPECT_EQ(parts.tx_id, id);
}

TEST_F(KeyCodecTest, StringSortsBeforeItsExtensions) {
    const ws::Bytes a = KeyCodec::primaryKey(Blockchain::Ethereum, "a");
    const ws::Bytes a0 = KeyCodec::primaryKey(Blockchain::Ethereum, std::string("a\0", 2));
    const ws::Bytes ab = KeyCodec::primaryKey(Blockchain::Ethereum, "ab");
    const ws::Bytes b = KeyCodec::primaryKey(Blockchain::Ethereum, "b");
    EXPECT_LT(a, a0);
    EXPECT_LT(a0, ab);
    EXPECT_LT(ab, b);
}

TEST_F(KeyCodecTest, WalletPrefixDoesNotMatchLongerWallet) {
    const ws::Bytes key = KeyCodec::walletIndexKey("wallet10", 0, Blockchain::Ethereum, "tx", 0);
    EXPECT_FALSE(KeyCodec::hasPrefix(key, KeyCodec::walletIndexPrefix("wallet1")));
    EXPECT_TRUE(KeyCodec::hasPrefix(key, KeyCodec::walletIndexPrefix("wallet10")));
    EXPECT_TRUE(KeyCodec::hasPrefix(key, KeyCodec::walletIndexPrefix()));
}

TEST_F(KeyCodecTest, WalletIndexOrder) {
    std::vector<ws::Bytes> keys{
        KeyCodec::walletIndexKey("w", 0, Blockchain::Ethereum, "tx1", 0),
        KeyCodec::walletIndexKey("w", 0, Blockchain::Ethereum, "tx1", 1),
        KeyCodec::walletIndexKey("w", 0, Blockchain::Ethereum, "tx2", 0),
        KeyCodec::walletIndexKey("w", 1, Blockchain::Bitcoin, "tx0", 0),
        KeyCodec::walletIndexKey("w", 256, Blockchain::Bitcoin, "tx0", 0),
    };
    EXPECT_TRUE(std::is_sorted(keys.begin(), keys.end()));

    WalletIndexParts parts;
    ASSERT_TRUE(KeyCodec::parseWalletIndexKey(keys[4], &parts));
    EXPECT_EQ(parts.wallet_id, "w");
    EXPECT_EQ(parts.entry_id, 256u);
    EXPECT_EQ(parts.blockchain, Blockchain::Bitcoin);
    EXPECT_EQ(parts.tx_id, "tx0");
    EXPECT_EQ(parts.change, 0u);
}

TEST_F(KeyCodecTest, AddressIndexOrderedByTime) {
    const ws::Bytes early = KeyCodec::addressIndexKey("addr", 255, Blockchain::Ethereum, "z");
    const ws::Bytes late = KeyCodec::addressIndexKey("addr", 256, Blockchain::Ethereum, "a");
    EXPECT_LT(early, late);

    AddressIndexParts parts;
    ASSERT_TRUE(KeyCodec::parseAddressIndexKey(late, &parts));
    EXPECT_EQ(parts.address, "addr");
    EXPECT_EQ(parts.timestamp, 256u);
    EXPECT_EQ(parts.tx_id, "a");
}

TEST_F(KeyCodecTest, HeightIndexRange) {
    const ws::Bytes start = KeyCodec::heightIndexStart(Blockchain::Ethereum, 100);
    const ws::Bytes below = KeyCodec::heightIndexKey(Blockchain::Ethereum, 99, "tx");
    const ws::Bytes at = KeyCodec::heightIndexKey(Blockchain::Ethereum, 100, "tx");
    const ws::Bytes other = KeyCodec::heightIndexKey(Blockchain::EthereumClassic, 1, "tx");

    EXPECT_LT(below, start);
    EXPECT_LE(start, at);
    EXPECT_TRUE(KeyCodec::hasPrefix(at, KeyCodec::heightIndexPrefix(Blockchain::Ethereum)));
    EXPECT_FALSE(KeyCodec::hasPrefix(other, KeyCodec::heightIndexPrefix(Blockchain::Ethereum)));

    HeightIndexParts parts;
    ASSERT_TRUE(KeyCodec::parseHeightIndexKey(at, &parts));
    EXPECT_EQ(parts.height, 100u);
}

TEST_F(KeyCodecTest, TimeIndex) {
    const ws::Bytes key = KeyCodec::timeIndexKey(1234, Blockchain::Goerli, "tx");
    EXPECT_LE(KeyCodec::timeIndexStart(1234), key);
    EXPECT_LT(key, KeyCodec::timeIndexStart(1235));

    TimeIndexParts parts;
    ASSERT_TRUE(KeyCodec::parseTimeIndexKey(key, &parts));
    EXPECT_EQ(parts.timestamp, 1234u);
    EXPECT_EQ(parts.blockchain, Blockchain::Goerli);
}

TEST_F(KeyCodecTest, AllowanceAndBalance) {
    AllowanceKeyParts allowance;
    ASSERT_TRUE(KeyCodec::parseAllowanceKey(KeyCodec::allowanceKey(Blockchain::Ethereum, "t", "o", "s"), &allowance));
    EXPECT_EQ(allowance.token, "t");
    EXPECT_EQ(allowance.owner, "o");
    EXPECT_EQ(allowance.spender, "s");

    BalanceKeyParts balance;
    const ws::Bytes key = KeyCodec::balanceKey("addr", Blockchain::Bitcoin, "BTC");
    ASSERT_TRUE(KeyCodec::parseBalanceKey(key, &balance));
    EXPECT_EQ(balance.address, "addr");
    EXPECT_EQ(balance.blockchain, Blockchain::Bitcoin);
    EXPECT_EQ(balance.asset, "BTC");
    EXPECT_TRUE(KeyCodec::hasPrefix(key, KeyCodec::balancePrefix("addr")));
}

TEST_F(KeyCodecTest, TablesAreDisjoint) {
    const ws::Bytes primary = KeyCodec::primaryKey(Blockchain::Ethereum, "tx");
    const ws::Bytes meta = KeyCodec::metaKey(Blockchain::Ethereum, "tx");
    EXPECT_NE(primary, meta);
    EXPECT_FALSE(KeyCodec::hasPrefix(meta, KeyCodec::primaryPrefix()));
    EXPECT_FALSE(KeyCodec::parsePrimaryKey(meta, nullptr));
    EXPECT_FALSE(KeyCodec::parseWalletIndexKey(primary, nullptr));
    EXPECT_FALSE(KeyCodec::parseBalanceKey(KeyCodec::remoteCursorKey("addr"), nullptr));
}

TEST_F(KeyCodecTest, DamagedKeys) {
    ws::Bytes key = KeyCodec::primaryKey(Blockchain::Ethereum, "tx");

    ws::Bytes truncated(key.begin(), key.end() - 1);
    EXPECT_FALSE(KeyCodec::parsePrimaryKey(truncated, nullptr));

    ws::Bytes trailing = key;
    trailing.push_back(0x42);
    EXPECT_FALSE(KeyCodec::parsePrimaryKey(trailing, nullptr));

    ws::Bytes bad_escape = key;
    bad_escape[bad_escape.size() - 1] = 0x07;
    EXPECT_FALSE(KeyCodec::parsePrimaryKey(bad_escape, nullptr));

    EXPECT_FALSE(KeyCodec::parsePrimaryKey(ws::Bytes{}, nullptr));
    EXPECT_FALSE(KeyCodec::parseHeightIndexKey(KeyCodec::heightIndexStart(Blockchain::Ethereum, 1), nullptr));
}
