/**
 * @file keys.hpp
 */

#ifndef _WSDB_KEYS_HPP_INCLUDED_
#define _WSDB_KEYS_HPP_INCLUDED_

#include <string>

#include <wsdb/types.hpp>

namespace wsdb {

struct PrimaryKeyParts {
    Blockchain blockchain = Blockchain::Unspecified;
    std::string tx_id;
};

struct WalletIndexParts {
    std::string wallet_id;
    uint32_t entry_id = 0;
    Blockchain blockchain = Blockchain::Unspecified;
    std::string tx_id;
    uint32_t change = 0;
};

struct AddressIndexParts {
    std::string address;
    ws::Timestamp timestamp = 0;
    Blockchain blockchain = Blockchain::Unspecified;
    std::string tx_id;
};

struct HeightIndexParts {
    Blockchain blockchain = Blockchain::Unspecified;
    uint64_t height = 0;
    std::string tx_id;
};

struct TimeIndexParts {
    ws::Timestamp timestamp = 0;
    Blockchain blockchain = Blockchain::Unspecified;
    std::string tx_id;
};

struct AllowanceKeyParts {
    Blockchain blockchain = Blockchain::Unspecified;
    std::string token;
    std::string owner;
    std::string spender;
};

struct BalanceKeyParts {
    std::string address;
    Blockchain blockchain = Blockchain::Unspecified;
    std::string asset;
};

/**
 * @brief Composite, order preserving keys of every table.
 *
 * A key is a table tag followed by its components. Strings are written with
 * 0x00 escaped as 0x00 0xFF and closed by 0x00 0x01, so a string sorts
 * before all of its extensions and no two keys collide. Integers are fixed
 * width big endian, so bytewise order equals numeric order.
 *
 * Parsers return false when the key belongs to another table or is
 * damaged; stores report that as MalformedKey.
 */
class KeyCodec {
public:
    static ws::Bytes primaryKey(Blockchain blockchain, const std::string& tx_id);
    static ws::Bytes primaryPrefix();
    static bool parsePrimaryKey(const ws::Bytes& key, PrimaryKeyParts* parts);

    static ws::Bytes metaKey(Blockchain blockchain, const std::string& tx_id);

    static ws::Bytes walletIndexKey(const std::string& wallet_id, uint32_t entry_id, Blockchain blockchain, const std::string& tx_id,
                                    uint32_t change);
    static ws::Bytes walletIndexPrefix(const std::string& wallet_id);
    static ws::Bytes walletIndexPrefix();
    static bool parseWalletIndexKey(const ws::Bytes& key, WalletIndexParts* parts);

    static ws::Bytes addressIndexKey(const std::string& address, ws::Timestamp timestamp, Blockchain blockchain, const std::string& tx_id);
    static ws::Bytes addressIndexPrefix(const std::string& address);
    static ws::Bytes addressIndexPrefix();
    static bool parseAddressIndexKey(const ws::Bytes& key, AddressIndexParts* parts);

    static ws::Bytes heightIndexKey(Blockchain blockchain, uint64_t height, const std::string& tx_id);
    static ws::Bytes heightIndexStart(Blockchain blockchain, uint64_t height);
    static ws::Bytes heightIndexPrefix(Blockchain blockchain);
    static ws::Bytes heightIndexPrefix();
    static bool parseHeightIndexKey(const ws::Bytes& key, HeightIndexParts* parts);

    static ws::Bytes timeIndexKey(ws::Timestamp timestamp, Blockchain blockchain, const std::string& tx_id);
    static ws::Bytes timeIndexStart(ws::Timestamp timestamp);
    static ws::Bytes timeIndexPrefix();
    static bool parseTimeIndexKey(const ws::Bytes& key, TimeIndexParts* parts);

    static ws::Bytes allowanceKey(Blockchain blockchain, const std::string& token, const std::string& owner, const std::string& spender);
    static ws::Bytes allowancePrefix();
    static bool parseAllowanceKey(const ws::Bytes& key, AllowanceKeyParts* parts);

    static ws::Bytes balanceKey(const std::string& address, Blockchain blockchain, const std::string& asset);
    static ws::Bytes balancePrefix(const std::string& address);
    static bool parseBalanceKey(const ws::Bytes& key, BalanceKeyParts* parts);

    static ws::Bytes remoteCursorKey(const std::string& address);

    static ws::Bytes versionKey();

    static bool hasPrefix(const ws::Bytes& key, const ws::Bytes& prefix);
};

}  // namespace wsdb

#endif  // _WSDB_KEYS_HPP_INCLUDED_
