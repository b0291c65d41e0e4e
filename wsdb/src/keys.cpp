#include <wsdb/keys.hpp>

#include <algorithm>
#include <cstring>

#include <boost/endian/conversion.hpp>

namespace wsdb {

namespace {
const char* const kPrimaryTable = "tx";
const char* const kMetaTable = "txmeta";
const char* const kWalletIndex = "idx:wallet";
const char* const kAddressIndex = "idx:address";
const char* const kHeightIndex = "idx:height";
const char* const kTimeIndex = "idx:time";
const char* const kAllowanceTable = "allowance";
const char* const kBalanceTable = "balance";
const char* const kRemoteCursorTable = "cursor";
const char* const kVersionTable = "version";

constexpr uint8_t kEscape = 0x00;
constexpr uint8_t kEscapedZero = 0xFF;
constexpr uint8_t kTerminator = 0x01;

class KeyWriter {
public:
    explicit KeyWriter(const char* table) {
        str(table);
    }

    KeyWriter& str(const std::string& value) {
        for (char c : value) {
            const auto b = static_cast<uint8_t>(c);
            key_.push_back(b);
            if (b == kEscape) {
                key_.push_back(kEscapedZero);
            }
        }
        key_.push_back(kEscape);
        key_.push_back(kTerminator);
        return *this;
    }

    template <typename T>
    KeyWriter& num(T value) {
        const T be = boost::endian::native_to_big(value);
        const auto data = reinterpret_cast<const uint8_t*>(&be);
        key_.insert(key_.end(), data, data + sizeof(be));
        return *this;
    }

    KeyWriter& chain(Blockchain blockchain) {
        return num(static_cast<uint32_t>(blockchain));
    }

    const ws::Bytes& bytes() const {
        return key_;
    }

private:
    ws::Bytes key_;
};

class KeyReader {
public:
    KeyReader(const ws::Bytes& key, const char* table)
    : key_(key) {
        std::string tag;
        ok_ = str(tag) && tag == table;
    }

    bool str(std::string& value) {
        if (!ok_) {
            return false;
        }
        std::string res;
        while (pos_ < key_.size()) {
            const uint8_t b = key_[pos_++];
            if (b != kEscape) {
                res.push_back(static_cast<char>(b));
                continue;
            }
            if (pos_ >= key_.size()) {
                break;
            }
            const uint8_t next = key_[pos_++];
            if (next == kTerminator) {
                value = std::move(res);
                return true;
            }
            if (next != kEscapedZero) {
                break;
            }
            res.push_back('\0');
        }
        ok_ = false;
        return false;
    }

    template <typename T>
    bool num(T& value) {
        if (!ok_ || key_.size() - pos_ < sizeof(T)) {
            ok_ = false;
            return false;
        }
        T be;
        std::memcpy(&be, key_.data() + pos_, sizeof(T));
        pos_ += sizeof(T);
        value = boost::endian::big_to_native(be);
        return true;
    }

    bool chain(Blockchain& blockchain) {
        uint32_t code = 0;
        if (!num(code)) {
            return false;
        }
        blockchain = static_cast<Blockchain>(code);
        return true;
    }

    bool done() const {
        return ok_ && pos_ == key_.size();
    }

private:
    const ws::Bytes& key_;
    size_t pos_ = 0;
    bool ok_ = true;
};
}  // namespace

ws::Bytes KeyCodec::primaryKey(Blockchain blockchain, const std::string& tx_id) {
    return KeyWriter(kPrimaryTable).chain(blockchain).str(tx_id).bytes();
}

ws::Bytes KeyCodec::primaryPrefix() {
    return KeyWriter(kPrimaryTable).bytes();
}

bool KeyCodec::parsePrimaryKey(const ws::Bytes& key, PrimaryKeyParts* parts) {
    PrimaryKeyParts res;
    KeyReader reader(key, kPrimaryTable);
    if (!reader.chain(res.blockchain) || !reader.str(res.tx_id) || !reader.done()) {
        return false;
    }
    if (nullptr != parts) {
        *parts = std::move(res);
    }
    return true;
}

ws::Bytes KeyCodec::metaKey(Blockchain blockchain, const std::string& tx_id) {
    return KeyWriter(kMetaTable).chain(blockchain).str(tx_id).bytes();
}

ws::Bytes KeyCodec::walletIndexKey(const std::string& wallet_id, uint32_t entry_id, Blockchain blockchain, const std::string& tx_id,
                                   uint32_t change) {
    return KeyWriter(kWalletIndex).str(wallet_id).num(entry_id).chain(blockchain).str(tx_id).num(change).bytes();
}

ws::Bytes KeyCodec::walletIndexPrefix(const std::string& wallet_id) {
    return KeyWriter(kWalletIndex).str(wallet_id).bytes();
}

ws::Bytes KeyCodec::walletIndexPrefix() {
    return KeyWriter(kWalletIndex).bytes();
}

bool KeyCodec::parseWalletIndexKey(const ws::Bytes& key, WalletIndexParts* parts) {
    WalletIndexParts res;
    KeyReader reader(key, kWalletIndex);
    if (!reader.str(res.wallet_id) || !reader.num(res.entry_id) || !reader.chain(res.blockchain) || !reader.str(res.tx_id) ||
        !reader.num(res.change) || !reader.done()) {
        return false;
    }
    if (nullptr != parts) {
        *parts = std::move(res);
    }
    return true;
}

ws::Bytes KeyCodec::addressIndexKey(const std::string& address, ws::Timestamp timestamp, Blockchain blockchain, const std::string& tx_id) {
    return KeyWriter(kAddressIndex).str(address).num(timestamp).chain(blockchain).str(tx_id).bytes();
}

ws::Bytes KeyCodec::addressIndexPrefix(const std::string& address) {
    return KeyWriter(kAddressIndex).str(address).bytes();
}

ws::Bytes KeyCodec::addressIndexPrefix() {
    return KeyWriter(kAddressIndex).bytes();
}

bool KeyCodec::parseAddressIndexKey(const ws::Bytes& key, AddressIndexParts* parts) {
    AddressIndexParts res;
    KeyReader reader(key, kAddressIndex);
    if (!reader.str(res.address) || !reader.num(res.timestamp) || !reader.chain(res.blockchain) || !reader.str(res.tx_id) ||
        !reader.done()) {
        return false;
    }
    if (nullptr != parts) {
        *parts = std::move(res);
    }
    return true;
}

ws::Bytes KeyCodec::heightIndexKey(Blockchain blockchain, uint64_t height, const std::string& tx_id) {
    return KeyWriter(kHeightIndex).chain(blockchain).num(height).str(tx_id).bytes();
}

ws::Bytes KeyCodec::heightIndexStart(Blockchain blockchain, uint64_t height) {
    return KeyWriter(kHeightIndex).chain(blockchain).num(height).bytes();
}

ws::Bytes KeyCodec::heightIndexPrefix(Blockchain blockchain) {
    return KeyWriter(kHeightIndex).chain(blockchain).bytes();
}

ws::Bytes KeyCodec::heightIndexPrefix() {
    return KeyWriter(kHeightIndex).bytes();
}

bool KeyCodec::parseHeightIndexKey(const ws::Bytes& key, HeightIndexParts* parts) {
    HeightIndexParts res;
    KeyReader reader(key, kHeightIndex);
    if (!reader.chain(res.blockchain) || !reader.num(res.height) || !reader.str(res.tx_id) || !reader.done()) {
        return false;
    }
    if (nullptr != parts) {
        *parts = std::move(res);
    }
    return true;
}

ws::Bytes KeyCodec::timeIndexKey(ws::Timestamp timestamp, Blockchain blockchain, const std::string& tx_id) {
    return KeyWriter(kTimeIndex).num(timestamp).chain(blockchain).str(tx_id).bytes();
}

ws::Bytes KeyCodec::timeIndexStart(ws::Timestamp timestamp) {
    return KeyWriter(kTimeIndex).num(timestamp).bytes();
}

ws::Bytes KeyCodec::timeIndexPrefix() {
    return KeyWriter(kTimeIndex).bytes();
}

bool KeyCodec::parseTimeIndexKey(const ws::Bytes& key, TimeIndexParts* parts) {
    TimeIndexParts res;
    KeyReader reader(key, kTimeIndex);
    if (!reader.num(res.timestamp) || !reader.chain(res.blockchain) || !reader.str(res.tx_id) || !reader.done()) {
        return false;
    }
    if (nullptr != parts) {
        *parts = std::move(res);
    }
    return true;
}

ws::Bytes KeyCodec::allowanceKey(Blockchain blockchain, const std::string& token, const std::string& owner, const std::string& spender) {
    return KeyWriter(kAllowanceTable).chain(blockchain).str(token).str(owner).str(spender).bytes();
}

ws::Bytes KeyCodec::allowancePrefix() {
    return KeyWriter(kAllowanceTable).bytes();
}

bool KeyCodec::parseAllowanceKey(const ws::Bytes& key, AllowanceKeyParts* parts) {
    AllowanceKeyParts res;
    KeyReader reader(key, kAllowanceTable);
    if (!reader.chain(res.blockchain) || !reader.str(res.token) || !reader.str(res.owner) || !reader.str(res.spender) || !reader.done()) {
        return false;
    }
    if (nullptr != parts) {
        *parts = std::move(res);
    }
    return true;
}

ws::Bytes KeyCodec::balanceKey(const std::string& address, Blockchain blockchain, const std::string& asset) {
    return KeyWriter(kBalanceTable).str(address).chain(blockchain).str(asset).bytes();
}

ws::Bytes KeyCodec::balancePrefix(const std::string& address) {
    return KeyWriter(kBalanceTable).str(address).bytes();
}

bool KeyCodec::parseBalanceKey(const ws::Bytes& key, BalanceKeyParts* parts) {
    BalanceKeyParts res;
    KeyReader reader(key, kBalanceTable);
    if (!reader.str(res.address) || !reader.chain(res.blockchain) || !reader.str(res.asset) || !reader.done()) {
        return false;
    }
    if (nullptr != parts) {
        *parts = std::move(res);
    }
    return true;
}

ws::Bytes KeyCodec::remoteCursorKey(const std::string& address) {
    return KeyWriter(kRemoteCursorTable).str(address).bytes();
}

ws::Bytes KeyCodec::versionKey() {
    return KeyWriter(kVersionTable).bytes();
}

bool KeyCodec::hasPrefix(const ws::Bytes& key, const ws::Bytes& prefix) {
    return key.size() >= prefix.size() && std::equal(prefix.cbegin(), prefix.cend(), key.cbegin());
}

}  // namespace wsdb
