#include <wsdb/transaction.hpp>

#include <algorithm>
#include <iterator>

#include "record_fields.hpp"

namespace wsdb {

namespace {
enum BlockRefField : priv::field_id_t {
    BlockHeight = 1,
    BlockId = 2,
    BlockTimestamp = 3,
};

enum ChangeField : priv::field_id_t {
    ChangeWalletId = 1,
    ChangeEntryId = 2,
    ChangeAddress = 3,
    ChangeHdPath = 4,
    ChangeAsset = 5,
    ChangeAmount = 6,
    ChangeKind = 7,
    ChangeDirection = 8,
};

// ids are never reused; a retired field keeps its number reserved
enum TransactionField : priv::field_id_t {
    TxBlockchain = 1,
    TxId = 2,
    TxSinceTimestamp = 3,
    TxSyncTimestamp = 4,
    TxConfirmTimestamp = 5,
    TxState = 6,
    TxBlock = 7,
    TxStatus = 8,
    TxChanges = 9,
    TxVersion = 10,
    TxBlockPos = 11,
    TxOwn = 12,
};

enum MetaField : priv::field_id_t {
    MetaTimestamp = 1,
    MetaBlockchain = 2,
    MetaTxId = 3,
    MetaLabel = 4,
    MetaRaw = 5,
};
}  // namespace

const char* to_string(State state) {
    switch (state) {
        case State::Prepared:
            return "PREPARED";
        case State::Submitted:
            return "SUBMITTED";
        case State::Replaced:
            return "REPLACED";
        case State::Confirmed:
            return "CONFIRMED";
        case State::Dropped:
            return "DROPPED";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, State state) {
    os << to_string(state);
    if (!lifecycle::is_known(state)) {
        os << '(' << static_cast<uint32_t>(state) << ')';
    }
    return os;
}

bool BlockRef::operator==(const BlockRef& other) const {
    return height == other.height && block_id == other.block_id && timestamp == other.timestamp;
}

void BlockRef::put(priv::obstream& os) const {
    priv::field_writer writer(os);
    writer.put(BlockHeight, height);
    writer.put(BlockId, block_id);
    writer.put(BlockTimestamp, timestamp);
}

bool BlockRef::get(priv::ibstream& is) {
    priv::field_reader reader(is);
    priv::field_id_t id;
    while (reader.next(id)) {
        bool ok = false;
        switch (id) {
            case BlockHeight:
                ok = reader.get(height);
                break;
            case BlockId:
                ok = reader.get(block_id);
                break;
            case BlockTimestamp:
                ok = reader.get(timestamp);
                break;
            default:
                ok = reader.skip();
                break;
        }
        if (!ok) {
            return false;
        }
    }
    return !reader.failed();
}

bool Change::operator==(const Change& other) const {
    return wallet_id == other.wallet_id && entry_id == other.entry_id && address == other.address && hd_path == other.hd_path &&
           asset == other.asset && amount == other.amount && change_type == other.change_type && direction == other.direction;
}

void Change::put(priv::obstream& os) const {
    priv::field_writer writer(os);
    writer.put(ChangeWalletId, wallet_id);
    writer.put(ChangeEntryId, entry_id);
    writer.put(ChangeAddress, address);
    writer.put(ChangeHdPath, hd_path);
    writer.put(ChangeAsset, asset);
    writer.put(ChangeAmount, amount);
    writer.put(ChangeKind, change_type);
    writer.put(ChangeDirection, direction);
}

bool Change::get(priv::ibstream& is) {
    priv::field_reader reader(is);
    priv::field_id_t id;
    while (reader.next(id)) {
        bool ok = false;
        switch (id) {
            case ChangeWalletId:
                ok = reader.get(wallet_id);
                break;
            case ChangeEntryId:
                ok = reader.get(entry_id);
                break;
            case ChangeAddress:
                ok = reader.get(address);
                break;
            case ChangeHdPath:
                ok = reader.get(hd_path);
                break;
            case ChangeAsset:
                ok = reader.get(asset);
                break;
            case ChangeAmount:
                ok = reader.get(amount);
                break;
            case ChangeKind:
                ok = reader.get(change_type);
                break;
            case ChangeDirection:
                ok = reader.get(direction);
                break;
            default:
                ok = reader.skip();
                break;
        }
        if (!ok) {
            return false;
        }
    }
    return !reader.failed();
}

bool Transaction::is_own() const {
    if (own) {
        return *own;
    }
    return std::any_of(changes.cbegin(), changes.cend(), [](const Change& c) { return c.direction == Direction::Send; });
}

bool Transaction::operator==(const Transaction& other) const {
    return blockchain == other.blockchain && tx_id == other.tx_id && own == other.own && since_timestamp == other.since_timestamp &&
           sync_timestamp == other.sync_timestamp && confirm_timestamp == other.confirm_timestamp && state == other.state &&
           block == other.block && block_pos == other.block_pos && status == other.status && changes == other.changes &&
           version == other.version;
}

void Transaction::put(priv::obstream& os) const {
    priv::field_writer writer(os);
    writer.put(TxBlockchain, blockchain);
    writer.put(TxId, tx_id);
    writer.put(TxSinceTimestamp, since_timestamp);
    writer.put(TxSyncTimestamp, sync_timestamp);
    writer.put(TxConfirmTimestamp, confirm_timestamp);
    writer.put(TxState, state);
    writer.put(TxBlock, block);
    writer.put(TxStatus, status);
    writer.put(TxChanges, changes);
    writer.put(TxVersion, version);
    writer.put(TxBlockPos, block_pos);
    writer.put(TxOwn, own);
}

bool Transaction::get(priv::ibstream& is) {
    priv::field_reader reader(is);
    priv::field_id_t id;
    while (reader.next(id)) {
        bool ok = false;
        switch (id) {
            case TxBlockchain:
                ok = reader.get(blockchain);
                break;
            case TxId:
                ok = reader.get(tx_id);
                break;
            case TxSinceTimestamp:
                ok = reader.get(since_timestamp);
                break;
            case TxSyncTimestamp:
                ok = reader.get(sync_timestamp);
                break;
            case TxConfirmTimestamp:
                ok = reader.get(confirm_timestamp);
                break;
            case TxState:
                ok = reader.get(state);
                break;
            case TxBlock:
                ok = reader.get(block);
                break;
            case TxStatus:
                ok = reader.get(status);
                break;
            case TxChanges:
                ok = reader.get(changes);
                break;
            case TxVersion:
                ok = reader.get(version);
                break;
            case TxBlockPos:
                ok = reader.get(block_pos);
                break;
            case TxOwn:
                ok = reader.get(own);
                break;
            default:
                ok = reader.skip();
                break;
        }
        if (!ok) {
            return false;
        }
    }
    return !reader.failed();
}

ws::Bytes Transaction::to_binary() const {
    priv::obstream os;
    os.put(*this);
    return os.buffer();
}

bool Transaction::from_binary(const ws::Bytes& data, Transaction& result) {
    Transaction tx;
    priv::ibstream is(data);
    if (!is.get(tx)) {
        return false;
    }
    result = std::move(tx);
    return true;
}

void TransactionMeta::put(priv::obstream& os) const {
    priv::field_writer writer(os);
    writer.put(MetaTimestamp, timestamp);
    writer.put(MetaBlockchain, blockchain);
    writer.put(MetaTxId, tx_id);
    writer.put(MetaLabel, label);
    writer.put(MetaRaw, raw);
}

bool TransactionMeta::get(priv::ibstream& is) {
    priv::field_reader reader(is);
    priv::field_id_t id;
    while (reader.next(id)) {
        bool ok = false;
        switch (id) {
            case MetaTimestamp:
                ok = reader.get(timestamp);
                break;
            case MetaBlockchain:
                ok = reader.get(blockchain);
                break;
            case MetaTxId:
                ok = reader.get(tx_id);
                break;
            case MetaLabel:
                ok = reader.get(label);
                break;
            case MetaRaw:
                ok = reader.get(raw);
                break;
            default:
                ok = reader.skip();
                break;
        }
        if (!ok) {
            return false;
        }
    }
    return !reader.failed();
}

ws::Bytes TransactionMeta::to_binary() const {
    priv::obstream os;
    os.put(*this);
    return os.buffer();
}

bool TransactionMeta::from_binary(const ws::Bytes& data, TransactionMeta& result) {
    TransactionMeta meta;
    priv::ibstream is(data);
    if (!is.get(meta)) {
        return false;
    }
    result = std::move(meta);
    return true;
}

namespace lifecycle {

bool is_known(State state) {
    switch (state) {
        case State::Prepared:
        case State::Submitted:
        case State::Replaced:
        case State::Confirmed:
        case State::Dropped:
            return true;
    }
    return false;
}

bool is_terminal(State state) {
    return state == State::Replaced || state == State::Dropped;
}

namespace {
bool reject(std::string* reason, const std::string& message) {
    if (nullptr != reason) {
        *reason = message;
    }
    return false;
}

std::string code(State state) {
    return std::to_string(static_cast<uint32_t>(state));
}
}  // namespace

bool block_consistent(const Transaction& tx, std::string* reason) {
    switch (tx.state) {
        case State::Prepared:
        case State::Replaced:
        case State::Dropped:
            if (tx.block) {
                return reject(reason, std::string(to_string(tx.state)) + " transaction must not carry a block reference");
            }
            return true;
        case State::Confirmed:
            if (!tx.block) {
                return reject(reason, "CONFIRMED transaction requires a block reference");
            }
            return true;
        case State::Submitted:
            return true;
    }
    return reject(reason, "unknown state code " + code(tx.state));
}

bool transition_allowed(const Transaction& stored, const Transaction& incoming, std::string* reason) {
    const State from = stored.state;
    const State to = incoming.state;

    if (!is_known(from)) {
        return reject(reason, "stored state code " + code(from) + " is not known, record is read only");
    }
    if (!is_known(to)) {
        return reject(reason, "unknown state code " + code(to));
    }

    bool allowed = false;
    switch (from) {
        case State::Prepared:
            allowed = (to == State::Prepared || to == State::Submitted);
            break;
        case State::Submitted:
            allowed = (to == State::Submitted || to == State::Confirmed || to == State::Replaced || to == State::Dropped);
            break;
        case State::Confirmed:
            if (to == State::Confirmed) {
                if (incoming.block != stored.block) {
                    return reject(reason, "CONFIRMED rewrite must keep the block reference");
                }
                allowed = true;
            }
            else if (to == State::Submitted) {
                // reversal is only legal when the recorded block is abandoned
                if (incoming.block && incoming.block == stored.block) {
                    return reject(reason, "CONFIRMED -> SUBMITTED requires a different or no block reference");
                }
                allowed = true;
            }
            else {
                allowed = (to == State::Dropped);
            }
            break;
        case State::Replaced:
        case State::Dropped:
            return reject(reason, std::string(to_string(from)) + " is terminal");
    }

    if (!allowed) {
        return reject(reason, std::string(to_string(from)) + " -> " + to_string(to) + " is not allowed");
    }
    return true;
}

namespace {
bool is_fee(const Change& change) {
    return change.change_type == ChangeType::Fee;
}

bool similar(const Change& a, const Change& b) {
    return a.amount == b.amount && a.direction == b.direction && a.asset == b.asset && a.address == b.address;
}
}  // namespace

Transaction merge(const Transaction& stored, const Transaction& incoming) {
    Transaction result = incoming;

    if (result.since_timestamp == 0) {
        result.since_timestamp = stored.since_timestamp;
    }
    // a reversal clears the confirmation together with the block
    const bool reversed = stored.block && !incoming.block;
    if (!reversed) {
        result.confirm_timestamp = std::max(stored.confirm_timestamp, incoming.confirm_timestamp);
    }

    std::vector<bool> used(stored.changes.size(), false);
    bool has_fee = false;
    for (auto& change : result.changes) {
        if (is_fee(change)) {
            has_fee = true;
            continue;
        }
        for (size_t i = 0; i < stored.changes.size(); ++i) {
            const Change& candidate = stored.changes[i];
            if (used[i] || is_fee(candidate) || !similar(change, candidate)) {
                continue;
            }
            used[i] = true;
            if (change.wallet_id.empty()) {
                change.wallet_id = candidate.wallet_id;
                change.entry_id = candidate.entry_id;
            }
            break;
        }
    }

    if (!has_fee) {
        std::copy_if(stored.changes.begin(), stored.changes.end(), std::back_inserter(result.changes), is_fee);
    }
    return result;
}

}  // namespace lifecycle

}  // namespace wsdb
