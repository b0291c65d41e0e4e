#include <wsdb/transaction_store.hpp>

#include <algorithm>
#include <limits>
#include <mutex>
#include <sstream>

#include <lib/system/logger.hpp>

#include <wsdb/internal/utils.hpp>
#include <wsdb/keys.hpp>
#include <wsdb/storage.hpp>

namespace wsdb {

namespace {
const std::string kWalletScope = "wallet:";
const std::string kAddressScope = "address:";
const std::string kQueryScope = "query:";

enum class QuerySource {
    Wallet,
    Address,
    Time,
    Primary,
};

bool wallet_match(const TransactionFilter& filter, const Change& change) {
    return change.wallet_id == filter.wallet_id && (!filter.entry_id || change.entry_id == *filter.entry_id);
}

// earliest nonzero timestamp of tx at or after the lower bound
ws::Timestamp first_timestamp(const Transaction& tx, ws::Timestamp after) {
    ws::Timestamp result = 0;
    for (ws::Timestamp ts : {tx.since_timestamp, tx.confirm_timestamp}) {
        if (ts != 0 && ts >= after && (result == 0 || ts < result)) {
            result = ts;
        }
    }
    return result;
}

// cursors of one query are not accepted by another
std::string query_scope(const TransactionFilter& filter) {
    std::ostringstream os;
    os << kQueryScope;
    for (Blockchain blockchain : filter.blockchains) {
        os << static_cast<uint32_t>(blockchain) << ',';
    }
    os << '|' << (filter.after ? std::to_string(*filter.after) : "-");
    os << '|' << (filter.before ? std::to_string(*filter.before) : "-");
    os << '|' << filter.wallet_id.size() << ':' << filter.wallet_id;
    os << '|' << (filter.entry_id ? std::to_string(*filter.entry_id) : "-");
    for (const auto& address : filter.addresses) {
        os << '|' << address.size() << ':' << address;
    }
    return os.str();
}

ws::Timestamp address_timestamp(const Transaction& tx) {
    return tx.since_timestamp != 0 ? tx.since_timestamp : tx.confirm_timestamp;
}

std::string describe(const Transaction& tx) {
    std::ostringstream os;
    os << tx.blockchain << '/' << tx.tx_id;
    return os.str();
}
}  // namespace

std::set<ws::Bytes> index_keys(const Transaction& tx) {
    std::set<ws::Bytes> keys;

    for (size_t i = 0; i < tx.changes.size(); ++i) {
        const Change& change = tx.changes[i];
        if (!change.wallet_id.empty()) {
            keys.insert(KeyCodec::walletIndexKey(change.wallet_id, change.entry_id, tx.blockchain, tx.tx_id, static_cast<uint32_t>(i)));
        }
        if (!change.address.empty()) {
            keys.insert(KeyCodec::addressIndexKey(change.address, address_timestamp(tx), tx.blockchain, tx.tx_id));
        }
    }

    if (tx.block) {
        keys.insert(KeyCodec::heightIndexKey(tx.blockchain, tx.block->height, tx.tx_id));
    }

    if (tx.since_timestamp != 0) {
        keys.insert(KeyCodec::timeIndexKey(tx.since_timestamp, tx.blockchain, tx.tx_id));
    }
    if (tx.confirm_timestamp != 0) {
        keys.insert(KeyCodec::timeIndexKey(tx.confirm_timestamp, tx.blockchain, tx.tx_id));
    }

    return keys;
}

TransactionStore::TransactionStore(Storage& storage)
: ErrorHolder("TransactionStore")
, storage_(storage)
, cursors_(static_cast<uint8_t>(Storage::kSchemaVersion)) {
}

std::shared_ptr<Database> TransactionStore::database() {
    auto db = storage_.database();
    if (!db) {
        set_last_error(NotOpen);
    }
    return db;
}

bool TransactionStore::validate(const Transaction& tx) {
    if (tx.tx_id.empty()) {
        set_last_error(InvalidParameter, "Transaction id is empty");
        return false;
    }
    for (const auto& change : tx.changes) {
        if (!change.amount.empty() && !internal::is_decimal(change.amount)) {
            set_last_error(InvalidParameter, "Transaction %s: change amount \"%s\" is not a decimal number", describe(tx).c_str(),
                           change.amount.c_str());
            return false;
        }
    }

    std::string reason;
    if (!lifecycle::block_consistent(tx, &reason)) {
        set_last_error(InvalidTransition, "Transaction %s: %s", describe(tx).c_str(), reason.c_str());
        return false;
    }
    return true;
}

bool TransactionStore::load(Database& db, const ws::Bytes& key, Transaction* tx, bool* found, const Database::SnapshotPtr& snapshot) {
    ws::Bytes value;
    if (!db.get(key, &value, snapshot)) {
        if (db.last_error() == Database::NotFound) {
            *found = false;
            return true;
        }
        set_last_error(DatabaseError, "Read failed: %s", db.last_error_message().c_str());
        return false;
    }

    if (!Transaction::from_binary(value, *tx)) {
        set_last_error(MalformedValue, "Transaction record %s cannot be decoded", internal::to_hex(key).c_str());
        return false;
    }
    *found = true;
    return true;
}

void TransactionStore::stage(Database::Batch& batch, const Transaction* stored, const Transaction& updated) {
    const ws::Bytes primary = KeyCodec::primaryKey(updated.blockchain, updated.tx_id);
    const std::set<ws::Bytes> fresh = index_keys(updated);

    if (nullptr != stored) {
        for (const auto& key : index_keys(*stored)) {
            if (fresh.count(key) == 0) {
                batch.remove(key);
            }
        }
    }

    batch.put(primary, updated.to_binary());

    for (const auto& key : fresh) {
        batch.put(key, primary);
    }
}

bool TransactionStore::commit(Database& db, const Database::Batch& batch) {
    if (!db.write_batch(batch)) {
        set_last_error(DatabaseError, "Batch of %zu operations failed: %s", batch.size(), db.last_error_message().c_str());
        return false;
    }
    return true;
}

bool TransactionStore::write(const Transaction& tx, uint64_t expected_version, bool create_only, uint64_t* new_version) {
    if (!validate(tx)) {
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    const ws::Bytes key = KeyCodec::primaryKey(tx.blockchain, tx.tx_id);
    std::lock_guard<std::mutex> lock(storage_.stripe(key));

    Transaction stored;
    bool found = false;
    if (!load(*db, key, &stored, &found)) {
        return false;
    }

    const uint64_t current = found ? stored.version : 0;
    if (create_only && found) {
        set_last_error(VersionConflict, "Transaction %s already exists with version %llu", describe(tx).c_str(),
                       static_cast<unsigned long long>(current));
        return false;
    }
    if (!create_only && expected_version != current) {
        set_last_error(VersionConflict, "Transaction %s: expected version %llu, stored %llu", describe(tx).c_str(),
                       static_cast<unsigned long long>(expected_version), static_cast<unsigned long long>(current));
        return false;
    }

    std::string reason;
    if (found && !lifecycle::transition_allowed(stored, tx, &reason)) {
        set_last_error(InvalidTransition, "Transaction %s: %s", describe(tx).c_str(), reason.c_str());
        return false;
    }

    Transaction updated = found ? lifecycle::merge(stored, tx) : tx;
    updated.version = create_only ? 0 : current + 1;

    Database::Batch batch;
    stage(batch, found ? &stored : nullptr, updated);
    if (!commit(*db, batch)) {
        return false;
    }

    wsdebug() << "TransactionStore> " << describe(updated) << " stored, version " << updated.version << ", " << updated.state;
    if (nullptr != new_version) {
        *new_version = updated.version;
    }
    set_last_error();
    return true;
}

bool TransactionStore::insert(const Transaction& tx) {
    return write(tx, 0, true, nullptr);
}

bool TransactionStore::upsert(const Transaction& tx, uint64_t expected_version, uint64_t* new_version) {
    return write(tx, expected_version, false, new_version);
}

bool TransactionStore::getByTxId(Blockchain blockchain, const std::string& tx_id, Transaction* result) {
    if (tx_id.empty()) {
        set_last_error(InvalidParameter, "Transaction id is empty");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    Transaction tx;
    bool found = false;
    if (!load(*db, KeyCodec::primaryKey(blockchain, tx_id), &tx, &found)) {
        return false;
    }
    if (!found) {
        set_last_error(NotFound, "Transaction %s/%s is not found", to_string(blockchain), tx_id.c_str());
        return false;
    }

    if (nullptr != result) {
        *result = std::move(tx);
    }
    set_last_error();
    return true;
}

bool TransactionStore::openCursor(const std::string& scope, const std::string& token, const ws::Bytes& prefix, ws::Bytes* position) {
    Cursor cursor;
    if (!cursors_.decode(token, &cursor)) {
        set_last_error(cursors_.last_error(), cursors_.last_error_message());
        return false;
    }

    if (cursor.address != scope) {
        set_last_error(MalformedCursor, "Cursor belongs to another listing");
        return false;
    }

    ws::Bytes pos(cursor.value.begin(), cursor.value.end());
    if (!KeyCodec::hasPrefix(pos, prefix)) {
        set_last_error(MalformedCursor, "Cursor position is outside of the listing");
        return false;
    }

    const ws::Timestamp now = storage_.now();
    const ws::Duration lifetime = storage_.cursorLifetime();
    if (now > lifetime && cursor.timestamp < now - lifetime) {
        set_last_error(StaleCursor, "Cursor issued at %llu is older than %llu ms", static_cast<unsigned long long>(cursor.timestamp),
                       static_cast<unsigned long long>(lifetime));
        return false;
    }

    *position = std::move(pos);
    return true;
}

std::string TransactionStore::issueCursor(const std::string& scope, const ws::Bytes& position) {
    Cursor cursor;
    cursor.address = scope;
    cursor.value.assign(position.begin(), position.end());
    cursor.timestamp = storage_.now();
    return cursors_.encode(cursor);
}

bool TransactionStore::scanPage(const std::string& scope, const ws::Bytes& prefix, const ws::Bytes& start, const std::string& token,
                                size_t page_size, const Visitor& visit, std::string* next_cursor) {
    if (page_size == 0) {
        set_last_error(InvalidParameter, "Page size must be positive");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    ws::Bytes position = start;
    const bool resume = !token.empty();
    if (resume && !openCursor(scope, token, prefix, &position)) {
        return false;
    }

    auto snapshot = db->new_snapshot();
    auto it = snapshot ? db->new_iterator(snapshot) : nullptr;
    if (!it) {
        set_last_error(DatabaseError, "Cannot read index: %s", db->last_error_message().c_str());
        return false;
    }

    it->seek(position);
    if (resume && it->is_valid() && it->key() == position) {
        it->next();
    }

    size_t count = 0;
    ws::Bytes last;
    for (; it->is_valid() && count < page_size; it->next()) {
        ws::Bytes key = it->key();
        if (!KeyCodec::hasPrefix(key, prefix)) {
            break;
        }
        bool taken = false;
        if (!visit(*db, snapshot, key, &taken)) {
            return false;
        }
        last = std::move(key);
        if (taken) {
            ++count;
        }
    }

    next_cursor->clear();
    if (count == page_size && it->is_valid() && KeyCodec::hasPrefix(it->key(), prefix)) {
        *next_cursor = issueCursor(scope, last);
    }
    return true;
}

bool TransactionStore::listByWallet(const std::string& wallet_id, const std::string& cursor, size_t page_size, Page<WalletEntry>* page) {
    if (wallet_id.empty()) {
        set_last_error(InvalidParameter, "Wallet id is empty");
        return false;
    }

    Page<WalletEntry> result;
    auto visit = [this, &result](Database& db, const Database::SnapshotPtr& snapshot, const ws::Bytes& key, bool* taken) {
        WalletIndexParts parts;
        if (!KeyCodec::parseWalletIndexKey(key, &parts)) {
            set_last_error(MalformedKey, "Wallet index key %s cannot be parsed", internal::to_hex(key).c_str());
            return false;
        }

        WalletEntry entry;
        bool found = false;
        if (!load(db, KeyCodec::primaryKey(parts.blockchain, parts.tx_id), &entry.transaction, &found, snapshot)) {
            return false;
        }
        if (!found || parts.change >= entry.transaction.changes.size()) {
            set_last_error(ConsistencyViolation, "Wallet index entry of %s has no matching transaction change", parts.tx_id.c_str());
            return false;
        }
        entry.change = parts.change;
        result.items.push_back(std::move(entry));
        *taken = true;
        return true;
    };

    const ws::Bytes prefix = KeyCodec::walletIndexPrefix(wallet_id);
    if (!scanPage(kWalletScope + wallet_id, prefix, prefix, cursor, page_size, visit, &result.cursor)) {
        return false;
    }

    if (nullptr != page) {
        *page = std::move(result);
    }
    set_last_error();
    return true;
}

bool TransactionStore::listByAddress(const std::string& address, const std::string& cursor, size_t page_size, Page<Transaction>* page) {
    if (address.empty()) {
        set_last_error(InvalidParameter, "Address is empty");
        return false;
    }

    Page<Transaction> result;
    auto visit = [this, &result](Database& db, const Database::SnapshotPtr& snapshot, const ws::Bytes& key, bool* taken) {
        AddressIndexParts parts;
        if (!KeyCodec::parseAddressIndexKey(key, &parts)) {
            set_last_error(MalformedKey, "Address index key %s cannot be parsed", internal::to_hex(key).c_str());
            return false;
        }

        Transaction tx;
        bool found = false;
        if (!load(db, KeyCodec::primaryKey(parts.blockchain, parts.tx_id), &tx, &found, snapshot)) {
            return false;
        }
        if (!found) {
            set_last_error(ConsistencyViolation, "Address index entry of %s has no primary record", parts.tx_id.c_str());
            return false;
        }
        result.items.push_back(std::move(tx));
        *taken = true;
        return true;
    };

    const ws::Bytes prefix = KeyCodec::addressIndexPrefix(address);
    if (!scanPage(kAddressScope + address, prefix, prefix, cursor, page_size, visit, &result.cursor)) {
        return false;
    }

    if (nullptr != page) {
        *page = std::move(result);
    }
    set_last_error();
    return true;
}

bool TransactionFilter::matches(const Transaction& tx) const {
    if (!blockchains.empty() && std::find(blockchains.begin(), blockchains.end(), tx.blockchain) == blockchains.end()) {
        return false;
    }

    const ws::Timestamp since = tx.since_timestamp;
    const ws::Timestamp confirm = tx.confirm_timestamp;
    if (after && !((since != 0 && since >= *after) || (confirm != 0 && confirm >= *after))) {
        return false;
    }
    if (before && !((since != 0 && since <= *before) || (confirm != 0 && confirm <= *before))) {
        return false;
    }

    if (!wallet_id.empty() &&
        std::none_of(tx.changes.begin(), tx.changes.end(), [this](const Change& change) { return wallet_match(*this, change); })) {
        return false;
    }
    if (!addresses.empty() && std::none_of(tx.changes.begin(), tx.changes.end(), [this](const Change& change) {
            return std::find(addresses.begin(), addresses.end(), change.address) != addresses.end();
        })) {
        return false;
    }
    return true;
}

bool TransactionStore::scanFilter(const TransactionFilter& filter, const std::string& token, size_t page_size, Page<Transaction>* page,
                                  size_t* counted) {
    if (filter.entry_id && filter.wallet_id.empty()) {
        set_last_error(InvalidParameter, "Entry id %u is given without a wallet id", *filter.entry_id);
        return false;
    }

    QuerySource source = QuerySource::Primary;
    ws::Bytes prefix;
    ws::Bytes start;
    if (!filter.wallet_id.empty()) {
        source = QuerySource::Wallet;
        prefix = KeyCodec::walletIndexPrefix(filter.wallet_id);
        start = prefix;
    }
    else if (filter.addresses.size() == 1) {
        source = QuerySource::Address;
        prefix = KeyCodec::addressIndexPrefix(filter.addresses.front());
        start = prefix;
    }
    else if (filter.after || filter.before) {
        source = QuerySource::Time;
        prefix = KeyCodec::timeIndexPrefix();
        start = filter.after ? KeyCodec::timeIndexStart(*filter.after) : prefix;
    }
    else {
        prefix = KeyCodec::primaryPrefix();
        start = prefix;
    }

    Page<Transaction> result;
    size_t matched = 0;
    auto visit = [&](Database& db, const Database::SnapshotPtr& snapshot, const ws::Bytes& key, bool* taken) {
        Blockchain blockchain = Blockchain::Unspecified;
        std::string tx_id;
        uint32_t change = 0;
        ws::Timestamp timestamp = 0;
        bool parsed = false;
        switch (source) {
            case QuerySource::Wallet: {
                WalletIndexParts parts;
                parsed = KeyCodec::parseWalletIndexKey(key, &parts);
                blockchain = parts.blockchain;
                tx_id = std::move(parts.tx_id);
                change = parts.change;
                break;
            }
            case QuerySource::Address: {
                AddressIndexParts parts;
                parsed = KeyCodec::parseAddressIndexKey(key, &parts);
                blockchain = parts.blockchain;
                tx_id = std::move(parts.tx_id);
                break;
            }
            case QuerySource::Time: {
                TimeIndexParts parts;
                parsed = KeyCodec::parseTimeIndexKey(key, &parts);
                blockchain = parts.blockchain;
                tx_id = std::move(parts.tx_id);
                timestamp = parts.timestamp;
                break;
            }
            case QuerySource::Primary: {
                PrimaryKeyParts parts;
                parsed = KeyCodec::parsePrimaryKey(key, &parts);
                blockchain = parts.blockchain;
                tx_id = std::move(parts.tx_id);
                break;
            }
        }
        if (!parsed) {
            set_last_error(MalformedKey, "Query key %s cannot be parsed", internal::to_hex(key).c_str());
            return false;
        }

        if (!filter.blockchains.empty() &&
            std::find(filter.blockchains.begin(), filter.blockchains.end(), blockchain) == filter.blockchains.end()) {
            return true;
        }

        Transaction tx;
        bool found = false;
        if (!load(db, KeyCodec::primaryKey(blockchain, tx_id), &tx, &found, snapshot)) {
            return false;
        }
        if (!found) {
            set_last_error(ConsistencyViolation, "Index entry of %s has no primary record", tx_id.c_str());
            return false;
        }
        if (!filter.matches(tx)) {
            return true;
        }

        // a transaction with several entries in the index is taken at one of them
        if (source == QuerySource::Wallet) {
            const auto first = std::find_if(tx.changes.begin(), tx.changes.end(),
                                            [&filter](const Change& c) { return wallet_match(filter, c); });
            if (static_cast<size_t>(first - tx.changes.begin()) != change) {
                return true;
            }
        }
        else if (source == QuerySource::Time && timestamp != first_timestamp(tx, filter.after.value_or(0))) {
            return true;
        }

        *taken = true;
        ++matched;
        if (nullptr == counted) {
            result.items.push_back(std::move(tx));
        }
        return true;
    };

    if (!scanPage(query_scope(filter), prefix, start, token, page_size, visit, &result.cursor)) {
        return false;
    }

    if (nullptr != counted) {
        *counted = matched;
    }
    if (nullptr != page) {
        *page = std::move(result);
    }
    set_last_error();
    return true;
}

bool TransactionStore::query(const TransactionFilter& filter, const std::string& cursor, size_t page_size, Page<Transaction>* page) {
    return scanFilter(filter, cursor, page_size, page, nullptr);
}

bool TransactionStore::count(const TransactionFilter& filter, size_t* result) {
    size_t counted = 0;
    if (!scanFilter(filter, "", std::numeric_limits<size_t>::max(), nullptr, &counted)) {
        return false;
    }
    wsdebug() << "TransactionStore> " << counted << " transactions match the filter";
    if (nullptr != result) {
        *result = counted;
    }
    return true;
}

bool TransactionStore::listSince(ws::Timestamp timestamp, std::vector<Transaction>* result) {
    auto db = database();
    if (!db) {
        return false;
    }

    auto snapshot = db->new_snapshot();
    auto it = snapshot ? db->new_iterator(snapshot) : nullptr;
    if (!it) {
        set_last_error(DatabaseError, "Cannot read index: %s", db->last_error_message().c_str());
        return false;
    }

    const ws::Bytes prefix = KeyCodec::timeIndexPrefix();
    std::set<ws::Bytes> seen;
    std::vector<Transaction> transactions;
    for (it->seek(KeyCodec::timeIndexStart(timestamp)); it->is_valid(); it->next()) {
        const ws::Bytes key = it->key();
        if (!KeyCodec::hasPrefix(key, prefix)) {
            break;
        }

        TimeIndexParts parts;
        if (!KeyCodec::parseTimeIndexKey(key, &parts)) {
            set_last_error(MalformedKey, "Time index key %s cannot be parsed", internal::to_hex(key).c_str());
            return false;
        }

        ws::Bytes primary = KeyCodec::primaryKey(parts.blockchain, parts.tx_id);
        if (seen.count(primary) != 0) {
            continue;
        }

        Transaction tx;
        bool found = false;
        if (!load(*db, primary, &tx, &found, snapshot)) {
            return false;
        }
        if (!found) {
            set_last_error(ConsistencyViolation, "Time index entry of %s has no primary record", parts.tx_id.c_str());
            return false;
        }
        seen.insert(std::move(primary));
        transactions.push_back(std::move(tx));
    }

    if (nullptr != result) {
        *result = std::move(transactions);
    }
    set_last_error();
    return true;
}

bool TransactionStore::listByHeight(Blockchain blockchain, uint64_t from_height, uint64_t to_height, std::vector<Transaction>* result) {
    if (from_height > to_height) {
        set_last_error(InvalidParameter, "Height range [%llu, %llu] is empty", static_cast<unsigned long long>(from_height),
                       static_cast<unsigned long long>(to_height));
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    auto snapshot = db->new_snapshot();
    auto it = snapshot ? db->new_iterator(snapshot) : nullptr;
    if (!it) {
        set_last_error(DatabaseError, "Cannot read index: %s", db->last_error_message().c_str());
        return false;
    }

    const ws::Bytes prefix = KeyCodec::heightIndexPrefix(blockchain);
    std::vector<Transaction> transactions;
    for (it->seek(KeyCodec::heightIndexStart(blockchain, from_height)); it->is_valid(); it->next()) {
        const ws::Bytes key = it->key();
        if (!KeyCodec::hasPrefix(key, prefix)) {
            break;
        }

        HeightIndexParts parts;
        if (!KeyCodec::parseHeightIndexKey(key, &parts)) {
            set_last_error(MalformedKey, "Height index key %s cannot be parsed", internal::to_hex(key).c_str());
            return false;
        }
        if (parts.height > to_height) {
            break;
        }

        Transaction tx;
        bool found = false;
        if (!load(*db, KeyCodec::primaryKey(parts.blockchain, parts.tx_id), &tx, &found, snapshot)) {
            return false;
        }
        if (!found) {
            set_last_error(ConsistencyViolation, "Height index entry of %s has no primary record", parts.tx_id.c_str());
            return false;
        }
        transactions.push_back(std::move(tx));
    }

    if (nullptr != result) {
        *result = std::move(transactions);
    }
    set_last_error();
    return true;
}

bool TransactionStore::prune(Blockchain blockchain, const std::string& tx_id) {
    if (tx_id.empty()) {
        set_last_error(InvalidParameter, "Transaction id is empty");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    const ws::Bytes key = KeyCodec::primaryKey(blockchain, tx_id);
    std::lock_guard<std::mutex> lock(storage_.stripe(key));

    Transaction stored;
    bool found = false;
    if (!load(*db, key, &stored, &found)) {
        return false;
    }
    if (!found) {
        set_last_error(NotFound, "Transaction %s/%s is not found", to_string(blockchain), tx_id.c_str());
        return false;
    }

    Database::Batch batch;
    for (const auto& index : index_keys(stored)) {
        batch.remove(index);
    }
    batch.remove(KeyCodec::metaKey(blockchain, tx_id));
    batch.remove(key);
    if (!commit(*db, batch)) {
        return false;
    }

    wsinfo() << "TransactionStore> " << describe(stored) << " pruned";
    set_last_error();
    return true;
}

bool TransactionStore::getMeta(Blockchain blockchain, const std::string& tx_id, TransactionMeta* meta) {
    if (tx_id.empty()) {
        set_last_error(InvalidParameter, "Transaction id is empty");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    ws::Bytes value;
    if (!db->get(KeyCodec::metaKey(blockchain, tx_id), &value)) {
        if (db->last_error() == Database::NotFound) {
            set_last_error(NotFound, "Meta of %s/%s is not found", to_string(blockchain), tx_id.c_str());
        }
        else {
            set_last_error(DatabaseError, "Read failed: %s", db->last_error_message().c_str());
        }
        return false;
    }

    TransactionMeta result;
    if (!TransactionMeta::from_binary(value, result)) {
        set_last_error(MalformedValue, "Meta of %s cannot be decoded", tx_id.c_str());
        return false;
    }

    if (nullptr != meta) {
        *meta = std::move(result);
    }
    set_last_error();
    return true;
}

bool TransactionStore::setMeta(const TransactionMeta& meta) {
    if (meta.tx_id.empty()) {
        set_last_error(InvalidParameter, "Transaction id is empty");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    const ws::Bytes key = KeyCodec::metaKey(meta.blockchain, meta.tx_id);
    std::lock_guard<std::mutex> lock(storage_.stripe(key));

    ws::Bytes value;
    if (db->get(key, &value)) {
        TransactionMeta stored;
        if (!TransactionMeta::from_binary(value, stored)) {
            set_last_error(MalformedValue, "Meta of %s cannot be decoded", meta.tx_id.c_str());
            return false;
        }
        if (stored.timestamp >= meta.timestamp) {
            wsdebug() << "TransactionStore> meta of " << meta.tx_id << " is not newer than the stored one, ignored";
            set_last_error();
            return true;
        }
    }
    else if (db->last_error() != Database::NotFound) {
        set_last_error(DatabaseError, "Read failed: %s", db->last_error_message().c_str());
        return false;
    }

    Database::Batch batch;
    batch.put(key, meta.to_binary());
    if (!commit(*db, batch)) {
        return false;
    }
    set_last_error();
    return true;
}

bool TransactionStore::getRemoteCursor(const std::string& address, Cursor* cursor) {
    if (address.empty()) {
        set_last_error(InvalidParameter, "Address is empty");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    ws::Bytes value;
    if (!db->get(KeyCodec::remoteCursorKey(address), &value)) {
        if (db->last_error() == Database::NotFound) {
            set_last_error(NotFound, "Remote cursor of %s is not found", address.c_str());
        }
        else {
            set_last_error(DatabaseError, "Read failed: %s", db->last_error_message().c_str());
        }
        return false;
    }

    Cursor result;
    if (!Cursor::from_binary(value, result)) {
        set_last_error(MalformedValue, "Remote cursor of %s cannot be decoded", address.c_str());
        return false;
    }
    if (result.value.empty()) {
        set_last_error(NotFound, "Remote cursor of %s is empty", address.c_str());
        return false;
    }

    if (nullptr != cursor) {
        *cursor = std::move(result);
    }
    set_last_error();
    return true;
}

bool TransactionStore::setRemoteCursor(const std::string& address, const std::string& value) {
    if (address.empty()) {
        set_last_error(InvalidParameter, "Address is empty");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    Cursor cursor;
    cursor.address = address;
    cursor.value = value;
    cursor.timestamp = storage_.now();

    Database::Batch batch;
    batch.put(KeyCodec::remoteCursorKey(address), cursor.to_binary());
    if (!commit(*db, batch)) {
        return false;
    }
    set_last_error();
    return true;
}

bool TransactionStore::applyReorg(Blockchain blockchain, uint64_t height, const std::string& block_id, size_t* reverted) {
    if (block_id.empty()) {
        set_last_error(InvalidParameter, "Block id is empty");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    // candidates first, then re-read each one under its stripe lock
    std::vector<ws::Bytes> candidates;
    {
        auto it = db->new_iterator();
        if (!it) {
            set_last_error(DatabaseError, "Cannot read index: %s", db->last_error_message().c_str());
            return false;
        }
        const ws::Bytes prefix = KeyCodec::heightIndexPrefix(blockchain);
        for (it->seek(KeyCodec::heightIndexStart(blockchain, height)); it->is_valid(); it->next()) {
            const ws::Bytes key = it->key();
            if (!KeyCodec::hasPrefix(key, prefix)) {
                break;
            }
            HeightIndexParts parts;
            if (!KeyCodec::parseHeightIndexKey(key, &parts)) {
                set_last_error(MalformedKey, "Height index key %s cannot be parsed", internal::to_hex(key).c_str());
                return false;
            }
            candidates.push_back(KeyCodec::primaryKey(parts.blockchain, parts.tx_id));
        }
    }

    auto locks = storage_.lockStripes(candidates);

    Database::Batch batch;
    size_t count = 0;
    for (const auto& key : candidates) {
        Transaction stored;
        bool found = false;
        if (!load(*db, key, &stored, &found)) {
            return false;
        }
        // pruned after the index scan
        if (!found || !stored.block) {
            continue;
        }
        if (stored.block->height < height || (stored.block->height == height && stored.block->block_id == block_id)) {
            continue;
        }
        if (stored.state != State::Confirmed && stored.state != State::Submitted) {
            wswarning() << "TransactionStore> " << describe(stored) << " in state " << stored.state << " holds a block, left as is";
            continue;
        }

        Transaction updated = stored;
        updated.state = State::Submitted;
        updated.block.reset();
        updated.block_pos = 0;
        updated.confirm_timestamp = 0;
        updated.version = stored.version + 1;
        stage(batch, &stored, updated);
        ++count;

        wsdebug() << "TransactionStore> " << describe(stored) << " left block " << stored.block->height << " by reorg";
    }

    if (!commit(*db, batch)) {
        return false;
    }

    if (count > 0) {
        wsinfo() << "TransactionStore> reorg of " << blockchain << " at height " << height << " reverted " << count << " transactions";
    }
    if (nullptr != reverted) {
        *reverted = count;
    }
    set_last_error();
    return true;
}

bool TransactionStore::verify() {
    auto db = database();
    if (!db) {
        return false;
    }

    auto snapshot = db->new_snapshot();
    auto it = snapshot ? db->new_iterator(snapshot) : nullptr;
    if (!it) {
        set_last_error(DatabaseError, "Cannot read database: %s", db->last_error_message().c_str());
        return false;
    }

    using Parser = std::function<bool(const ws::Bytes&, PrimaryKeyParts*)>;
    const std::vector<std::pair<ws::Bytes, Parser>> indices = {
        {KeyCodec::walletIndexPrefix(),
         [](const ws::Bytes& key, PrimaryKeyParts* parts) {
             WalletIndexParts p;
             if (!KeyCodec::parseWalletIndexKey(key, &p)) {
                 return false;
             }
             *parts = PrimaryKeyParts{p.blockchain, p.tx_id};
             return true;
         }},
        {KeyCodec::addressIndexPrefix(),
         [](const ws::Bytes& key, PrimaryKeyParts* parts) {
             AddressIndexParts p;
             if (!KeyCodec::parseAddressIndexKey(key, &p)) {
                 return false;
             }
             *parts = PrimaryKeyParts{p.blockchain, p.tx_id};
             return true;
         }},
        {KeyCodec::heightIndexPrefix(),
         [](const ws::Bytes& key, PrimaryKeyParts* parts) {
             HeightIndexParts p;
             if (!KeyCodec::parseHeightIndexKey(key, &p)) {
                 return false;
             }
             *parts = PrimaryKeyParts{p.blockchain, p.tx_id};
             return true;
         }},
        {KeyCodec::timeIndexPrefix(),
         [](const ws::Bytes& key, PrimaryKeyParts* parts) {
             TimeIndexParts p;
             if (!KeyCodec::parseTimeIndexKey(key, &p)) {
                 return false;
             }
             *parts = PrimaryKeyParts{p.blockchain, p.tx_id};
             return true;
         }},
    };

    size_t entries = 0;
    for (const auto& index : indices) {
        for (it->seek(index.first); it->is_valid(); it->next()) {
            const ws::Bytes key = it->key();
            if (!KeyCodec::hasPrefix(key, index.first)) {
                break;
            }

            PrimaryKeyParts parts;
            if (!index.second(key, &parts)) {
                set_last_error(MalformedKey, "Index key %s cannot be parsed", internal::to_hex(key).c_str());
                return false;
            }

            const ws::Bytes primary = KeyCodec::primaryKey(parts.blockchain, parts.tx_id);
            if (it->value() != primary) {
                set_last_error(ConsistencyViolation, "Index entry %s points to another record", internal::to_hex(key).c_str());
                return false;
            }

            Transaction tx;
            bool found = false;
            if (!load(*db, primary, &tx, &found, snapshot)) {
                return false;
            }
            if (!found) {
                set_last_error(ConsistencyViolation, "Index entry %s of %s has no primary record", internal::to_hex(key).c_str(),
                               parts.tx_id.c_str());
                return false;
            }
            if (index_keys(tx).count(key) == 0) {
                set_last_error(ConsistencyViolation, "Index entry %s of %s is stale", internal::to_hex(key).c_str(), parts.tx_id.c_str());
                return false;
            }
            ++entries;
        }
    }

    size_t records = 0;
    const ws::Bytes prefix = KeyCodec::primaryPrefix();
    for (it->seek(prefix); it->is_valid(); it->next()) {
        const ws::Bytes key = it->key();
        if (!KeyCodec::hasPrefix(key, prefix)) {
            break;
        }

        PrimaryKeyParts parts;
        if (!KeyCodec::parsePrimaryKey(key, &parts)) {
            set_last_error(MalformedKey, "Primary key %s cannot be parsed", internal::to_hex(key).c_str());
            return false;
        }

        Transaction tx;
        if (!Transaction::from_binary(it->value(), tx)) {
            set_last_error(MalformedValue, "Transaction record %s cannot be decoded", parts.tx_id.c_str());
            return false;
        }
        if (tx.blockchain != parts.blockchain || tx.tx_id != parts.tx_id) {
            set_last_error(ConsistencyViolation, "Transaction record under %s belongs to %s", parts.tx_id.c_str(), tx.tx_id.c_str());
            return false;
        }

        for (const auto& index : index_keys(tx)) {
            ws::Bytes value;
            if (!db->get(index, &value, snapshot)) {
                if (db->last_error() != Database::NotFound) {
                    set_last_error(DatabaseError, "Read failed: %s", db->last_error_message().c_str());
                    return false;
                }
                set_last_error(ConsistencyViolation, "Transaction %s misses index entry %s", describe(tx).c_str(),
                               internal::to_hex(index).c_str());
                return false;
            }
            if (value != key) {
                set_last_error(ConsistencyViolation, "Index entry %s points to another record", internal::to_hex(index).c_str());
                return false;
            }
        }
        ++records;
    }

    wsinfo() << "TransactionStore> verified " << records << " transactions and " << entries << " index entries";
    set_last_error();
    return true;
}

}  // namespace wsdb
