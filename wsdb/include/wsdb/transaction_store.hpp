/**
 * @file transaction_store.hpp
 */

#ifndef _WSDB_TRANSACTION_STORE_HPP_INCLUDED_
#define _WSDB_TRANSACTION_STORE_HPP_INCLUDED_

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <wsdb/cursor.hpp>
#include <wsdb/database.hpp>
#include <wsdb/errors.hpp>
#include <wsdb/transaction.hpp>

namespace wsdb {

class Storage;

template <typename T>
struct Page {
    std::vector<T> items;
    /// Continuation token, empty when the listing is exhausted.
    std::string cursor;

    bool has_more() const {
        return !cursor.empty();
    }
};

/// One change of a wallet listing: the transaction and the change position.
struct WalletEntry {
    Transaction transaction;
    uint32_t change = 0;

    const Change& change_ref() const {
        return transaction.changes.at(change);
    }
};

/**
 * @brief Selection of a transaction query. Empty members match everything.
 *
 * The time window holds when since_timestamp or confirm_timestamp is at or
 * after \ref after, and since_timestamp or confirm_timestamp is at or before
 * \ref before. Zero timestamps never count.
 */
struct TransactionFilter {
    std::vector<Blockchain> blockchains;
    std::optional<ws::Timestamp> after;
    std::optional<ws::Timestamp> before;
    /// Some change belongs to this wallet, and to \ref entry_id when set.
    std::string wallet_id;
    std::optional<uint32_t> entry_id;
    /// Some change has one of these addresses.
    std::vector<std::string> addresses;

    bool matches(const Transaction& tx) const;
};

/**
 * @brief Transactions, their secondary indices and lifecycle.
 *
 * Each transaction is stored under its primary key with index entries by
 * wallet (one per change), by address (one per distinct change address), by
 * block height and by time (since and confirm timestamps). Index entries
 * hold the primary key as their value. Every write commits the primary
 * record together with all index changes in one batch.
 *
 * All methods return false on failure; the reason is in \ref last_error.
 */
class TransactionStore : public ErrorHolder {
public:
    explicit TransactionStore(Storage& storage);

    /**
     * @brief Stores a new transaction with version 0.
     *
     * Fails with VersionConflict if the transaction exists.
     */
    bool insert(const Transaction& tx);

    /**
     * @brief Writes \p tx if the stored version equals \p expected_version.
     * @param new_version  receives the stored version (expected + 1)
     *
     * An absent record counts as version 0. The lifecycle rules of
     * lifecycle::transition_allowed apply to existing records.
     */
    bool upsert(const Transaction& tx, uint64_t expected_version, uint64_t* new_version = nullptr);

    bool getByTxId(Blockchain blockchain, const std::string& tx_id, Transaction* result);

    bool listByWallet(const std::string& wallet_id, const std::string& cursor, size_t page_size, Page<WalletEntry>* page);
    bool listByAddress(const std::string& address, const std::string& cursor, size_t page_size, Page<Transaction>* page);

    /**
     * @brief Pages through the transactions matching \p filter, each once.
     *
     * Served from the wallet index when a wallet is given, else from the
     * address index for a single address, else from the time index for a
     * time window, else from the primary table; the order is that of the
     * index. A page may hold fewer than \p page_size items, even none,
     * while a cursor is still returned.
     */
    bool query(const TransactionFilter& filter, const std::string& cursor, size_t page_size, Page<Transaction>* page);
    bool count(const TransactionFilter& filter, size_t* result);

    /// Transactions whose since or confirm timestamp is >= \p timestamp, ascending.
    bool listSince(ws::Timestamp timestamp, std::vector<Transaction>* result);

    /// Transactions of \p blockchain in blocks [from_height, to_height], ascending.
    bool listByHeight(Blockchain blockchain, uint64_t from_height, uint64_t to_height, std::vector<Transaction>* result);

    bool prune(Blockchain blockchain, const std::string& tx_id);

    bool getMeta(Blockchain blockchain, const std::string& tx_id, TransactionMeta* meta);
    bool setMeta(const TransactionMeta& meta);

    bool getRemoteCursor(const std::string& address, Cursor* cursor);
    bool setRemoteCursor(const std::string& address, const std::string& value);

    /**
     * @brief The best chain now has \p block_id at \p height.
     * @param reverted  receives the number of transactions moved back
     *
     * Transactions holding a block above \p height, or at \p height with
     * another id, become SUBMITTED without block, version + 1, in one batch.
     */
    bool applyReorg(Blockchain blockchain, uint64_t height, const std::string& block_id, size_t* reverted = nullptr);

    /// Cross-checks every index entry against the primary records. Never repairs.
    bool verify();

private:
    std::shared_ptr<Database> database();
    bool validate(const Transaction& tx);
    bool load(Database& db, const ws::Bytes& key, Transaction* tx, bool* found, const Database::SnapshotPtr& snapshot = nullptr);
    void stage(Database::Batch& batch, const Transaction* stored, const Transaction& updated);
    bool commit(Database& db, const Database::Batch& batch);
    bool write(const Transaction& tx, uint64_t expected_version, bool create_only, uint64_t* new_version);

    /// Sets \p taken when the key adds an item to the page.
    using Visitor = std::function<bool(Database& db, const Database::SnapshotPtr& snapshot, const ws::Bytes& key, bool* taken)>;
    bool scanPage(const std::string& scope, const ws::Bytes& prefix, const ws::Bytes& start, const std::string& token, size_t page_size,
                  const Visitor& visit, std::string* next_cursor);
    bool scanFilter(const TransactionFilter& filter, const std::string& token, size_t page_size, Page<Transaction>* page,
                    size_t* counted);
    bool openCursor(const std::string& scope, const std::string& token, const ws::Bytes& prefix, ws::Bytes* position);
    std::string issueCursor(const std::string& scope, const ws::Bytes& position);

    Storage& storage_;
    CursorCodec cursors_;
};

/// Every index key of \p tx.
std::set<ws::Bytes> index_keys(const Transaction& tx);

}  // namespace wsdb

#endif  // _WSDB_TRANSACTION_STORE_HPP_INCLUDED_
