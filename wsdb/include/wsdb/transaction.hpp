/**
 * @file transaction.hpp
 */

#ifndef _WSDB_TRANSACTION_HPP_INCLUDED_
#define _WSDB_TRANSACTION_HPP_INCLUDED_

#include <optional>
#include <string>
#include <vector>

#include <wsdb/types.hpp>

namespace wsdb {

enum class State : uint32_t {
    Prepared = 0,
    Submitted = 10,
    Replaced = 11,
    Confirmed = 12,
    Dropped = 20,
};

enum class Status : uint32_t {
    Unknown = 0,
    Ok = 1,
    Failed = 2,
};

enum class Direction : uint32_t {
    Receive = 0,
    Send = 1,
};

enum class ChangeType : uint32_t {
    Unspecified = 0,
    Transfer = 1,
    Fee = 2,
};

const char* to_string(State state);
std::ostream& operator<<(std::ostream& os, State state);

struct BlockRef {
    uint64_t height = 0;
    std::string block_id;
    ws::Timestamp timestamp = 0;

    bool operator==(const BlockRef& other) const;
    bool operator!=(const BlockRef& other) const {
        return !(*this == other);
    }

private:
    void put(priv::obstream&) const;
    bool get(priv::ibstream&);
    friend class priv::obstream;
    friend class priv::ibstream;
    friend class priv::field_writer;
    friend class priv::field_reader;
};

/// One balance movement of a transaction, as seen by one wallet entry.
struct Change {
    std::string wallet_id;
    uint32_t entry_id = 0;
    std::string address;
    std::string hd_path;
    std::string asset;
    std::string amount;
    ChangeType change_type = ChangeType::Unspecified;
    Direction direction = Direction::Receive;

    bool operator==(const Change& other) const;

private:
    void put(priv::obstream&) const;
    bool get(priv::ibstream&);
    friend class priv::obstream;
    friend class priv::ibstream;
    friend class priv::field_writer;
    friend class priv::field_reader;
};

class Transaction {
public:
    Blockchain blockchain = Blockchain::Unspecified;
    std::string tx_id;
    std::optional<bool> own;
    ws::Timestamp since_timestamp = 0;
    ws::Timestamp sync_timestamp = 0;
    ws::Timestamp confirm_timestamp = 0;
    State state = State::Prepared;
    std::optional<BlockRef> block;
    uint32_t block_pos = 0;
    Status status = Status::Unknown;
    std::vector<Change> changes;
    uint64_t version = 0;

public:
    /// Explicit own flag, or true if any change is a send.
    bool is_own() const;

    ws::Bytes to_binary() const;
    static bool from_binary(const ws::Bytes& data, Transaction& result);

    bool operator==(const Transaction& other) const;
    bool operator!=(const Transaction& other) const {
        return !(*this == other);
    }

private:
    void put(priv::obstream&) const;
    bool get(priv::ibstream&);
    friend class priv::obstream;
    friend class priv::ibstream;
};

/// User annotation of a transaction, kept apart from the versioned record.
struct TransactionMeta {
    ws::Timestamp timestamp = 0;
    Blockchain blockchain = Blockchain::Unspecified;
    std::string tx_id;
    std::string label;
    ws::Bytes raw;

    ws::Bytes to_binary() const;
    static bool from_binary(const ws::Bytes& data, TransactionMeta& result);

private:
    void put(priv::obstream&) const;
    bool get(priv::ibstream&);
    friend class priv::obstream;
    friend class priv::ibstream;
};

/**
 * @brief Lifecycle rules.
 *
 * PREPARED -> SUBMITTED -> CONFIRMED, SUBMITTED -> REPLACED | DROPPED,
 * CONFIRMED -> DROPPED, and CONFIRMED -> SUBMITTED when the recorded block
 * is no longer valid. REPLACED and DROPPED are terminal.
 */
namespace lifecycle {
bool is_known(State state);
bool is_terminal(State state);

/// Checks that the block reference agrees with the state of the record.
bool block_consistent(const Transaction& tx, std::string* reason = nullptr);

/// Checks that \p stored may be overwritten by \p incoming.
bool transition_allowed(const Transaction& stored, const Transaction& incoming, std::string* reason = nullptr);

/**
 * @brief Builds the record that replaces \p stored when \p incoming is written over it.
 *
 * A zero since_timestamp of \p incoming keeps the stored one, and the later
 * confirm_timestamp wins unless \p incoming drops the block reference. Changes
 * that arrive without a wallet id take wallet_id and entry_id from a stored
 * change with the same amount, direction, asset and address. Stored FEE changes
 * are kept when \p incoming carries none.
 */
Transaction merge(const Transaction& stored, const Transaction& incoming);
}  // namespace lifecycle

}  // namespace wsdb

#endif  // _WSDB_TRANSACTION_HPP_INCLUDED_
