#include <wsdb/balance_store.hpp>

#include <mutex>

#include <lib/system/logger.hpp>

#include <wsdb/internal/utils.hpp>
#include <wsdb/keys.hpp>
#include <wsdb/storage.hpp>

namespace wsdb {

BalanceStore::BalanceStore(Storage& storage)
: ErrorHolder("BalanceStore")
, storage_(storage) {
}

std::shared_ptr<Database> BalanceStore::database() {
    auto db = storage_.database();
    if (!db) {
        set_last_error(NotOpen);
    }
    return db;
}

bool BalanceStore::validate(const Balance& balance) {
    if (balance.address.empty() || !internal::is_ascii(balance.address)) {
        set_last_error(InvalidParameter, "Balance address must be non-empty ASCII");
        return false;
    }
    if (!internal::is_decimal(balance.amount)) {
        set_last_error(InvalidParameter, "Balance amount \"%s\" of %s is not a decimal number", balance.amount.c_str(),
                       balance.address.c_str());
        return false;
    }

    if (balance.utxo.empty()) {
        return true;
    }

    uint64_t amount = 0;
    if (!internal::parse_decimal(balance.amount, amount)) {
        set_last_error(ConsistencyViolation, "Balance amount %s of %s exceeds the UTXO range", balance.amount.c_str(),
                       balance.address.c_str());
        return false;
    }
    uint64_t sum = 0;
    for (const auto& utxo : balance.utxo) {
        if (utxo.amount > UINT64_MAX - sum) {
            set_last_error(ConsistencyViolation, "UTXO amounts of %s overflow", balance.address.c_str());
            return false;
        }
        sum += utxo.amount;
    }
    if (sum != amount) {
        set_last_error(ConsistencyViolation, "Balance of %s is %s but its UTXO sum to %llu", balance.address.c_str(), balance.amount.c_str(),
                       static_cast<unsigned long long>(sum));
        return false;
    }
    return true;
}

bool BalanceStore::upsert(const Balance& balance, bool* replaced) {
    if (!validate(balance)) {
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    const ws::Bytes key = KeyCodec::balanceKey(balance.address, balance.blockchain, balance.asset);
    std::lock_guard<std::mutex> lock(storage_.stripe(key));

    ws::Bytes value;
    if (db->get(key, &value)) {
        Balance stored;
        if (!Balance::from_binary(value, stored)) {
            set_last_error(MalformedValue, "Balance of %s cannot be decoded", balance.address.c_str());
            return false;
        }
        if (stored.timestamp >= balance.timestamp) {
            wsdebug() << "BalanceStore> balance of " << balance.address << " at " << balance.timestamp << " is not newer than "
                      << stored.timestamp << ", ignored";
            if (nullptr != replaced) {
                *replaced = false;
            }
            set_last_error();
            return true;
        }
    }
    else if (db->last_error() != Database::NotFound) {
        set_last_error(DatabaseError, "Read failed: %s", db->last_error_message().c_str());
        return false;
    }

    Database::Batch batch;
    batch.put(key, balance.to_binary());
    if (!db->write_batch(batch)) {
        set_last_error(DatabaseError, "Write failed: %s", db->last_error_message().c_str());
        return false;
    }

    if (nullptr != replaced) {
        *replaced = true;
    }
    set_last_error();
    return true;
}

bool BalanceStore::get(const std::string& address, Blockchain blockchain, const std::string& asset, Balance* balance) {
    if (address.empty()) {
        set_last_error(InvalidParameter, "Address is empty");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    ws::Bytes value;
    if (!db->get(KeyCodec::balanceKey(address, blockchain, asset), &value)) {
        if (db->last_error() == Database::NotFound) {
            set_last_error(NotFound, "Balance of %s %s is not found", address.c_str(), asset.c_str());
        }
        else {
            set_last_error(DatabaseError, "Read failed: %s", db->last_error_message().c_str());
        }
        return false;
    }

    Balance result;
    if (!Balance::from_binary(value, result)) {
        set_last_error(MalformedValue, "Balance of %s cannot be decoded", address.c_str());
        return false;
    }

    if (nullptr != balance) {
        *balance = std::move(result);
    }
    set_last_error();
    return true;
}

bool BalanceStore::list(const std::string& address, std::vector<Balance>* balances) {
    if (address.empty()) {
        set_last_error(InvalidParameter, "Address is empty");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    auto it = db->new_iterator();
    if (!it) {
        set_last_error(DatabaseError, "Cannot read balances: %s", db->last_error_message().c_str());
        return false;
    }

    const ws::Bytes prefix = KeyCodec::balancePrefix(address);
    std::vector<Balance> result;
    for (it->seek(prefix); it->is_valid(); it->next()) {
        const ws::Bytes key = it->key();
        if (!KeyCodec::hasPrefix(key, prefix)) {
            break;
        }
        if (!KeyCodec::parseBalanceKey(key, nullptr)) {
            set_last_error(MalformedKey, "Balance key %s cannot be parsed", internal::to_hex(key).c_str());
            return false;
        }

        Balance balance;
        if (!Balance::from_binary(it->value(), balance)) {
            set_last_error(MalformedValue, "Balance of %s cannot be decoded", address.c_str());
            return false;
        }
        result.push_back(std::move(balance));
    }

    if (nullptr != balances) {
        *balances = std::move(result);
    }
    set_last_error();
    return true;
}

bool BalanceStore::clear(const std::string& address, size_t* removed) {
    if (address.empty()) {
        set_last_error(InvalidParameter, "Address is empty");
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    auto it = db->new_iterator();
    if (!it) {
        set_last_error(DatabaseError, "Cannot read balances: %s", db->last_error_message().c_str());
        return false;
    }

    const ws::Bytes prefix = KeyCodec::balancePrefix(address);
    std::vector<ws::Bytes> candidates;
    for (it->seek(prefix); it->is_valid(); it->next()) {
        ws::Bytes key = it->key();
        if (!KeyCodec::hasPrefix(key, prefix)) {
            break;
        }
        candidates.push_back(std::move(key));
    }

    // count only what is still there once the writers of these keys are held off
    auto locks = storage_.lockStripes(candidates);

    Database::Batch batch;
    for (const auto& key : candidates) {
        if (db->get(key)) {
            batch.remove(key);
        }
        else if (db->last_error() != Database::NotFound) {
            set_last_error(DatabaseError, "Read failed: %s", db->last_error_message().c_str());
            return false;
        }
    }

    if (!db->write_batch(batch)) {
        set_last_error(DatabaseError, "Write failed: %s", db->last_error_message().c_str());
        return false;
    }

    wsdebug() << "BalanceStore> cleared " << batch.size() << " balances of " << address;
    if (nullptr != removed) {
        *removed = batch.size();
    }
    set_last_error();
    return true;
}

}  // namespace wsdb
