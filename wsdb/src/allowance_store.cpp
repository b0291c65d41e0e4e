#include <wsdb/allowance_store.hpp>

#include <algorithm>
#include <mutex>

#include <lib/system/logger.hpp>

#include <wsdb/internal/utils.hpp>
#include <wsdb/keys.hpp>
#include <wsdb/storage.hpp>

namespace wsdb {

AllowanceStore::AllowanceStore(Storage& storage)
: ErrorHolder("AllowanceStore")
, storage_(storage) {
}

std::shared_ptr<Database> AllowanceStore::database() {
    auto db = storage_.database();
    if (!db) {
        set_last_error(NotOpen);
    }
    return db;
}

bool AllowanceStore::upsert(const Allowance& allowance, bool* stored) {
    if (!internal::is_ethereum_address(allowance.token) || !internal::is_ethereum_address(allowance.owner) ||
        !internal::is_ethereum_address(allowance.spender)) {
        set_last_error(InvalidParameter, "Token, owner and spender must be 0x prefixed 20 byte hex addresses");
        return false;
    }
    if (allowance.wallet_id.empty()) {
        set_last_error(InvalidParameter, "Allowance wallet id is empty");
        return false;
    }
    if (!internal::is_decimal(allowance.amount)) {
        set_last_error(InvalidParameter, "Allowance amount \"%s\" is not a decimal number", allowance.amount.c_str());
        return false;
    }

    auto db = database();
    if (!db) {
        return false;
    }

    const ws::Timestamp now = storage_.now();

    Allowance record = allowance;
    if (record.timestamp == 0) {
        record.timestamp = now;
    }
    if (record.ttl == 0) {
        record.ttl = storage_.allowanceDefaultTtl();
    }
    record.ttl = std::min(record.ttl, storage_.allowanceMaxTtl());

    if (record.is_expired(now)) {
        wsdebug() << "AllowanceStore> allowance of " << record.spender << " over " << record.owner << " expired at "
                  << record.timestamp + record.ttl << ", not cached";
        if (nullptr != stored) {
            *stored = false;
        }
        set_last_error();
        return true;
    }

    const ws::Bytes key = KeyCodec::allowanceKey(record.blockchain, record.token, record.owner, record.spender);
    std::lock_guard<std::mutex> lock(storage_.stripe(key));

    Database::Batch batch;
    batch.put(key, record.to_binary());
    if (!db->write_batch(batch)) {
        set_last_error(DatabaseError, "Write failed: %s", db->last_error_message().c_str());
        return false;
    }

    if (nullptr != stored) {
        *stored = true;
    }
    set_last_error();
    return true;
}

bool AllowanceStore::get(Blockchain blockchain, const std::string& token, const std::string& owner, const std::string& spender,
                         Allowance* allowance) {
    auto db = database();
    if (!db) {
        return false;
    }

    ws::Bytes value;
    if (!db->get(KeyCodec::allowanceKey(blockchain, token, owner, spender), &value)) {
        if (db->last_error() == Database::NotFound) {
            set_last_error(NotFound, "Allowance of %s over %s is not found", spender.c_str(), owner.c_str());
        }
        else {
            set_last_error(DatabaseError, "Read failed: %s", db->last_error_message().c_str());
        }
        return false;
    }

    Allowance result;
    if (!Allowance::from_binary(value, result)) {
        set_last_error(MalformedValue, "Allowance of %s over %s cannot be decoded", spender.c_str(), owner.c_str());
        return false;
    }

    if (result.is_expired(storage_.now())) {
        set_last_error(NotFound, "Allowance of %s over %s has expired", spender.c_str(), owner.c_str());
        return false;
    }

    if (nullptr != allowance) {
        *allowance = std::move(result);
    }
    set_last_error();
    return true;
}

bool AllowanceStore::list(const std::string& wallet_id, std::vector<Allowance>* allowances) {
    auto db = database();
    if (!db) {
        return false;
    }

    auto it = db->new_iterator();
    if (!it) {
        set_last_error(DatabaseError, "Cannot read allowances: %s", db->last_error_message().c_str());
        return false;
    }

    const ws::Timestamp now = storage_.now();
    const ws::Bytes prefix = KeyCodec::allowancePrefix();
    std::vector<Allowance> result;
    for (it->seek(prefix); it->is_valid(); it->next()) {
        const ws::Bytes key = it->key();
        if (!KeyCodec::hasPrefix(key, prefix)) {
            break;
        }

        Allowance allowance;
        if (!Allowance::from_binary(it->value(), allowance)) {
            wswarning() << "AllowanceStore> skip undecodable allowance " << internal::to_hex(key);
            continue;
        }
        if (allowance.is_expired(now)) {
            continue;
        }
        if (!wallet_id.empty() && allowance.wallet_id != wallet_id) {
            continue;
        }
        result.push_back(std::move(allowance));
    }

    if (nullptr != allowances) {
        *allowances = std::move(result);
    }
    set_last_error();
    return true;
}

bool AllowanceStore::remove(const std::string& wallet_id, std::optional<Blockchain> blockchain, std::optional<ws::Timestamp> min_ts,
                            size_t* removed) {
    if (wallet_id.empty()) {
        set_last_error(InvalidParameter, "Wallet id is empty");
        return false;
    }

    auto doomed = [&](const ws::Bytes&, const ws::Bytes& value) {
        Allowance allowance;
        if (!Allowance::from_binary(value, allowance)) {
            return false;
        }
        if (allowance.wallet_id != wallet_id) {
            return false;
        }
        if (blockchain && allowance.blockchain != *blockchain) {
            return false;
        }
        return !min_ts || allowance.timestamp < *min_ts;
    };

    size_t count = 0;
    if (!removeWhere(doomed, &count)) {
        return false;
    }

    wsdebug() << "AllowanceStore> removed " << count << " allowances of wallet " << wallet_id;
    if (nullptr != removed) {
        *removed = count;
    }
    set_last_error();
    return true;
}

bool AllowanceStore::purge(size_t* removed) {
    const ws::Timestamp now = storage_.now();
    auto doomed = [now](const ws::Bytes& key, const ws::Bytes& value) {
        Allowance allowance;
        return !KeyCodec::parseAllowanceKey(key, nullptr) || !Allowance::from_binary(value, allowance) || allowance.is_expired(now);
    };

    size_t count = 0;
    if (!removeWhere(doomed, &count)) {
        return false;
    }

    if (count > 0) {
        wsinfo() << "AllowanceStore> purged " << count << " allowances";
    }
    if (nullptr != removed) {
        *removed = count;
    }
    set_last_error();
    return true;
}

bool AllowanceStore::removeWhere(const Predicate& doomed, size_t* removed) {
    auto db = database();
    if (!db) {
        return false;
    }

    std::vector<ws::Bytes> candidates;
    {
        auto it = db->new_iterator();
        if (!it) {
            set_last_error(DatabaseError, "Cannot read allowances: %s", db->last_error_message().c_str());
            return false;
        }

        const ws::Bytes prefix = KeyCodec::allowancePrefix();
        for (it->seek(prefix); it->is_valid(); it->next()) {
            ws::Bytes key = it->key();
            if (!KeyCodec::hasPrefix(key, prefix)) {
                break;
            }
            if (doomed(key, it->value())) {
                candidates.push_back(std::move(key));
            }
        }
    }

    // an upsert may have replaced a candidate since the scan
    auto locks = storage_.lockStripes(candidates);

    Database::Batch batch;
    for (const auto& key : candidates) {
        ws::Bytes value;
        if (!db->get(key, &value)) {
            if (db->last_error() == Database::NotFound) {
                continue;
            }
            set_last_error(DatabaseError, "Read failed: %s", db->last_error_message().c_str());
            return false;
        }
        if (doomed(key, value)) {
            batch.remove(key);
        }
    }

    if (!db->write_batch(batch)) {
        set_last_error(DatabaseError, "Write failed: %s", db->last_error_message().c_str());
        return false;
    }

    *removed = batch.size();
    return true;
}

}  // namespace wsdb
