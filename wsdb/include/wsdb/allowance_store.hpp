/**
 * @file allowance_store.hpp
 */

#ifndef _WSDB_ALLOWANCE_STORE_HPP_INCLUDED_
#define _WSDB_ALLOWANCE_STORE_HPP_INCLUDED_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <wsdb/allowance.hpp>
#include <wsdb/database.hpp>
#include <wsdb/errors.hpp>

namespace wsdb {

class Storage;

/**
 * @brief TTL bounded cache of ERC-20 allowances.
 *
 * Expiry is evaluated when an allowance is read: an entry with
 * now > timestamp + ttl is reported as NotFound while it may still be
 * physically present. \ref purge deletes such entries.
 */
class AllowanceStore : public ErrorHolder {
public:
    explicit AllowanceStore(Storage& storage);

    /**
     * @brief Stores \p allowance unless it has already expired.
     *
     * A zero timestamp is replaced by the current time, a zero ttl by the
     * default one. The ttl is capped by the configured maximum.
     *
     * @param stored  receives false when the allowance was expired and skipped
     */
    bool upsert(const Allowance& allowance, bool* stored = nullptr);

    bool get(Blockchain blockchain, const std::string& token, const std::string& owner, const std::string& spender,
             Allowance* allowance);

    /// Live allowances of \p wallet_id, or of every wallet when it is empty.
    bool list(const std::string& wallet_id, std::vector<Allowance>* allowances);

    /**
     * @brief Removes allowances of \p wallet_id.
     * @param blockchain  only this blockchain when set
     * @param min_ts      only entries persisted before this time when set
     */
    bool remove(const std::string& wallet_id, std::optional<Blockchain> blockchain, std::optional<ws::Timestamp> min_ts,
                size_t* removed = nullptr);

    /// Physically deletes expired and undecodable entries.
    bool purge(size_t* removed = nullptr);

private:
    using Predicate = std::function<bool(const ws::Bytes& key, const ws::Bytes& value)>;

    std::shared_ptr<Database> database();

    /// Removes the entries matching \p doomed, re-checked under their stripe locks.
    bool removeWhere(const Predicate& doomed, size_t* removed);

    Storage& storage_;
};

}  // namespace wsdb

#endif  // _WSDB_ALLOWANCE_STORE_HPP_INCLUDED_
