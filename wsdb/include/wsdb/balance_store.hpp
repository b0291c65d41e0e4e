/**
 * @file balance_store.hpp
 */

#ifndef _WSDB_BALANCE_STORE_HPP_INCLUDED_
#define _WSDB_BALANCE_STORE_HPP_INCLUDED_

#include <memory>
#include <string>
#include <vector>

#include <wsdb/balance.hpp>
#include <wsdb/database.hpp>
#include <wsdb/errors.hpp>

namespace wsdb {

class Storage;

/**
 * @brief Latest-wins cache of address balances.
 *
 * A balance replaces the stored one only when its timestamp is strictly
 * newer; late deliveries are dropped silently.
 */
class BalanceStore : public ErrorHolder {
public:
    explicit BalanceStore(Storage& storage);

    /**
     * @param replaced  receives false when an equal or newer balance was kept
     */
    bool upsert(const Balance& balance, bool* replaced = nullptr);
    bool get(const std::string& address, Blockchain blockchain, const std::string& asset, Balance* balance);

    /// All balances of \p address in key order.
    bool list(const std::string& address, std::vector<Balance>* balances);

    /// Removes all balances of \p address in one batch.
    bool clear(const std::string& address, size_t* removed = nullptr);

private:
    std::shared_ptr<Database> database();
    bool validate(const Balance& balance);

    Storage& storage_;
};

}  // namespace wsdb

#endif  // _WSDB_BALANCE_STORE_HPP_INCLUDED_
