/**
 * @file balance.hpp
 */

#ifndef _WSDB_BALANCE_HPP_INCLUDED_
#define _WSDB_BALANCE_HPP_INCLUDED_

#include <string>
#include <vector>

#include <wsdb/types.hpp>

namespace wsdb {

struct Utxo {
    std::string txid;
    uint32_t vout = 0;
    uint64_t amount = 0;

    bool operator==(const Utxo& other) const {
        return txid == other.txid && vout == other.vout && amount == other.amount;
    }

private:
    void put(priv::obstream&) const;
    bool get(priv::ibstream&);
    friend class priv::obstream;
    friend class priv::ibstream;
    friend class priv::field_writer;
    friend class priv::field_reader;
};

/**
 * @brief Latest known balance of one asset on one address.
 *
 * \ref amount is a decimal string in the smallest unit of the asset. When
 * \ref utxo is not empty, the amount equals the sum of the outputs.
 */
struct Balance {
    std::string address;
    ws::Timestamp timestamp = 0;
    Blockchain blockchain = Blockchain::Unspecified;
    std::string asset;
    std::string amount;
    std::vector<Utxo> utxo;

    ws::Bytes to_binary() const;
    static bool from_binary(const ws::Bytes& data, Balance& result);

    bool operator==(const Balance& other) const;

private:
    void put(priv::obstream&) const;
    bool get(priv::ibstream&);
    friend class priv::obstream;
    friend class priv::ibstream;
};

}  // namespace wsdb

#endif  // _WSDB_BALANCE_HPP_INCLUDED_
