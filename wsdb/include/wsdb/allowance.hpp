/**
 * @file allowance.hpp
 */

#ifndef _WSDB_ALLOWANCE_HPP_INCLUDED_
#define _WSDB_ALLOWANCE_HPP_INCLUDED_

#include <string>

#include <wsdb/types.hpp>

namespace wsdb {

/// ERC-20 allowance of \ref spender over \ref owner's \ref token.
struct Allowance {
    ws::Timestamp timestamp = 0;
    ws::Duration ttl = 0;
    std::string wallet_id;
    Blockchain blockchain = Blockchain::Unspecified;
    std::string token;
    std::string owner;
    std::string spender;
    std::string amount;

    /// now > timestamp + ttl, without wrapping near the end of the range
    bool is_expired(ws::Timestamp now) const {
        return now > timestamp && now - timestamp > ttl;
    }

    ws::Bytes to_binary() const;
    static bool from_binary(const ws::Bytes& data, Allowance& result);

    bool operator==(const Allowance& other) const;

private:
    void put(priv::obstream&) const;
    bool get(priv::ibstream&);
    friend class priv::obstream;
    friend class priv::ibstream;
};

}  // namespace wsdb

#endif  // _WSDB_ALLOWANCE_HPP_INCLUDED_
