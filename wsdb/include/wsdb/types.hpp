/**
 * @file types.hpp
 */

#ifndef _WSDB_TYPES_HPP_INCLUDED_
#define _WSDB_TYPES_HPP_INCLUDED_

#include <cstdint>
#include <ostream>

#include <lib/system/common.hpp>

namespace wsdb {

namespace priv {
class obstream;
class ibstream;
class field_writer;
class field_reader;
}  // namespace priv

/// Wallet numbering of chains. Codes unknown to this build are kept as is.
enum class Blockchain : uint32_t {
    Unspecified = 0,
    Bitcoin = 1,
    Ethereum = 100,
    EthereumClassic = 101,
    Morden = 10001,
    Kovan = 10002,
    TestnetBitcoin = 10003,
    Goerli = 10005,
    Ropsten = 10006,
    Rinkeby = 10007,
    Holesky = 10008,
    Sepolia = 10009,
};

const char* to_string(Blockchain blockchain);
std::ostream& operator<<(std::ostream& os, Blockchain blockchain);

}  // namespace wsdb

#endif  // _WSDB_TYPES_HPP_INCLUDED_
