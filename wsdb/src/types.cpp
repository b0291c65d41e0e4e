#include <wsdb/types.hpp>

namespace wsdb {

const char* to_string(Blockchain blockchain) {
    switch (blockchain) {
        case Blockchain::Unspecified:
            return "UNSPECIFIED";
        case Blockchain::Bitcoin:
            return "BITCOIN";
        case Blockchain::Ethereum:
            return "ETHEREUM";
        case Blockchain::EthereumClassic:
            return "ETHEREUM_CLASSIC";
        case Blockchain::Morden:
            return "MORDEN";
        case Blockchain::Kovan:
            return "KOVAN";
        case Blockchain::TestnetBitcoin:
            return "TESTNET_BITCOIN";
        case Blockchain::Goerli:
            return "GOERLI";
        case Blockchain::Ropsten:
            return "ROPSTEN";
        case Blockchain::Rinkeby:
            return "RINKEBY";
        case Blockchain::Holesky:
            return "HOLESKY";
        case Blockchain::Sepolia:
            return "SEPOLIA";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, Blockchain blockchain) {
    const char* name = to_string(blockchain);
    os << name;
    if (name[0] == 'U' && blockchain != Blockchain::Unspecified) {
        os << '(' << static_cast<uint32_t>(blockchain) << ')';
    }
    return os;
}

}  // namespace wsdb
