#include <wsdb/balance.hpp>

#include "record_fields.hpp"

namespace wsdb {

namespace {
enum UtxoField : priv::field_id_t {
    UtxoTxId = 1,
    UtxoVout = 2,
    UtxoAmount = 3,
};

enum BalanceField : priv::field_id_t {
    BalanceAddress = 1,
    BalanceTimestamp = 2,
    BalanceBlockchain = 3,
    BalanceAsset = 4,
    BalanceAmount = 5,
    BalanceUtxo = 6,
};
}  // namespace

void Utxo::put(priv::obstream& os) const {
    priv::field_writer writer(os);
    writer.put(UtxoTxId, txid);
    writer.put(UtxoVout, vout);
    writer.put(UtxoAmount, amount);
}

bool Utxo::get(priv::ibstream& is) {
    priv::field_reader reader(is);
    priv::field_id_t id;
    while (reader.next(id)) {
        bool ok = false;
        switch (id) {
            case UtxoTxId:
                ok = reader.get(txid);
                break;
            case UtxoVout:
                ok = reader.get(vout);
                break;
            case UtxoAmount:
                ok = reader.get(amount);
                break;
            default:
                ok = reader.skip();
                break;
        }
        if (!ok) {
            return false;
        }
    }
    return !reader.failed();
}

bool Balance::operator==(const Balance& other) const {
    return address == other.address && timestamp == other.timestamp && blockchain == other.blockchain && asset == other.asset &&
           amount == other.amount && utxo == other.utxo;
}

void Balance::put(priv::obstream& os) const {
    priv::field_writer writer(os);
    writer.put(BalanceAddress, address);
    writer.put(BalanceTimestamp, timestamp);
    writer.put(BalanceBlockchain, blockchain);
    writer.put(BalanceAsset, asset);
    writer.put(BalanceAmount, amount);
    writer.put(BalanceUtxo, utxo);
}

bool Balance::get(priv::ibstream& is) {
    priv::field_reader reader(is);
    priv::field_id_t id;
    while (reader.next(id)) {
        bool ok = false;
        switch (id) {
            case BalanceAddress:
                ok = reader.get(address);
                break;
            case BalanceTimestamp:
                ok = reader.get(timestamp);
                break;
            case BalanceBlockchain:
                ok = reader.get(blockchain);
                break;
            case BalanceAsset:
                ok = reader.get(asset);
                break;
            case BalanceAmount:
                ok = reader.get(amount);
                break;
            case BalanceUtxo:
                ok = reader.get(utxo);
                break;
            default:
                ok = reader.skip();
                break;
        }
        if (!ok) {
            return false;
        }
    }
    return !reader.failed();
}

ws::Bytes Balance::to_binary() const {
    priv::obstream os;
    os.put(*this);
    return os.buffer();
}

bool Balance::from_binary(const ws::Bytes& data, Balance& result) {
    Balance balance;
    priv::ibstream is(data);
    if (!is.get(balance)) {
        return false;
    }
    result = std::move(balance);
    return true;
}

}  // namespace wsdb
