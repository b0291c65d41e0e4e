#include <wsdb/allowance.hpp>

#include "record_fields.hpp"

namespace wsdb {

namespace {
enum AllowanceField : priv::field_id_t {
    AllowanceTimestamp = 1,
    AllowanceTtl = 2,
    AllowanceWalletId = 3,
    AllowanceBlockchain = 4,
    AllowanceToken = 5,
    AllowanceOwner = 6,
    AllowanceSpender = 7,
    AllowanceAmount = 8,
};
}  // namespace

bool Allowance::operator==(const Allowance& other) const {
    return timestamp == other.timestamp && ttl == other.ttl && wallet_id == other.wallet_id && blockchain == other.blockchain &&
           token == other.token && owner == other.owner && spender == other.spender && amount == other.amount;
}

void Allowance::put(priv::obstream& os) const {
    priv::field_writer writer(os);
    writer.put(AllowanceTimestamp, timestamp);
    writer.put(AllowanceTtl, ttl);
    writer.put(AllowanceWalletId, wallet_id);
    writer.put(AllowanceBlockchain, blockchain);
    writer.put(AllowanceToken, token);
    writer.put(AllowanceOwner, owner);
    writer.put(AllowanceSpender, spender);
    writer.put(AllowanceAmount, amount);
}

bool Allowance::get(priv::ibstream& is) {
    priv::field_reader reader(is);
    priv::field_id_t id;
    while (reader.next(id)) {
        bool ok = false;
        switch (id) {
            case AllowanceTimestamp:
                ok = reader.get(timestamp);
                break;
            case AllowanceTtl:
                ok = reader.get(ttl);
                break;
            case AllowanceWalletId:
                ok = reader.get(wallet_id);
                break;
            case AllowanceBlockchain:
                ok = reader.get(blockchain);
                break;
            case AllowanceToken:
                ok = reader.get(token);
                break;
            case AllowanceOwner:
                ok = reader.get(owner);
                break;
            case AllowanceSpender:
                ok = reader.get(spender);
                break;
            case AllowanceAmount:
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

ws::Bytes Allowance::to_binary() const {
    priv::obstream os;
    os.put(*this);
    return os.buffer();
}

bool Allowance::from_binary(const ws::Bytes& data, Allowance& result) {
    Allowance allowance;
    priv::ibstream is(data);
    if (!is.get(allowance)) {
        return false;
    }
    result = std::move(allowance);
    return true;
}

}  // namespace wsdb
