#include "wsdb_unit_tests_environment.hpp"

#include <leveldb/db.h>
#include <leveldb/env.h>
#include <leveldb/options.h>

namespace wsdb {
namespace test {

std::string fresh_db_path(const std::string& name) {
    leveldb::Env* env = leveldb::Env::Default();
    std::string path;
    EXPECT_TRUE(env->GetTestDirectory(&path).ok());
    path += "/" + name;
    destroy_db(path);
    return path;
}

void destroy_db(const std::string& path) {
    if (leveldb::Env::Default()->FileExists(path)) {
        EXPECT_TRUE(leveldb::DestroyDB(path, leveldb::Options()).ok());
    }
}

Change change(const std::string& wallet_id, const std::string& address, const std::string& amount, Direction direction) {
    Change c;
    c.wallet_id = wallet_id;
    c.address = address;
    c.asset = "ETH";
    c.amount = amount;
    c.change_type = ChangeType::Transfer;
    c.direction = direction;
    return c;
}

Transaction transaction(const std::string& tx_id, State state, Blockchain blockchain) {
    Transaction tx;
    tx.blockchain = blockchain;
    tx.tx_id = tx_id;
    tx.state = state;
    tx.since_timestamp = 1000;
    tx.sync_timestamp = 1000;
    return tx;
}

BlockRef block(uint64_t height, const std::string& block_id) {
    BlockRef b;
    b.height = height;
    b.block_id = block_id;
    b.timestamp = 5000 + height;
    return b;
}

}  // namespace test
}  // namespace wsdb
