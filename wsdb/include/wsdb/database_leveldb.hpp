/**
 * @file database_leveldb.hpp
 */

#ifndef _WSDB_DATABASE_LEVELDB_HPP_INCLUDED_
#define _WSDB_DATABASE_LEVELDB_HPP_INCLUDED_

#include <memory>

#include <wsdb/database.hpp>

namespace leveldb {
class DB;
class Status;
struct Options;
struct ReadOptions;
}  // namespace leveldb

namespace wsdb {

class DatabaseLevelDB : public Database {
public:
    static constexpr size_t kDefaultCacheSize = 8 * 1024 * 1024;

    DatabaseLevelDB();
    ~DatabaseLevelDB() override;

public:
    bool open(const std::string& path, size_t cache_size = kDefaultCacheSize);
    bool open(const std::string& path, const leveldb::Options& options);
    void close();

private:
    bool is_open() const override final;
    bool put(const ws::Bytes& key, const ws::Bytes& value) override final;
    bool get(const ws::Bytes& key, ws::Bytes* value, const SnapshotPtr& snapshot) override final;
    bool remove(const ws::Bytes& key) override final;
    bool write_batch(const Batch& batch) override final;
    SnapshotPtr new_snapshot() override final;
    IteratorPtr new_iterator(const SnapshotPtr& snapshot) override final;

private:
    class Iterator;
    class Snapshot;

private:
    /// Records the outcome of \p status, true when it is ok.
    bool check(const ::leveldb::Status& status);
    /// Read options at \p snapshot; false when closed or the snapshot is foreign.
    bool read_options(const SnapshotPtr& snapshot, ::leveldb::ReadOptions* options);

private:
    // iterators and snapshots keep their own reference, so the engine outlives them
    std::shared_ptr<leveldb::DB> db_;
};

}  // namespace wsdb
#endif  // _WSDB_DATABASE_LEVELDB_HPP_INCLUDED_
