#include <wsdb/database_leveldb.hpp>

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/status.h>
#include <leveldb/write_batch.h>

#include <lib/system/logger.hpp>

namespace wsdb {

namespace {
::leveldb::Slice slice(const ws::Bytes& data) {
    return ::leveldb::Slice(reinterpret_cast<const char*>(data.data()), data.size());
}

ws::Bytes to_bytes(const ::leveldb::Slice& data) {
    auto begin = reinterpret_cast<const ws::Byte*>(data.data());
    return ws::Bytes(begin, begin + data.size());
}
}  // namespace

class DatabaseLevelDB::Snapshot final : public Database::Snapshot {
public:
    explicit Snapshot(std::shared_ptr<::leveldb::DB> db)
    : db_(std::move(db))
    , snapshot_(db_->GetSnapshot()) {
    }

    ~Snapshot() override {
        db_->ReleaseSnapshot(snapshot_);
    }

    const ::leveldb::Snapshot* handle() const {
        return snapshot_;
    }

private:
    std::shared_ptr<::leveldb::DB> db_;
    const ::leveldb::Snapshot* snapshot_;
};

class DatabaseLevelDB::Iterator final : public Database::Iterator {
public:
    Iterator(std::shared_ptr<::leveldb::DB> db, SnapshotPtr snapshot, ::leveldb::Iterator* it)
    : db_(std::move(db))
    , snapshot_(std::move(snapshot))
    , it_(it) {
    }

    bool is_valid() const override final {
        return it_->Valid();
    }

    void seek_to_first() override final {
        it_->SeekToFirst();
    }

    void seek_to_last() override final {
        it_->SeekToLast();
    }

    void seek(const ws::Bytes& key) override final {
        it_->Seek(slice(key));
    }

    void next() override final {
        it_->Next();
    }

    void prev() override final {
        it_->Prev();
    }

    ws::Bytes key() const override final {
        return it_->Valid() ? to_bytes(it_->key()) : ws::Bytes{};
    }

    ws::Bytes value() const override final {
        return it_->Valid() ? to_bytes(it_->value()) : ws::Bytes{};
    }

private:
    // destroyed bottom-up: the leveldb iterator first, the engine last
    std::shared_ptr<::leveldb::DB> db_;
    SnapshotPtr snapshot_;
    std::unique_ptr<::leveldb::Iterator> it_;
};

DatabaseLevelDB::DatabaseLevelDB() = default;

DatabaseLevelDB::~DatabaseLevelDB() = default;

bool DatabaseLevelDB::check(const ::leveldb::Status& status) {
    if (status.ok()) {
        set_last_error();
        return true;
    }

    Error error = UnknownError;
    if (status.IsNotFound()) {
        error = NotFound;
    }
    else if (status.IsCorruption()) {
        error = Corruption;
    }
    else if (status.IsNotSupportedError()) {
        error = NotSupported;
    }
    else if (status.IsInvalidArgument()) {
        error = InvalidArgument;
    }
    else if (status.IsIOError()) {
        error = IOError;
    }
    set_last_error(error, "LevelDB error: %s", status.ToString().c_str());
    return false;
}

bool DatabaseLevelDB::read_options(const SnapshotPtr& snapshot, ::leveldb::ReadOptions* options) {
    if (!db_) {
        set_last_error(NotOpen);
        return false;
    }
    if (!snapshot) {
        return true;
    }

    auto own = dynamic_cast<const DatabaseLevelDB::Snapshot*>(snapshot.get());
    if (nullptr == own) {
        set_last_error(InvalidArgument, "Snapshot was not created by LevelDB");
        return false;
    }
    options->snapshot = own->handle();
    return true;
}

bool DatabaseLevelDB::open(const std::string& path, const leveldb::Options& options) {
    db_.reset();

    leveldb::DB* db = nullptr;
    const leveldb::Status status = leveldb::DB::Open(options, path, &db);
    if (!check(status)) {
        wserror() << "DatabaseLevelDB> cannot open " << path << ": " << status.ToString();
        return false;
    }

    // the block cache is owned by this instance and freed with the engine
    leveldb::Cache* cache = options.block_cache;
    db_.reset(db, [cache](leveldb::DB* p) {
        delete p;
        delete cache;
    });
    wsinfo() << "DatabaseLevelDB> opened " << path;
    return true;
}

bool DatabaseLevelDB::open(const std::string& path, size_t cache_size) {
    ::leveldb::Options options;
    options.block_cache = leveldb::NewLRUCache(cache_size);
    options.create_if_missing = true;
    if (!open(path, options)) {
        delete options.block_cache;
        return false;
    }
    return true;
}

void DatabaseLevelDB::close() {
    db_.reset();
}

bool DatabaseLevelDB::is_open() const {
    return static_cast<bool>(db_);
}

bool DatabaseLevelDB::put(const ws::Bytes& key, const ws::Bytes& value) {
    if (!db_) {
        set_last_error(NotOpen);
        return false;
    }
    return check(db_->Put(leveldb::WriteOptions(), slice(key), slice(value)));
}

bool DatabaseLevelDB::get(const ws::Bytes& key, ws::Bytes* value, const SnapshotPtr& snapshot) {
    leveldb::ReadOptions options;
    if (!read_options(snapshot, &options)) {
        return false;
    }

    std::string result;
    if (!check(db_->Get(options, slice(key), &result))) {
        return false;
    }
    if (nullptr != value) {
        value->assign(result.cbegin(), result.cend());
    }
    return true;
}

bool DatabaseLevelDB::remove(const ws::Bytes& key) {
    if (!db_) {
        set_last_error(NotOpen);
        return false;
    }
    return check(db_->Delete(leveldb::WriteOptions(), slice(key)));
}

bool DatabaseLevelDB::write_batch(const Batch& batch) {
    if (!db_) {
        set_last_error(NotOpen);
        return false;
    }
    if (batch.empty()) {
        set_last_error();
        return true;
    }

    leveldb::WriteBatch updates;
    for (const auto& op : batch.operations()) {
        if (op.type == Batch::Operation::Put) {
            updates.Put(slice(op.key), slice(op.value));
        }
        else {
            updates.Delete(slice(op.key));
        }
    }

    leveldb::WriteOptions options;
    options.sync = true;
    return check(db_->Write(options, &updates));
}

DatabaseLevelDB::SnapshotPtr DatabaseLevelDB::new_snapshot() {
    if (!db_) {
        set_last_error(NotOpen);
        return nullptr;
    }
    set_last_error();
    return std::make_shared<DatabaseLevelDB::Snapshot>(db_);
}

DatabaseLevelDB::IteratorPtr DatabaseLevelDB::new_iterator(const SnapshotPtr& snapshot) {
    leveldb::ReadOptions options;
    if (!read_options(snapshot, &options)) {
        return nullptr;
    }
    set_last_error();
    return std::make_shared<DatabaseLevelDB::Iterator>(db_, snapshot, db_->NewIterator(options));
}

}  // namespace wsdb
