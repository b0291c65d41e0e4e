#include <wsdb/storage.hpp>

#include <algorithm>
#include <cstring>

#include <boost/endian/conversion.hpp>
#include <boost/functional/hash.hpp>

#include <lib/system/logger.hpp>
#include <lib/system/utils.hpp>

#include <wsdb/config.hpp>
#include <wsdb/database_leveldb.hpp>
#include <wsdb/keys.hpp>

namespace wsdb {

Storage::Storage()
: ErrorHolder("Storage") {
}

Storage::~Storage() {
    close();
}

bool Storage::checkSchema(Database& db) {
    const ws::Bytes key = KeyCodec::versionKey();
    ws::Bytes value;
    if (!db.get(key, &value)) {
        if (db.last_error() != Database::NotFound) {
            set_last_error(DatabaseError, "Cannot read schema version: %s", db.last_error_message().c_str());
            return false;
        }
        value.clear();
    }

    uint32_t stored = 0;
    if (!value.empty()) {
        if (value.size() != sizeof(stored)) {
            set_last_error(MalformedValue, "Schema version marker has %zu bytes", value.size());
            return false;
        }
        std::memcpy(&stored, value.data(), sizeof(stored));
        stored = boost::endian::big_to_native(stored);
    }

    if (stored > kSchemaVersion) {
        set_last_error(DatabaseError, "Database is written by schema version %u, this build supports up to %u", stored, kSchemaVersion);
        return false;
    }

    if (stored < kSchemaVersion) {
        const uint32_t marker = boost::endian::native_to_big(kSchemaVersion);
        const auto data = reinterpret_cast<const uint8_t*>(&marker);
        if (!db.put(key, ws::Bytes(data, data + sizeof(marker)))) {
            set_last_error(DatabaseError, "Cannot write schema version: %s", db.last_error_message().c_str());
            return false;
        }
        if (stored == 0) {
            wsinfo() << "Storage> new database, schema version " << kSchemaVersion;
        }
        else {
            wsinfo() << "Storage> schema version " << stored << " upgraded to " << kSchemaVersion;
        }
    }

    schema_version_ = kSchemaVersion;
    return true;
}

bool Storage::open(const OpenOptions& options) {
    if (!options.db) {
        set_last_error(DatabaseError, "No valid database driver specified.");
        return false;
    }
    if (!options.db->is_open()) {
        set_last_error(DatabaseError, "Error open database: %s", options.db->last_error_message().c_str());
        return false;
    }
    if (options.page_size == 0 || options.allowance_default_ttl == 0 || options.allowance_max_ttl < options.allowance_default_ttl) {
        set_last_error(InvalidParameter, "Open options are inconsistent");
        return false;
    }

    ws::Lock<ws::SharedMutex> lock(mutex_);
    if (!checkSchema(*options.db)) {
        return false;
    }

    db_ = options.db;
    options_ = options;
    if (!options_.clock) {
        options_.clock = &ws::Utils::currentTimestamp;
    }

    set_last_error();
    return true;
}

bool Storage::open(const std::string& path, size_t cache_size) {
    if (path.empty()) {
        set_last_error(InvalidParameter, "Empty path to database");
        return false;
    }

    auto db = std::make_shared<DatabaseLevelDB>();
    if (!db->open(path, cache_size == 0 ? DatabaseLevelDB::kDefaultCacheSize : cache_size)) {
        set_last_error(DatabaseError, "Cannot open %s: %s", path.c_str(), db->last_error_message().c_str());
        return false;
    }

    OpenOptions options;
    options.db = db;
    return open(options);
}

bool Storage::open(const Config& config, Clock clock) {
    if (!config.isGood()) {
        set_last_error(InvalidParameter, "Configuration is not valid");
        return false;
    }

    auto db = std::make_shared<DatabaseLevelDB>();
    if (!db->open(config.getPathToDb(), config.getCacheSize())) {
        set_last_error(DatabaseError, "Cannot open %s: %s", config.getPathToDb().c_str(), db->last_error_message().c_str());
        return false;
    }

    OpenOptions options;
    options.db = db;
    options.clock = std::move(clock);
    options.cursor_lifetime = config.getCursorLifetime();
    options.allowance_default_ttl = config.getAllowanceDefaultTtl();
    options.allowance_max_ttl = config.getAllowanceMaxTtl();
    options.page_size = config.getPageSize();
    return open(options);
}

void Storage::close() {
    ws::Lock<ws::SharedMutex> lock(mutex_);
    if (db_) {
        wsdebug() << "Storage> closed";
    }
    db_.reset();
    schema_version_ = 0;
}

bool Storage::isOpen() const {
    ws::SharedLock<ws::SharedMutex> lock(mutex_);
    return static_cast<bool>(db_);
}

Database::Error Storage::db_last_error() const {
    auto db = database();
    if (db) {
        return db->last_error();
    }
    return Database::NotOpen;
}

std::string Storage::db_last_error_message() const {
    auto db = database();
    if (db) {
        return db->last_error_message();
    }
    return std::string{"Database not specified"};
}

std::shared_ptr<Database> Storage::database() const {
    ws::SharedLock<ws::SharedMutex> lock(mutex_);
    return db_;
}

ws::Timestamp Storage::now() const {
    ws::SharedLock<ws::SharedMutex> lock(mutex_);
    return options_.clock ? options_.clock() : ws::Utils::currentTimestamp();
}

ws::Duration Storage::cursorLifetime() const {
    ws::SharedLock<ws::SharedMutex> lock(mutex_);
    return options_.cursor_lifetime;
}

ws::Duration Storage::allowanceDefaultTtl() const {
    ws::SharedLock<ws::SharedMutex> lock(mutex_);
    return options_.allowance_default_ttl;
}

ws::Duration Storage::allowanceMaxTtl() const {
    ws::SharedLock<ws::SharedMutex> lock(mutex_);
    return options_.allowance_max_ttl;
}

size_t Storage::pageSize() const {
    ws::SharedLock<ws::SharedMutex> lock(mutex_);
    return options_.page_size;
}

uint32_t Storage::schemaVersion() const {
    ws::SharedLock<ws::SharedMutex> lock(mutex_);
    return schema_version_;
}

size_t Storage::stripeIndex(const ws::Bytes& key) const {
    return boost::hash_range(key.cbegin(), key.cend()) % kStripeCount;
}

std::mutex& Storage::stripe(const ws::Bytes& key) {
    return stripes_[stripeIndex(key)];
}

std::vector<std::unique_lock<std::mutex>> Storage::lockStripes(const std::vector<ws::Bytes>& keys) {
    std::vector<size_t> indexes;
    indexes.reserve(keys.size());
    for (const auto& key : keys) {
        indexes.push_back(stripeIndex(key));
    }
    std::sort(indexes.begin(), indexes.end());
    indexes.erase(std::unique(indexes.begin(), indexes.end()), indexes.end());

    std::vector<std::unique_lock<std::mutex>> locks;
    locks.reserve(indexes.size());
    for (size_t index : indexes) {
        locks.emplace_back(stripes_[index]);
    }
    return locks;
}

}  // namespace wsdb
