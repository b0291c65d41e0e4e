/**
 * @file storage.hpp
 */

#ifndef _WSDB_STORAGE_HPP_INCLUDED_
#define _WSDB_STORAGE_HPP_INCLUDED_

#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <wsdb/database.hpp>
#include <wsdb/errors.hpp>

#include <lib/system/common.hpp>

namespace wsdb {

class Config;

/**
 * @brief Handle to the opened key-value engine.
 *
 * Storage is created closed. It is opened explicitly, either over an already
 * open \ref Database or over a LevelDB directory, and passed by reference to
 * every store. Stores check the handle on each call and fail with NotOpen
 * once it is closed.
 *
 * On open the schema version marker is written if the database is new; a
 * database written by a newer schema is refused.
 */
class Storage final : public ErrorHolder {
public:
    static constexpr uint32_t kSchemaVersion = 1;
    static constexpr size_t kStripeCount = 64;

    static constexpr ws::Duration kDefaultCursorLifetime = 24 * 60 * 60 * 1000ull;
    static constexpr ws::Duration kDefaultAllowanceTtl = 24 * 60 * 60 * 1000ull;
    static constexpr ws::Duration kMaxAllowanceTtl = 30 * 24 * 60 * 60 * 1000ull;
    static constexpr size_t kDefaultPageSize = 50;

    using Clock = std::function<ws::Timestamp()>;

    struct OpenOptions {
        /// Db driver unit, has to be open already
        std::shared_ptr<Database> db;
        /// Source of "now", system clock if empty
        Clock clock;
        ws::Duration cursor_lifetime = kDefaultCursorLifetime;
        ws::Duration allowance_default_ttl = kDefaultAllowanceTtl;
        ws::Duration allowance_max_ttl = kMaxAllowanceTtl;
        size_t page_size = kDefaultPageSize;
    };

public:
    Storage();
    ~Storage() override;

    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;

    bool open(const OpenOptions& options);

    /**
     * @brief Opens (creating if missing) a LevelDB database in \p path.
     */
    bool open(const std::string& path, size_t cache_size = 0);

    /**
     * @brief Opens the database described by the [storage] section of \p config.
     */
    bool open(const Config& config, Clock clock = nullptr);

    void close();
    bool isOpen() const;

    Database::Error db_last_error() const;
    std::string db_last_error_message() const;

    /// Engine of the open storage, nullptr when closed.
    std::shared_ptr<Database> database() const;

    ws::Timestamp now() const;
    ws::Duration cursorLifetime() const;
    ws::Duration allowanceDefaultTtl() const;
    ws::Duration allowanceMaxTtl() const;
    size_t pageSize() const;
    uint32_t schemaVersion() const;

    /// Lock serializing read-check-write sequences on \p key.
    std::mutex& stripe(const ws::Bytes& key);

    /// Locks the stripes of all \p keys in a deadlock free order.
    std::vector<std::unique_lock<std::mutex>> lockStripes(const std::vector<ws::Bytes>& keys);

private:
    bool checkSchema(Database& db);
    size_t stripeIndex(const ws::Bytes& key) const;

    mutable ws::SharedMutex mutex_;
    std::shared_ptr<Database> db_;
    OpenOptions options_;
    uint32_t schema_version_ = 0;
    std::array<std::mutex, kStripeCount> stripes_;
};

}  // namespace wsdb

#endif  // _WSDB_STORAGE_HPP_INCLUDED_
