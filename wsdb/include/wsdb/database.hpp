/**
 * @file database.hpp
 */

#ifndef _WSDB_DATABASE_HPP_INCLUDED_
#define _WSDB_DATABASE_HPP_INCLUDED_

#include <memory>
#include <string>
#include <vector>

#include <lib/system/common.hpp>

namespace wsdb {

/**
 * @brief Abstract ordered key-value engine.
 *
 * Keys are compared bytewise. Every method reports its outcome through
 * \ref last_error; a missing key is reported as NotFound.
 */
class Database {
public:
    enum Error {
        NoError = 0,
        NotFound = 1,
        Corruption = 2,
        NotSupported = 3,
        InvalidArgument = 4,
        IOError = 5,
        NotOpen = 6,
        UnknownError = 255,
    };

protected:
    Database();

public:
    virtual ~Database();

    /**
     * @brief Read view of the engine, fixed at the moment of creation.
     */
    class Snapshot {
    protected:
        Snapshot();

    public:
        virtual ~Snapshot();
    };
    using SnapshotPtr = std::shared_ptr<const Snapshot>;

    /**
     * @brief Set of puts and removes applied atomically by \ref write_batch.
     *
     * Operations are applied in insertion order.
     */
    class Batch {
    public:
        struct Operation {
            enum Type {
                Put,
                Remove,
            };

            Type type;
            ws::Bytes key;
            ws::Bytes value;
        };

        void put(const ws::Bytes& key, const ws::Bytes& value);
        void remove(const ws::Bytes& key);

        bool empty() const noexcept {
            return operations_.empty();
        }

        size_t size() const noexcept {
            return operations_.size();
        }

        const std::vector<Operation>& operations() const noexcept {
            return operations_;
        }

    private:
        std::vector<Operation> operations_;
    };

    virtual bool is_open() const = 0;
    virtual bool put(const ws::Bytes& key, const ws::Bytes& value) = 0;
    virtual bool get(const ws::Bytes& key, ws::Bytes* value = nullptr, const SnapshotPtr& snapshot = nullptr) = 0;
    virtual bool remove(const ws::Bytes& key) = 0;
    virtual bool write_batch(const Batch& batch) = 0;

    virtual SnapshotPtr new_snapshot() = 0;

    class Iterator {
    protected:
        Iterator();

    public:
        virtual ~Iterator();

    public:
        virtual bool is_valid() const = 0;
        virtual void seek_to_first() = 0;
        virtual void seek_to_last() = 0;
        virtual void seek(const ws::Bytes& key) = 0;
        virtual void next() = 0;
        virtual void prev() = 0;
        virtual ws::Bytes key() const = 0;
        virtual ws::Bytes value() const = 0;
    };
    using IteratorPtr = std::shared_ptr<Iterator>;
    virtual IteratorPtr new_iterator(const SnapshotPtr& snapshot = nullptr) = 0;

public:
    Error last_error() const;
    std::string last_error_message() const;

protected:
    void set_last_error(Error error = NoError, const std::string& message = std::string());
    void set_last_error(Error error, const char* message, ...);
};

}  // namespace wsdb

#endif  // _WSDB_DATABASE_HPP_INCLUDED_
