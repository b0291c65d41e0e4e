#ifndef _WSDB_UNIT_TESTS_DATABASE_MOCK_HPP_INCLUDED_
#define _WSDB_UNIT_TESTS_DATABASE_MOCK_HPP_INCLUDED_

#include <iterator>
#include <map>

#include <wsdb/database.hpp>

#include <gmock/gmock.h>

namespace wsdb {

/// Iterator over a fixed, ordered set of entries.
class FakeIterator : public Database::Iterator {
public:
    explicit FakeIterator(std::map<ws::Bytes, ws::Bytes> entries)
    : entries_(std::move(entries))
    , pos_(entries_.end()) {
    }

    bool is_valid() const override {
        return pos_ != entries_.end();
    }
    void seek_to_first() override {
        pos_ = entries_.begin();
    }
    void seek_to_last() override {
        pos_ = entries_.empty() ? entries_.end() : std::prev(entries_.end());
    }
    void seek(const ws::Bytes& key) override {
        pos_ = entries_.lower_bound(key);
    }
    void next() override {
        ++pos_;
    }
    void prev() override {
        pos_ = pos_ == entries_.begin() ? entries_.end() : std::prev(pos_);
    }
    ws::Bytes key() const override {
        return pos_->first;
    }
    ws::Bytes value() const override {
        return pos_->second;
    }

private:
    std::map<ws::Bytes, ws::Bytes> entries_;
    std::map<ws::Bytes, ws::Bytes>::const_iterator pos_;
};

class MockDatabase : public Database {
public:
    MOCK_CONST_METHOD0(is_open, bool());
    MOCK_METHOD2(put, bool(const ws::Bytes&, const ws::Bytes&));
    MOCK_METHOD3(get, bool(const ws::Bytes&, ws::Bytes*, const SnapshotPtr&));
    MOCK_METHOD1(remove, bool(const ws::Bytes&));
    MOCK_METHOD1(write_batch, bool(const Batch&));
    MOCK_METHOD0(new_snapshot, SnapshotPtr());
    MOCK_METHOD1(new_iterator, IteratorPtr(const SnapshotPtr&));

    using Database::set_last_error;

    /// Action failing the call with \p error.
    auto fail(Error error) {
        return [this, error](auto&&...) {
            set_last_error(error);
            return false;
        };
    }

    /// Action succeeding the call.
    auto succeed() {
        return [this](auto&&...) {
            set_last_error();
            return true;
        };
    }
};

}  // namespace wsdb

#endif  // _WSDB_UNIT_TESTS_DATABASE_MOCK_HPP_INCLUDED_
