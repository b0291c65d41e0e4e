/**
 * @file record_fields.hpp
 *
 * Binary form of stored records. \ref obstream and \ref ibstream move
 * varints, length-prefixed strings and raw bytes; the tagged field layer on
 * top of them writes a record as a sequence of fields, each one a compact
 * header ((id << 3) | wire type) followed by its payload. Unknown ids are
 * skipped on read and absent fields keep their defaults, so records written
 * by a newer or older layout stay readable. Repeated fields are written as
 * the same id several times.
 */

#ifndef _WSDB_PRIVATE_RECORD_FIELDS_HPP_INCLUDED_
#define _WSDB_PRIVATE_RECORD_FIELDS_HPP_INCLUDED_

#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <lib/system/common.hpp>

#include "integral_encdec.hpp"

namespace wsdb {
namespace priv {

/// Growing buffer a record is serialized into.
class obstream {
public:
    /// Raw bytes, no length prefix.
    void put(const void* buf, size_t size);

    void put(const std::string& value) {
        put_sized(value.data(), value.size());
    }

    void put(const ws::Bytes& value) {
        put_sized(value.data(), value.size());
    }

    template <typename T>
    typename std::enable_if<detail::is_encodable<T>::value, void>::type put(T value) {
        uint8_t buf[MAX_INTEGRAL_ENCODED_SIZE];
        put(buf, encode(buf, value));
    }

    // record with its own put(obstream&)
    template <typename T>
    decltype(std::declval<T>().put(std::declval<obstream&>())) put(const T& record) {
        record.put(*this);
    }

    const ws::Bytes& buffer() const noexcept {
        return buffer_;
    }

private:
    void put_sized(const void* data, size_t size);

    ws::Bytes buffer_;
};

/// Read position over serialized bytes. The bytes are not owned and must outlive the stream.
class ibstream {
public:
    ibstream(const void* data, size_t size)
    : pos_(static_cast<const uint8_t*>(data))
    , end_(pos_ + size) {
    }

    template <typename T>
    explicit ibstream(const T& container)
    : ibstream(container.data(), container.size()) {
    }

    /// Raw bytes, no length prefix.
    bool get(void* buf, size_t size);
    bool get(std::string& value);
    bool get(ws::Bytes& value);

    template <typename T>
    typename std::enable_if<detail::is_encodable<T>::value, bool>::type get(T& value) {
        const size_t used = decode(pos_, size(), value);
        pos_ += used;
        return used != 0;
    }

    // record with its own get(ibstream&)
    template <typename T>
    decltype(std::declval<T>().get(std::declval<ibstream&>())) get(T& record) {
        return record.get(*this);
    }

    size_t size() const noexcept {
        return static_cast<size_t>(end_ - pos_);
    }

    bool empty() const noexcept {
        return pos_ == end_;
    }

private:
    /// Consumes \p size bytes, false if fewer remain.
    bool take(size_t size, const uint8_t** data);
    /// Consumes a varint length and that many bytes.
    bool take_sized(const uint8_t** data, size_t* size);

    const uint8_t* pos_;
    const uint8_t* end_;
};

using field_id_t = uint32_t;

enum class WireType : uint8_t {
    Varint = 0,
    Bytes = 2,
};

class field_writer {
public:
    explicit field_writer(obstream& os)
    : os_(os) {
    }

    template <typename T>
    typename std::enable_if<detail::is_encodable<T>::value, void>::type put(field_id_t id, T value) {
        header(id, WireType::Varint);
        os_.put(value);
    }

    void put(field_id_t id, const std::string& value) {
        header(id, WireType::Bytes);
        os_.put(value);
    }

    void put(field_id_t id, const ws::Bytes& value) {
        header(id, WireType::Bytes);
        os_.put(value);
    }

    // nested record
    template <typename T>
    decltype(std::declval<T>().put(std::declval<obstream&>())) put(field_id_t id, const T& value) {
        obstream nested;
        nested.put(value);
        header(id, WireType::Bytes);
        os_.put(nested.buffer());
    }

    template <typename T>
    void put(field_id_t id, const std::optional<T>& value) {
        if (value) {
            put(id, *value);
        }
    }

    template <typename T>
    void put(field_id_t id, const std::vector<T>& values) {
        for (const auto& value : values) {
            put(id, value);
        }
    }

private:
    void header(field_id_t id, WireType type) {
        os_.put((static_cast<uint64_t>(id) << 3) | static_cast<uint64_t>(type));
    }

    obstream& os_;
};

class field_reader {
public:
    explicit field_reader(ibstream& is)
    : is_(is) {
    }

    /**
     * @brief Reads the next field header.
     * @return false at the end of the record or on a broken header, see \ref failed.
     */
    bool next(field_id_t& id) {
        if (is_.empty()) {
            return false;
        }
        uint64_t header = 0;
        if (!is_.get(header)) {
            failed_ = true;
            return false;
        }
        const auto type = static_cast<uint8_t>(header & 0x07u);
        if (type != static_cast<uint8_t>(WireType::Varint) && type != static_cast<uint8_t>(WireType::Bytes)) {
            failed_ = true;
            return false;
        }
        if ((header >> 3) > std::numeric_limits<field_id_t>::max()) {
            failed_ = true;
            return false;
        }
        type_ = static_cast<WireType>(type);
        id = static_cast<field_id_t>(header >> 3);
        return true;
    }

    bool failed() const noexcept {
        return failed_;
    }

    template <typename T>
    typename std::enable_if<detail::is_encodable<T>::value, bool>::type get(T& value) {
        return check(type_ == WireType::Varint && is_.get(value));
    }

    bool get(std::string& value) {
        return check(type_ == WireType::Bytes && is_.get(value));
    }

    bool get(ws::Bytes& value) {
        return check(type_ == WireType::Bytes && is_.get(value));
    }

    // nested record
    template <typename T>
    decltype(std::declval<T>().get(std::declval<ibstream&>())) get(T& value) {
        ws::Bytes data;
        if (!check(type_ == WireType::Bytes && is_.get(data))) {
            return false;
        }
        ibstream nested(data);
        return check(nested.get(value));
    }

    template <typename T>
    bool get(std::optional<T>& value) {
        T item{};
        if (!get(item)) {
            return false;
        }
        value = std::move(item);
        return true;
    }

    template <typename T>
    bool get(std::vector<T>& values) {
        T item{};
        if (!get(item)) {
            return false;
        }
        values.push_back(std::move(item));
        return true;
    }

    bool skip() {
        if (type_ == WireType::Varint) {
            uint64_t ignored;
            return check(is_.get(ignored));
        }
        ws::Bytes ignored;
        return check(is_.get(ignored));
    }

private:
    bool check(bool ok) {
        if (!ok) {
            failed_ = true;
        }
        return ok;
    }

    ibstream& is_;
    WireType type_ = WireType::Varint;
    bool failed_ = false;
};

}  // namespace priv
}  // namespace wsdb

#endif  // _WSDB_PRIVATE_RECORD_FIELDS_HPP_INCLUDED_
