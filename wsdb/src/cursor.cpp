#include <wsdb/cursor.hpp>

#include <cstring>

#include <boost/crc.hpp>
#include <boost/endian/conversion.hpp>

#include <wsdb/internal/utils.hpp>

#include "record_fields.hpp"

namespace wsdb {

namespace {
enum CursorField : priv::field_id_t {
    CursorAddress = 1,
    CursorValue = 2,
    CursorTimestamp = 3,
};

constexpr size_t kChecksumSize = sizeof(uint32_t);

uint32_t checksum(const uint8_t* data, size_t size) {
    boost::crc_32_type crc;
    crc.process_bytes(data, size);
    return crc.checksum();
}
}  // namespace

void Cursor::put(priv::obstream& os) const {
    priv::field_writer writer(os);
    writer.put(CursorAddress, address);
    writer.put(CursorValue, value);
    writer.put(CursorTimestamp, timestamp);
}

bool Cursor::get(priv::ibstream& is) {
    priv::field_reader reader(is);
    priv::field_id_t id;
    while (reader.next(id)) {
        bool ok = false;
        switch (id) {
            case CursorAddress:
                ok = reader.get(address);
                break;
            case CursorValue:
                ok = reader.get(value);
                break;
            case CursorTimestamp:
                ok = reader.get(timestamp);
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

ws::Bytes Cursor::to_binary() const {
    priv::obstream os;
    os.put(*this);
    return os.buffer();
}

bool Cursor::from_binary(const ws::Bytes& data, Cursor& result) {
    Cursor cursor;
    priv::ibstream is(data);
    if (!is.get(cursor)) {
        return false;
    }
    result = std::move(cursor);
    return true;
}

CursorCodec::CursorCodec(uint8_t generation)
: ErrorHolder("CursorCodec")
, generation_(generation) {
}

std::string CursorCodec::encode(const Cursor& cursor) const {
    priv::obstream os;
    os.put(&generation_, sizeof(generation_));
    os.put(cursor);

    const ws::Bytes& data = os.buffer();
    const uint32_t crc = boost::endian::native_to_big(checksum(data.data(), data.size()));
    os.put(&crc, sizeof(crc));

    set_last_error();
    return internal::to_hex(os.buffer());
}

bool CursorCodec::decode(const std::string& token, Cursor* cursor) const {
    ws::Bytes data;
    if (!internal::from_hex(token, data)) {
        set_last_error(MalformedCursor, "Cursor token is not a hex string");
        return false;
    }
    if (data.size() < 1 + kChecksumSize) {
        set_last_error(MalformedCursor, "Cursor token is truncated");
        return false;
    }

    const size_t payload = data.size() - kChecksumSize;
    uint32_t stored = 0;
    std::memcpy(&stored, data.data() + payload, kChecksumSize);
    if (boost::endian::big_to_native(stored) != checksum(data.data(), payload)) {
        set_last_error(MalformedCursor, "Cursor token checksum mismatch");
        return false;
    }

    if (data[0] != generation_) {
        set_last_error(StaleCursor, "Cursor token generation %u, current %u", static_cast<unsigned>(data[0]),
                       static_cast<unsigned>(generation_));
        return false;
    }

    Cursor result;
    priv::ibstream is(data.data() + 1, payload - 1);
    if (!is.get(result)) {
        set_last_error(MalformedCursor, "Cursor record cannot be decoded");
        return false;
    }

    if (nullptr != cursor) {
        *cursor = std::move(result);
    }
    set_last_error();
    return true;
}

}  // namespace wsdb
