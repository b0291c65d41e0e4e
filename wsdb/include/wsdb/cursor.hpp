/**
 * @file cursor.hpp
 */

#ifndef _WSDB_CURSOR_HPP_INCLUDED_
#define _WSDB_CURSOR_HPP_INCLUDED_

#include <string>

#include <wsdb/errors.hpp>
#include <wsdb/types.hpp>

namespace wsdb {

/**
 * @brief Continuation position of a scan.
 *
 * \ref address names the scope the cursor belongs to (a wallet listing, an
 * address listing or the remote sync feed of an address), \ref value is the
 * opaque position inside that scope and \ref timestamp is the issue time.
 */
struct Cursor {
    std::string address;
    std::string value;
    ws::Timestamp timestamp = 0;

    bool operator==(const Cursor& other) const {
        return address == other.address && value == other.value && timestamp == other.timestamp;
    }

    ws::Bytes to_binary() const;
    static bool from_binary(const ws::Bytes& data, Cursor& result);

private:
    void put(priv::obstream&) const;
    bool get(priv::ibstream&);
    friend class priv::obstream;
    friend class priv::ibstream;
};

/**
 * @brief Opaque pagination token codec.
 *
 * Token layout, hex encoded: [generation byte][cursor record][CRC-32 of the
 * preceding bytes, big endian]. A token of another generation is reported
 * as StaleCursor, anything unreadable as MalformedCursor.
 */
class CursorCodec : public ErrorHolder {
public:
    explicit CursorCodec(uint8_t generation);

    uint8_t generation() const noexcept {
        return generation_;
    }

    std::string encode(const Cursor& cursor) const;
    bool decode(const std::string& token, Cursor* cursor) const;

private:
    uint8_t generation_;
};

}  // namespace wsdb

#endif  // _WSDB_CURSOR_HPP_INCLUDED_
