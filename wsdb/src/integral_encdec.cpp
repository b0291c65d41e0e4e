#include "integral_encdec.hpp"

namespace wsdb {
namespace priv {

std::size_t encode_unsigned(void* buf, uint64_t value) {
    auto buffer = static_cast<uint8_t*>(buf);
    std::size_t size = 0;
    while (value >= 0x80u) {
        buffer[size++] = static_cast<uint8_t>(value | 0x80u);
        value >>= 7;
    }
    buffer[size++] = static_cast<uint8_t>(value);
    return size;
}

std::size_t decode_unsigned(const void* buf, std::size_t size, uint64_t& value) {
    auto d = static_cast<const uint8_t*>(buf);
    uint64_t val = 0;
    for (std::size_t i = 0; i < size && i < MAX_INTEGRAL_ENCODED_SIZE; ++i) {
        const uint8_t byte = d[i];
        // the tenth byte may only carry the top bit of a 64-bit value
        if (i == MAX_INTEGRAL_ENCODED_SIZE - 1 && byte > 1u) {
            return 0;
        }
        val |= static_cast<uint64_t>(byte & 0x7Fu) << (7 * i);
        if (0 == (byte & 0x80u)) {
            value = val;
            return i + 1;
        }
    }
    return 0;
}

}  // namespace priv
}  // namespace wsdb
