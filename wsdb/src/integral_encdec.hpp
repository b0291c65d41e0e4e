/**
 * @file integral_encdec.hpp
 *
 * Compact variable-length encoding of integral types. Values are written
 * seven bits per byte, least significant group first, with the high bit of
 * each byte marking a continuation. Signed values are zigzag-mapped first so
 * that small negative numbers stay short.
 */

#ifndef _WSDB_PRIVATE_INTEGRAL_ENCDEC_HPP_INCLUDED_
#define _WSDB_PRIVATE_INTEGRAL_ENCDEC_HPP_INCLUDED_

#include <cinttypes>
#include <cstddef>
#include <limits>
#include <type_traits>

namespace wsdb {
namespace priv {
enum {
    MAX_INTEGRAL_ENCODED_SIZE = 10,
};

namespace detail {
template <typename T, bool = std::is_enum<T>::value>
struct integral_of {
    using type = T;
};

template <typename T>
struct integral_of<T, true> {
    using type = typename std::underlying_type<T>::type;
};

template <typename T>
using is_encodable = std::integral_constant<bool, (std::is_integral<T>::value || std::is_enum<T>::value) && (sizeof(T) <= sizeof(uint64_t))>;
}  // namespace detail

std::size_t encode_unsigned(void* buf, uint64_t value);
std::size_t decode_unsigned(const void* buf, std::size_t size, uint64_t& value);

inline uint64_t zigzag(int64_t value) {
    return (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);
}

inline int64_t unzigzag(uint64_t value) {
    return static_cast<int64_t>(value >> 1) ^ -static_cast<int64_t>(value & 1);
}

/**
 * @brief Encodes an integral or enum value.
 * @param[out]  buf   At least \ref MAX_INTEGRAL_ENCODED_SIZE bytes.
 * @return  Number of bytes written.
 */
template <typename T>
typename std::enable_if<detail::is_encodable<T>::value, std::size_t>::type encode(void* buf, T value) {
    using I = typename detail::integral_of<T>::type;
    const I v = static_cast<I>(value);
    if constexpr (std::is_same<I, bool>::value) {
        return encode_unsigned(buf, v ? 1u : 0u);
    }
    else if constexpr (std::is_signed<I>::value) {
        return encode_unsigned(buf, zigzag(static_cast<int64_t>(v)));
    }
    else {
        return encode_unsigned(buf, static_cast<uint64_t>(v));
    }
}

/**
 * @brief Decodes an integral or enum value.
 * @return  Number of bytes consumed, 0 if the data is truncated, overlong or
 *          does not fit into T.
 */
template <typename T>
typename std::enable_if<detail::is_encodable<T>::value, std::size_t>::type decode(const void* buf, std::size_t size, T& value) {
    using I = typename detail::integral_of<T>::type;
    uint64_t raw = 0;
    const std::size_t res = decode_unsigned(buf, size, raw);
    if (0 == res) {
        return 0;
    }

    if constexpr (std::is_same<I, bool>::value) {
        if (raw > 1) {
            return 0;
        }
        value = static_cast<T>(raw != 0);
    }
    else if constexpr (std::is_signed<I>::value) {
        const int64_t s = unzigzag(raw);
        if (s < static_cast<int64_t>(std::numeric_limits<I>::min()) || s > static_cast<int64_t>(std::numeric_limits<I>::max())) {
            return 0;
        }
        value = static_cast<T>(static_cast<I>(s));
    }
    else {
        if (raw > static_cast<uint64_t>(std::numeric_limits<I>::max())) {
            return 0;
        }
        value = static_cast<T>(static_cast<I>(raw));
    }
    return res;
}

}  // namespace priv
}  // namespace wsdb

#endif  // _WSDB_PRIVATE_INTEGRAL_ENCDEC_HPP_INCLUDED_
