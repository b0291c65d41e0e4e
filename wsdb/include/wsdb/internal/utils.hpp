/**
 * @file utils.hpp
 */

#ifndef _WSDB_INTERNAL_UTILS_HPP_INCLUDED_
#define _WSDB_INTERNAL_UTILS_HPP_INCLUDED_

#include <cctype>
#include <iterator>
#include <string>

#include <lib/system/common.hpp>

namespace wsdb {
namespace internal {

inline bool digit_from_hex(char val, uint8_t& result) {
    val = static_cast<char>(toupper(static_cast<unsigned char>(val)));

    if ((val >= '0') && (val <= '9'))
        result = static_cast<uint8_t>(val - '0');
    else if ((val >= 'A') && (val <= 'F'))
        result = static_cast<uint8_t>(val - 'A' + 10);
    else
        return false;

    return true;
}

/**
 * @brief Strict hex decoding.
 * @return false on odd length or a non-hex character.
 */
template <typename Iterator>
bool from_hex(Iterator beg, Iterator end, ws::Bytes& result) {
    const auto length = std::distance(beg, end);
    if (length % 2 != 0) {
        return false;
    }

    ws::Bytes res;
    res.reserve(static_cast<size_t>(length / 2));
    for (Iterator it = beg; it != end;) {
        uint8_t hi = 0, lo = 0;
        if (!digit_from_hex(*it++, hi) || !digit_from_hex(*it++, lo)) {
            return false;
        }
        res.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    result = std::move(res);
    return true;
}

template <typename Iterator>
std::string to_hex(Iterator beg, Iterator end) {
    auto digit_to_hex = [](uint8_t val) { return static_cast<char>((val < 10) ? (val + '0') : (val - 10 + 'a')); };

    std::string res;
    res.reserve(static_cast<size_t>(std::distance(beg, end)) * 2);
    for (Iterator it = beg; it != end; it++) {
        res.push_back(digit_to_hex((*it >> 4) & 0x0F));
        res.push_back(digit_to_hex(*it & 0x0F));
    }
    return res;
}

inline bool from_hex(const std::string& val, ws::Bytes& result) {
    return from_hex(val.begin(), val.end(), result);
}

inline std::string to_hex(const ws::Bytes& val) {
    return to_hex(val.begin(), val.end());
}

inline bool is_ascii(const std::string& value) {
    for (char c : value) {
        if (static_cast<unsigned char>(c) > 0x7F) {
            return false;
        }
    }
    return true;
}

/// Non-empty string of decimal digits.
inline bool is_decimal(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (char c : value) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

/// "0x" followed by 40 hex digits.
inline bool is_ethereum_address(const std::string& value) {
    if (value.size() != 42 || value[0] != '0' || value[1] != 'x') {
        return false;
    }
    uint8_t ignored;
    for (size_t i = 2; i < value.size(); ++i) {
        if (!digit_from_hex(value[i], ignored)) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Parses a decimal string into an unsigned 64-bit value.
 * @return false on empty input, a non-digit or overflow.
 */
inline bool parse_decimal(const std::string& value, uint64_t& result) {
    if (!is_decimal(value)) {
        return false;
    }
    uint64_t res = 0;
    for (char c : value) {
        const auto digit = static_cast<uint64_t>(c - '0');
        if (res > (UINT64_MAX - digit) / 10) {
            return false;
        }
        res = res * 10 + digit;
    }
    result = res;
    return true;
}

}  // namespace internal
}  // namespace wsdb

#endif  // _WSDB_INTERNAL_UTILS_HPP_INCLUDED_
