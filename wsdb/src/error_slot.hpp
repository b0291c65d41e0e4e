/**
 * @file error_slot.hpp
 */

#ifndef _WSDB_PRIVATE_ERROR_SLOT_HPP_INCLUDED_
#define _WSDB_PRIVATE_ERROR_SLOT_HPP_INCLUDED_

#include <cstdarg>
#include <map>
#include <string>

namespace wsdb {
namespace priv {

/**
 * @brief Last outcome recorded by one object on the current thread.
 *
 * Slots are keyed by the owner address, one map per thread and code type,
 * so stores and engines shared between threads report per caller.
 */
template <typename Code>
struct error_slot {
    Code code{};
    std::string message;

    static error_slot& of(const void* owner) {
        return slots()[owner];
    }

    static void reset(const void* owner) {
        slots()[owner] = error_slot{};
    }

    static void release(const void* owner) {
        slots().erase(owner);
    }

private:
    static std::map<const void*, error_slot>& slots() {
        static thread_local std::map<const void*, error_slot> slots_;
        return slots_;
    }
};

/// printf-style formatting of \p format; empty for nullptr.
std::string vformat(const char* format, va_list args);

}  // namespace priv
}  // namespace wsdb

#endif  // _WSDB_PRIVATE_ERROR_SLOT_HPP_INCLUDED_
