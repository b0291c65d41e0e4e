/**
 * @file errors.hpp
 */

#ifndef _WSDB_ERRORS_HPP_INCLUDED_
#define _WSDB_ERRORS_HPP_INCLUDED_

#include <string>

namespace wsdb {

enum Error {
    NoError = 0,
    NotOpen = 1,
    NotFound = 2,
    VersionConflict = 3,
    InvalidTransition = 4,
    InvalidParameter = 5,
    MalformedKey = 6,
    MalformedValue = 7,
    StaleCursor = 8,
    MalformedCursor = 9,
    ConsistencyViolation = 10,
    DatabaseError = 11,
    UnknownError = 255,
};

const char* error_name(Error error);

/**
 * @brief Per-object, per-thread last error slot.
 *
 * Every store operation returns bool and records the outcome here. The slot
 * is thread local, so concurrent callers of one store see their own errors.
 * Errors other than NotFound are logged with the component prefix given to
 * the constructor.
 */
class ErrorHolder {
protected:
    explicit ErrorHolder(const char* component);

public:
    virtual ~ErrorHolder();

    ErrorHolder(const ErrorHolder&) = delete;
    ErrorHolder& operator=(const ErrorHolder&) = delete;

    Error last_error() const;
    std::string last_error_message() const;

protected:
    void set_last_error(Error error = NoError, const std::string& message = std::string()) const;
    void set_last_error(Error error, const char* message, ...) const;

private:
    void record(Error error, std::string message) const;

    const char* component_;
};

}  // namespace wsdb

#endif  // _WSDB_ERRORS_HPP_INCLUDED_
