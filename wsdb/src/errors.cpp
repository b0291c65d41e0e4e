#include <wsdb/errors.hpp>

#include <cstdio>
#include <utility>

#include <lib/system/logger.hpp>

#include "error_slot.hpp"

namespace wsdb {

namespace priv {
std::string vformat(const char* format, va_list args) {
    if (nullptr == format) {
        return std::string();
    }

    va_list measure;
    va_copy(measure, args);
    const int size = std::vsnprintf(nullptr, 0, format, measure);
    va_end(measure);
    if (size <= 0) {
        return std::string();
    }

    std::string result(static_cast<size_t>(size) + 1, '\0');
    std::vsnprintf(&result[0], result.size(), format, args);
    result.resize(static_cast<size_t>(size));
    return result;
}
}  // namespace priv

namespace {
using store_slot = priv::error_slot<Error>;
}  // namespace

const char* error_name(Error error) {
    switch (error) {
        case NoError:
            return "No error";
        case NotOpen:
            return "Storage is not open";
        case NotFound:
            return "Not found";
        case VersionConflict:
            return "Version conflict";
        case InvalidTransition:
            return "Invalid state transition";
        case InvalidParameter:
            return "Invalid parameter passed to method";
        case MalformedKey:
            return "Malformed key";
        case MalformedValue:
            return "Malformed value";
        case StaleCursor:
            return "Stale cursor";
        case MalformedCursor:
            return "Malformed cursor";
        case ConsistencyViolation:
            return "Consistency violation";
        case DatabaseError:
            return "Database error";
        default:
            return "Unknown error";
    }
}

ErrorHolder::ErrorHolder(const char* component)
: component_(component) {
    store_slot::reset(this);
}

ErrorHolder::~ErrorHolder() {
    store_slot::release(this);
}

Error ErrorHolder::last_error() const {
    return store_slot::of(this).code;
}

std::string ErrorHolder::last_error_message() const {
    const store_slot& slot = store_slot::of(this);
    return slot.message.empty() ? error_name(slot.code) : slot.message;
}

void ErrorHolder::set_last_error(Error error, const std::string& message) const {
    record(error, message);
}

void ErrorHolder::set_last_error(Error error, const char* message, ...) const {
    va_list args;
    va_start(args, message);
    std::string text = priv::vformat(message, args);
    va_end(args);
    record(error, std::move(text));
}

void ErrorHolder::record(Error error, std::string message) const {
    store_slot& slot = store_slot::of(this);
    slot.code = error;
    slot.message = std::move(message);

    // lookups of absent keys are routine, races and expired cursors are the caller's to retry
    switch (error) {
        case NoError:
            break;
        case NotFound:
            wsdebug() << component_ << "> " << last_error_message();
            break;
        case VersionConflict:
        case StaleCursor:
            wswarning() << component_ << "> " << error_name(error) << ": " << last_error_message();
            break;
        default:
            wserror() << component_ << "> " << error_name(error) << ": " << last_error_message();
            break;
    }
}

}  // namespace wsdb
