#include <wsdb/database.hpp>

#include <utility>

#include "error_slot.hpp"

namespace wsdb {

namespace {
using engine_slot = priv::error_slot<Database::Error>;

const char* engine_error_text(Database::Error error) {
    switch (error) {
        case Database::NoError:
            return "No error";
        case Database::NotFound:
            return "Key is not found";
        case Database::Corruption:
            return "Database is corrupted";
        case Database::NotSupported:
            return "Operation is not supported";
        case Database::InvalidArgument:
            return "Invalid argument passed";
        case Database::IOError:
            return "I/O error";
        case Database::NotOpen:
            return "Database is not open";
        default:
            return "Unknown error";
    }
}
}  // namespace

Database::Database() {
    engine_slot::reset(this);
}

Database::~Database() {
    engine_slot::release(this);
}

Database::Snapshot::Snapshot() = default;
Database::Snapshot::~Snapshot() = default;

Database::Iterator::Iterator() = default;
Database::Iterator::~Iterator() = default;

void Database::Batch::put(const ws::Bytes& key, const ws::Bytes& value) {
    operations_.emplace_back(Operation{Operation::Put, key, value});
}

void Database::Batch::remove(const ws::Bytes& key) {
    operations_.emplace_back(Operation{Operation::Remove, key, ws::Bytes{}});
}

Database::Error Database::last_error() const {
    return engine_slot::of(this).code;
}

std::string Database::last_error_message() const {
    const engine_slot& slot = engine_slot::of(this);
    return slot.message.empty() ? engine_error_text(slot.code) : slot.message;
}

void Database::set_last_error(Error error, const std::string& message) {
    engine_slot& slot = engine_slot::of(this);
    slot.code = error;
    slot.message = message;
}

void Database::set_last_error(Error error, const char* message, ...) {
    va_list args;
    va_start(args, message);
    std::string text = priv::vformat(message, args);
    va_end(args);

    engine_slot& slot = engine_slot::of(this);
    slot.code = error;
    slot.message = std::move(text);
}

}  // namespace wsdb
