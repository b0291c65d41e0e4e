#include "record_fields.hpp"

#include <cstring>

namespace wsdb {
namespace priv {

void obstream::put(const void* buf, size_t size) {
    auto begin = static_cast<const uint8_t*>(buf);
    buffer_.insert(buffer_.end(), begin, begin + size);
}

void obstream::put_sized(const void* data, size_t size) {
    put(static_cast<uint64_t>(size));
    put(data, size);
}

bool ibstream::take(size_t size, const uint8_t** data) {
    if (size > this->size()) {
        return false;
    }
    *data = pos_;
    pos_ += size;
    return true;
}

bool ibstream::take_sized(const uint8_t** data, size_t* size) {
    // a length beyond the remaining bytes fails before any allocation
    uint64_t length = 0;
    const uint8_t* start = pos_;
    if (!get(length) || length > this->size()) {
        pos_ = start;
        return false;
    }
    *size = static_cast<size_t>(length);
    return take(*size, data);
}

bool ibstream::get(void* buf, size_t size) {
    const uint8_t* data = nullptr;
    if (!take(size, &data)) {
        return false;
    }
    if (size != 0) {
        std::memcpy(buf, data, size);
    }
    return true;
}

bool ibstream::get(std::string& value) {
    const uint8_t* data = nullptr;
    size_t size = 0;
    if (!take_sized(&data, &size)) {
        return false;
    }
    value.assign(reinterpret_cast<const char*>(data), size);
    return true;
}

bool ibstream::get(ws::Bytes& value) {
    const uint8_t* data = nullptr;
    size_t size = 0;
    if (!take_sized(&data, &size)) {
        return false;
    }
    value.assign(data, data + size);
    return true;
}

}  // namespace priv
}  // namespace wsdb
