#ifndef COMMON_HPP
#define COMMON_HPP

#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ws {
using Byte = uint8_t;

// dynamic vector of bytes
using Bytes = std::vector<Byte>;

// milliseconds since unix epoch
using Timestamp = uint64_t;
// milliseconds
using Duration = uint64_t;

// sync types
using SharedMutex = std::shared_mutex;

// RAII locks
template<typename T>
class Lock : public std::lock_guard<T> {
public:
  explicit inline Lock(T& lockable) noexcept : std::lock_guard<T>(lockable) {}
};

template<typename T>
class SharedLock : public std::shared_lock<T> {
public:
  explicit inline SharedLock(T& lockable) noexcept : std::shared_lock<T>(lockable) {}
};
}  // namespace ws
#endif  // COMMON_HPP
