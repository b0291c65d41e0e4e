#ifndef UTILS_HPP
#define UTILS_HPP

#include <chrono>
#include <cstdint>

#include <boost/numeric/conversion/cast.hpp>

#include <lib/system/common.hpp>

namespace ws {
class Utils {
public:
    ///
    /// Returns current time point in milliseconds since epoch
    ///
    static ws::Timestamp currentTimestamp() {
        auto now = std::chrono::system_clock::now();
        return static_cast<ws::Timestamp>(std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
    }
};

///
/// Conversion between numeric types with checks based on boost::numeric_cast in DEBUG build
///
template <typename Target, typename Source>
inline auto numeric_cast(Source arg) {
#ifndef NDEBUG
    return boost::numeric_cast<Target>(arg);
#else
    return static_cast<Target>(arg);
#endif
}

}  // namespace ws

#endif  // UTILS_HPP
