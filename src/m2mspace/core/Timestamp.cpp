#include "core/Timestamp.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace M2M {

auto formatTimestamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto const seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto const micros  = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();
    auto const timeT   = std::chrono::system_clock::to_time_t(seconds);
    std::tm    utc{};
    gmtime_r(&timeT, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y%m%dT%H%M%S") << ',' << std::setfill('0') << std::setw(6) << micros;
    return oss.str();
}

auto timestampNow() -> std::string {
    return formatTimestamp(std::chrono::system_clock::now());
}

auto timestampAfter(std::int64_t seconds) -> std::string {
    return formatTimestamp(std::chrono::system_clock::now() + std::chrono::seconds{seconds});
}

} // namespace M2M
