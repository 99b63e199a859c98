#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace M2M {

/**
 * @brief oneM2M basic time format "YYYYMMDDTHHMMSS,ffffff" in UTC.
 *
 * Fixed width, so lexicographic comparison orders timestamps chronologically.
 */
[[nodiscard]] auto formatTimestamp(std::chrono::system_clock::time_point tp) -> std::string;

[[nodiscard]] auto timestampNow() -> std::string;

[[nodiscard]] auto timestampAfter(std::int64_t seconds) -> std::string;

} // namespace M2M
