/**
 * @file time.cpp
 * @brief Wall-clock formatting helpers
 */

#include "scaleguard/core/types.h"
#include <ctime>

namespace scaleguard {

std::string format_time(TimePoint time) {
    std::time_t seconds = Clock::to_time_t(time);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char buffer[32];
    std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, written);
}

} // namespace scaleguard
