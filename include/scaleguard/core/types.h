#pragma once
/**
 * @file types.h
 * @brief Core type definitions for ScaleGuard
 *
 * This file defines fundamental types used throughout the library,
 * including numeric aliases, wall-clock time points and group identity.
 */

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace scaleguard {

// ============================================================================
// Numeric Types
// ============================================================================

using Real = double;

// Integer types
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Time
// ============================================================================

/**
 * @brief Wall-clock instant
 *
 * Provider timestamps (activity start times, price observations) are
 * absolute UTC instants, so the system clock is used throughout.
 */
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Seconds = std::chrono::seconds;

/**
 * @brief Source of "now", injectable for deterministic tests
 */
using ClockFn = std::function<TimePoint()>;

/**
 * @brief Default clock reading the system time
 */
inline TimePoint system_now() {
    return Clock::now();
}

/**
 * @brief Format a time point as ISO-8601 UTC ("2024-01-31T12:00:00Z")
 */
std::string format_time(TimePoint time);

// ============================================================================
// Group Identity
// ============================================================================

/**
 * @brief Identity of a scaling group: (region, name)
 */
struct GroupId {
    std::string region;
    std::string name;

    bool operator==(const GroupId& other) const {
        return region == other.region && name == other.name;
    }
    bool operator!=(const GroupId& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Hash for GroupId keyed maps
 */
struct GroupIdHash {
    std::size_t operator()(const GroupId& id) const {
        auto h1 = std::hash<std::string>{}(id.region);
        auto h2 = std::hash<std::string>{}(id.name);
        return h1 ^ (h2 << 1);
    }
};

} // namespace scaleguard
