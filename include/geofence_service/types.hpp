// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// geofence service (wall-clock primitives and geodetic positions).

#pragma once

#include <chrono>
#include <string>

namespace geofence_service {

/**
 * @brief Alias for the wall clock used for event timestamps and debounce.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps captured from the wall clock.
 */
using WallTime = std::chrono::time_point<WallClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct Position final {
    double latitude_deg{};   /**< Latitude in decimal degrees, -90..90. */
    double longitude_deg{};  /**< Longitude in decimal degrees, -180..180. */
};

/** @brief Convert a double-precision duration into the wall-clock tick type. */
[[nodiscard]] inline WallClock::duration to_wall_duration(Duration duration) {
    return std::chrono::duration_cast<WallClock::duration>(duration);
}

}  // namespace geofence_service
