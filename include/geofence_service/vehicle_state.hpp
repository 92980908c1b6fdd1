#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "geofence_service/types.hpp"

namespace geofence_service {

/**
 * @brief Last committed view of a single vehicle.
 *
 * A default-constructed state (version 0) stands for a vehicle that has never
 * been observed.
 */
struct VehicleState final {
    std::string vehicle_id{};                      /**< Store key. */
    std::set<std::string> current_zones{};         /**< Zone ids the vehicle is inside. */
    std::optional<WallTime> last_event_time{};     /**< Timestamp of the last accepted event. */
    std::optional<std::string> last_event_id{};    /**< Idempotency key of the last accepted event. */
    std::optional<Position> last_position{};       /**< Position of the last accepted event. */
    std::optional<WallTime> last_processed_time{}; /**< Processing time of the last accepted event; debounce reference. */
    std::uint64_t version{};                       /**< Bumped by every commit; 0 means never committed. */
};

}  // namespace geofence_service
