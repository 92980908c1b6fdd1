// === Status Query ============================================================
//
// Read-only projection of the vehicle state store. Reads observe only
// committed snapshots and never wait on the engine's per-vehicle writer lock.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "geofence_service/types.hpp"
#include "geofence_service/vehicle_state_store.hpp"

namespace geofence_service {

/** @brief Externally visible status of one vehicle. */
struct VehicleStatus final {
    std::string vehicle_id{};
    std::vector<std::string> current_zones{};      /**< Sorted by zone id. */
    std::optional<WallTime> last_event_time{};
    std::optional<Position> last_position{};
};

/** @brief Serves status lookups straight from the store. */
class StatusQuery final {
  public:
    explicit StatusQuery(const VehicleStateStore& store);

    /** @brief Status for @p vehicle_id, or std::nullopt if it was never observed. */
    [[nodiscard]] std::optional<VehicleStatus> status(const std::string& vehicle_id) const;

  private:
    const VehicleStateStore& store_;
};

}  // namespace geofence_service
