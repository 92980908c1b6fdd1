#include "geofence_service/status_query.hpp"

namespace geofence_service {

StatusQuery::StatusQuery(const VehicleStateStore& store)
    : store_(store) {}

std::optional<VehicleStatus> StatusQuery::status(const std::string& vehicle_id) const {
    const std::optional<VehicleState> optional_state = store_.find(vehicle_id);
    if (!optional_state.has_value()) {
        return std::nullopt;
    }
    const VehicleState& state = optional_state.value();
    return VehicleStatus{
        state.vehicle_id,
        std::vector<std::string>(state.current_zones.begin(), state.current_zones.end()),
        state.last_event_time,
        state.last_position
    };
}

}  // namespace geofence_service
