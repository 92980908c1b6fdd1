#include "geofence_service/geofence_service.hpp"

#include <utility>

#include "geofence_service/version.hpp"

namespace geofence_service {

GeofenceService::GeofenceService(std::vector<Zone> zones, EngineConfig engine_config, const Clock& clock, std::string environment)
    : str_environment_(std::move(environment)),
      zone_registry_(std::move(zones)),
      state_store_(),
      transition_engine_(zone_registry_, state_store_, clock, engine_config),
      status_query_(state_store_),
      logger_(get_logger()) {
    logger_->info("Geofence service {} ready in {} with {} zones", k_version, str_environment_, zone_registry_.size());
}

TransitionResult GeofenceService::process_event(const LocationEvent& event) {
    return transition_engine_.process_event(event);
}

std::optional<VehicleStatus> GeofenceService::get_status(const std::string& vehicle_id) const {
    return status_query_.status(vehicle_id);
}

const std::vector<Zone>& GeofenceService::list_zones() const noexcept {
    return zone_registry_.all();
}

HealthReport GeofenceService::health() const {
    return HealthReport{
        "ok",
        str_environment_,
        zone_registry_.size(),
        state_store_.size(),
        std::string{k_version}
    };
}

}  // namespace geofence_service
