// === Geofence Service ========================================================
//
// Process-scoped composition of the zone registry, vehicle state store,
// transition engine and status query. Tests construct isolated instances; the
// entry point builds one from Configuration.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geofence_service/clock.hpp"
#include "geofence_service/logging.hpp"
#include "geofence_service/status_query.hpp"
#include "geofence_service/transition_engine.hpp"
#include "geofence_service/vehicle_state_store.hpp"
#include "geofence_service/zone_registry.hpp"

namespace geofence_service {

/** @brief Liveness summary for operators. */
struct HealthReport final {
    std::string status{};
    std::string environment{};
    std::size_t zone_count{};
    std::size_t tracked_vehicles{};
    std::string version{};
};

/** @brief Facade exposing ingest, status and zone listing. */
class GeofenceService final {
  public:
    /**
     * @throws ConfigurationError if @p zones fail registry validation.
     */
    GeofenceService(std::vector<Zone> zones, EngineConfig engine_config, const Clock& clock, std::string environment);

    /** @brief See TransitionEngine::process_event(). */
    [[nodiscard]] TransitionResult process_event(const LocationEvent& event);
    /** @brief Status for @p vehicle_id, or std::nullopt when never observed. */
    [[nodiscard]] std::optional<VehicleStatus> get_status(const std::string& vehicle_id) const;
    [[nodiscard]] const std::vector<Zone>& list_zones() const noexcept;
    [[nodiscard]] HealthReport health() const;

  private:
    std::string str_environment_;
    ZoneRegistry zone_registry_;
    InMemoryVehicleStateStore state_store_;
    TransitionEngine transition_engine_;
    StatusQuery status_query_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geofence_service
